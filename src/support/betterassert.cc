//
// betterassert.cc
//
// Copyright 2023-Present Couchbase, Inc. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
// http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//

#include "util/betterassert.hh"
#include <cstdio>
#include <cstring>
#include <exception>

#ifndef __cold
#define __cold
#endif

namespace pubip {

    __cold
    static const char* filename(const char *file) {
        if (const char *slash = strrchr(file, '/'))
            file = slash + 1;
        return file;
    }


    __cold
    static void default_assert_failed_hook(const char *msg) {
        fprintf(stderr, "\n***%s\n", msg);
    }

    void (*assert_failed_hook)(const char *message) = &default_assert_failed_hook;


    __cold
    static void report(const char *what, const char *cond, std::source_location const& loc) {
        char msg[512];
        snprintf(msg, sizeof(msg), "FATAL: %s `%s` in %s (at %s line %u)",
                 what, cond, loc.function_name(), filename(loc.file_name()), unsigned(loc.line()));
        assert_failed_hook(msg);
    }


    __cold
    void _assert_failed(const char *cond, std::source_location const& loc) noexcept {
        report("FAILED ASSERTION", cond, loc);
        std::terminate();
    }

    __cold
    void _precondition_failed(const char *cond, std::source_location const& loc) noexcept {
        report("FAILED PRECONDITION", cond, loc);
        std::terminate();
    }

    __cold
    void _postcondition_failed(const char *cond, std::source_location const& loc) noexcept {
        report("FAILED POSTCONDITION", cond, loc);
        std::terminate();
    }

}
