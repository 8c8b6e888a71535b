//
// Coroutine.cc
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

#include "Coroutine.hh"
#include "Scheduler.hh"

#include <spdlog/fmt/fmt.h>

namespace pubip {

    CoroutineImplBase::~CoroutineImplBase() {
        // The frame may die while queued or parked (e.g. an abandoned Generator).
        if (_handle)
            Scheduler::current().destroying(_handle);
    }


    string CoroutineName(coro_handle h) {
        if (!h)
            return "coro(null)";
        return fmt::format("coro({})", h.address());
    }

}
