//
// betterassert.hh
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

// Replacement for `assert()` that reports the failing function and source line through
// `assert_failed_hook` (which the logging layer routes to the critical log) and then calls
// `std::terminate`.
//
// * `precondition()` checks a function's parameters or initial state; a failure is a bug in
//   the caller.
// * `postcondition()` checks a result or final state; a failure is a bug in the function.
// * `assert_always()` checks anything in between.
//
// These three are enabled in all builds. `assert()` is compiled out when `NDEBUG` is defined.
// NOTE: Including <cassert> after this header replaces `assert` with the standard one.

#ifndef assert_always
    #include <source_location>

    #ifndef __has_attribute
        #define __has_attribute(x) 0
    #endif
    #ifndef __has_builtin
        #define __has_builtin(x) 0
    #endif

    #if __has_attribute(noinline)
        #define PUBIP_NOINLINE  __attribute((noinline))
    #else
        #define PUBIP_NOINLINE
    #endif

    #define assert_always(e) \
        do {  if (!(e)) [[unlikely]] ::pubip::_assert_failed (#e);  } while (0)
    #define precondition(e) \
        do {  if (!(e)) [[unlikely]] ::pubip::_precondition_failed (#e);  } while (0)
    #define postcondition(e) \
        do {  if (!(e)) [[unlikely]] ::pubip::_postcondition_failed (#e);  } while (0)

    namespace pubip {
        [[noreturn]] PUBIP_NOINLINE void _assert_failed(const char *cond,
                        std::source_location const& = std::source_location::current()) noexcept;
        [[noreturn]] PUBIP_NOINLINE void _precondition_failed(const char *cond,
                        std::source_location const& = std::source_location::current()) noexcept;
        [[noreturn]] PUBIP_NOINLINE void _postcondition_failed(const char *cond,
                        std::source_location const& = std::source_location::current()) noexcept;

        /// Receives the formatted failure message before the process terminates.
        extern void (*assert_failed_hook)(const char *message);
    }
#endif // assert_always

#undef assert
#ifdef NDEBUG
#   if __has_builtin(__builtin_assume)
#       define assert(e)           __builtin_assume(bool(e))
#   else
#       define assert(e)           (void(0))
#   endif
#else
#   define assert(e)               assert_always(e)
#endif //NDEBUG
