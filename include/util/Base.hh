//
// Base.hh
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

#pragma once
#include "util/betterassert.hh"

#include <coroutine>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

/// Namespace of the coroutine library types (`coroutine_handle`, `suspend_always`...).
namespace CORO_NS = std;

#if defined(__GNUC__) || defined(__clang__)
#   define Pure     __attribute__((pure))
#else
#   define Pure
#endif

// Spelled-out coroutine keywords; they stand out better when reading the code.
#define AWAIT  co_await
#define YIELD  co_yield
#define RETURN co_return


namespace pubip {

    using std::string;
    using std::string_view;

    using coro_handle = CORO_NS::coroutine_handle<>;

}
