//
// Coroutine.hh
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
#include "util/Base.hh"

namespace pubip {
    template <class SELF, bool EAGER> class CoroutineImpl;

    /** Base of the objects returned by coroutine functions (Future, Generator).
        Owns the coroutine frame and destroys it along with itself; move-only. */
    template <class IMPL>
    class Coroutine {
    public:
        using promise_type = IMPL;

        Coroutine(Coroutine&& c) noexcept           :_handle(std::exchange(c._handle, {})) { }
        Coroutine& operator=(Coroutine&& c) noexcept {
            if (this != &c) {
                if (_handle) _handle.destroy();
                _handle = std::exchange(c._handle, {});
            }
            return *this;
        }
        ~Coroutine()                                {if (_handle) _handle.destroy();}

        IMPL& impl()                                {return _handle.promise();}

    protected:
        using handle_type = CORO_NS::coroutine_handle<IMPL>;

        Coroutine() = default;
        explicit Coroutine(handle_type h)           :_handle(h) {}

    private:
        Coroutine(Coroutine const&) = delete;
        Coroutine& operator=(Coroutine const&) = delete;

        handle_type _handle;
    };



    /// `initial_suspend` result: suspends a lazy coroutine, lets an eager one run.
    template <bool LAZY>
    struct SuspendInitial : public CORO_NS::suspend_always {
        constexpr bool await_ready() const noexcept {return !LAZY;}
    };

    /// Awaiter that suspends the current coroutine and switches to `target`,
    /// or back to the non-coroutine caller if `target` is `noop_coroutine()`.
    class SwitchTo : public CORO_NS::suspend_always {
    public:
        explicit SwitchTo(coro_handle target)       :_target(target) { }
        coro_handle await_suspend(coro_handle) const noexcept {return _target;}
    private:
        coro_handle _target;
    };



    /** Untyped base of the promise types. Tells the Scheduler when a frame goes away. */
    class CoroutineImplBase {
    public:
        CoroutineImplBase() = default;
        ~CoroutineImplBase();

        coro_handle handle() const                  {precondition(_handle); return _handle;}

        /// By default a finished coroutine returns control to whoever resumed it.
        CORO_NS::suspend_always final_suspend() noexcept {return {};}

    protected:
        CoroutineImplBase(CoroutineImplBase const&) = delete;
        CoroutineImplBase(CoroutineImplBase&&) = delete;

        coro_handle _handle;
    };



    /** CRTP base of a promise type `SELF`. If `EAGER` is true the coroutine runs as soon as
        it is called; otherwise it waits to be resumed. */
    template <class SELF, bool EAGER =false>
    class CoroutineImpl : public CoroutineImplBase {
    public:
        using handle_type = CORO_NS::coroutine_handle<SELF>;

        handle_type typedHandle() {
            auto h = handle_type::from_promise(static_cast<SELF&>(*this));
            if (!_handle)
                _handle = h;
            return h;
        }

        SuspendInitial<!EAGER> initial_suspend()    {return {};}
    };


    /// A printable identifier for a coroutine handle, for logging.
    string CoroutineName(coro_handle);

}
