//
// Future.hh
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
#include "Coroutine.hh"
#include "Result.hh"
#include "Scheduler.hh"

#include <exception>

/// Declares a function returning a Future, e.g. `ASYNC<IPAddress> lookup();`.
/// Marked `[[nodiscard]]` because an un-awaited Future silently drops its error.
#define        ASYNC [[nodiscard]]         pubip::Future
#define  staticASYNC [[nodiscard]] static  pubip::Future
#define virtualASYNC [[nodiscard]] virtual pubip::Future


namespace pubip {
    template <typename T> class FutureImpl;
    template <typename T> class FutureState;
    template <typename T> class NoThrow;

    /// The writable end of a Future, for callback-based code.
    template <typename T> using FutureProvider = std::shared_ptr<FutureState<T>>;


    /** A single value of type `T`, or an Error, that may arrive later.

        A coroutine returning `Future<T>` starts running immediately, and `co_return`s either a
        `T` or an `Error`; an exception escaping it becomes the Future's error.
        `co_await`ing a Future yields the value or rethrows the error; wrap it in `NoThrow` to
        get a `Result<T>` instead.

        Code driven by libuv callbacks makes one with `Future<T>::provider()` and later calls
        `setResult` on the provider. */
    template <typename T>
    class Future : public Coroutine<FutureImpl<T>> {
    public:
        using nonvoidT = std::conditional<std::is_void_v<T>, std::byte, T>::type;

        static FutureProvider<T> provider()             {return std::make_shared<FutureState<T>>();}

        explicit Future(FutureProvider<T> state)        :_state(std::move(state)) {precondition(_state);}

        /// An already-resolved Future.
        Future(nonvoidT&& v)  requires (!std::is_void_v<T>) {_state->setResult(std::move(v));}
        Future()  requires (std::is_void_v<T>)          {_state->setResult();}

        /// An already-failed Future.
        Future(Error err)                               {_state->setResult(err);}
        Future(ErrorDomain auto d)                      :Future(Error(d)) { }

        Future(Future&&) = default;
        ~Future()                                       {if (_state) _state->noFuture();}

        bool hasResult() const                          {return _state->hasResult();}

        /// The value; throws if the Future failed. Only valid once `hasResult` is true.
        std::add_rvalue_reference_t<T> result() const   {return _state->resultValue();}

        bool await_ready()                              {return _state->hasResult();}
        coro_handle await_suspend(coro_handle waiter)   {return _state->suspend(waiter);}

        [[nodiscard]] std::add_rvalue_reference_t<T> await_resume() requires (!std::is_void_v<T>) {
            return std::move(_state->resultValue());
        }
        void await_resume() requires (std::is_void_v<T>) {
            _state->resultValue();
        }

    private:
        using super = Coroutine<FutureImpl<T>>;
        friend class FutureImpl<T>;
        friend class NoThrow<T>;

        Future(typename super::handle_type h, FutureProvider<T> state)
        :super(h)
        ,_state(std::move(state))
        { }

        FutureProvider<T> _state = std::make_shared<FutureState<T>>();
    };


#pragma mark - FUTURE STATE:


    /** Type-independent part of FutureState: readiness, plus the (single) coroutine waiting.
        Futures live on one thread, so no locking is needed. */
    class FutureStateBase {
    public:
        virtual ~FutureStateBase() = default;

        bool hasResult() const                  {return _ready;}

        /// Parks `waiter` until the result arrives; returns the coroutine to switch to.
        coro_handle suspend(coro_handle waiter);

        /// The Future was destroyed; its waiter (if any) must not be woken.
        void noFuture();

    protected:
        void notify();

        Suspension  _waiter;
        bool        _ready = false;
    };


    /** The shared state behind a Future, and the object a FutureProvider points to. */
    template <typename T>
    class FutureState : public FutureStateBase {
    public:
        Result<T> && result() &&                        {return std::move(_result);}
        Result<T> & result() &                          {return _result;}

        std::add_rvalue_reference_t<T> resultValue()  requires (!std::is_void_v<T>) {
            precondition(_ready);
            return std::move(_result).value();
        }
        void resultValue()  requires (std::is_void_v<T>) {
            precondition(_ready);
            _result.value();
        }

        /// Stores a value or an Error, and wakes the waiting coroutine.
        template <typename U>
        void setResult(U&& value)  requires (!std::is_void_v<T>) {
            _result = std::forward<U>(value);
            notify();
        }

        void setResult()  requires (std::is_void_v<T>) {
            _result.set();
            notify();
        }
        void setResult(Error err)  requires (std::is_void_v<T>) {
            if (err)
                _result = err;
            else
                _result.set();
            notify();
        }

    private:
        Result<T> _result;
    };



    /** `co_await NoThrow(future)` produces a `Result<T>` rather than throwing on failure. */
    template <typename T>
    class NoThrow {
    public:
        NoThrow(Future<T>&& future)
        :_future(std::move(future))
        ,_state(_future._state)
        { }

        bool await_ready() noexcept                     {return _state->hasResult();}
        coro_handle await_suspend(coro_handle waiter)   {return _state->suspend(waiter);}
        [[nodiscard]] Result<T> await_resume() noexcept {return std::move(*_state).result();}

    private:
        Future<T>          _future;     // keeps the producing coroutine alive
        FutureProvider<T>  _state;
    };


#pragma mark - FUTURE IMPL:


    /** promise_type of a coroutine returning `Future<T>`. Runs eagerly. */
    template <typename T>
    class FutureImpl : public CoroutineImpl<FutureImpl<T>, true> {
    public:
        using super = CoroutineImpl<FutureImpl<T>, true>;
        using nonvoidT = std::conditional<std::is_void_v<T>, std::byte, T>::type;

        FutureImpl() = default;

        Future<T> get_return_object() {
            return Future<T>(this->typedHandle(), _provider);
        }

        void unhandled_exception()                      {_provider->setResult(Error(std::current_exception()));}

        void return_value(Error err)                    {_provider->setResult(err);}
        void return_value(ErrorDomain auto code)        {_provider->setResult(Error(code));}

        void return_value(nonvoidT&& value)  requires (!std::is_void_v<T>) {
            _provider->setResult(std::move(value));
        }
        void return_value(nonvoidT const& value)  requires (!std::is_void_v<T>) {
            _provider->setResult(value);
        }

    private:
        FutureProvider<T> _provider = std::make_shared<FutureState<T>>();
    };

}
