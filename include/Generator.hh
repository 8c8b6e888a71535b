//
// Generator.hh
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

#include <iterator>
#include <utility>

namespace pubip {
    template <typename T> class GeneratorImpl;


    /** A lazy sequence produced by a coroutine that `co_yield`s items.

        Items are `Result<T>`s, so values and Errors can be interleaved; an Error item does not
        end the sequence. The sequence ends when the coroutine returns, or with a final Error
        item if it throws.

        The coroutine runs only while a consumer is waiting for an item. Inside a coroutine,
        `co_await` the Generator to get the next item (empty at the end); elsewhere, call
        `next()` or use a range-for, which run the Scheduler while waiting. Destroying the
        Generator abandons the coroutine wherever it is suspended. */
    template <typename T>
    class Generator : public Coroutine<GeneratorImpl<T>> {
    public:
        Generator(Generator&&) noexcept = default;
        Generator& operator=(Generator&&) noexcept = default;

        /// Runs the Scheduler until the next item is available, and returns it; empty at the end.
        /// Not for use inside a coroutine.
        Result<T> next()                            {return this->impl().next();}

        // Single-pass iteration.
        class iterator;
        iterator begin()                            {return iterator(*this);}
        std::default_sentinel_t end()               {return std::default_sentinel_t{};}

        bool await_ready()                          {return this->impl().isReady();}

        coro_handle await_suspend(coro_handle cur)  {return this->impl().generateFor(cur);}

        Result<T> await_resume()                    {return this->impl().yieldedValue();}

    private:
        friend class GeneratorImpl<T>;
        using super = Coroutine<GeneratorImpl<T>>;

        explicit Generator(typename super::handle_type handle)  :super(handle) {}
    };



    // Input iterator over a Generator; same restriction as `next()`.
    template <typename T>
    class Generator<T>::iterator {
    public:
        iterator& operator++()              {_item = _gen.next(); return *this;}
        Result<T> const& operator*() const  {return _item;}
        Result<T>& operator*()              {return _item;}

        friend bool operator== (iterator const& i, std::default_sentinel_t) {
            return i._item.empty();
        }

    private:
        friend class Generator;
        explicit iterator(Generator& gen)   :_gen(gen), _item(gen.next()) { }

        Generator&  _gen;
        Result<T>   _item;
    };


#pragma mark - IMPLEMENTATION:


    template <typename T>
    class GeneratorImpl : public CoroutineImpl<GeneratorImpl<T>> {
    public:
        using super = CoroutineImpl<GeneratorImpl<T>>;

        GeneratorImpl() = default;

        bool isReady() const    {return _ready || this->handle().done();}

        Result<T> next() {
            auto h = this->handle();
            if (!_ready && !h.done()) {
                _consumer = nullptr;
                h.resume();
                // It's parked on I/O; drive the loop until it yields or finishes:
                if (!_ready && !h.done())
                    Scheduler::current().runUntil([&]{return _ready || h.done();});
            }
            return yieldedValue();
        }

        // Takes the pending item, if any.
        Result<T> yieldedValue() {
            if (!_ready)
                return noerror;
            _ready = false;
            return std::move(_yielded_value);
        }

        //---- C++ coroutine internal API:

        Generator<T> get_return_object() {
            return Generator<T>(this->typedHandle());
        }

        // co_yield: stash the item and switch to the consumer.
        SwitchTo yield_value(Result<T> item) {
            precondition(!item.empty());
            _yielded_value = std::move(item);
            _ready = true;
            return SwitchTo{takeConsumer()};
        }

        // A thrown exception becomes the final item.
        void unhandled_exception() {
            _yielded_value = Error(std::current_exception());
            _ready = true;
        }

        void return_void() { }

        // At the end, wake whoever was waiting; they'll see the empty item.
        SwitchTo final_suspend() noexcept {
            return SwitchTo{takeConsumer()};
        }

    private:
        template <class U> friend class Generator;

        // Records the awaiting consumer and resumes this generator.
        coro_handle generateFor(coro_handle consumer) {
            precondition(!_consumer);   // only one consumer at a time
            _consumer = consumer;
            return this->handle();
        }

        coro_handle takeConsumer() {
            coro_handle resumer = _consumer;
            if (resumer)
                _consumer = nullptr;
            else
                resumer = CORO_NS::noop_coroutine();
            return resumer;
        }

        Result<T>           _yielded_value;
        coro_handle         _consumer;          // coroutine awaiting the next item
        bool                _ready = false;     // _yielded_value holds an unconsumed item
    };

}
