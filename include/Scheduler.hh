//
// Scheduler.hh
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

#include <deque>
#include <functional>
#include <memory>
#include <unordered_map>

namespace pubip {
    class EventLoop;
    class Suspension;


    /** Runs coroutines on one thread, interleaved with that thread's event loop.
        Everything in PubIP happens on the thread that pulls a Resolutions sequence, so nothing
        here is thread-safe. */
    class Scheduler {
    public:
        /// The calling thread's Scheduler, created on first use.
        static Scheduler& current()                     {return sCurSched ? *sCurSched : _create();}

        bool isCurrent() const                          {return this == sCurSched;}

        /// The event loop this Scheduler drives; created lazily.
        EventLoop& eventLoop();

        /// Alternates between resuming ready coroutines and running the event loop, until
        /// `done` returns true. Raises `PubIPError::InvalidState` if `done` is still false
        /// when no coroutine is ready and the loop has nothing pending.
        void runUntil(std::function<bool()> done);

        /// Resumes the first ready coroutine, if any. Returns false if none was ready.
        bool resume();

        /// Pops the next ready coroutine, or returns `noop_coroutine()` to leave coroutine-land.
        coro_handle next();

        /// Parks a coroutine until the returned Suspension is woken.
        Suspension suspend(coro_handle);

        /// Called as a coroutine frame is destroyed, so it is never resumed afterwards.
        void destroying(coro_handle);

        /// Lets any remaining coroutines finish, then returns true if none are ready or parked.
        /// Unit tests call this at the end of a case to catch leaked coroutines.
        bool assertEmpty();

    private:
        friend class Suspension;

        struct Parked {
            coro_handle handle;         // null once the coroutine has been destroyed
        };

        Scheduler();
        ~Scheduler();
        static Scheduler& _create();
        static std::unique_ptr<EventLoop> newEventLoop();   // defined by the I/O backend
        bool hasParked() const;
        void unpark(const void* key, bool wake);

        static inline thread_local Scheduler* sCurSched;

        std::deque<coro_handle>                      _ready;
        std::unordered_map<const void*, Parked>      _parked;
        std::unique_ptr<EventLoop>                   _eventLoop;
        bool                                         _inRunUntil = false;
    };



    /** A claim on a parked coroutine. Waking it moves the coroutine to its Scheduler's ready
        queue; destroying or canceling it forgets the coroutine without resuming it.
        Either way the Suspension becomes empty. */
    class Suspension {
    public:
        Suspension() = default;
        Suspension(Suspension&& s) noexcept             :_sched(s._sched), _key(s._key) {s._sched = nullptr;}
        Suspension& operator=(Suspension&& s) noexcept  {std::swap(_sched, s._sched); std::swap(_key, s._key); return *this;}
        ~Suspension()                                   {cancel();}

        explicit operator bool() const                  {return _sched != nullptr;}

        coro_handle handle() const;

        void wakeUp()                                   {release(true);}
        void cancel()                                   {release(false);}

    private:
        friend class Scheduler;
        Suspension(Scheduler* s, const void* key)       :_sched(s), _key(key) { }
        Suspension(Suspension const&) = delete;
        void release(bool wake);

        Scheduler*  _sched = nullptr;
        const void* _key = nullptr;
    };

}
