//
// EventLoop.hh
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
#include "Future.hh"

#include <functional>

struct uv_timer_s;

namespace pubip {

    /** The I/O side of a Scheduler: polls sockets, timers and DNS lookups on one thread.
        `Scheduler::runUntil` interleaves it with resuming coroutines. */
    class EventLoop {
    public:
        virtual ~EventLoop();

        /// Polls once. If `wait` is true, blocks until at least one event has been handled.
        /// Returns false once nothing (no handle or request) is left to wait for.
        virtual bool runOnce(bool wait) =0;

        /// Makes a blocked `runOnce` return early.
        virtual void stop() =0;

        bool isRunning() const                              {return _running;}

    protected:
        bool _running = false;
    };



    /** A one-shot timer on the current thread's event loop. */
    class Timer {
    public:
        explicit Timer(std::function<void()> fn);
        ~Timer();

        /// Schedules the function to be called once, `delaySecs` from now.
        /// Calling it again before it fires reschedules it.
        void once(double delaySecs);

        /// Cancels a pending call.
        void stop();

        /// Calls `fn` once after `delaySecs`; the timer cleans itself up.
        static void after(double delaySecs, std::function<void()> fn);

        /// Returns a Future that resolves `delaySecs` from now.
        staticASYNC<void> sleep(double delaySecs);

    private:
        Timer(Timer const&) = delete;
        void fire();

        std::function<void()>   _fn;
        uv_timer_s*             _handle = nullptr;
        bool                    _selfOwned = false;
    };

}
