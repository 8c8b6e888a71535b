//
// Future.cc
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

#include "Future.hh"
#include "util/Logging.hh"

namespace pubip {

    coro_handle FutureStateBase::suspend(coro_handle waiter) {
        if (_ready)
            return waiter;
        if (_waiter)
            Error::raise(PubIPError::LogicError, "Future is already being awaited");
        Scheduler& sched = Scheduler::current();
        _waiter = sched.suspend(waiter);
        return sched.next();
    }


    void FutureStateBase::noFuture() {
        if (_waiter) {
            LSched->debug("Future destroyed while {} awaits it", CoroutineName(_waiter.handle()));
            _waiter.cancel();
        }
    }


    void FutureStateBase::notify() {
        if (_ready)
            Error::raise(PubIPError::LogicError, "Future already has a result");
        _ready = true;
        _waiter.wakeUp();
    }

}
