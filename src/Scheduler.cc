//
// Scheduler.cc
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

#include "Scheduler.hh"
#include "EventLoop.hh"
#include "Internal.hh"
#include "util/Logging.hh"

#include <algorithm>

namespace pubip {
    using namespace std;


    EventLoop::~EventLoop() = default;


    Scheduler& Scheduler::_create() {
        InitLogging();
        sCurSched = new Scheduler();
        LSched->debug("Created Scheduler {}", (void*)sCurSched);
        return *sCurSched;
    }

    Scheduler::Scheduler() = default;
    Scheduler::~Scheduler() = default;


    EventLoop& Scheduler::eventLoop() {
        precondition(isCurrent());
        if (!_eventLoop)
            _eventLoop = newEventLoop();
        return *_eventLoop;
    }


    bool Scheduler::resume() {
        if (_ready.empty())
            return false;
        coro_handle h = _ready.front();
        _ready.pop_front();
        LSched->trace("resume {}", CoroutineName(h));
        h.resume();
        return true;
    }


    coro_handle Scheduler::next() {
        precondition(isCurrent());
        if (_ready.empty())
            return CORO_NS::noop_coroutine();
        coro_handle h = _ready.front();
        _ready.pop_front();
        LSched->trace("switch to {}", CoroutineName(h));
        return h;
    }


    void Scheduler::runUntil(std::function<bool()> done) {
        NotReentrant nr(_inRunUntil);
        while (!done()) {
            if (resume())
                continue;
            bool pending = eventLoop().runOnce(true);
            if (!pending && _ready.empty() && !done())
                Error::raise(PubIPError::InvalidState,
                             "runUntil: nothing is ready and no I/O is pending");
        }
    }


    Suspension Scheduler::suspend(coro_handle h) {
        precondition(isCurrent());
        LSched->trace("park {}", CoroutineName(h));
        auto [i, added] = _parked.try_emplace(h.address(), Parked{h});
        precondition(added);
        return Suspension(this, i->first);
    }


    // Removes a parked coroutine; if `wake` is true and it still exists, makes it ready.
    void Scheduler::unpark(const void* key, bool wake) {
        auto i = _parked.find(key);
        if (i == _parked.end())
            return;
        coro_handle h = i->second.handle;
        _parked.erase(i);
        if (wake && h) {
            LSched->trace("wake {}", CoroutineName(h));
            _ready.push_back(h);
            // An I/O callback woke it; return from runOnce so it can run:
            if (_eventLoop && _eventLoop->isRunning())
                _eventLoop->stop();
        }
    }


    void Scheduler::destroying(coro_handle h) {
        LSched->trace("destroying {}", CoroutineName(h));
        std::erase(_ready, h);
        // Its Suspension may outlive it; keep the entry so the key stays valid, but forget
        // the handle so waking it is a no-op.
        if (auto i = _parked.find(h.address()); i != _parked.end())
            i->second.handle = nullptr;
    }


    bool Scheduler::hasParked() const {
        return std::any_of(_parked.begin(), _parked.end(),
                           [](auto const& entry) {return entry.second.handle != nullptr;});
    }


    bool Scheduler::assertEmpty() {
        for (int round = 0; round < 10 && (!_ready.empty() || hasParked()); ++round) {
            while (resume())
                ;
            eventLoop().runOnce(false);
        }
        if (_ready.empty() && !hasParked())
            return true;

        LSched->error("Coroutines still alive:");
        for (coro_handle h : _ready)
            LSched->error("\tready: {}", CoroutineName(h));
        for (auto const& [key, parked] : _parked) {
            if (parked.handle)
                LSched->error("\tparked: {}", CoroutineName(parked.handle));
        }
        return false;
    }


#pragma mark - SUSPENSION:


    coro_handle Suspension::handle() const {
        if (!_sched)
            return {};
        auto i = _sched->_parked.find(_key);
        return i != _sched->_parked.end() ? i->second.handle : coro_handle{};
    }


    void Suspension::release(bool wake) {
        if (Scheduler* sched = _sched) {
            _sched = nullptr;
            sched->unpark(_key, wake);
        }
    }

}
