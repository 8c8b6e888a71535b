//
// UVBase.cc
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

#include "io/uv/UVBase.hh"
#include "EventLoop.hh"
#include "UVInternal.hh"

#include <cmath>

namespace pubip {
    using namespace pubip::io::uv;

    string ErrorDomainInfo<io::uv::UVError>::description(errorcode_t code) {
        switch (code) {
            case UV_EAI_NONAME:     return "unknown host";
            default:                return uv_strerror(code);
        }
    }
}


namespace pubip::io {

    void Randomize(void* buf, size_t len) {
        uv::check(uv_random(nullptr, nullptr, buf, len, 0, nullptr), "generating random bytes");
    }

}


namespace pubip::io::uv {
    using namespace std;


    /** EventLoop backed by a `uv_loop_t`. */
    class UVEventLoop final : public EventLoop {
    public:
        UVEventLoop() {
            check(uv_loop_init(&_loop), "initializing the event loop");
            _loop.data = this;
        }

        ~UVEventLoop() override {
            // Let pending close callbacks run so their memory is freed:
            uv_run(&_loop, UV_RUN_NOWAIT);
            if (int err = uv_loop_close(&_loop); err < 0)
                LLoop->warn("Event loop closed with handles still open: {}", uv_strerror(err));
        }

        bool runOnce(bool wait) override {
            NotReentrant nr(_running);
            int active = uv_run(&_loop, wait ? UV_RUN_ONCE : UV_RUN_NOWAIT);
            LLoop->trace("loop iteration done; {} active", active);
            return active != 0;
        }

        void stop() override {
            uv_stop(&_loop);
        }

        uv_loop_t* uvLoop()     {return &_loop;}

    private:
        uv_loop_t _loop;
    };


    uv_loop_s* curLoop() {
        return static_cast<UVEventLoop&>(Scheduler::current().eventLoop()).uvLoop();
    }

}


namespace pubip {
    using namespace std;
    using namespace pubip::io::uv;

    unique_ptr<EventLoop> Scheduler::newEventLoop() {
        return make_unique<UVEventLoop>();
    }


    Timer::Timer(std::function<void()> fn)
    :_fn(std::move(fn))
    {
        auto handle = new uv_timer_t;
        if (int err = uv_timer_init(curLoop(), handle); err < 0) {
            delete handle;
            check(err, "creating a timer");
        }
        handle->data = this;
        _handle = handle;
    }


    Timer::~Timer() {
        if (_handle)
            uv_timer_stop(_handle);
        closeHandle(_handle);
    }


    void Timer::once(double delaySecs) {
        auto ms = uint64_t(::round(max(delaySecs, 0.0) * 1000.0));
        check(uv_timer_start(_handle, [](uv_timer_t* h) noexcept {
            static_cast<Timer*>(h->data)->fire();
        }, ms, 0), "starting a timer");
    }


    void Timer::stop() {
        uv_timer_stop(_handle);
    }


    void Timer::fire() {
        try {
            _fn();
        } catch (std::exception const& x) {
            LLoop->error("Timer callback threw: {}", x.what());
        }
        if (_selfOwned)
            delete this;
    }


    void Timer::after(double delaySecs, std::function<void()> fn) {
        auto timer = make_unique<Timer>(std::move(fn));
        timer->once(delaySecs);
        timer.release()->_selfOwned = true;
    }


    Future<void> Timer::sleep(double delaySecs) {
        FutureProvider<void> provider = Future<void>::provider();
        after(delaySecs, [provider] {provider->setResult();});
        return Future<void>(provider);
    }

}
