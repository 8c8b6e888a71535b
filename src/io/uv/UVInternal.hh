//
// UVInternal.hh
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
#include "Internal.hh"
#include "Scheduler.hh"
#include "io/uv/UVBase.hh"
#include "util/Bytes.hh"
#include "util/Logging.hh"

#include <algorithm>
#include <concepts>

#include <uv.h>
// On Windows <uv.h> drags in <windows.h>, which defines `min` and `max` as macros,
// which creates crazy syntax errors when calling std::min/max...
#undef min
#undef max


namespace pubip::io::uv {

    /// Checks a libuv function result and throws a UVError exception if it's negative.
    static inline void check(std::signed_integral auto status, const char* what) {
        if (status < 0)
            Error::raise(UVError(status), what);
    }


    /// Convenience function that returns the current Scheduler's libuv loop.
    uv_loop_s* curLoop();


    /// Closes any type compatible with `uv_handle_t`, and
    /// calls `delete` on the struct pointer after the close completes.
    template <class T>
    void closeHandle(T* &handle) {
        if (handle) {
            handle->data = nullptr;
            uv_close((uv_handle_t*)handle, [](uv_handle_t* h) noexcept {
                delete (T*)h;
            });
            handle = nullptr;
        }
    }


    /** A heap-allocated libuv request (such as uv_write_s) whose completion resolves a Future.
        The request owns a copy of any data it sends, and deletes itself when libuv calls back,
        so the awaiting coroutine may go away while the request is still in flight. */
    template <class UV_REQUEST_T>
    class AwaitableRequest : public UV_REQUEST_T {
    public:
        explicit AwaitableRequest(const char* what)  :_what(what) { }

        /// Copies data into the request, and returns a buffer pointing to the copy.
        uv_buf_t keep(ConstBytes data) {
            _data = string(string_view(data));
            return uv_buf_init(_data.data(), unsigned(_data.size()));
        }

        /// Pass this as the callback to a UV call on this request.
        static void callback(UV_REQUEST_T *req, int status) noexcept {
            auto self = static_cast<AwaitableRequest*>(req);
            self->completed(status);
            delete self;
        }

        /// Call this with the status returned by the libuv function that started the request.
        /// Returns a Future that resolves when the request completes.
        /// If the status is an error, the request never started, so it's deleted immediately.
        Future<void> started(int status) {
            Future<void> result(_provider);
            if (status < 0) {
                completed(status);
                delete this;
            }
            return result;
        }

    private:
        void completed(int status) {
            if (_provider->hasResult())
                return;
            if (status < 0) {
                LNet->debug("{} failed: {}", _what, uv_strerror(status));
                _provider->setResult(Error(UVError(status)));
            } else {
                _provider->setResult();
            }
        }

        FutureProvider<void> _provider = Future<void>::provider();
        const char*          _what;
        string               _data;
    };

    using connect_request = AwaitableRequest<uv_connect_s>;
    using write_request   = AwaitableRequest<uv_write_s>;
    using send_request    = AwaitableRequest<uv_udp_send_s>;

}
