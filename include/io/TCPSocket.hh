//
// TCPSocket.hh
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
#include "Address.hh"
#include "io/IStream.hh"

struct uv_tcp_s;
struct uv_buf_t;

namespace pubip {
    class Timer;
}

namespace pubip::io {

    /** A TCP client socket. (For TLS connections, wrap it in a TLSSocket.) */
    class TCPSocket : public IStream {
    public:
        explicit TCPSocket(SocketAddress);
        ~TCPSocket();

        /// The address this socket connects to.
        SocketAddress const& address() const            {return _address;}

        /// Sets a timeout for each subsequent operation: connecting, each read and each write.
        /// When it expires the operation fails with `PubIPError::Timeout` and the socket closes.
        /// Zero (the default) means no timeout.
        void setTimeout(double secs)                    {_timeoutSecs = secs;}

        bool isOpen() const override                    {return _tcp != nullptr && _connected;}

        /// Connects to the address. Resolves once connected.
        ASYNC<void> open() override;

        /// Closes the socket immediately. A pending read fails with `UVError(UV_ECANCELED)`.
        ASYNC<void> close() override;

        ASYNC<ConstBytes> readNoCopy(size_t maxLen = 65536) override;

        ASYNC<void> write(ConstBytes) override;
        using IStream::write;

    private:
        void _close();
        void readStart();
        void allocCallback(uv_buf_t*);
        void readCallback(intptr_t nread);
        void startTimer();
        void stopTimer();
        void timedOut();

        SocketAddress               _address;           // Peer address
        uv_tcp_s*                   _tcp = nullptr;     // libuv handle
        std::unique_ptr<Timer>      _timer;             // Timeout timer, if any
        double                      _timeoutSecs = 0;
        BufferRef                   _inputBuf;          // Data read but not yet consumed
        BufferRef                   _readingBuf;        // Buffer libuv is reading into
        FutureProvider<BufferRef>   _pendingRead;       // Resolved by readCallback
        int                         _readError = 0;     // Sticky read error
        bool                        _connected = false;
        bool                        _reading = false;   // True between uv_read_start and _stop
        bool                        _eof = false;
        bool                        _timedOut = false;
        bool                        _readBusy = false;
    };

}
