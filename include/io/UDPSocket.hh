//
// UDPSocket.hh
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
#include "Future.hh"

#include <deque>

struct uv_udp_s;
struct uv_buf_t;

namespace pubip {
    class Timer;
}

namespace pubip::io {

    /** A UDP socket for request/response exchanges, such as DNS queries. */
    class UDPSocket {
    public:
        /// A received datagram and the address it came from.
        struct Datagram {
            string          data;
            SocketAddress   sender;
        };

        UDPSocket();
        ~UDPSocket();

        /// Binds to an ephemeral local port on the wildcard address of the given family
        /// (`V4` or `V6`.) Must be called before `send` or `receive`.
        void bind(Version family);

        /// Binds to a specific local address and port; port 0 picks an ephemeral port.
        void bind(SocketAddress const& local);

        /// The address and port the socket is bound to.
        SocketAddress localAddress() const;

        bool isOpen() const                         {return _udp != nullptr;}

        /// Sends a datagram. The data is copied, so it needn't remain valid.
        ASYNC<void> send(SocketAddress const& to, ConstBytes data);

        /// Waits for the next datagram. If none arrives within `timeoutSecs`, fails with
        /// `PubIPError::Timeout`.
        ASYNC<Datagram> receive(double timeoutSecs);

        /// Closes the socket. A pending receive fails with `UVError(UV_ECANCELED)`.
        void close();

    private:
        void recvCallback(intptr_t nread, uv_buf_t const*, struct sockaddr const*, unsigned flags);

        static constexpr size_t kMaxQueued = 16;

        uv_udp_s*                       _udp = nullptr;
        std::unique_ptr<Timer>          _timer;
        std::unique_ptr<char[]>         _recvBuf;
        std::deque<Datagram>            _received;      // Datagrams no one has asked for yet
        FutureProvider<Datagram>        _pendingReceive;
        bool                            _receiving = false;
    };

}
