//
// UDPSocket.cc
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

#include "io/UDPSocket.hh"
#include "EventLoop.hh"
#include "UVInternal.hh"

namespace pubip::io {
    using namespace std;
    using namespace pubip::io::uv;

    static constexpr size_t kRecvBufSize = 65536;


    UDPSocket::UDPSocket() = default;


    UDPSocket::~UDPSocket() {
        close();
    }


    void UDPSocket::bind(Version family) {
        precondition(family != Version::Any);
        bind(SocketAddress{*IPAddress::parse(family == Version::V4 ? "0.0.0.0" : "::"), 0});
    }


    void UDPSocket::bind(SocketAddress const& local) {
        precondition(!_udp);
        auto udp = new uv_udp_t;
        if (int err = uv_udp_init(curLoop(), udp); err < 0) {
            delete udp;
            check(err, "creating a UDP socket");
        }
        _udp = udp;
        _udp->data = this;

        sockaddr_storage addr;
        local.toSockAddr(addr);
        check(uv_udp_bind(_udp, (sockaddr*)&addr, 0), "binding UDP socket");
    }


    SocketAddress UDPSocket::localAddress() const {
        precondition(_udp);
        sockaddr_storage addr;
        int len = sizeof(addr);
        check(uv_udp_getsockname(_udp, (sockaddr*)&addr, &len), "getting UDP socket address");
        optional<IPAddress> ip = IPAddress::fromSockAddr((sockaddr&)addr);
        postcondition(ip);
        uint16_t port = ntohs(addr.ss_family == AF_INET ? ((sockaddr_in&)addr).sin_port
                                                        : ((sockaddr_in6&)addr).sin6_port);
        return SocketAddress{*ip, port};
    }


    void UDPSocket::close() {
        _timer.reset();
        closeHandle(_udp);
        _receiving = false;
        _received.clear();
        if (auto pending = std::move(_pendingReceive))
            pending->setResult(Error(UVError(UV_ECANCELED)));
    }


    Future<void> UDPSocket::send(SocketAddress const& to, ConstBytes data) {
        if (!_udp)
            return Future<void>(UVError(UV_EBADF));
        sockaddr_storage addr;
        to.toSockAddr(addr);
        auto req = new send_request("sending datagram");
        uv_buf_t buf = req->keep(data);
        LNet->trace("Sending {}-byte datagram to {}", data.size(), to.toString());
        return req->started(uv_udp_send(req, _udp, &buf, 1, (sockaddr*)&addr, req->callback));
    }


    Future<UDPSocket::Datagram> UDPSocket::receive(double timeoutSecs) {
        precondition(!_pendingReceive);
        if (!_received.empty()) {
            Datagram d = std::move(_received.front());
            _received.pop_front();
            return Future<Datagram>(std::move(d));
        }
        if (!_udp)
            return Future<Datagram>(UVError(UV_EBADF));

        if (!_receiving) {
            auto alloc = [](uv_handle_t* h, size_t, uv_buf_t* uvbuf) noexcept {
                auto self = static_cast<UDPSocket*>(h->data);
                if (!self->_recvBuf)
                    self->_recvBuf = make_unique<char[]>(kRecvBufSize);
                *uvbuf = uv_buf_init(self->_recvBuf.get(), unsigned(kRecvBufSize));
            };
            auto recv = [](uv_udp_t* h, ssize_t nread, const uv_buf_t* buf,
                           const struct sockaddr* addr, unsigned flags) noexcept {
                static_cast<UDPSocket*>(h->data)->recvCallback(nread, buf, addr, flags);
            };
            check(uv_udp_recv_start(_udp, alloc, recv), "receiving datagrams");
            _receiving = true;
        }

        _pendingReceive = Future<Datagram>::provider();
        if (timeoutSecs > 0) {
            if (!_timer) {
                _timer = make_unique<Timer>([this] {
                    LNet->debug("UDP receive timed out");
                    if (auto pending = std::move(_pendingReceive))
                        pending->setResult(Error(PubIPError::Timeout));
                });
            }
            _timer->once(timeoutSecs);
        }
        return Future<Datagram>(_pendingReceive);
    }


    void UDPSocket::recvCallback(intptr_t nread, uv_buf_t const* buf,
                                 struct sockaddr const* addr, unsigned flags)
    {
        if (nread == 0 && addr == nullptr)
            return;     // Nothing more to read
        if (nread < 0) {
            LNet->debug("UDP receive failed: {}", uv_strerror(int(nread)));
            if (auto pending = std::move(_pendingReceive)) {
                if (_timer)
                    _timer->stop();
                pending->setResult(Error(UVError(int(nread))));
            }
            return;
        }
        if (flags & UV_UDP_PARTIAL) {
            LNet->debug("Ignoring truncated datagram");
            return;
        }
        optional<IPAddress> sender = addr ? IPAddress::fromSockAddr(*addr) : nullopt;
        if (!sender)
            return;
        uint16_t port = ntohs(addr->sa_family == AF_INET6 ? ((sockaddr_in6*)addr)->sin6_port
                                                          : ((sockaddr_in*)addr)->sin_port);
        Datagram d {string(buf->base, size_t(nread)), SocketAddress{*sender, port}};
        LNet->trace("Received {}-byte datagram from {}", nread, d.sender.toString());

        if (auto pending = std::move(_pendingReceive)) {
            if (_timer)
                _timer->stop();
            pending->setResult(std::move(d));
        } else if (_received.size() < kMaxQueued) {
            _received.push_back(std::move(d));
        }
    }

}
