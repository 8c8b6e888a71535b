//
// TCPSocket.cc
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

#include "io/TCPSocket.hh"
#include "EventLoop.hh"
#include "UVInternal.hh"

namespace pubip::io {
    using namespace std;
    using namespace pubip::io::uv;


    TCPSocket::TCPSocket(SocketAddress addr)
    :_address(std::move(addr))
    { }


    TCPSocket::~TCPSocket() {
        _close();
    }


    Future<void> TCPSocket::open() {
        precondition(!_tcp && !_timedOut);
        sockaddr_storage addr;
        _address.toSockAddr(addr);

        auto tcp = new uv_tcp_t;
        if (int err = uv_tcp_init(curLoop(), tcp); err < 0) {
            delete tcp;
            check(err, "creating a TCP socket");
        }
        _tcp = tcp;
        _tcp->data = this;
        uv_tcp_nodelay(_tcp, true);

        LNet->debug("Connecting to {}", _address.toString());
        auto req = new connect_request("opening connection");
        startTimer();
        Result<void> result = AWAIT NoThrow(
                    req->started(uv_tcp_connect(req, _tcp, (sockaddr*)&addr, req->callback)));
        stopTimer();
        if (_timedOut)
            RETURN PubIPError::Timeout;
        if (result.isError()) {
            _close();
            RETURN result.error();
        }
        _connected = true;
        RETURN noerror;
    }


    Future<void> TCPSocket::close() {
        _close();
        return Future<void>();
    }


    void TCPSocket::_close() {
        _connected = false;
        _reading = false;
        _timer.reset();
        closeHandle(_tcp);
        _inputBuf.reset();
        if (auto pending = std::move(_pendingRead))
            pending->setResult(Error(UVError(UV_ECANCELED)));
    }


#pragma mark - TIMEOUT:


    void TCPSocket::startTimer() {
        if (_timeoutSecs <= 0)
            return;
        if (!_timer)
            _timer = make_unique<Timer>([this] {timedOut();});
        _timer->once(_timeoutSecs);
    }


    void TCPSocket::stopTimer() {
        if (_timer)
            _timer->stop();
    }


    void TCPSocket::timedOut() {
        LNet->debug("Connection to {} timed out after {} sec", _address.toString(), _timeoutSecs);
        _timedOut = true;
        if (auto pending = std::move(_pendingRead))
            pending->setResult(Error(PubIPError::Timeout));
        // Closing the handle makes libuv cancel any pending connect or write:
        _connected = false;
        _reading = false;
        closeHandle(_tcp);
    }


#pragma mark - READING:


    Future<ConstBytes> TCPSocket::readNoCopy(size_t maxLen) {
        NotReentrant nr(_readBusy);
        if (_inputBuf && !_inputBuf->empty())
            RETURN _inputBuf->read(maxLen);
        if (_eof)
            RETURN ConstBytes{};
        if (_timedOut)
            RETURN PubIPError::Timeout;
        if (_readError)
            RETURN UVError(_readError);
        if (!isOpen())
            RETURN UVError(UV_ENOTCONN);

        _pendingRead = Future<BufferRef>::provider();
        Future<BufferRef> futureBuf(_pendingRead);
        readStart();
        startTimer();
        Result<BufferRef> result = AWAIT NoThrow(std::move(futureBuf));
        stopTimer();
        if (result.isError())
            RETURN result.error();

        BufferRef buf = std::move(result).value();
        if (!buf) {
            _eof = true;
            RETURN ConstBytes{};
        }
        _inputBuf = std::move(buf);
        RETURN _inputBuf->read(maxLen);
    }


    void TCPSocket::readStart() {
        if (!_reading) {
            auto alloc = [](uv_handle_t* h, size_t, uv_buf_t* uvbuf) noexcept {
                static_cast<TCPSocket*>(h->data)->allocCallback(uvbuf);
            };
            auto read = [](uv_stream_t* h, ssize_t nread, const uv_buf_t*) noexcept {
                static_cast<TCPSocket*>(h->data)->readCallback(nread);
            };
            check(uv_read_start((uv_stream_t*)_tcp, alloc, read), "reading from the network");
            _reading = true;
        }
    }


    void TCPSocket::allocCallback(uv_buf_t* uvbuf) {
        // The previous input buffer has been consumed, so it can be recycled:
        if (_inputBuf)
            _readingBuf = std::move(_inputBuf);
        else if (!_readingBuf)
            _readingBuf = make_unique<Buffer>();
        uvbuf->base = (char*)_readingBuf->data;
        uvbuf->len = Buffer::kCapacity;
    }


    void TCPSocket::readCallback(intptr_t nread) {
        if (nread == 0)
            return;     // EAGAIN; the buffer was not used
        // Only read one buffer-full per readNoCopy call:
        uv_read_stop((uv_stream_t*)_tcp);
        _reading = false;

        auto pending = std::move(_pendingRead);
        if (nread > 0) {
            _readingBuf->size = uint32_t(nread);
            _readingBuf->used = 0;
            LNet->trace("Read {} bytes from {}", nread, _address.toString());
            if (pending)
                pending->setResult(std::move(_readingBuf));
        } else if (nread == UV_EOF) {
            if (pending)
                pending->setResult(BufferRef());
        } else {
            _readError = int(nread);
            if (pending)
                pending->setResult(Error(UVError(_readError)));
        }
    }


#pragma mark - WRITING:


    Future<void> TCPSocket::write(ConstBytes data) {
        if (_timedOut)
            RETURN PubIPError::Timeout;
        if (!isOpen())
            RETURN UVError(UV_ENOTCONN);

        auto req = new write_request("sending to the network");
        uv_buf_t buf = req->keep(data);
        startTimer();
        Result<void> result = AWAIT NoThrow(
                    req->started(uv_write(req, (uv_stream_t*)_tcp, &buf, 1, req->callback)));
        stopTimer();
        if (_timedOut)
            RETURN PubIPError::Timeout;
        RETURN result.error();
    }

}
