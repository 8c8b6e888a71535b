//
// TLSSocket.cc
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

#include "io/mbedtls/TLSSocket.hh"
#include "TLSContext.hh"
#include "Internal.hh"

#include <optional>

namespace pubip {
    using namespace std;

    string ErrorDomainInfo<io::mbed::MbedError>::description(errorcode_t code) {
        char msg[128];
        mbedtls_strerror(code, msg, sizeof(msg));
        return msg;
    }
}


namespace pubip::io::mbed {
    using namespace std;


    shared_ptr<TLSContext> NewClientContext() {
        InitLogging();
        return make_shared<TLSContext>();
    }


    static bool WouldBlock(int status) {
        return status == MBEDTLS_ERR_SSL_WANT_READ || status == MBEDTLS_ERR_SSL_WANT_WRITE;
    }


    /** The mbedTLS session. mbedTLS does its I/O through synchronous callbacks; those start
        an async read or write on the underlying stream and report "would block", and `pump`
        then awaits it before the mbedTLS call is retried. */
    class TLSSocket::Impl {
    public:
        Impl(std::unique_ptr<IStream> stream, shared_ptr<TLSContext> context, string const& hostname)
        :_stream(std::move(stream))
        ,_context(std::move(context))
        ,_hostname(hostname)
        {
            mbedtls_ssl_init(&_ssl);
            check(mbedtls_ssl_setup(&_ssl, _context->config()), "setting up TLS");
            if (!_hostname.empty())
                check(mbedtls_ssl_set_hostname(&_ssl, _hostname.c_str()), "setting TLS hostname");
            mbedtls_ssl_set_bio(&_ssl, this,
                                [](void* ctx, const unsigned char* buf, size_t len) {
                                    return static_cast<Impl*>(ctx)->onSend(buf, len);},
                                [](void* ctx, unsigned char* buf, size_t len) {
                                    return static_cast<Impl*>(ctx)->onRecv(buf, len);},
                                nullptr);
        }

        ~Impl()                         {mbedtls_ssl_free(&_ssl);}

        bool isOpen() const             {return _secure;}


        Future<void> handshake() {
            AWAIT _stream->open();
            _connected = true;

            int status;
            while (WouldBlock(status = mbedtls_ssl_handshake(&_ssl)))
                AWAIT pump();
            check(status, "TLS handshake");

            if (uint32_t flags = mbedtls_ssl_get_verify_result(&_ssl); flags != 0) {
                char info[512];
                mbedtls_x509_crt_verify_info(info, sizeof(info), "", flags);
                LNet->warn("Certificate of {} rejected: {}", _hostname, info);
                check(MBEDTLS_ERR_X509_CERT_VERIFY_FAILED, "verifying server certificate");
            }
            LNet->debug("TLS session with {} established ({})",
                        _hostname, mbedtls_ssl_get_version(&_ssl));
            _secure = true;
            RETURN noerror;
        }


        Future<void> write(ConstBytes data) {
            while (!data.empty()) {
                int n = mbedtls_ssl_write(&_ssl, (const unsigned char*)data.data(), data.size());
                if (WouldBlock(n))
                    AWAIT pump();
                else if (n < 0)
                    check(n, "TLS write");
                else
                    data = data.without_first(size_t(n));
            }
            AWAIT pump();   // flush the last record to the stream
            RETURN noerror;
        }


        Future<size_t> read(void* dst, size_t maxLen) {
            while (!_peerClosed) {
                int n = mbedtls_ssl_read(&_ssl, (unsigned char*)dst, maxLen);
                if (WouldBlock(n)) {
                    AWAIT pump();
                } else if (n > 0) {
                    RETURN size_t(n);
                } else if (n == 0 || n == MBEDTLS_ERR_SSL_PEER_CLOSE_NOTIFY) {
                    _peerClosed = true;
                } else {
                    check(n, "TLS read");
                }
            }
            RETURN size_t(0);
        }


        Future<void> close() {
            if (!_connected)
                RETURN noerror;
            if (_secure) {
                _secure = false;
                mbedtls_ssl_close_notify(&_ssl);
                // The server often hangs up first, so failing to send close-notify is normal.
                if (Result<void> r = AWAIT NoThrow(pump()); r.isError())
                    LNet->debug("TLS close-notify to {} failed: {}", _hostname, r.error().description());
            }
            _connected = false;
            AWAIT _stream->close();
            RETURN noerror;
        }

    private:
        int onSend(const unsigned char* buf, size_t len) {
            if (!_connected)
                return MBEDTLS_ERR_NET_CONN_RESET;
            if (_sending)
                return MBEDTLS_ERR_SSL_WANT_WRITE;
            _sending.emplace(_stream->write(string((const char*)buf, len)));
            return int(len);
        }


        int onRecv(unsigned char* buf, size_t len) {
            if (!_connected)
                return MBEDTLS_ERR_NET_CONN_RESET;
            if (_receiving)
                return MBEDTLS_ERR_SSL_WANT_READ;
            if (!_received.empty())
                return int(_received.read(buf, len));
            if (_streamEOF)
                return 0;
            _receiving.emplace(_stream->readNoCopy(65536));
            return MBEDTLS_ERR_SSL_WANT_READ;
        }


        // Completes the stream operations started by onSend/onRecv. The write goes first, since
        // the peer may not send anything until it gets it.
        Future<void> pump() {
            while (_sending || _receiving) {
                if (_sending) {
                    Future<void> op = std::move(*_sending);
                    _sending.reset();
                    AWAIT op;
                } else {
                    Future<ConstBytes> op = std::move(*_receiving);
                    _receiving.reset();
                    _received = AWAIT op;
                    _streamEOF = _received.empty();
                }
            }
            RETURN noerror;
        }


        std::unique_ptr<IStream>        _stream;
        shared_ptr<TLSContext>          _context;
        string                          _hostname;
        mbedtls_ssl_context             _ssl;
        optional<Future<void>>          _sending;           // stream write started by onSend
        optional<Future<ConstBytes>>    _receiving;         // stream read started by onRecv
        ConstBytes                      _received;          // ciphertext not yet given to mbedTLS
        bool                            _streamEOF = false;
        bool                            _peerClosed = false;
        bool                            _connected = false; // underlying stream is open
        bool                            _secure = false;    // handshake completed
    };


#pragma mark - TLS SOCKET:


    TLSSocket::TLSSocket(std::unique_ptr<IStream> stream,
                         shared_ptr<TLSContext> context,
                         string const& hostname)
    :_impl(make_unique<Impl>(std::move(stream), std::move(context), hostname))
    ,_inputBuf(make_unique<Buffer>())
    { }

    TLSSocket::~TLSSocket() = default;

    bool TLSSocket::isOpen() const          {return _impl->isOpen();}


    Future<void> TLSSocket::open() {
        NotReentrant nr(_busy);
        AWAIT _impl->handshake();
        RETURN noerror;
    }


    Future<ConstBytes> TLSSocket::readNoCopy(size_t maxLen) {
        NotReentrant nr(_busy);
        if (_inputBuf->empty()) {
            size_t n = AWAIT _impl->read(_inputBuf->data, _inputBuf->kCapacity);
            _inputBuf->size = uint32_t(n);
            _inputBuf->used = 0;
        }
        RETURN _inputBuf->read(maxLen);
    }


    Future<void> TLSSocket::write(ConstBytes data) {
        NotReentrant nr(_busy);
        AWAIT _impl->write(data);
        RETURN noerror;
    }


    Future<void> TLSSocket::close() {
        NotReentrant nr(_busy);
        AWAIT _impl->close();
        RETURN noerror;
    }

}
