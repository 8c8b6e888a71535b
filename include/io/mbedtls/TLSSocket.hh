//
// TLSSocket.hh
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
#include "io/IStream.hh"

#include <memory>

namespace pubip::io::mbed {
    class TLSContext;

    /// Errors reported by mbedTLS; the code is mbedTLS's (negative) status code.
    enum class MbedError : errorcode_t { };


    /// Creates a client-side TLS context that verifies servers against the system's trusted
    /// root certificates. A context can be shared by any number of sockets, but must outlive
    /// them.
    std::shared_ptr<TLSContext> NewClientContext();


    /*** A TLS client connection over another stream (usually a TCPSocket), using mbedTLS. */
    class TLSSocket : public IStream {
    public:
        /// @param stream  The underlying stream; it's opened by `open`.
        /// @param context  The TLS configuration.
        /// @param hostname  The server's hostname, for SNI and certificate verification.
        TLSSocket(std::unique_ptr<IStream> stream,
                  std::shared_ptr<TLSContext> context,
                  string const& hostname);
        ~TLSSocket();

        bool isOpen() const override;
        ASYNC<void> open() override;
        ASYNC<void> close() override;

        ASYNC<ConstBytes> readNoCopy(size_t maxLen = 65536) override;
        ASYNC<void> write(ConstBytes) override;
        using IStream::write;

    private:
        class Impl;
        std::unique_ptr<Impl>   _impl;
        BufferRef               _inputBuf;
        bool                    _busy = false;
    };

}

namespace pubip {
    template <> struct ErrorDomainInfo<io::mbed::MbedError> {
        static constexpr string_view name = "mbedTLS";
        static constexpr bool strategy = true;
        static string description(errorcode_t);
    };
}
