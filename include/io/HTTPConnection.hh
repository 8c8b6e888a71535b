//
// HTTPConnection.hh
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
#include "io/HTTPParser.hh"
#include "io/IStream.hh"
#include "io/URL.hh"

#include <memory>

namespace pubip::io::http {

    /** A complete HTTP response. */
    struct Response {
        Status  status = Status::Unknown;
        string  statusMessage;
        Headers headers;
        string  body;
    };


    /** An HTTP/1.1 client connection over a stream, that sends a single GET request
        with `Connection: close` and reads the entire response. */
    class Connection {
    public:
        /// @param stream  A TCP or TLS stream to the server; opened by `get` if necessary.
        /// @param url  The URL to request.
        Connection(std::unique_ptr<IStream> stream, URL url);
        ~Connection();

        /// Sets the maximum body size; a larger response fails with `HTTPError::BodyTooLarge`.
        void setMaxBodySize(size_t max)                     {_maxBodySize = max;}

        /// Adds a request header. (`Host` and `Connection` are added automatically.)
        void setHeader(string const& name, string const& value) {_headers.set(name, value);}

        /// Sends the request and reads the response.
        /// Any status code is returned as a successful Response; only I/O and protocol
        /// failures are errors.
        ASYNC<Response> get();

        /// The request line and headers, as they'll be sent.
        string requestText() const;

        /// Closes the stream.
        ASYNC<void> close();

    private:
        std::unique_ptr<IStream>    _stream;
        URL                         _url;
        Headers                     _headers;
        size_t                      _maxBodySize = SIZE_MAX;
        bool                        _sent = false;
    };

}
