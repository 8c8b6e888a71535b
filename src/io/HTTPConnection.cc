//
// HTTPConnection.cc
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

#include "io/HTTPConnection.hh"
#include "util/Logging.hh"

#include <charconv>
#include <sstream>

namespace pubip::io::http {
    using namespace std;


    Connection::Connection(std::unique_ptr<IStream> stream, URL url)
    :_stream(std::move(stream))
    ,_url(std::move(url))
    {
        precondition(_stream);
    }


    Connection::~Connection() = default;


    string Connection::requestText() const {
        stringstream out;
        out << "GET " << _url.pathAndQuery() << " HTTP/1.1\r\n";
        out << "Host: ";
        if (_url.hostname.find(':') != string::npos)
            out << '[' << _url.hostname << ']';
        else
            out << _url.hostname;
        if (_url.port != 0)
            out << ':' << _url.port;
        out << "\r\n";
        for (auto &h : _headers)
            out << h.first << ": " << h.second << "\r\n";
        out << "Connection: close\r\n\r\n";
        return out.str();
    }


    Future<Response> Connection::get() {
        if (_sent)
            RETURN Error(PubIPError::LogicError, "Connection can only send one request");
        _sent = true;

        if (!_stream->isOpen())
            AWAIT _stream->open();
        LNet->debug("GET {}", _url.reencoded());
        AWAIT _stream->write(requestText());

        Parser parser;
        bool checkedLength = false;
        while (!parser.complete()) {
            ConstBytes data = AWAIT _stream->readNoCopy();
            parser.parseData(data);
            if (parser.headersComplete() && !checkedLength) {
                // Fail early if the server announces a body that's too large:
                checkedLength = true;
                string len = parser.headers.get("Content-Length");
                size_t n = 0;
                auto [ptr, ec] = from_chars(len.data(), len.data() + len.size(), n);
                if (ec == errc{} && n > _maxBodySize)
                    RETURN HTTPError::BodyTooLarge;
            }
            if (parser.body().size() > _maxBodySize)
                RETURN HTTPError::BodyTooLarge;
            if (data.size() == 0)
                break;  // EOF
        }
        if (!parser.complete())
            RETURN Error(HTTPError::ParseError, "Connection closed before end of response");

        LNet->debug("GET {} -> {} {}, {}-byte body", _url.reencoded(), int(parser.status),
                    parser.statusMessage, parser.body().size());
        RETURN Response{parser.status, parser.statusMessage, std::move(parser.headers),
                        parser.takeBody()};
    }


    Future<void> Connection::close() {
        return _stream->close();
    }

}
