//
// HTTPParser.cc
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

#include "io/HTTPParser.hh"
#include "Internal.hh"
#include "StringUtils.hh"
#include "util/Logging.hh"

#include <llhttp.h>

namespace pubip {
    using namespace std;
    using namespace pubip::io::http;

    string ErrorDomainInfo<Status>::description(errorcode_t code) {
        static constexpr NameEntry names[] = {
            {200, "OK"},
            {301, "Moved Permanently"},
            {302, "Found"},
            {400, "Bad Request"},
            {403, "Forbidden"},
            {404, "Not Found"},
            {429, "Too Many Requests"},
            {500, "Internal Server Error"},
            {502, "Bad Gateway"},
            {503, "Service Unavailable"},
        };
        if (string name = NameEntry::lookup(code, names); !name.empty())
            return to_string(code) + " " + name;
        return "HTTP status " + to_string(code);
    }

    string ErrorDomainInfo<HTTPError>::description(errorcode_t code) {
        static constexpr NameEntry names[] = {
            {errorcode_t(HTTPError::InvalidURI),   "invalid or non-HTTP URI"},
            {errorcode_t(HTTPError::ParseError),   "invalid HTTP response"},
            {errorcode_t(HTTPError::BodyTooLarge), "HTTP response body is too large"},
        };
        return NameEntry::lookup(code, names);
    }
}


namespace pubip::io::http {
    using namespace std;


    string Headers::canonicalName(string name) {
        bool inWord = false;
        for (char &c : name) {
            c = inWord ? toLower(c) : toUpper(c);
            inWord = isAlphanumeric(c);
        }
        return name;
    }


#define SELF ((Parser*)parser->data)

    Parser::Parser()
    :_settings(make_unique<llhttp_settings_s>())
    ,_parser(make_unique<llhttp_t>())
    {
        llhttp_settings_init(_settings.get());

        _settings->on_status = [](llhttp_t* parser, const char *data, size_t length) -> int {
            SELF->statusMessage.append(data, length);
            return 0;
        };
        _settings->on_header_field = [](llhttp_t* parser, const char *data, size_t length) -> int {
            SELF->_curHeaderName.append(data, length);
            return 0;
        };
        _settings->on_header_value = [](llhttp_t* parser, const char *data, size_t length) -> int {
            SELF->_curHeaderValue.append(data, length);
            return 0;
        };
        _settings->on_header_value_complete = [](llhttp_t* parser) -> int {
            auto self = SELF;
            self->headers.add(self->_curHeaderName, self->_curHeaderValue);
            self->_curHeaderName.clear();
            self->_curHeaderValue.clear();
            return 0;
        };
        _settings->on_headers_complete = [](llhttp_t* parser) -> int {
            SELF->_headersComplete = true;
            SELF->status = Status{llhttp_get_status_code(parser)};
            return 0;
        };
        _settings->on_body = [](llhttp_t* parser, const char *data, size_t length) -> int {
            SELF->_body.append(data, length);
            return 0;
        };
        _settings->on_message_complete = [](llhttp_t* parser) -> int {
            SELF->_messageComplete = true;
            return 0;
        };

        llhttp_init(_parser.get(), HTTP_RESPONSE, _settings.get());
        _parser->data = this;
    }


    Parser::~Parser() = default;


    bool Parser::parseData(ConstBytes data) {
        llhttp_errno_t err;
        if (data.size() > 0)
            err = llhttp_execute(_parser.get(), (const char*)data.data(), data.size());
        else
            err = llhttp_finish(_parser.get());

        if (err != HPE_OK) {
            const char* reason = llhttp_get_error_reason(_parser.get());
            LNet->debug("HTTP parse error: {} ({})", llhttp_errno_name(err), reason ? reason : "");
            Error::raise(HTTPError::ParseError, reason ? reason : "");
        }
        return _headersComplete;
    }

}
