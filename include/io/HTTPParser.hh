//
// HTTPParser.hh
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
#include "Error.hh"
#include "util/Bytes.hh"

#include <memory>
#include <unordered_map>

struct llhttp_settings_s;
struct llhttp__internal_s;

namespace pubip::io::http {

    /// HTTP response status codes. As an ErrorDomain, a Status is an error when a request
    /// returns a non-success status.
    enum class Status : errorcode_t {
        Unknown = 0,
        OK = 200,
        MovedPermanently = 301,
        Found = 302,
        BadRequest = 400,
        Forbidden = 403,
        NotFound = 404,
        TooManyRequests = 429,
        ServerError = 500,
        BadGateway = 502,
        ServiceUnavailable = 503,
    };

    /// True for 2xx codes.
    inline bool IsSuccess(Status s)     {return errorcode_t(s) >= 200 && errorcode_t(s) < 300;}


    /// Errors in HTTP requests and responses, other than status codes.
    enum class HTTPError : errorcode_t {
        InvalidURI = 1,         // URI is unparseable, or its scheme isn't http or https
        ParseError,             // Response is not valid HTTP
        BodyTooLarge,           // Response body exceeds the configured limit
    };


    /// A map of HTTP header names->values. Inherits from `unordered_map`.
    class Headers : public std::unordered_map<string,string> {
    public:
        using unordered_map::unordered_map;

        /// True if the header name exists. Name lookup is case-insensitive.
        bool contains(string const& name) const {
            return find(canonicalName(name)) != end();
        }

        /// Returns the value of a header. Name lookup is case-insensitive.
        string get(string const& name) const {
            auto i = find(canonicalName(name));
            return (i != end()) ? i->second : "";
        }

        /// Sets a header, replacing any prior value. The name is canonicalized.
        void set(string const& name, string const& value) {
            (*this)[canonicalName(name)] = value;
        }

        /// Sets a header, appending to any prior value (with a comma as a delimiter.)
        /// The name is canonicalized.
        void add(string const& name, string const& value) {
            if (auto [i, added] = insert({canonicalName(name), value}); !added) {
                i->second += ", ";
                i->second += value;
            }
        }

        /// Title-capitalizes a header name, e.g. `conTent-TYPe` -> `Content-Type`.
        static string canonicalName(string name);
    };


    /** Parses an HTTP response that's fed to it in chunks, using llhttp.
        The body is accumulated in memory. */
    class Parser {
    public:
        Parser();
        ~Parser();

        /// Feeds data to the parser; an empty buffer signals EOF.
        /// Returns true once the status and headers are available.
        /// Throws `HTTPError::ParseError` if the data isn't valid HTTP.
        bool parseData(ConstBytes);

        /// True once the status and headers have been parsed.
        bool headersComplete() const    {return _headersComplete;}

        /// True once the entire response has been parsed.
        bool complete() const           {return _messageComplete;}

        /// The body data received so far.
        string const& body() const      {return _body;}

        /// Moves the body out of the parser.
        string takeBody()               {return std::move(_body);}

        /// The response status code; `Unknown` until the headers are complete.
        Status status = Status::Unknown;

        /// The response status message.
        string statusMessage;

        /// All the headers.
        Headers headers;

    private:
        Parser(Parser const&) = delete;

        std::unique_ptr<llhttp_settings_s>  _settings;
        std::unique_ptr<llhttp__internal_s> _parser;
        string                              _curHeaderName;
        string                              _curHeaderValue;
        string                              _body;
        bool                                _headersComplete = false;
        bool                                _messageComplete = false;
    };

}

namespace pubip {
    template <> struct ErrorDomainInfo<io::http::Status> {
        static constexpr string_view name = "HTTP";
        static constexpr bool strategy = true;
        static string description(errorcode_t);
    };

    template <> struct ErrorDomainInfo<io::http::HTTPError> {
        static constexpr string_view name = "HTTPError";
        static constexpr bool strategy = true;
        static string description(errorcode_t);
    };
}
