//
// HTTPResolver.hh
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
#include "io/HTTPConnection.hh"
#include "io/URL.hh"
#include "Future.hh"
#include "Resolver.hh"

#include <memory>
#include <optional>

namespace pubip::io::mbed {
    class TLSContext;
}

namespace pubip::http {

    using Status = io::http::Status;
    using HTTPError = io::http::HTTPError;


    /// How the address is extracted from a response body.
    enum class ExtractMethod : uint8_t {
        PlainText,              ///< The whole (trimmed) body is the address
        StripDoubleQuotes,      ///< The body is the address in double quotes
        ExtractJsonIpField,     ///< The body is JSON with an `"ip"` string property
    };

    string_view ExtractMethodName(ExtractMethod);

    /// Extracts an address from a response body.
    /// Invalid UTF-8, or text that isn't an IP address, is `ResolveError::NoAddress`.
    Result<IPAddress> ExtractAddress(string_view body, ExtractMethod);

    /// Interprets a complete response: a non-2xx status is returned as the `Status` error,
    /// an unparseable one as `HTTPError::ParseError`, otherwise the body is extracted.
    Result<IPAddress> AddressFromResponse(io::http::Response const&, ExtractMethod);


    /** HTTP client settings shared by HTTP resolvers: a TLS context and request limits.
        Create one per session and pass it to each resolver. */
    class Client {
    public:
        struct Options {
            double  timeoutSecs = 10.0;             ///< Limit on each connect, read and write
            size_t  maxBodySize = 64 * 1024;        ///< Longer responses fail
            string  userAgent   = "PubIP/1.0";
        };

        Client();
        explicit Client(Options);
        Client(Options, std::shared_ptr<io::mbed::TLSContext>);

        Options const& options() const              {return _options;}

        /// Sends a GET request for `url` to the server at `address`, using TLS if the URL
        /// scheme is "https", and returns the response. A timeout fails with
        /// `UVError(UV_ETIMEDOUT)`.
        ASYNC<io::http::Response> get(io::URL url, SocketAddress address) const;

    private:
        Options                                 _options;
        std::shared_ptr<io::mbed::TLSContext>   _tlsContext;
    };

    using ClientRef = std::shared_ptr<const Client>;


    /** How an address was obtained from an HTTP(S) service. */
    class Details final : public pubip::Details {
    public:
        static constexpr DetailsKind Kind = DetailsKind::HTTP;

        Details(string uri, SocketAddress server, ExtractMethod method)
        :_uri(std::move(uri)), _server(server), _method(method) { }

        DetailsKind kind() const override           {return Kind;}
        string description() const override;

        string const& uri() const                   {return _uri;}
        /// The address of the server that answered.
        SocketAddress const& server() const         {return _server;}
        ExtractMethod method() const                {return _method;}

    private:
        string          _uri;
        SocketAddress   _server;
        ExtractMethod   _method;
    };


    /** Requests a URL from one specific server address. Its sequence has exactly one item, or
        none if the address doesn't match the requested Version. */
    class HTTPEndpointResolver final : public Resolver {
    public:
        HTTPEndpointResolver(io::URL url, SocketAddress server, ExtractMethod, ClientRef);

        Resolutions resolve(Version) const override;
        string name() const override;

    private:
        io::URL         _url;
        SocketAddress   _server;
        ExtractMethod   _method;
        ClientRef       _client;
    };


    /** Looks up the public address by fetching a URL from a service that returns the
        client's address. Every address of the host (of the requested Version) is tried in
        turn until one succeeds. */
    class HTTPResolver final : public Resolver {
    public:
        HTTPResolver(string uri, ExtractMethod, ClientRef);

        /// Yields a single `HTTPError::InvalidURI` if the URI is invalid or isn't http or
        /// https. Otherwise looks up the host when first pulled, yielding a `UVError` if
        /// that fails, then yields one item per address.
        Resolutions resolve(Version) const override;
        string name() const override;

        string const& uri() const                   {return _uri;}
        ExtractMethod method() const                {return _method;}

    private:
        string                  _uri;
        std::optional<io::URL>  _url;
        ExtractMethod           _method;
        ClientRef               _client;
    };

}
