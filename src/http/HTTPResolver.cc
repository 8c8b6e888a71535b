//
// HTTPResolver.cc
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

#include "http/HTTPResolver.hh"
#include "io/AddrInfo.hh"
#include "io/TCPSocket.hh"
#include "io/mbedtls/TLSSocket.hh"
#include "io/uv/UVBase.hh"
#include "util/Logging.hh"
#include "StringUtils.hh"

#include <regex>
#include <uv.h>

namespace pubip::http {
    using namespace std;
    using namespace pubip::io;


    string_view ExtractMethodName(ExtractMethod m) {
        switch (m) {
            case ExtractMethod::PlainText:           return "plain text";
            case ExtractMethod::StripDoubleQuotes:   return "quoted text";
            case ExtractMethod::ExtractJsonIpField:  return "JSON \"ip\" field";
            default:                                 return "?";
        }
    }


    Result<IPAddress> ExtractAddress(string_view body, ExtractMethod method) {
        if (!isValidUTF8(body))
            return ResolveError::NoAddress;
        string_view text = trim(body);
        switch (method) {
            case ExtractMethod::PlainText:
                break;
            case ExtractMethod::StripDoubleQuotes:
                while (text.starts_with('"'))
                    text.remove_prefix(1);
                while (text.ends_with('"'))
                    text.remove_suffix(1);
                text = trim(text);
                break;
            case ExtractMethod::ExtractJsonIpField: {
                static const regex kIPField(R"("ip"\s*:\s*"(.+?)")", regex::icase);
                cmatch m;
                if (!regex_search(text.data(), text.data() + text.size(), m, kIPField))
                    return ResolveError::NoAddress;
                text = trim(string_view(m[1].first, m[1].length()));
                break;
            }
        }
        optional<IPAddress> addr = IPAddress::parse(text);
        if (!addr)
            return ResolveError::NoAddress;
        return *addr;
    }


    Result<IPAddress> AddressFromResponse(io::http::Response const& response, ExtractMethod method) {
        if (response.status == Status::Unknown)
            return HTTPError::ParseError;
        if (!IsSuccess(response.status))
            return response.status;
        return ExtractAddress(response.body, method);
    }


#pragma mark - CLIENT:


    Client::Client()
    :Client(Options{})
    { }

    Client::Client(Options options)
    :Client(std::move(options), mbed::NewClientContext())
    { }

    Client::Client(Options options, shared_ptr<mbed::TLSContext> tlsContext)
    :_options(std::move(options))
    ,_tlsContext(std::move(tlsContext))
    { }


    Future<io::http::Response> Client::get(URL url, SocketAddress address) const {
        InitLogging();
        auto tcp = make_unique<TCPSocket>(address);
        tcp->setTimeout(_options.timeoutSecs);
        unique_ptr<IStream> stream = std::move(tcp);
        if (equalIgnoringCase(url.scheme, "https"))
            stream = make_unique<mbed::TLSSocket>(std::move(stream), _tlsContext, url.hostname);

        io::http::Connection connection(std::move(stream), url);
        connection.setMaxBodySize(_options.maxBodySize);
        connection.setHeader("User-Agent", _options.userAgent);
        connection.setHeader("Accept", "*/*");
        LNet->debug("GET {} from {}", url.reencoded(), address.toString());

        Result<io::http::Response> response = AWAIT NoThrow(connection.get());
        if (Result<void> closed = AWAIT NoThrow(connection.close()); closed.isError())
            LNet->debug("Error closing connection to {}: {}",
                        address.toString(), closed.error().description());
        if (response.error() == PubIPError::Timeout)
            RETURN uv::UVError(UV_ETIMEDOUT);
        else if (!response.ok())
            RETURN response.error();
        LNet->debug("{} responded {} {}", address.toString(),
                    int(response->status), response->statusMessage);
        RETURN std::move(response).value();
    }


#pragma mark - ENDPOINT RESOLVER:


    string Details::description() const {
        return fmt::format("HTTP {} via {} ({})", _uri, _server.toString(), ExtractMethodName(_method));
    }


    HTTPEndpointResolver::HTTPEndpointResolver(URL url, SocketAddress server, ExtractMethod method,
                                               ClientRef client)
    :_url(std::move(url))
    ,_server(server)
    ,_method(method)
    ,_client(std::move(client))
    {
        precondition(_client);
    }


    string HTTPEndpointResolver::name() const {
        return fmt::format("HTTP {} @{}", _url.reencoded(), _server.toString());
    }


    static Future<Resolution> queryEndpoint(URL url, SocketAddress server, ExtractMethod method,
                                            ClientRef client)
    {
        io::http::Response response = AWAIT client->get(url, server);
        Result<IPAddress> addr = AddressFromResponse(response, method);
        if (!addr.ok()) {
            LNet->debug("No address in {} response from {}", int(response.status), server.toString());
            RETURN addr.error();
        }
        RETURN Resolution{*addr, make_unique<Details>(url.reencoded(), server, method)};
    }


    static Resolutions yieldQuery(URL url, SocketAddress server, ExtractMethod method,
                                  ClientRef client)
    {
        Result<Resolution> result = AWAIT NoThrow(queryEndpoint(std::move(url), server, method,
                                                                std::move(client)));
        YIELD std::move(result);
    }


    Resolutions HTTPEndpointResolver::resolve(Version v) const {
        if (Matches(v, _server.address))
            return yieldQuery(_url, _server, _method, _client);
        else
            return Fallback({}, v);
    }


#pragma mark - HTTP RESOLVER:


    static optional<URL> parseURI(string_view uri) {
        optional<URL> url = URL::tryParse(uri);
        if (url) {
            bool web = equalIgnoringCase(url->scheme, "http") || equalIgnoringCase(url->scheme, "https");
            if (!web || url->hostname.empty())
                url = nullopt;
        }
        return url;
    }


    HTTPResolver::HTTPResolver(string uri, ExtractMethod method, ClientRef client)
    :_uri(std::move(uri))
    ,_url(parseURI(_uri))
    ,_method(method)
    ,_client(std::move(client))
    {
        precondition(_client);
    }


    string HTTPResolver::name() const {
        return "HTTP " + _uri;
    }


    static Resolutions invalidURI() {
        YIELD HTTPError::InvalidURI;
    }


    // Looks up the host, then tries each of its addresses.
    static Resolutions resolveHost(URL url, ExtractMethod method, ClientRef client, Version v) {
        Result<AddrInfo> info = AWAIT NoThrow(AddrInfo::lookup(url.hostname, url.effectivePort()));
        if (!info.ok()) {
            LNet->debug("Couldn't look up {}: {}", url.hostname, info.error().description());
            YIELD info.error();
            RETURN;
        }

        vector<ResolverRef> endpoints;
        for (IPAddress const& addr : info->addresses(v))
            endpoints.push_back(make_shared<HTTPEndpointResolver>(
                                    url, SocketAddress{addr, url.effectivePort()}, method, client));
        if (endpoints.empty())
            LNet->debug("{} has no {} addresses", url.hostname, VersionName(v));

        Resolutions items = Fallback(std::move(endpoints), v);
        while (true) {
            Result<Resolution> item = AWAIT items;
            if (item.empty())
                break;
            YIELD std::move(item);
        }
    }


    Resolutions HTTPResolver::resolve(Version v) const {
        InitLogging();
        if (!_url) {
            LResolve->warn("Invalid HTTP resolver URI \"{}\"", _uri);
            return invalidURI();
        }
        return resolveHost(*_url, _method, _client, v);
    }

}
