//
// DNSResolver.cc
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

#include "dns/DNSResolver.hh"
#include "io/UDPSocket.hh"
#include "io/uv/UVBase.hh"
#include "util/Logging.hh"
#include "StringUtils.hh"

#include <uv.h>

#include <chrono>

namespace pubip::dns {
    using namespace std;
    using namespace pubip::io;


    string Details::description() const {
        return fmt::format("DNS {} {} via {}", QueryMethodName(_method), _name, _server.toString());
    }


#pragma mark - SERVER RESOLVER:


    DNSServerResolver::DNSServerResolver(string name, SocketAddress server, QueryMethod method,
                                         Options options)
    :_name(std::move(name))
    ,_server(server)
    ,_method(method)
    ,_options(options)
    { }


    string DNSServerResolver::name() const {
        return fmt::format("DNS {} {} @{}", QueryMethodName(_method), _name, _server.toString());
    }


    // Sends one query and waits for the matching reply. Replies with the wrong ID or from the
    // wrong address are ignored, without extending the deadline.
    static Future<Resolution> queryServer(string name, SocketAddress server, QueryMethod method,
                                          Options options)
    {
        uint16_t id;
        Randomize(&id, sizeof(id));
        string query = EncodeQuery(name, RecordTypeFor(method), id);

        UDPSocket socket;
        socket.bind(server.address.version());
        LNet->debug("Querying {} for {} {} (id {})", server.toString(), QueryMethodName(method),
                    name, id);
        AWAIT socket.send(server, query);

        using clock = chrono::steady_clock;
        auto deadline = clock::now() + chrono::duration<double>(options.timeoutSecs);
        while (true) {
            double remaining = chrono::duration<double>(deadline - clock::now()).count();
            if (remaining <= 0)
                RETURN uv::UVError(UV_ETIMEDOUT);
            Result<UDPSocket::Datagram> dgram = AWAIT NoThrow(socket.receive(remaining));
            if (dgram.error() == PubIPError::Timeout)
                RETURN uv::UVError(UV_ETIMEDOUT);
            else if (!dgram.ok())
                RETURN dgram.error();

            LNet->trace("Received {} bytes from {}: {}", dgram->data.size(),
                        dgram->sender.toString(), hexString(ConstBytes(dgram->data)));
            if (dgram->sender != server) {
                LNet->debug("Ignoring datagram from {}", dgram->sender.toString());
                continue;
            }
            if (optional<uint16_t> replyID = PeekMessageID(ConstBytes(dgram->data)); replyID != id) {
                LNet->debug("Ignoring DNS message with id {}", replyID.value_or(0));
                continue;
            }
            Response response = DecodeResponse(ConstBytes(dgram->data));
            if (!response.isResponse) {
                LNet->debug("Ignoring DNS query with id {}", response.id);
                continue;
            }

            Result<IPAddress> addr = ExtractAddress(response, method);
            if (!addr.ok())
                RETURN addr.error();
            LNet->debug("{} answered {}", server.toString(), addr->toString());
            RETURN Resolution{*addr, make_unique<Details>(std::move(name), server, method)};
        }
    }


    static Resolutions yieldQuery(string name, SocketAddress server, QueryMethod method,
                                  Options options)
    {
        Result<Resolution> result = AWAIT NoThrow(queryServer(std::move(name), server, method,
                                                              options));
        YIELD std::move(result);
    }


    Resolutions DNSServerResolver::resolve(Version v) const {
        if (Matches(v, _server.address))
            return yieldQuery(_name, _server, _method, _options);
        else
            return Fallback({}, v);
    }


#pragma mark - DNS RESOLVER:


    DNSResolver::DNSResolver(string name, vector<IPAddress> servers, uint16_t port,
                             QueryMethod method, Options options)
    :_name(std::move(name))
    ,_servers(std::move(servers))
    ,_port(port)
    ,_method(method)
    ,_options(options)
    { }


    string DNSResolver::name() const {
        return fmt::format("DNS {} {}", QueryMethodName(_method), _name);
    }


    vector<ResolverRef> DNSResolver::serverResolvers(Version v) const {
        vector<ResolverRef> resolvers;
        for (IPAddress const& addr : _servers) {
            if (Matches(v, addr))
                resolvers.push_back(make_shared<DNSServerResolver>(
                                        _name, SocketAddress{addr, _port}, _method, _options));
        }
        return resolvers;
    }


    static Resolutions invalidName() {
        YIELD DNSError::InvalidName;
    }


    Resolutions DNSResolver::resolve(Version v) const {
        InitLogging();
        if (!IsValidName(_name)) {
            LResolve->warn("Invalid DNS name \"{}\"", _name);
            return invalidName();
        }
        return Fallback(serverResolvers(v), v);
    }

}
