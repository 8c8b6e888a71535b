//
// DNSResolver.hh
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
#include "dns/DNSMessage.hh"
#include "Resolver.hh"

#include <vector>

namespace pubip::dns {

    /** How an address was obtained from DNS. */
    class Details final : public pubip::Details {
    public:
        static constexpr DetailsKind Kind = DetailsKind::DNS;

        Details(string name, SocketAddress server, QueryMethod method)
        :_name(std::move(name)), _server(server), _method(method) { }

        DetailsKind kind() const override           {return Kind;}
        string description() const override;

        /// The name that was looked up.
        string const& name() const                  {return _name;}
        /// The DNS server that answered.
        SocketAddress const& server() const         {return _server;}
        QueryMethod method() const                  {return _method;}

    private:
        string          _name;
        SocketAddress   _server;
        QueryMethod     _method;
    };


    /// Per-query settings.
    struct Options {
        double timeoutSecs = 5.0;       ///< How long to wait for each server's reply
    };


    /** Queries a single DNS server over UDP. Its sequence has exactly one item, or none if the
        server's address family doesn't match the requested Version. */
    class DNSServerResolver final : public Resolver {
    public:
        DNSServerResolver(string name, SocketAddress server, QueryMethod, Options = {});

        Resolutions resolve(Version) const override;
        string name() const override;

        SocketAddress const& server() const         {return _server;}

    private:
        string          _name;
        SocketAddress   _server;
        QueryMethod     _method;
        Options         _options;
    };


    /** Looks up the public address by asking DNS servers that report the client's own address,
        trying each server in order until one answers. */
    class DNSResolver final : public Resolver {
    public:
        /// @param name  The special name to look up, e.g. "myip.opendns.com".
        /// @param servers  Addresses of the DNS servers to ask, in order.
        /// @param port  The servers' UDP port, normally 53.
        /// @param method  The record type to ask for, and how to interpret it.
        DNSResolver(string name, std::vector<IPAddress> servers, uint16_t port,
                    QueryMethod method, Options = {});

        /// Yields one item per server of the requested Version, or a single
        /// `DNSError::InvalidName` if the name isn't valid.
        Resolutions resolve(Version) const override;
        string name() const override;

        /// The per-server resolvers of a Version, in order.
        std::vector<ResolverRef> serverResolvers(Version) const;

        string const& queryName() const             {return _name;}
        std::vector<IPAddress> const& servers() const {return _servers;}
        uint16_t port() const                       {return _port;}
        QueryMethod method() const                  {return _method;}

    private:
        string                  _name;
        std::vector<IPAddress>  _servers;
        uint16_t                _port;
        QueryMethod             _method;
        Options                 _options;
    };

}
