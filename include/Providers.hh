//
// Providers.hh
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
#include "dns/DNSResolver.hh"
#include "http/HTTPResolver.hh"
#include "Resolve.hh"

namespace pubip::dns {

    /// The standard DNS port.
    static constexpr uint16_t kDefaultPort = 53;

    /// OpenDNS: an `A` query for "myip.opendns.com" to its IPv4 servers, then an `AAAA` query
    /// to its IPv6 servers.
    ResolverRef OpenDNS(Options = {});

    /// Google: a `TXT` query for "o-o.myaddr.l.google.com" to its IPv4 servers, then to its
    /// IPv6 servers.
    ResolverRef Google(Options = {});

    /// OpenDNS, then Google.
    ResolverRef All(Options = {});

}


namespace pubip::http {

    /// All the built-in HTTP(S) services, in order: ipify, my-ip.io, myip.com, seeip.org.
    ResolverRef All(ClientRef);

}


namespace pubip {

    /// Every built-in resolver: all the DNS ones, then all the HTTP ones.
    ResolverRef AllResolvers(http::ClientRef);

    /// Finds the public address of either family, using every built-in resolver.
    ASYNC<std::optional<IPAddress>> Addr();

    /// Finds the public IPv4 address, using every built-in resolver.
    ASYNC<std::optional<IPAddress>> AddrV4();

    /// Finds the public IPv6 address, using every built-in resolver.
    ASYNC<std::optional<IPAddress>> AddrV6();

}
