//
// AddrInfo.hh
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
#include "Address.hh"
#include "Future.hh"

#include <vector>

namespace pubip::io {

    /** An asynchronous hostname lookup, using the system resolver (getaddrinfo). */
    class AddrInfo {
    public:
        /// Looks up the given hostname, returning an AddrInfo or an error.
        /// A lookup that finds no addresses fails with `UVError(UV_EAI_NONAME)`.
        staticASYNC<AddrInfo> lookup(string hostname, uint16_t port =0);

        /// All the addresses found, in the order the system resolver returned them,
        /// without duplicates.
        std::vector<IPAddress> const& addresses() const     {return _addresses;}

        /// The addresses that match a Version.
        std::vector<IPAddress> addresses(Version) const;

        /// The first address that matches a Version, or nullopt.
        std::optional<IPAddress> primaryAddress(Version = Version::Any) const;

        /// The port that was passed to `lookup`.
        uint16_t port() const                               {return _port;}

    private:
        AddrInfo(std::vector<IPAddress> addrs, uint16_t port)
        :_addresses(std::move(addrs)), _port(port) { }

        std::vector<IPAddress>  _addresses;
        uint16_t                _port = 0;
    };

}
