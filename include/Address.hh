//
// Address.hh
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
#include "util/Base.hh"
#include "util/Bytes.hh"

#include <array>
#include <optional>

struct sockaddr;
struct sockaddr_storage;

namespace pubip {

    /// Which IP address family a lookup asks for.
    enum class Version : uint8_t {
        V4,         ///< IPv4 only
        V6,         ///< IPv6 only
        Any,        ///< Either family
    };

    /// "IPv4", "IPv6" or "Any".
    string_view VersionName(Version) noexcept;


    /** An IPv4 or IPv6 address. */
    class IPAddress {
    public:
        /// Parses the standard textual form ("203.0.113.5", "2001:db8::1").
        /// Returns nullopt if the string isn't a valid address of either family.
        static std::optional<IPAddress> parse(string_view) noexcept;

        /// Makes an address from raw network-order bytes: 4 for IPv4, 16 for IPv6.
        /// Returns nullopt if the size is neither.
        static std::optional<IPAddress> fromBytes(ConstBytes) noexcept;

        /// Makes an address from a `sockaddr_in` or `sockaddr_in6`. Other families return nullopt.
        static std::optional<IPAddress> fromSockAddr(sockaddr const&) noexcept;

        bool isIPv4() const noexcept Pure           {return _version == Version::V4;}
        bool isIPv6() const noexcept Pure           {return _version == Version::V6;}

        /// The address family: `V4` or `V6`, never `Any`.
        Version version() const noexcept Pure       {return _version;}

        /// The address in network byte order: 4 or 16 bytes.
        ConstBytes bytes() const noexcept           {return {_bytes.data(), isIPv4() ? 4u : 16u};}

        /// The standard textual form.
        string toString() const;

        friend bool operator== (IPAddress const&, IPAddress const&) = default;

    private:
        IPAddress(Version v, ConstBytes bytes) noexcept;

        std::array<uint8_t,16>  _bytes {};
        Version                 _version;
    };

    std::ostream& operator<< (std::ostream&, IPAddress const&);


    /// True if the address satisfies the requested Version:
    /// always for `Any`, otherwise iff the families are equal.
    bool Matches(Version, IPAddress const&) noexcept Pure;


    /** An IP address plus port number. */
    struct SocketAddress {
        IPAddress   address;
        uint16_t    port = 0;

        /// Fills in a `sockaddr_in` or `sockaddr_in6` inside the storage, and returns its size.
        size_t toSockAddr(sockaddr_storage&) const noexcept;

        /// "203.0.113.5:53", or "[2001:db8::1]:53" for IPv6.
        string toString() const;

        friend bool operator== (SocketAddress const&, SocketAddress const&) = default;
    };

}
