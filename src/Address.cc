//
// Address.cc
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

#include "Address.hh"

#include <cstring>
#include <ostream>

#include <uv.h>

namespace pubip {
    using namespace std;


    string_view VersionName(Version v) noexcept {
        switch (v) {
            case Version::V4:   return "IPv4";
            case Version::V6:   return "IPv6";
            default:            return "Any";
        }
    }


    IPAddress::IPAddress(Version v, ConstBytes bytes) noexcept
    :_version(v)
    {
        ::memcpy(_bytes.data(), bytes.data(), std::min(bytes.size(), _bytes.size()));
    }


    optional<IPAddress> IPAddress::parse(string_view str) noexcept {
        // uv_inet_pton needs a C string, and a textual address is never long:
        char buf[INET6_ADDRSTRLEN + 16];
        if (str.empty() || str.size() >= sizeof(buf))
            return nullopt;
        ::memcpy(buf, str.data(), str.size());
        buf[str.size()] = '\0';

        uint8_t bytes[16];
        if (str.find(':') == string_view::npos) {
            if (uv_inet_pton(AF_INET, buf, bytes) == 0)
                return IPAddress(Version::V4, ConstBytes(bytes, 4));
        } else {
            if (uv_inet_pton(AF_INET6, buf, bytes) == 0)
                return IPAddress(Version::V6, ConstBytes(bytes, 16));
        }
        return nullopt;
    }


    optional<IPAddress> IPAddress::fromBytes(ConstBytes bytes) noexcept {
        switch (bytes.size()) {
            case 4:     return IPAddress(Version::V4, bytes);
            case 16:    return IPAddress(Version::V6, bytes);
            default:    return nullopt;
        }
    }


    optional<IPAddress> IPAddress::fromSockAddr(sockaddr const& addr) noexcept {
        switch (addr.sa_family) {
            case AF_INET: {
                auto& in = (sockaddr_in const&)addr;
                return IPAddress(Version::V4, ConstBytes(&in.sin_addr, 4));
            }
            case AF_INET6: {
                auto& in6 = (sockaddr_in6 const&)addr;
                return IPAddress(Version::V6, ConstBytes(&in6.sin6_addr, 16));
            }
            default:
                return nullopt;
        }
    }


    string IPAddress::toString() const {
        char buf[INET6_ADDRSTRLEN];
        int af = isIPv4() ? AF_INET : AF_INET6;
        if (uv_inet_ntop(af, _bytes.data(), buf, sizeof(buf)) != 0)
            return "";
        return buf;
    }


    std::ostream& operator<< (std::ostream& out, IPAddress const& addr) {
        return out << addr.toString();
    }


    bool Matches(Version v, IPAddress const& addr) noexcept {
        return v == Version::Any || v == addr.version();
    }


    size_t SocketAddress::toSockAddr(sockaddr_storage& storage) const noexcept {
        ::memset(&storage, 0, sizeof(storage));
        if (address.isIPv4()) {
            auto& in = (sockaddr_in&)storage;
            in.sin_family = AF_INET;
            in.sin_port = htons(port);
            ::memcpy(&in.sin_addr, address.bytes().data(), 4);
            return sizeof(sockaddr_in);
        } else {
            auto& in6 = (sockaddr_in6&)storage;
            in6.sin6_family = AF_INET6;
            in6.sin6_port = htons(port);
            ::memcpy(&in6.sin6_addr, address.bytes().data(), 16);
            return sizeof(sockaddr_in6);
        }
    }


    string SocketAddress::toString() const {
        if (address.isIPv4())
            return address.toString() + ":" + std::to_string(port);
        else
            return "[" + address.toString() + "]:" + std::to_string(port);
    }

}
