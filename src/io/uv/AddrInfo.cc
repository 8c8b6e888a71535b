//
// AddrInfo.cc
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

#include "io/AddrInfo.hh"
#include "UVInternal.hh"

#include <algorithm>

namespace pubip::io {
    using namespace std;
    using namespace pubip::io::uv;


    namespace {
        // A uv_getaddrinfo request. It deletes itself on completion, so the coroutine awaiting
        // it can be destroyed (cancelled) while the lookup is still in progress.
        class getaddrinfo_request : public uv_getaddrinfo_s {
        public:
            static void callback(uv_getaddrinfo_s *req, int status, struct addrinfo *res) noexcept {
                auto self = static_cast<getaddrinfo_request*>(req);
                if (status < 0) {
                    LNet->debug("getaddrinfo failed: {}", uv_strerror(status));
                    self->provider->setResult(Error(UVError(status)));
                } else {
                    vector<IPAddress> addrs;
                    for (auto i = res; i; i = i->ai_next) {
                        if (!i->ai_addr)
                            continue;
                        if (auto addr = IPAddress::fromSockAddr(*i->ai_addr)) {
                            if (ranges::find(addrs, *addr) == addrs.end())
                                addrs.push_back(*addr);
                        }
                    }
                    uv_freeaddrinfo(res);
                    self->provider->setResult(std::move(addrs));
                }
                delete self;
            }

            FutureProvider<vector<IPAddress>> provider = Future<vector<IPAddress>>::provider();
        };
    }


    Future<AddrInfo> AddrInfo::lookup(string hostName, uint16_t port) {
        struct addrinfo hints = {
            .ai_family = AF_UNSPEC,
            .ai_socktype = SOCK_STREAM,
            .ai_protocol = IPPROTO_TCP,
        };

        const char* service = nullptr;
        char portStr[10];
        if (port != 0) {
            snprintf(portStr, 10, "%u", port);
            service = portStr;
        }

        LNet->debug("Looking up {}", hostName);
        auto req = new getaddrinfo_request;
        Future<vector<IPAddress>> result(req->provider);
        if (int err = uv_getaddrinfo(curLoop(), req, req->callback,
                                     hostName.c_str(), service, &hints); err < 0) {
            delete req;
            check(err, "looking up hostname");
        }
        vector<IPAddress> addrs = AWAIT result;

        if (addrs.empty())
            RETURN UVError(UV_EAI_NONAME);
        LNet->debug("{} has {} address(es), first {}", hostName, addrs.size(), addrs[0].toString());
        RETURN AddrInfo(std::move(addrs), port);
    }


    vector<IPAddress> AddrInfo::addresses(Version v) const {
        vector<IPAddress> result;
        for (auto& addr : _addresses) {
            if (Matches(v, addr))
                result.push_back(addr);
        }
        return result;
    }


    optional<IPAddress> AddrInfo::primaryAddress(Version v) const {
        for (auto& addr : _addresses) {
            if (Matches(v, addr))
                return addr;
        }
        return nullopt;
    }

}
