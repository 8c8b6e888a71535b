//
// Providers.cc
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

#include "Providers.hh"

namespace pubip::dns {
    using namespace std;


    static vector<IPAddress> addresses(initializer_list<string_view> strs) {
        vector<IPAddress> addrs;
        for (string_view str : strs) {
            optional<IPAddress> addr = IPAddress::parse(str);
            postcondition(addr);
            addrs.push_back(*addr);
        }
        return addrs;
    }


    ResolverRef OpenDNS(Options options) {
        static constexpr string_view kName = "myip.opendns.com";
        return make_shared<ResolverList>(ResolverList{
            make_shared<DNSResolver>(string(kName),
                                     addresses({"208.67.222.222", "208.67.220.220",
                                                "208.67.222.220", "208.67.220.222"}),
                                     kDefaultPort, QueryMethod::A, options),
            make_shared<DNSResolver>(string(kName),
                                     addresses({"2620:0:ccc::2", "2620:0:ccd::2"}),
                                     kDefaultPort, QueryMethod::AAAA, options),
        });
    }


    ResolverRef Google(Options options) {
        static constexpr string_view kName = "o-o.myaddr.l.google.com";
        return make_shared<ResolverList>(ResolverList{
            make_shared<DNSResolver>(string(kName),
                                     addresses({"216.239.32.10", "216.239.34.10",
                                                "216.239.36.10", "216.239.38.10"}),
                                     kDefaultPort, QueryMethod::TXT, options),
            make_shared<DNSResolver>(string(kName),
                                     addresses({"2001:4860:4802:32::a", "2001:4860:4802:34::a",
                                                "2001:4860:4802:36::a", "2001:4860:4802:38::a"}),
                                     kDefaultPort, QueryMethod::TXT, options),
        });
    }


    ResolverRef All(Options options) {
        return make_shared<ResolverList>(ResolverList{OpenDNS(options), Google(options)});
    }

}


namespace pubip::http {
    using namespace std;

    ResolverRef All(ClientRef client) {
        return make_shared<ResolverList>(ResolverList{
            make_shared<HTTPResolver>("https://api64.ipify.org", ExtractMethod::PlainText, client),
            make_shared<HTTPResolver>("https://api.my-ip.io/ip", ExtractMethod::PlainText, client),
            make_shared<HTTPResolver>("https://api.myip.com", ExtractMethod::ExtractJsonIpField, client),
            make_shared<HTTPResolver>("https://api.seeip.org", ExtractMethod::PlainText, client),
        });
    }

}


namespace pubip {
    using namespace std;


    ResolverRef AllResolvers(http::ClientRef client) {
        return make_shared<ResolverList>(ResolverList{dns::All(), http::All(std::move(client))});
    }


    static Future<optional<IPAddress>> addrWithAllResolvers(Version v) {
        auto client = make_shared<http::Client>();
        RETURN AWAIT BestEffortAddress(AllResolvers(client), v);
    }


    Future<optional<IPAddress>> Addr()      {return addrWithAllResolvers(Version::Any);}
    Future<optional<IPAddress>> AddrV4()    {return addrWithAllResolvers(Version::V4);}
    Future<optional<IPAddress>> AddrV6()    {return addrWithAllResolvers(Version::V6);}

}
