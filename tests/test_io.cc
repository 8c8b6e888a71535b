//
// test_io.cc
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

#include "tests.hh"
#include "io/AddrInfo.hh"
#include "io/TCPSocket.hh"
#include "io/UDPSocket.hh"
#include "io/URL.hh"
#include "io/uv/UVBase.hh"
#include "StringUtils.hh"

#include <uv.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>


TEST_CASE("URLs", "[io]") {
    {
        io::URL url("http://example.com:8080/~jens?foo=bar#frag");
        CHECK(url.scheme == "http");
        CHECK(url.hostname == "example.com");
        CHECK(url.port == 8080);
        CHECK(url.effectivePort() == 8080);
        CHECK(url.path == "/~jens");
        CHECK(url.query == "foo=bar");
        CHECK(url.pathAndQuery() == "/~jens?foo=bar");
        CHECK(url.reencoded() == "http://example.com:8080/~jens?foo=bar");
    }
    {
        io::URL url("HTTPS://api64.ipify.org");
        CHECK(url.normalizedScheme() == "https");
        CHECK(url.hostname == "api64.ipify.org");
        CHECK(url.port == 0);
        CHECK(url.effectivePort() == 443);
        CHECK(url.path == "/");
        CHECK(url.query == "");
    }
    {
        io::URL url("http://[2001:db8::1]/ip");
        CHECK(url.hostname == "2001:db8::1");
        CHECK(url.effectivePort() == 80);
        CHECK(url.reencoded() == "http://[2001:db8::1]/ip");
    }
    {
        io::URL url("ws://example.com?x=y");
        CHECK(url.path == "/");
        CHECK(url.query == "x=y");
        CHECK(url.effectivePort() == 0);
    }

    for (string_view bad : {"", "example.com", "://example.com", "http://", "http://[::1/",
                            "http://host:0/", "http://host:65536/", "http://host:8o/",
                            "http://host name/", "http://host path", "ht tp://host/"}) {
        INFO("URL is \"" << bad << "\"");
        CHECK(!io::URL::tryParse(bad));
    }
    try {
        io::URL url("nope");
        FAIL("should have thrown");
    } catch (Exception const& x) {
        CHECK(x.error() == PubIPError::InvalidURL);
    }
}


TEST_CASE("String Utils", "[io]") {
    CHECK(trim("  \t203.0.113.5\r\n") == "203.0.113.5");
    CHECK(trim("   ") == "");
    CHECK(split("a.b.c", '.') == pair<string_view,string_view>{"a", "b.c"});
    CHECK(split("abc", '.') == pair<string_view,string_view>{"abc", ""});
    CHECK(equalIgnoringCase("HTTPS", "https"));
    CHECK(!equalIgnoringCase("http", "https"));
    CHECK(toLower("MyIP.OpenDNS.com"s) == "myip.opendns.com");
    CHECK(hexString(ConstBytes("\x01\xAB\xff"sv)) == "01abff");

    CHECK(isValidUTF8(""));
    CHECK(isValidUTF8("203.0.113.5"));
    CHECK(isValidUTF8("caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80"));
    CHECK(!isValidUTF8("\xFF"));
    CHECK(!isValidUTF8("\xC3"));                  // truncated
    CHECK(!isValidUTF8("\xC0\xAF"));              // overlong
    CHECK(!isValidUTF8("\xED\xA0\x80"));          // surrogate
    CHECK(!isValidUTF8("\xF4\x90\x80\x80"));      // > U+10FFFF
}


TEST_CASE("AddrInfo", "[io]") {
    io::AddrInfo info = waitFor(io::AddrInfo::lookup("192.0.2.1", 8080));
    CHECK(info.port() == 8080);
    REQUIRE(info.addresses().size() == 1);
    CHECK(info.addresses()[0] == ip("192.0.2.1"));
    CHECK(info.primaryAddress() == ip("192.0.2.1"));
    CHECK(info.primaryAddress(Version::V6) == nullopt);
    CHECK(info.addresses(Version::V6).empty());
    CHECK(info.addresses(Version::V4).size() == 1);
}


TEST_CASE("AddrInfo Real Host", "[io][.net]") {
    io::AddrInfo info = waitFor(io::AddrInfo::lookup("api64.ipify.org", 443));
    CHECK(!info.addresses().empty());
    for (auto& addr : info.addresses())
        cerr << "api64.ipify.org: " << addr << endl;
}


TEST_CASE("TCP Connection Refused", "[io]") {
    io::TCPSocket socket({ip("127.0.0.1"), 1});
    socket.setTimeout(5);
    try {
        waitFor(socket.open());
        FAIL("connecting should have failed");
    } catch (Exception const& x) {
        CHECK(x.error().is<io::uv::UVError>());
        CHECK(x.error().isStrategy());
    }
    CHECK(!socket.isOpen());
}


TEST_CASE("UDP Receive Timeout", "[io]") {
    io::UDPSocket socket;
    socket.bind(SocketAddress{ip("127.0.0.1"), 0});
    SocketAddress local = socket.localAddress();
    CHECK(local.address == ip("127.0.0.1"));
    CHECK(local.port != 0);
    try {
        (void)waitFor(socket.receive(0.05));
        FAIL("receive should have timed out");
    } catch (Exception const& x) {
        CHECK(x.error() == PubIPError::Timeout);
    }
    socket.close();
    CHECK(!socket.isOpen());
}


#pragma mark - LOCAL DNS SERVER:


// Answers the first DNS query it receives with an A record for 203.0.113.77. It first sends
// a truncated datagram and a decoy reply, both with the wrong ID, which the client must ignore.
static Future<void> fakeDNSServer(io::UDPSocket& server) {
    io::UDPSocket::Datagram query = AWAIT server.receive(5.0);
    CHECK(query.data.size() > 12 + 11);

    // Turn the query into a response: drop the OPT record, set flags and counts, add an answer.
    string reply = query.data.substr(0, query.data.size() - 11);
    reply[2] = '\x81';  reply[3] = '\x80';                  // QR RD RA
    reply[6] = '\x00';  reply[7] = '\x01';                  // ANCOUNT = 1
    reply[10] = '\x00'; reply[11] = '\x00';                 // ARCOUNT = 0
    reply += "\xC0\x0C"                                     // name -> question
             "\x00\x01" "\x00\x01"                          // A, IN
             "\x00\x00\x00\x3C"                             // TTL
             "\x00\x04" "\xCB\x00\x71\x4D"sv;               // 203.0.113.77

    string decoy = reply;
    decoy[1] ^= 0x55;
    AWAIT server.send(query.sender, decoy.substr(0, 5));
    AWAIT server.send(query.sender, decoy);
    AWAIT server.send(query.sender, reply);
    RETURN noerror;
}


TEST_CASE("DNS Local Server", "[io][dns]") {
    RunCoroutine([]() -> Future<void> {
        io::UDPSocket server;
        server.bind(SocketAddress{ip("127.0.0.1"), 0});
        Future<void> serving = fakeDNSServer(server);

        dns::DNSServerResolver resolver("myip.example", server.localAddress(),
                                        dns::QueryMethod::A, {2.0});
        Resolutions items = resolver.resolve(Version::Any);
        Result<Resolution> item = AWAIT items;
        CHECK(describe(item) == "203.0.113.77");
        if (item.ok()) {
            auto details = item->details->as<dns::Details>();
            CHECK(details);
            if (details) {
                CHECK(details->name() == "myip.example");
                CHECK(details->server() == server.localAddress());
            }
        }
        Result<Resolution> end = AWAIT items;
        CHECK(end.empty());

        AWAIT serving;
        RETURN noerror;
    });
    REQUIRE(Scheduler::current().assertEmpty());
}


TEST_CASE("DNS Local Server Timeout", "[io][dns]") {
    io::UDPSocket silent;
    silent.bind(SocketAddress{ip("127.0.0.1"), 0});
    dns::DNSServerResolver resolver("myip.example", silent.localAddress(),
                                    dns::QueryMethod::A, {0.1});
    Resolutions items = resolver.resolve(Version::V4);
    Result<Resolution> item = items.next();
    CHECK(item.error() == io::uv::UVError(UV_ETIMEDOUT));
    CHECK(KindOf(item.error()) == ErrorKind::Strategy);
    CHECK(items.next().empty());
}


#pragma mark - LOCAL HTTP:


namespace {

    // A loopback TCP port that's bound but not listening, so connecting to it is refused.
    class RefusingPort {
    public:
        RefusingPort() {
            _fd = ::socket(AF_INET, SOCK_STREAM, 0);
            REQUIRE(_fd >= 0);
            sockaddr_in addr = {};
            addr.sin_family = AF_INET;
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            REQUIRE(::bind(_fd, (sockaddr*)&addr, sizeof(addr)) == 0);
            socklen_t len = sizeof(addr);
            REQUIRE(::getsockname(_fd, (sockaddr*)&addr, &len) == 0);
            port = ntohs(addr.sin_port);
        }
        ~RefusingPort()                             {::close(_fd);}

        string url() const  {return "http://127.0.0.1:" + std::to_string(port) + "/";}

        uint16_t port = 0;
    private:
        int _fd = -1;
    };


    Resolutions yieldAddress(IPAddress addr) {
        YIELD Resolution{addr, nullptr};
    }

    class FixedResolver final : public Resolver {
    public:
        explicit FixedResolver(IPAddress addr)      :_addr(addr) { }
        Resolutions resolve(Version) const override {return yieldAddress(_addr);}
    private:
        IPAddress _addr;
    };
}


TEST_CASE("HTTP Endpoint Refused", "[io][http]") {
    RefusingPort refusing;
    auto client = make_shared<http::Client>(http::Client::Options{}, nullptr);
    auto endpoint = make_shared<http::HTTPEndpointResolver>(
                        io::URL(refusing.url()), SocketAddress{ip("127.0.0.1"), refusing.port},
                        http::ExtractMethod::PlainText, client);

    Resolutions items = endpoint->resolve(Version::V4);
    Result<Resolution> item = items.next();
    REQUIRE(item.isError());
    CHECK(item.error() == io::uv::UVError(UV_ECONNREFUSED));
    CHECK(KindOf(item.error()) == ErrorKind::Strategy);
    CHECK(items.next().empty());

    // The next resolver in a list still gets its turn:
    ResolverList list{endpoint, make_shared<FixedResolver>(ip("203.0.113.9"))};
    vector<string> seen = drain(list.resolve(Version::Any));
    REQUIRE(seen.size() == 2);
    CHECK(seen[0].starts_with("error: strategy: "));
    CHECK(seen[1] == "203.0.113.9");
    REQUIRE(Scheduler::current().assertEmpty());
}


TEST_CASE("HTTP Resolver Refused", "[io][http]") {
    RefusingPort refusing;
    auto client = make_shared<http::Client>(http::Client::Options{}, nullptr);
    http::HTTPResolver resolver(refusing.url(), http::ExtractMethod::PlainText, client);

    // 127.0.0.1 has one address, so one endpoint is tried and fails:
    vector<string> seen = drain(resolver.resolve(Version::Any));
    REQUIRE(seen.size() == 1);
    CHECK(seen[0].starts_with("error: strategy: "));

    // No IPv6 address means no endpoints at all:
    CHECK(drain(resolver.resolve(Version::V6)).empty());

    // Best effort moves on to the next resolver:
    auto first = make_shared<http::HTTPResolver>(refusing.url(), http::ExtractMethod::PlainText,
                                                 client);
    CHECK(waitFor(BestEffortAddress({first, make_shared<FixedResolver>(ip("203.0.113.10"))},
                                    Version::V4)) == ip("203.0.113.10"));
    REQUIRE(Scheduler::current().assertEmpty());
}
