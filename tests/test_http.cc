//
// test_http.cc
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
#include "io/HTTPConnection.hh"


namespace {

    // An in-memory stream that returns a canned response, a few bytes at a time,
    // and records what's written to it.
    class CannedStream final : public io::IStream {
    public:
        explicit CannedStream(string response, size_t chunkSize = 7)
        :_response(std::move(response)), _chunkSize(chunkSize) { }

        bool isOpen() const override                {return _open;}
        Future<void> open() override                {_open = true; return Future<void>{};}
        Future<void> close() override               {_open = false; return Future<void>{};}

        Future<ConstBytes> readNoCopy(size_t maxLen) override {
            size_t n = std::min({maxLen, _chunkSize, _response.size() - _pos});
            ConstBytes result(_response.data() + _pos, n);
            _pos += n;
            return Future<ConstBytes>(std::move(result));
        }

        Future<void> write(ConstBytes data) override {
            written.append((const char*)data.data(), data.size());
            return Future<void>{};
        }
        using io::IStream::write;

        string written;

    private:
        string  _response;
        size_t  _chunkSize;
        size_t  _pos = 0;
        bool    _open = false;
    };


    const char* kIPifyResponse =
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/plain\r\n"
        "content-length: 11\r\n"
        "Vary: Origin\r\n"
        "Vary: Accept\r\n"
        "\r\n"
        "203.0.113.5";
}


#pragma mark - PARSER:


TEST_CASE("HTTP Header Names", "[http]") {
    CHECK(io::http::Headers::canonicalName("conTent-TYPe") == "Content-Type");
    CHECK(io::http::Headers::canonicalName("x-forwarded-for") == "X-Forwarded-For");

    io::http::Headers headers;
    headers.set("user-agent", "A");
    headers.add("Accept", "text/plain");
    headers.add("ACCEPT", "*/*");
    CHECK(headers.contains("User-Agent"));
    CHECK(headers.get("USER-AGENT") == "A");
    CHECK(headers.get("accept") == "text/plain, */*");
    CHECK(headers.get("Missing") == "");
}


TEST_CASE("HTTP Parser", "[http]") {
    io::http::Parser parser;
    CHECK(!parser.headersComplete());
    CHECK(parser.parseData(ConstBytes(string_view(kIPifyResponse))));
    CHECK(parser.complete());
    CHECK(parser.status == http::Status::OK);
    CHECK(parser.statusMessage == "OK");
    CHECK(parser.headers.get("Content-Type") == "text/plain");
    CHECK(parser.headers.get("Content-Length") == "11");
    CHECK(parser.headers.get("Vary") == "Origin, Accept");
    CHECK(parser.body() == "203.0.113.5");
}


TEST_CASE("HTTP Parser Chunked", "[http]") {
    string response = "HTTP/1.1 404 Not Found\r\n"
                      "Transfer-Encoding: chunked\r\n"
                      "\r\n"
                      "4\r\nnope\r\n"
                      "0\r\n\r\n";
    io::http::Parser parser;
    // Feed it one byte at a time:
    for (char c : response)
        (void)parser.parseData(ConstBytes(&c, 1));
    CHECK(parser.complete());
    CHECK(parser.status == http::Status::NotFound);
    CHECK(parser.statusMessage == "Not Found");
    CHECK(parser.takeBody() == "nope");
}


TEST_CASE("HTTP Parser Until EOF", "[http]") {
    io::http::Parser parser;
    CHECK(parser.parseData(ConstBytes("HTTP/1.1 200 OK\r\n\r\n\"2001:db8::1\""sv)));
    CHECK(!parser.complete());
    (void)parser.parseData(ConstBytes());
    CHECK(parser.complete());
    CHECK(parser.body() == "\"2001:db8::1\"");
}


TEST_CASE("HTTP Parser Errors", "[http]") {
    io::http::Parser parser;
    try {
        (void)parser.parseData(ConstBytes("SMTP is not HTTP\r\n\r\n"sv));
        FAIL("should have thrown");
    } catch (Exception const& x) {
        CHECK(x.error() == http::HTTPError::ParseError);
    }
}


#pragma mark - CONNECTION:


TEST_CASE("HTTP Request Text", "[http]") {
    io::http::Connection conn(make_unique<CannedStream>(""),
                              io::URL("http://[2001:db8::1]:8080/ip?x=1"));
    conn.setHeader("user-agent", "Tester");
    CHECK(conn.requestText() == "GET /ip?x=1 HTTP/1.1\r\n"
                                "Host: [2001:db8::1]:8080\r\n"
                                "User-Agent: Tester\r\n"
                                "Connection: close\r\n\r\n");

    io::http::Connection conn2(make_unique<CannedStream>(""), io::URL("https://api.myip.com"));
    CHECK(conn2.requestText() == "GET / HTTP/1.1\r\n"
                                 "Host: api.myip.com\r\n"
                                 "Connection: close\r\n\r\n");
}


TEST_CASE("HTTP Connection", "[http]") {
    auto stream = make_unique<CannedStream>(kIPifyResponse);
    CannedStream* streamPtr = stream.get();
    io::http::Connection conn(std::move(stream), io::URL("https://api64.ipify.org"));
    conn.setMaxBodySize(100);
    io::http::Response response = waitFor(conn.get());
    CHECK(response.status == http::Status::OK);
    CHECK(response.statusMessage == "OK");
    CHECK(response.headers.get("content-type") == "text/plain");
    CHECK(response.body == "203.0.113.5");
    CHECK(streamPtr->written == conn.requestText());
    CHECK(streamPtr->isOpen());
    waitFor(conn.close());
    CHECK(!streamPtr->isOpen());

    // A Connection is good for only one request:
    CHECK_THROWS_AS(waitFor(conn.get()), Exception);
}


TEST_CASE("HTTP Connection Errors", "[http]") {
    auto errorFrom = [](string response, size_t maxBody = 1000) {
        io::http::Connection conn(make_unique<CannedStream>(std::move(response)),
                                  io::URL("http://example.com/"));
        conn.setMaxBodySize(maxBody);
        try {
            (void)waitFor(conn.get());
            FAIL("should have failed");
        } catch (Exception const& x) {
            return x.error();
        }
        return Error();
    };

    // Announced body is too large:
    CHECK(errorFrom("HTTP/1.1 200 OK\r\nContent-Length: 5000\r\n\r\nxyz", 100)
          == http::HTTPError::BodyTooLarge);
    // Unannounced body is too large:
    CHECK(errorFrom("HTTP/1.1 200 OK\r\n\r\n" + string(200, 'x'), 100)
          == http::HTTPError::BodyTooLarge);
    // Connection closed early:
    CHECK(errorFrom("HTTP/1.1 200 OK\r\nContent-Length: 50\r\n\r\nabc")
          == http::HTTPError::ParseError);
    CHECK(errorFrom("HTTP/1.1 200 OK\r\nContent-") == http::HTTPError::ParseError);
    // Not HTTP:
    CHECK(errorFrom("220 smtp.example.com ESMTP\r\n") == http::HTTPError::ParseError);
}


#pragma mark - EXTRACTION:


TEST_CASE("HTTP Extract Plain Text", "[http]") {
    using http::ExtractMethod;
    CHECK(http::ExtractAddress("203.0.113.5", ExtractMethod::PlainText).value() == ip("203.0.113.5"));
    CHECK(http::ExtractAddress(" 2001:db8::1\r\n", ExtractMethod::PlainText).value() == ip("2001:db8::1"));
    CHECK(http::ExtractAddress("", ExtractMethod::PlainText).error() == ResolveError::NoAddress);
    CHECK(http::ExtractAddress("<html>", ExtractMethod::PlainText).error() == ResolveError::NoAddress);
    CHECK(http::ExtractAddress("\"203.0.113.5\"", ExtractMethod::PlainText).error() == ResolveError::NoAddress);
    CHECK(http::ExtractAddress("203.0.113.5\xff", ExtractMethod::PlainText).error() == ResolveError::NoAddress);
}


TEST_CASE("HTTP Extract Quoted", "[http]") {
    using http::ExtractMethod;
    CHECK(http::ExtractAddress("\"203.0.113.5\"", ExtractMethod::StripDoubleQuotes).value() == ip("203.0.113.5"));
    CHECK(http::ExtractAddress("\"2001:db8::1\"\n", ExtractMethod::StripDoubleQuotes).value() == ip("2001:db8::1"));
    CHECK(http::ExtractAddress("203.0.113.5", ExtractMethod::StripDoubleQuotes).value() == ip("203.0.113.5"));
    CHECK(http::ExtractAddress("\"\"", ExtractMethod::StripDoubleQuotes).error() == ResolveError::NoAddress);
}


TEST_CASE("HTTP Extract JSON", "[http]") {
    using http::ExtractMethod;
    CHECK(http::ExtractAddress(R"({"ip":"203.0.113.5","country":"Nowhere","cc":"XX"})",
                               ExtractMethod::ExtractJsonIpField).value() == ip("203.0.113.5"));
    CHECK(http::ExtractAddress("{\n  \"IP\" :  \"2001:db8::1\"\n}",
                               ExtractMethod::ExtractJsonIpField).value() == ip("2001:db8::1"));
    CHECK(http::ExtractAddress(R"({"address":"203.0.113.5"})",
                               ExtractMethod::ExtractJsonIpField).error() == ResolveError::NoAddress);
    CHECK(http::ExtractAddress(R"({"ip":"unknown"})",
                               ExtractMethod::ExtractJsonIpField).error() == ResolveError::NoAddress);
    CHECK(http::ExtractAddress("203.0.113.5",
                               ExtractMethod::ExtractJsonIpField).error() == ResolveError::NoAddress);
}


TEST_CASE("HTTP Address From Response", "[http]") {
    using http::ExtractMethod;
    auto responseTo = [](string text) {
        io::http::Connection conn(make_unique<CannedStream>(std::move(text)),
                                  io::URL("http://example.com/"));
        return waitFor(conn.get());
    };

    CHECK(http::AddressFromResponse(responseTo(kIPifyResponse), ExtractMethod::PlainText).value()
          == ip("203.0.113.5"));

    // A non-2xx status is the error, whatever the body says:
    io::http::Response limited = responseTo("HTTP/1.1 429 Too Many Requests\r\n"
                                            "Content-Length: 11\r\n\r\n203.0.113.5");
    Result<IPAddress> addr = http::AddressFromResponse(limited, ExtractMethod::PlainText);
    CHECK(addr.error() == http::Status::TooManyRequests);
    CHECK(KindOf(addr.error()) == ErrorKind::Strategy);
    CHECK(http::AddressFromResponse(responseTo("HTTP/1.1 404 Not Found\r\n\r\n"),
                                    ExtractMethod::PlainText).error() == http::Status::NotFound);

    // A 2xx response without an address:
    CHECK(http::AddressFromResponse(responseTo("HTTP/1.1 200 OK\r\n\r\n<html>"),
                                    ExtractMethod::PlainText).error() == ResolveError::NoAddress);

    io::http::Response unparsed;
    CHECK(http::AddressFromResponse(unparsed, ExtractMethod::PlainText).error()
          == http::HTTPError::ParseError);
}


#pragma mark - RESOLVER:


TEST_CASE("HTTP Resolver Invalid URI", "[http]") {
    auto client = make_shared<http::Client>(http::Client::Options{}, nullptr);
    for (string uri : {"not a uri", "ftp://example.com/ip", "https://", "http://:80/",
                       "https://example.com:99999/", "mailto:someone@example.com"}) {
        INFO("URI is " << uri);
        http::HTTPResolver resolver(uri, http::ExtractMethod::PlainText, client);
        CHECK(drain(resolver.resolve(Version::Any)) ==
              vector<string>{"error: strategy: invalid or non-HTTP URI"});
    }
}


TEST_CASE("HTTP Endpoint Resolver", "[http]") {
    auto client = make_shared<http::Client>(http::Client::Options{}, nullptr);
    http::HTTPEndpointResolver endpoint(io::URL("https://api.myip.com"), {ip("192.0.2.80"), 443},
                                        http::ExtractMethod::ExtractJsonIpField, client);
    CHECK(endpoint.name() == "HTTP https://api.myip.com/ @192.0.2.80:443");
    // Wrong address family means no items, and no I/O:
    CHECK(drain(endpoint.resolve(Version::V6)).empty());
}


TEST_CASE("HTTP Details", "[http]") {
    http::Details details("https://api.myip.com/", {ip("192.0.2.80"), 443},
                          http::ExtractMethod::ExtractJsonIpField);
    CHECK(details.kind() == DetailsKind::HTTP);
    CHECK(details.description() == "HTTP https://api.myip.com/ via 192.0.2.80:443 (JSON \"ip\" field)");
    pubip::Details const& base = details;
    CHECK(base.as<http::Details>() == &details);
    CHECK(base.as<dns::Details>() == nullptr);
}


TEST_CASE("HTTP Providers", "[http]") {
    auto client = make_shared<http::Client>(http::Client::Options{}, nullptr);
    auto all = dynamic_pointer_cast<const ResolverList>(http::All(client));
    REQUIRE(all);
    REQUIRE(all->size() == 4);
    vector<pair<string, http::ExtractMethod>> expected {
        {"https://api64.ipify.org", http::ExtractMethod::PlainText},
        {"https://api.my-ip.io/ip", http::ExtractMethod::PlainText},
        {"https://api.myip.com",    http::ExtractMethod::ExtractJsonIpField},
        {"https://api.seeip.org",   http::ExtractMethod::PlainText},
    };
    for (size_t i = 0; i < 4; ++i) {
        auto r = dynamic_pointer_cast<const http::HTTPResolver>(all->resolvers()[i]);
        REQUIRE(r);
        CHECK(r->uri() == expected[i].first);
        CHECK(r->method() == expected[i].second);
    }

    auto everything = dynamic_pointer_cast<const ResolverList>(AllResolvers(client));
    REQUIRE(everything);
    CHECK(everything->size() == 2);
}


TEST_CASE("HTTP ipify", "[http][.net]") {
    auto client = make_shared<http::Client>();
    http::HTTPResolver resolver("https://api64.ipify.org", http::ExtractMethod::PlainText, client);
    optional<Resolution> res = waitFor(BestEffortResolution(make_shared<http::HTTPResolver>(resolver),
                                                            Version::Any));
    REQUIRE(res);
    auto details = res->details->as<http::Details>();
    REQUIRE(details);
    cerr << "Public address: " << res->address << " (" << details->description() << ")\n";
}


TEST_CASE("All Resolvers", "[.net]") {
    optional<IPAddress> addr = waitFor(Addr());
    REQUIRE(addr);
    cerr << "Public address: " << *addr << "\n";
    REQUIRE(Scheduler::current().assertEmpty());
}
