//
// test_resolver.cc
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


namespace {

    // Details attached by ScriptedResolver.
    class TagDetails final : public Details {
    public:
        static constexpr DetailsKind Kind = DetailsKind::Custom;
        explicit TagDetails(string tag)             :tag(std::move(tag)) { }
        DetailsKind kind() const override           {return Kind;}
        string description() const override         {return "scripted by " + tag;}
        string tag;
    };


    using Script = vector<Result<IPAddress>>;

    Resolutions play(Script script, string tag, double delay) {
        for (auto& item : script) {
            if (delay > 0)
                AWAIT Timer::sleep(delay);
            if (item.ok())
                YIELD Resolution{*item, make_unique<TagDetails>(tag)};
            else
                YIELD item.error();
        }
    }


    // A resolver that yields a fixed list of items, optionally pausing before each one,
    // and counts how many times it's been asked to resolve.
    class ScriptedResolver final : public Resolver {
    public:
        ScriptedResolver(string tag, Script script, double delay = 0)
        :_tag(std::move(tag)), _script(std::move(script)), _delay(delay) { }

        Resolutions resolve(Version) const override {
            ++calls;
            return play(_script, _tag, _delay);
        }

        string name() const override                {return _tag;}

        mutable int calls = 0;

    private:
        string  _tag;
        Script  _script;
        double  _delay;
    };


    // A resolver whose sequence yields one address and then throws.
    class ThrowingResolver final : public Resolver {
    public:
        Resolutions resolve(Version) const override {
            return [](IPAddress addr) -> Resolutions {
                YIELD Resolution{addr, nullptr};
                throw std::runtime_error("resolver blew up");
            }(ip("192.0.2.99"));
        }
    };


    // A resolver that isn't a Resolver subclass.
    struct ConstantResolver {
        IPAddress address;
        Resolutions resolve(Version) const {
            return play({address}, "constant", 0);
        }
    };
    static_assert(ResolverLike<ConstantResolver>);


    shared_ptr<ScriptedResolver> scripted(string tag, Script script, double delay = 0) {
        return make_shared<ScriptedResolver>(std::move(tag), std::move(script), delay);
    }

    constexpr dns::DNSError kStrategyErr = dns::DNSError::ServerFailure;
    const string kStrategyErrStr = "error: strategy: DNS server failure";
    const string kMismatchStr = "error: version mismatch: address is of the wrong IP version";
}


#pragma mark - FALLBACK:


TEST_CASE("Fallback Empty", "[resolver]") {
    CHECK(drain(Fallback({}, Version::Any)).empty());
    CHECK(drain(ResolverList().resolve(Version::V4)).empty());
}


TEST_CASE("Fallback Preserves Order", "[resolver]") {
    auto r0 = scripted("r0", {ip("192.0.2.1"), kStrategyErr, ip("192.0.2.2")});
    auto r1 = scripted("r1", {ResolveError::NoAddress, ip("2001:db8::3")});
    auto r2 = scripted("r2", {});

    vector<string> merged = drain(Fallback({r0, r1, r2}, Version::Any));
    vector<string> separate = drain(r0->resolve(Version::Any));
    for (auto& item : drain(r1->resolve(Version::Any)))
        separate.push_back(item);
    CHECK(merged == separate);
    CHECK(merged == vector<string>{"192.0.2.1", kStrategyErrStr, "192.0.2.2",
                                   "error: no address: no valid IP address in the answer",
                                   "2001:db8::3"});
    // The combinator doesn't filter by version:
    CHECK(drain(Fallback({r1}, Version::V4)) == vector<string>{
                                   "error: no address: no valid IP address in the answer",
                                   "2001:db8::3"});
}


TEST_CASE("Fallback Is Lazy", "[resolver]") {
    auto r0 = scripted("r0", {ip("192.0.2.1")});
    auto r1 = scripted("r1", {ip("192.0.2.2")});
    {
        Resolutions items = Fallback({r0, r1}, Version::Any);
        CHECK(r0->calls == 0);
        CHECK(r1->calls == 0);
        Result<Resolution> first = items.next();
        CHECK(describe(first) == "192.0.2.1");
        CHECK(r0->calls == 1);
        CHECK(r1->calls == 0);
    }
    // Abandoning the sequence means r1 never starts:
    CHECK(r1->calls == 0);
}


TEST_CASE("Fallback Suspends", "[resolver]") {
    auto r0 = scripted("r0", {kStrategyErr, ip("192.0.2.1")}, 0.01);
    auto r1 = scripted("r1", {ip("2001:db8::1")}, 0.01);
    RunCoroutine([]() -> Future<void> {
        auto a = scripted("a", {kStrategyErr, ip("192.0.2.1")}, 0.01);
        auto b = scripted("b", {ip("2001:db8::1")}, 0.01);
        Resolutions items = Fallback({a, b}, Version::Any);
        vector<string> seen;
        while (true) {
            Result<Resolution> item = AWAIT items;
            if (item.empty())
                break;
            seen.push_back(describe(item));
        }
        CHECK(seen == vector<string>{kStrategyErrStr, "192.0.2.1", "2001:db8::1"});
        CHECK(a->calls == 1);
        CHECK(b->calls == 1);
        RETURN noerror;
    });
    CHECK(drain(Fallback({r0, r1}, Version::Any)) ==
          vector<string>{kStrategyErrStr, "192.0.2.1", "2001:db8::1"});
    REQUIRE(Scheduler::current().assertEmpty());
}


TEST_CASE("Fallback Exception", "[resolver]") {
    auto r1 = scripted("r1", {ip("192.0.2.2")});
    vector<string> items = drain(Fallback({make_shared<ThrowingResolver>(), r1}, Version::Any));
    REQUIRE(items.size() == 3);
    CHECK(items[0] == "192.0.2.99");
    CHECK(items[1] == "error: other: std::runtime_error");
    CHECK(items[2] == "192.0.2.2");
}


TEST_CASE("Resolver Idempotence", "[resolver]") {
    auto r0 = scripted("r0", {kStrategyErr, ip("192.0.2.1")});
    ResolverList list{r0, scripted("r1", {ip("192.0.2.2")})};
    Resolutions first = list.resolve(Version::Any);
    Resolutions second = list.resolve(Version::Any);
    CHECK(describe(first.next()) == kStrategyErrStr);
    CHECK(drain(std::move(second)) == vector<string>{kStrategyErrStr, "192.0.2.1", "192.0.2.2"});
    CHECK(describe(first.next()) == "192.0.2.1");
    CHECK(describe(first.next()) == "192.0.2.2");
    CHECK(first.next().empty());
    CHECK(r0->calls == 2);
}


TEST_CASE("ResolverList", "[resolver]") {
    std::array<ResolverRef,2> arr {scripted("a", {ip("192.0.2.1")}),
                                   scripted("b", {ip("192.0.2.2")})};
    ResolverList fromArray(arr);
    ResolverList fromSpan(std::span<const ResolverRef>(arr.data(), 1));
    CHECK(fromArray.size() == 2);
    CHECK(fromSpan.size() == 1);
    CHECK(fromArray.name() == "list of 2");
    CHECK(drain(fromSpan.resolve(Version::Any)) == vector<string>{"192.0.2.1"});

    // Lists nest:
    auto nested = make_shared<ResolverList>(ResolverList{make_shared<ResolverList>(fromSpan),
                                                         arr[1]});
    CHECK(drain(nested->resolve(Version::Any)) == vector<string>{"192.0.2.1", "192.0.2.2"});
}


TEST_CASE("Boxed Resolver", "[resolver]") {
    ResolverRef boxed = Box(ConstantResolver{ip("198.51.100.1")});
    CHECK(boxed->name() == "resolver");
    Result<Resolution> item = boxed->resolve(Version::Any).next();
    REQUIRE(item.ok());
    CHECK(item->address == ip("198.51.100.1"));
    REQUIRE(item->details);
    auto tag = item->details->as<TagDetails>();
    REQUIRE(tag);
    CHECK(tag->tag == "constant");
    CHECK(item->details->as<dns::Details>() == nullptr);
    CHECK(item->details->as<http::Details>() == nullptr);

    ResolverRef same = Box(ScriptedResolver("s", {}));
    CHECK(same->name() == "s");
}


TEST_CASE("Result Resolver", "[resolver]") {
    ResultResolver failed(Result<ResolverRef>(http::HTTPError::InvalidURI));
    CHECK(drain(failed.resolve(Version::Any)) ==
          vector<string>{"error: strategy: invalid or non-HTTP URI"});

    ResultResolver ok(Result<ResolverRef>(ResolverRef(scripted("ok", {ip("192.0.2.1")}))));
    CHECK(ok.name() == "ok");
    CHECK(drain(ok.resolve(Version::Any)) == vector<string>{"192.0.2.1"});
}


#pragma mark - PIPELINE:


TEST_CASE("Resolve Passes Matching Items", "[resolve]") {
    auto a = scripted("A", {kStrategyErr});
    auto b = scripted("B", {ip("203.0.113.5")});
    CHECK(drain(Resolve({a, b}, Version::Any)) == vector<string>{kStrategyErrStr, "203.0.113.5"});
    CHECK(waitFor(BestEffortAddress({a, b}, Version::Any)) == ip("203.0.113.5"));
}


TEST_CASE("Resolve Version Mismatch", "[resolve]") {
    auto a = scripted("A", {ip("2001:db8::1")});
    CHECK(drain(Resolve(a, Version::V4)) == vector<string>{kMismatchStr});
    CHECK(waitFor(BestEffortAddress(a, Version::V4)) == nullopt);

    // Best effort skips past the mismatch to the next resolver:
    auto b = scripted("B", {ip("192.0.2.8")});
    CHECK(waitFor(BestEffortAddress({a, b}, Version::V4)) == ip("192.0.2.8"));
    CHECK(drain(Resolve({a, b}, Version::V6)) == vector<string>{"2001:db8::1", kMismatchStr});
}


TEST_CASE("Resolve Empty", "[resolve]") {
    CHECK(drain(Resolve(vector<ResolverRef>{}, Version::Any)).empty());
    CHECK(waitFor(BestEffortAddress(vector<ResolverRef>{}, Version::Any)) == nullopt);
    CHECK(waitFor(BestEffortResolution(vector<ResolverRef>{}, Version::V6)) == nullopt);
}


TEST_CASE("Best Effort Invokes Each Resolver Once", "[resolve]") {
    auto r0 = scripted("r0", {kStrategyErr, ResolveError::NoAddress}, 0.01);
    auto r1 = scripted("r1", {ip("192.0.2.33")}, 0.01);
    auto r2 = scripted("r2", {ip("192.0.2.44")});
    CHECK(waitFor(BestEffortAddress({r0, r1, r2}, Version::Any)) == ip("192.0.2.33"));
    CHECK(r0->calls == 1);
    CHECK(r1->calls == 1);
    CHECK(r2->calls == 0);
    REQUIRE(Scheduler::current().assertEmpty());
}


TEST_CASE("Best Effort Abandoned While Waiting", "[resolve]") {
    auto r0 = scripted("r0", {ip("192.0.2.1")}, 0.05);
    auto r1 = scripted("r1", {ip("192.0.2.2")});
    {
        Future<optional<IPAddress>> addr = BestEffortAddress({r0, r1}, Version::Any);
        // r0 is now sleeping before its first item:
        CHECK(r0->calls == 1);
        CHECK(!addr.hasResult());
    }
    // Let r0's delay run out; nothing should wake up, and r1 never starts:
    RunCoroutine([]() -> Future<void> {
        AWAIT Timer::sleep(0.1);
        RETURN noerror;
    });
    CHECK(r0->calls == 1);
    CHECK(r1->calls == 0);
    REQUIRE(Scheduler::current().assertEmpty());
}


TEST_CASE("Best Effort All Fail", "[resolve]") {
    auto r0 = scripted("r0", {kStrategyErr});
    auto r1 = scripted("r1", {http::Status::TooManyRequests, ResolveError::NoAddress});
    CHECK(waitFor(BestEffortAddress({r0, r1}, Version::Any)) == nullopt);
    CHECK(r0->calls == 1);
    CHECK(r1->calls == 1);
}


TEST_CASE("Best Effort Resolution Details", "[resolve]") {
    auto r0 = scripted("first", {ip("2001:db8::5")});
    auto r1 = scripted("second", {ip("192.0.2.5")});
    optional<Resolution> res = waitFor(BestEffortResolution({r0, r1}, Version::V4));
    REQUIRE(res);
    CHECK(res->address == ip("192.0.2.5"));
    REQUIRE(res->details);
    CHECK(res->details->kind() == DetailsKind::Custom);
    CHECK(res->details->description() == "scripted by second");
}


TEST_CASE("Best Effort In Coroutine", "[resolve]") {
    RunCoroutine([]() -> Future<void> {
        auto r0 = scripted("r0", {ResolveError::NoAddress}, 0.01);
        auto r1 = scripted("r1", {ip("2001:db8::77")}, 0.01);
        optional<IPAddress> addr = AWAIT BestEffortAddress({r0, r1}, Version::V6);
        CHECK(addr == ip("2001:db8::77"));
        RETURN noerror;
    });
    REQUIRE(Scheduler::current().assertEmpty());
}
