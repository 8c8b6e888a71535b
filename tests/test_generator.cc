//
// test_generator.cc
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


// Yields start..limit, optionally pausing between items.
static Generator<int> counter(int start, int limit, double delay = 0) {
    for (int i = start; i <= limit; i++) {
        YIELD i;
        if (delay > 0)
            AWAIT Timer::sleep(delay);
    }
}


// Yields numbers, with an error in place of every multiple of 3.
static Generator<int> fizz(int limit) {
    for (int i = 1; i <= limit; i++) {
        if (i % 3 == 0)
            YIELD PubIPError::ParseError;
        else
            YIELD i;
    }
}


// Passes through its source's values, doubled.
static Generator<int> doubled(Generator<int> source) {
    while (true) {
        Result<int> item = AWAIT source;
        if (item.empty())
            break;
        if (item.ok())
            YIELD *item * 2;
        else
            YIELD item.error();
    }
}


static Generator<int> throwsAfter(int n) {
    for (int i = 1; i <= n; i++)
        YIELD i;
    throw std::runtime_error("generator failed");
}


TEST_CASE("Generator", "[generator]") {
    vector<int> results;
    for (Result<int> n : counter(1, 5))
        results.push_back(*n);
    CHECK(results == vector<int>{1, 2, 3, 4, 5});
}


TEST_CASE("Generator Next", "[generator]") {
    Generator<int> gen = counter(1, 2);
    CHECK(gen.next().value() == 1);
    CHECK(gen.next().value() == 2);
    CHECK(gen.next().empty());
    CHECK(gen.next().empty());
}


TEST_CASE("Generator Errors Don't End It", "[generator]") {
    Generator<int> gen = fizz(5);
    vector<string> items;
    for (Result<int> item = gen.next(); !item.empty(); item = gen.next())
        items.push_back(item.ok() ? to_string(*item) : "E");
    CHECK(items == vector<string>{"1", "2", "E", "4", "5"});
}


TEST_CASE("Generator Exception", "[generator]") {
    Generator<int> gen = throwsAfter(2);
    CHECK(gen.next().value() == 1);
    CHECK(gen.next().value() == 2);
    Result<int> last = gen.next();
    CHECK(last.error() == CppError::runtime_error);
    CHECK(gen.next().empty());
}


TEST_CASE("Generator Chain", "[generator]") {
    RunCoroutine([]() -> Future<void> {
        Generator<int> gen = doubled(fizz(4));
        vector<string> items;
        while (true) {
            Result<int> item = AWAIT gen;
            if (item.empty())
                break;
            items.push_back(item.ok() ? to_string(*item) : string(item.error().domain()));
        }
        CHECK(items == vector<string>{"2", "4", "PubIP", "8"});
        RETURN noerror;
    });
    REQUIRE(Scheduler::current().assertEmpty());
}


TEST_CASE("Generator Slow", "[generator]") {
    vector<int> results;
    for (Result<int> n : counter(1, 4, 0.01))
        results.push_back(*n);
    CHECK(results == vector<int>{1, 2, 3, 4});
    REQUIRE(Scheduler::current().assertEmpty());
}


TEST_CASE("Generator Is Lazy", "[generator]") {
    int started = 0;
    auto gen = [&]() -> Generator<int> {
        ++started;
        YIELD 1;
        ++started;
        YIELD 2;
    };
    {
        Generator<int> g = gen();
        CHECK(started == 0);
        CHECK(g.next().value() == 1);
        CHECK(started == 1);
        // Destroying it before the next pull means the rest never runs.
    }
    CHECK(started == 1);
}


TEST_CASE("Generator Abandoned After Yield", "[generator]") {
    {
        // The first item comes before any sleep, so this is destroyed at a yield point:
        Generator<int> gen = counter(1, 10, 0.05);
        CHECK(gen.next().value() == 1);
    }
    REQUIRE(Scheduler::current().assertEmpty());
}
