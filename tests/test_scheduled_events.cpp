// ScheduledEvents tests: time-ordered delivery of delayed values.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <vector>

#include "ScheduledEvents.h"

using Marionette::ScheduledEvents;
using Catch::Approx;

TEST_CASE("entries fire in time order, once", "[scheduled]") {
    ScheduledEvents<int> q;
    q.schedule(0.3f, 3);
    q.schedule(0.1f, 1);
    q.schedule(0.2f, 2);

    REQUIRE(q.size() == 3);
    CHECK(q.nextAt() == Approx(0.1f));

    std::vector<int> got;
    auto collect = [&got](const int &v) { got.push_back(v); };

    CHECK(q.consume(0.05f, collect) == 0);
    CHECK(got.empty());

    CHECK(q.consume(0.2f, collect) == 2);
    REQUIRE(got.size() == 2);
    CHECK(got[0] == 1);
    CHECK(got[1] == 2);

    CHECK(q.consume(0.2f, collect) == 0);
    CHECK(q.consume(10.0f, collect) == 1);
    CHECK(got.back() == 3);
    CHECK(q.empty());
}

TEST_CASE("equal times keep insertion order", "[scheduled]") {
    ScheduledEvents<char> q;
    q.schedule(1.0f, 'a');
    q.schedule(0.5f, 'x');
    q.schedule(1.0f, 'b');
    q.schedule(1.0f, 'c');

    std::vector<char> got;
    q.consume(1.0f, [&got](const char &c) { got.push_back(c); });

    REQUIRE(got.size() == 4);
    CHECK(got[0] == 'x');
    CHECK(got[1] == 'a');
    CHECK(got[2] == 'b');
    CHECK(got[3] == 'c');
}

TEST_CASE("clear drops pending entries", "[scheduled]") {
    ScheduledEvents<int> q;
    q.schedule(0.1f, 1);
    q.schedule(0.2f, 2);
    q.clear();

    CHECK(q.empty());
    int fired = 0;
    CHECK(q.consume(100.0f, [&fired](const int &) { ++fired; }) == 0);
    CHECK(fired == 0);
}
