#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/clock_value.hpp"

#include <cstdint>
#include <functional>

using namespace clockface;

namespace rc {

// Any valid time of day, built from seconds since midnight.
template<>
struct Arbitrary<ClockValue> {
    static Gen<ClockValue> arbitrary() {
        return gen::map(gen::inRange<std::int64_t>(0, ClockValue::kSecondsPerDay),
                        [](std::int64_t total) { return ClockValue::from_seconds(total); });
    }
};

} // namespace rc

TEST_CASE("Property: valid components read back unchanged", "[property][clock]") {
    REQUIRE(rc::check("create(h, m, s) keeps h, m, s",
        [] {
            const auto h = *rc::gen::inRange(0, 24);
            const auto m = *rc::gen::inRange(0, 60);
            const auto s = *rc::gen::inRange(0, 60);

            const auto clock = ClockValue::create(h, m, s);
            RC_ASSERT(clock.is_ok());
            RC_ASSERT(clock.unwrap().hours() == h);
            RC_ASSERT(clock.unwrap().minutes() == m);
            RC_ASSERT(clock.unwrap().seconds() == s);
        }));
}

TEST_CASE("Property: to_seconds and from_seconds round-trip", "[property][clock]") {
    REQUIRE(rc::check("from_seconds(c.to_seconds()) == c",
        [](const ClockValue& clock) {
            const auto total = clock.to_seconds();
            RC_ASSERT(total >= 0);
            RC_ASSERT(total < ClockValue::kSecondsPerDay);
            RC_ASSERT(ClockValue::from_seconds(total) == clock);
        }));
}

TEST_CASE("Property: out-of-bounds components are range errors", "[property][clock]") {
    REQUIRE(rc::check("create fails with OutOfRange when any component is out of bounds",
        [](int h, int m, int s) {
            RC_PRE(!ClockValue::is_valid(h, m, s));

            const auto clock = ClockValue::create(h, m, s);
            RC_ASSERT(clock.is_err());
            RC_ASSERT(clock.unwrap_err().code == static_cast<int>(ErrorCode::OutOfRange));
        }));
}

TEST_CASE("Property: add_seconds is additive modulo one day", "[property][clock]") {
    REQUIRE(rc::check("from_seconds(x).add_seconds(d) == from_seconds(x + d)",
        [](std::int32_t x, std::int32_t d) {
            auto clock = ClockValue::from_seconds(x);
            clock.add_seconds(d);
            RC_ASSERT(clock == ClockValue::from_seconds(static_cast<std::int64_t>(x) + d));
        }));
}

TEST_CASE("Property: add_seconds then its negation restores the clock", "[property][clock]") {
    REQUIRE(rc::check("c.add_seconds(d).add_seconds(-d) == c",
        [](const ClockValue& clock, std::int32_t d) {
            auto moved = clock;
            moved.add_seconds(d).add_seconds(-static_cast<std::int64_t>(d));
            RC_ASSERT(moved == clock);
        }));
}

TEST_CASE("Property: equal clocks hash identically", "[property][clock]") {
    REQUIRE(rc::check("direct and from_seconds construction agree on equality and hash",
        [](const ClockValue& clock) {
            const auto direct = ClockValue::create(clock.hours(), clock.minutes(), clock.seconds()).unwrap();
            const auto flattened = ClockValue::from_seconds(clock.to_seconds());

            RC_ASSERT(direct == flattened);
            RC_ASSERT(std::hash<ClockValue>{}(direct) == std::hash<ClockValue>{}(flattened));
        }));
}

TEST_CASE("Property: ordering agrees with seconds since midnight", "[property][clock]") {
    REQUIRE(rc::check("a < b iff a.to_seconds() < b.to_seconds()",
        [](const ClockValue& a, const ClockValue& b) {
            RC_ASSERT((a < b) == (a.to_seconds() < b.to_seconds()));
            RC_ASSERT((a == b) == (a.to_seconds() == b.to_seconds()));
        }));
}

TEST_CASE("Property: rendering parses back", "[property][clock]") {
    REQUIRE(rc::check("parse(c.to_string()) == c",
        [](const ClockValue& clock) {
            const auto parsed = ClockValue::parse(clock.to_string());
            RC_ASSERT(parsed.is_ok());
            RC_ASSERT(parsed.unwrap() == clock);
        }));
}

TEST_CASE("Property: a rejected set leaves the clock untouched", "[property][clock]") {
    REQUIRE(rc::check("set with an invalid triple changes nothing",
        [](const ClockValue& clock, int h, int m, int s) {
            RC_PRE(!ClockValue::is_valid(h, m, s));

            auto target = clock;
            const auto result = target.set(h, m, s);
            RC_ASSERT(result.is_err());
            RC_ASSERT(target == clock);
        }));
}
