#include <catch2/catch_test_macros.hpp>
#include "core/Types.hpp"

using namespace herd;

TEST_CASE("Types: market state names round trip", "[types]") {
    for (MarketState state : kAllMarketStates) {
        auto parsed = parseMarketState(toString(state));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == state);
    }
}

TEST_CASE("Types: personality names round trip", "[types]") {
    for (Personality p : kAllPersonalities) {
        auto parsed = parsePersonality(toString(p));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == p);
    }
}

TEST_CASE("Types: canonical names", "[types]") {
    REQUIRE(toString(MarketState::CRASH) == "crash");
    REQUIRE(toString(MarketState::BOOM) == "boom");
    REQUIRE(toString(Personality::RISK_TAKER) == "risk_taker");
    REQUIRE(toString(ParticipationStatus::INACTIVE) == "inactive");
}

TEST_CASE("Types: unknown names do not parse", "[types]") {
    REQUIRE_FALSE(parseMarketState("sideways").has_value());
    REQUIRE_FALSE(parseMarketState("UP").has_value());
    REQUIRE_FALSE(parsePersonality("reckless").has_value());
}

TEST_CASE("Types: canonical state order starts with up and ends with boom", "[types]") {
    REQUIRE(kAllMarketStates.front() == MarketState::UP);
    REQUIRE(kAllMarketStates.back() == MarketState::BOOM);
    REQUIRE(kAllPersonalities.size() == 4);
}

TEST_CASE("Types: PeriodRecord defaults", "[types]") {
    PeriodRecord record;
    REQUIRE(record.period == 0);
    REQUIRE(record.state == MarketState::FLAT);
    REQUIRE(record.marketIndex == 1.0);
}
