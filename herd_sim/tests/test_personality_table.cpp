#include <catch2/catch_test_macros.hpp>
#include "core/PersonalityTable.hpp"
#include <stdexcept>

using namespace herd;

TEST_CASE("PersonalityTable: reference stay-in probabilities", "[personality]") {
    PersonalityTable table = PersonalityTable::defaults();

    REQUIRE(table.stayProbability(Personality::RISK_TAKER, MarketState::UP) == 0.90);
    REQUIRE(table.stayProbability(Personality::CAUTIOUS, MarketState::DOWN) == 0.40);
    REQUIRE(table.stayProbability(Personality::GREEDY, MarketState::FLAT) == 0.70);
    REQUIRE(table.stayProbability(Personality::AVERAGE, MarketState::UP) == 0.85);
}

TEST_CASE("PersonalityTable: crash reads the down bucket", "[personality]") {
    PersonalityTable table = PersonalityTable::defaults();

    for (Personality p : kAllPersonalities) {
        StayLookup crash = table.lookup(p, MarketState::CRASH);
        REQUIRE(crash.bucket == MarketState::DOWN);
        REQUIRE(crash.source == StaySource::TABLE);
        REQUIRE(crash.probability == table.stayProbability(p, MarketState::DOWN));
    }
}

TEST_CASE("PersonalityTable: boom falls back to the default", "[personality]") {
    PersonalityTable table = PersonalityTable::defaults();

    for (Personality p : kAllPersonalities) {
        StayLookup boom = table.lookup(p, MarketState::BOOM);
        REQUIRE(boom.source == StaySource::DEFAULT);
        REQUIRE(boom.probability == PersonalityTable::kDefaultStayProbability);
        REQUIRE(boom.probability == 0.6);
    }
}

TEST_CASE("PersonalityTable: lookup is total over every combination", "[personality]") {
    PersonalityTable empty;
    PersonalityTable defaults = PersonalityTable::defaults();

    for (Personality p : kAllPersonalities) {
        for (MarketState s : kAllMarketStates) {
            REQUIRE(empty.stayProbability(p, s) == 0.6);
            double prob = defaults.stayProbability(p, s);
            REQUIRE(prob >= 0.0);
            REQUIRE(prob <= 1.0);
        }
    }
}

TEST_CASE("PersonalityTable: erased bucket resolves to default", "[personality]") {
    PersonalityTable table = PersonalityTable::defaults();
    table.erase(Personality::CAUTIOUS, MarketState::FLAT);

    REQUIRE_FALSE(table.hasEntry(Personality::CAUTIOUS, MarketState::FLAT));
    StayLookup flat = table.lookup(Personality::CAUTIOUS, MarketState::FLAT);
    REQUIRE(flat.source == StaySource::DEFAULT);
    REQUIRE(flat.probability == 0.6);

    // Other personalities unaffected
    REQUIRE(table.stayProbability(Personality::AVERAGE, MarketState::FLAT) == 0.65);
}

TEST_CASE("PersonalityTable: explicit boom entry overrides the default", "[personality]") {
    PersonalityTable table = PersonalityTable::defaults();
    table.set(Personality::GREEDY, MarketState::BOOM, 0.97);

    StayLookup boom = table.lookup(Personality::GREEDY, MarketState::BOOM);
    REQUIRE(boom.source == StaySource::TABLE);
    REQUIRE(boom.probability == 0.97);
}

TEST_CASE("PersonalityTable: validate rejects out-of-range probabilities", "[personality]") {
    PersonalityTable table = PersonalityTable::defaults();
    REQUIRE_NOTHROW(table.validate());

    table.set(Personality::AVERAGE, MarketState::UP, 1.2);
    REQUIRE_THROWS_AS(table.validate(), std::invalid_argument);
}
