#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "report/ReportGenerator.hpp"
#include "utils/Statistics.hpp"
#include "utils/Random.hpp"

using namespace herd;
using Catch::Approx;

TEST_CASE("Statistics: mode with a tie is NoUniqueMode", "[report]") {
    ModeResult mode = Statistics::mode({ 1, 1, 2, 2 });
    REQUIRE(std::holds_alternative<NoUniqueMode>(mode));
}

TEST_CASE("Statistics: mode with a single winner", "[report]") {
    ModeResult mode = Statistics::mode({ 1, 1, 1, 2 });
    REQUIRE(std::holds_alternative<double>(mode));
    REQUIRE(std::get<double>(mode) == 1.0);
}

TEST_CASE("Statistics: all distinct values have no unique mode", "[report]") {
    REQUIRE(std::holds_alternative<NoUniqueMode>(Statistics::mode({ 3, 1, 2 })));
    REQUIRE(std::get<double>(Statistics::mode({ 7.5 })) == 7.5);
}

TEST_CASE("Statistics: median of odd and even sizes", "[report]") {
    REQUIRE(Statistics::median({ 5, 1, 3 }) == 3.0);
    REQUIRE(Statistics::median({ 4, 1, 3, 2 }) == 2.5);
    REQUIRE(Statistics::mean({ 1, 2, 3, 4 }) == 2.5);
}

TEST_CASE("Statistics: rounding to cents", "[report]") {
    REQUIRE(Statistics::roundTo(1100.0000000000002, 2) == 1100.0);
    REQUIRE(Statistics::roundTo(12.345678, 2) == Approx(12.35));
}

TEST_CASE("ReportGenerator: empty group is no data", "[report]") {
    REQUIRE_FALSE(ReportGenerator::summarize({}).has_value());

    std::string text = ReportGenerator::formatGroupReport("Exited Participants", {});
    REQUIRE(text.find("(0 people)") != std::string::npos);
    REQUIRE(text.find("No data to show.") != std::string::npos);

    auto j = ReportGenerator::summaryJson(std::nullopt);
    REQUIRE(j["noData"] == true);
    REQUIRE(j["count"] == 0);
}

TEST_CASE("ReportGenerator: summary of a group", "[report]") {
    auto summary = ReportGenerator::summarize({ 1000.0, 1100.0000000000002, 1100.0, 810.0 });
    REQUIRE(summary.has_value());
    REQUIRE(summary->count == 4);
    REQUIRE(summary->min == 810.0);
    REQUIRE(summary->max == 1100.0);
    REQUIRE(summary->median == Approx(1050.0));
    REQUIRE(summary->mean == Approx(1002.5));

    // Values are compared after rounding to cents, so 1100 wins
    REQUIRE(std::holds_alternative<double>(summary->mode));
    REQUIRE(std::get<double>(summary->mode) == 1100.0);
}

TEST_CASE("ReportGenerator: group report text", "[report]") {
    std::string tied = ReportGenerator::formatGroupReport("Active Participants", { 1, 1, 2, 2 });
    REQUIRE(tied.find("--- Active Participants Report (4 people) ---") != std::string::npos);
    REQUIRE(tied.find("Mode: No unique mode") != std::string::npos);
    REQUIRE(tied.find("Mean: 1.50") != std::string::npos);

    std::string single = ReportGenerator::formatGroupReport("Active Participants", { 1, 1, 1, 2 });
    REQUIRE(single.find("Mode: 1.00") != std::string::npos);
    REQUIRE(single.find("Max: 2.00") != std::string::npos);
}

TEST_CASE("ReportGenerator: summary json carries the mode variant", "[report]") {
    auto tied = ReportGenerator::summaryJson(ReportGenerator::summarize({ 1, 1, 2, 2 }));
    REQUIRE(tied["mode"].is_null());
    REQUIRE(tied["noUniqueMode"] == true);

    auto single = ReportGenerator::summaryJson(ReportGenerator::summarize({ 1, 1, 1, 2 }));
    REQUIRE(single["mode"] == 1.0);
    REQUIRE_FALSE(single.contains("noUniqueMode"));
}

TEST_CASE("ReportGenerator: market update lists years in order", "[report]") {
    IntervalReport report;
    report.startPeriod = 5;
    report.states = { MarketState::UP, MarketState::CRASH };

    std::string text = ReportGenerator::formatMarketUpdate(report);
    REQUIRE(text.find("Year 6: UP") != std::string::npos);
    REQUIRE(text.find("Year 7: CRASH") != std::string::npos);
    REQUIRE(text.find("Year 6") < text.find("Year 7"));
}

TEST_CASE("ReportGenerator: interval and final summary text", "[report]") {
    RuntimeConfig cfg;
    cfg.simulation.agentCount = 12;
    Random rng(31);
    Simulation sim(cfg, rng);

    auto reports = sim.run({ 10 });
    std::string interval = ReportGenerator::formatInterval(reports.front());
    REQUIRE(interval.find("Market update for this interval:") != std::string::npos);
    REQUIRE(interval.find("Active Participants Report") != std::string::npos);
    REQUIRE(interval.find("Exited Participants Report") != std::string::npos);

    std::string closing = ReportGenerator::formatFinalSummary(sim);
    REQUIRE(closing.find("==== FINAL SUMMARY ====") != std::string::npos);
    REQUIRE(closing.find("Years simulated: 20") != std::string::npos);
}
