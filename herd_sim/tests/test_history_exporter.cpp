#include <catch2/catch_test_macros.hpp>
#include "report/HistoryExporter.hpp"
#include "utils/Random.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using namespace herd;

namespace {

    std::string readFile(const std::string& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    SimulationHistory sampleHistory() {
        SimulationHistory history;
        history.push_back({ 0, MarketState::UP, 1100.0, 1.1, 1.0 });
        history.push_back({ 1, MarketState::CRASH, 660.0, 0.66, 1.0 });
        history.push_back({ 2, MarketState::BOOM, 858.0, 0.858, 0.5 });
        return history;
    }

} // namespace

TEST_CASE("HistoryExporter: csv has a header and one row per year", "[export]") {
    const std::string path = "herd_sim_test_history.csv";
    REQUIRE(HistoryExporter::exportToCsv(sampleHistory(), path));

    std::string csv = readFile(path);
    REQUIRE(csv.find("year,state,active_value,market_index,participation_ratio\n") == 0);
    REQUIRE(csv.find("1,up,1100.00,1.100000,1.0000") != std::string::npos);
    REQUIRE(csv.find("2,crash,660.00") != std::string::npos);
    REQUIRE(csv.find("3,boom,858.00,0.858000,0.5000") != std::string::npos);

    std::remove(path.c_str());
}

TEST_CASE("HistoryExporter: json export of a finished run", "[export]") {
    RuntimeConfig cfg;
    cfg.simulation.agentCount = 8;
    cfg.simulation.horizon = 6;
    Random rng(64);
    Simulation sim(cfg, rng);
    sim.run({});

    const std::string path = "herd_sim_test_history.json";
    REQUIRE(HistoryExporter::exportToJson(sim, path));

    auto doc = nlohmann::json::parse(readFile(path));
    REQUIRE(doc["history"].size() == 6);
    REQUIRE(doc["state"]["finished"] == true);
    REQUIRE(doc["summary"].contains("active"));
    REQUIRE(doc["summary"].contains("exited"));

    std::remove(path.c_str());
}

TEST_CASE("HistoryExporter: unwritable path reports failure", "[export]") {
    REQUIRE_FALSE(HistoryExporter::exportToCsv(sampleHistory(), "no/such/dir/history.csv"));
}

TEST_CASE("HistoryExporter: chart plots one point per year", "[export]") {
    std::string chart = HistoryExporter::renderChart(sampleHistory(), 5);

    REQUIRE(chart.find("Total Market Value Over Time") != std::string::npos);
    REQUIRE(chart.find("1100.00 |") != std::string::npos);
    REQUIRE(chart.find("660.00 |") != std::string::npos);

    size_t points = 0;
    for (char c : chart) {
        if (c == 'o') points++;
    }
    // Title and axis label contain lower-case 'o' too
    size_t labelOs = 0;
    for (const char* label : { "Total Market Value Over Time", "Year (y: Total Active Investment Value)" }) {
        for (const char* p = label; *p; ++p) {
            if (*p == 'o') labelOs++;
        }
    }
    REQUIRE(points - labelOs == 3);
}

TEST_CASE("HistoryExporter: empty history", "[export]") {
    std::string chart = HistoryExporter::renderChart({});
    REQUIRE(chart.find("No history to plot.") != std::string::npos);
}

TEST_CASE("HistoryExporter: flat series renders on the bottom row", "[export]") {
    SimulationHistory history;
    history.push_back({ 0, MarketState::FLAT, 1000.0, 1.0, 1.0 });
    history.push_back({ 1, MarketState::FLAT, 1000.0, 1.0, 1.0 });

    std::string chart = HistoryExporter::renderChart(history, 3);
    REQUIRE(chart.find("1000.00 |  o  o") != std::string::npos);
}
