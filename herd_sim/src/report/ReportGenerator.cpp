#include "ReportGenerator.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>

namespace herd {

    namespace {

        std::string upper(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return s;
        }

    } // namespace

    std::optional<GroupSummary> ReportGenerator::summarize(const std::vector<double>& values) {
        if (values.empty()) return std::nullopt;

        std::vector<double> cents = Statistics::roundAll(values, 2);

        GroupSummary summary;
        summary.count = cents.size();
        summary.mean = Statistics::roundTo(Statistics::mean(cents), 2);
        summary.median = Statistics::roundTo(Statistics::median(cents), 2);
        summary.min = *std::min_element(cents.begin(), cents.end());
        summary.max = *std::max_element(cents.begin(), cents.end());
        summary.mode = Statistics::mode(cents);
        return summary;
    }

    std::string ReportGenerator::formatGroupReport(const std::string& name, const std::vector<double>& values) {
        std::string out = fmt::format("\n--- {} Report ({} people) ---\n", name, values.size());

        auto summary = summarize(values);
        if (!summary) {
            out += "No data to show.\n";
            return out;
        }

        out += fmt::format("Mean: {:.2f}\n", summary->mean);
        out += fmt::format("Median: {:.2f}\n", summary->median);
        if (const double* mode = std::get_if<double>(&summary->mode)) {
            out += fmt::format("Mode: {:.2f}\n", *mode);
        }
        else {
            out += "Mode: No unique mode\n";
        }
        out += fmt::format("Min: {:.2f}\n", summary->min);
        out += fmt::format("Max: {:.2f}\n", summary->max);
        return out;
    }

    std::string ReportGenerator::formatMarketUpdate(const IntervalReport& report) {
        std::string out = "\nMarket update for this interval:\n";
        for (size_t i = 0; i < report.states.size(); ++i) {
            out += fmt::format("Year {}: {}\n",
                report.startPeriod + static_cast<int>(i) + 1, upper(toString(report.states[i])));
        }
        return out;
    }

    std::string ReportGenerator::formatInterval(const IntervalReport& report) {
        std::string out = formatMarketUpdate(report);
        out += formatGroupReport("Active Participants", report.activeValues);
        out += formatGroupReport("Exited Participants", report.inactiveValues);
        return out;
    }

    std::string ReportGenerator::formatFinalSummary(const Simulation& sim) {
        std::string out = "\n\n==== FINAL SUMMARY ====\n";
        out += fmt::format("Years simulated: {}  Final state: {}  Market index: {:.4f}\n",
            sim.getCurrentPeriod(), upper(toString(sim.getCurrentState())), sim.getMarketIndex());
        out += formatGroupReport("Active Participants", sim.activeValues());
        out += formatGroupReport("Exited Participants", sim.inactiveValues());
        return out;
    }

    nlohmann::json ReportGenerator::summaryJson(const std::optional<GroupSummary>& summary) {
        if (!summary) {
            return { {"count", 0}, {"noData", true} };
        }

        nlohmann::json j = {
            {"count", summary->count},
            {"mean", summary->mean},
            {"median", summary->median},
            {"min", summary->min},
            {"max", summary->max}
        };
        if (const double* mode = std::get_if<double>(&summary->mode)) {
            j["mode"] = *mode;
        }
        else {
            j["mode"] = nullptr;
            j["noUniqueMode"] = true;
        }
        return j;
    }

} // namespace herd
