#pragma once

#include "engine/Simulation.hpp"
#include "utils/Statistics.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace herd {

    struct GroupSummary {
        size_t count = 0;
        double mean = 0.0;
        double median = 0.0;
        double min = 0.0;
        double max = 0.0;
        ModeResult mode = NoUniqueMode{};
    };

    // Descriptive statistics and console text for groups of agent values
    class ReportGenerator {
    public:
        // Values are rounded to cents first; nullopt means "no data"
        static std::optional<GroupSummary> summarize(const std::vector<double>& values);

        static std::string formatGroupReport(const std::string& name, const std::vector<double>& values);

        // "Year k: STATE" lines for the interval
        static std::string formatMarketUpdate(const IntervalReport& report);

        // Market update followed by the active and exited group reports
        static std::string formatInterval(const IntervalReport& report);

        static std::string formatFinalSummary(const Simulation& sim);

        static nlohmann::json summaryJson(const std::optional<GroupSummary>& summary);
    };

} // namespace herd
