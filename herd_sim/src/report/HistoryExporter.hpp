#pragma once

#include "core/Types.hpp"
#include "engine/Simulation.hpp"
#include <string>

namespace herd {

    // Writes the per-period series for external plotting and draws a
    // console chart of total active value by year
    class HistoryExporter {
    public:
        // History, final state and group summaries as one JSON document
        static bool exportToJson(const Simulation& sim, const std::string& filepath);

        // year,state,active_value,market_index,participation_ratio
        static bool exportToCsv(const SimulationHistory& history, const std::string& filepath);

        static std::string renderChart(const SimulationHistory& history, int height = 12);
    };

} // namespace herd
