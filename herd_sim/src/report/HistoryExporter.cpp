#include "HistoryExporter.hpp"
#include "ReportGenerator.hpp"
#include "utils/Logger.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <fstream>

namespace herd {

    bool HistoryExporter::exportToJson(const Simulation& sim, const std::string& filepath) {
        std::ofstream file(filepath);
        if (!file.is_open()) {
            Logger::error("Could not open {} for writing", filepath);
            return false;
        }

        nlohmann::json doc;
        doc["state"] = sim.getStateJson();
        doc["history"] = sim.getHistoryJson();
        doc["summary"] = {
            {"active", ReportGenerator::summaryJson(ReportGenerator::summarize(sim.activeValues()))},
            {"exited", ReportGenerator::summaryJson(ReportGenerator::summarize(sim.inactiveValues()))}
        };

        file << doc.dump(2) << "\n";
        Logger::info("Exported {} periods to {}", sim.getHistory().size(), filepath);
        return true;
    }

    bool HistoryExporter::exportToCsv(const SimulationHistory& history, const std::string& filepath) {
        std::ofstream file(filepath);
        if (!file.is_open()) {
            Logger::error("Could not open {} for writing", filepath);
            return false;
        }

        file << "year,state,active_value,market_index,participation_ratio\n";
        for (const auto& record : history) {
            file << fmt::format("{},{},{:.2f},{:.6f},{:.4f}\n",
                record.period + 1, toString(record.state), record.activeValue,
                record.marketIndex, record.participationRatio);
        }

        Logger::info("Exported {} periods to {}", history.size(), filepath);
        return true;
    }

    std::string HistoryExporter::renderChart(const SimulationHistory& history, int height) {
        std::string out = "\nTotal Market Value Over Time\n";
        if (history.empty()) {
            out += "No history to plot.\n";
            return out;
        }
        height = std::max(height, 2);

        auto [lo, hi] = std::minmax_element(history.begin(), history.end(),
            [](const PeriodRecord& a, const PeriodRecord& b) { return a.activeValue < b.activeValue; });
        double minV = lo->activeValue;
        double maxV = hi->activeValue;
        double span = maxV - minV;

        std::vector<int> rows;
        rows.reserve(history.size());
        for (const auto& record : history) {
            int row = span > 0.0
                ? static_cast<int>(std::lround((record.activeValue - minV) / span * (height - 1)))
                : 0;
            rows.push_back(row);
        }

        for (int r = height - 1; r >= 0; --r) {
            double label = span > 0.0 ? minV + span * r / (height - 1) : minV;
            out += fmt::format("{:>14.2f} |", label);
            for (int row : rows) {
                out += (row == r) ? "  o" : "   ";
            }
            out += "\n";
        }

        out += std::string(15, ' ') + "+" + std::string(history.size() * 3, '-') + "\n";
        out += std::string(16, ' ');
        for (const auto& record : history) {
            out += fmt::format("{:>3}", record.period + 1);
        }
        out += "\n" + std::string(16, ' ') + "Year (y: Total Active Investment Value)\n";
        return out;
    }

} // namespace herd
