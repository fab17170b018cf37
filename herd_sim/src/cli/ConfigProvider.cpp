#include "ConfigProvider.hpp"
#include "utils/Logger.hpp"
#include <cctype>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace herd {

    bool ConfigProvider::loadFile(RuntimeConfig& cfg, const std::string& path, LoggingOptions* logging) {
        std::ifstream file(path);
        if (!file.is_open()) {
            Logger::warn("Could not open config file: {}, using defaults", path);
            return false;
        }

        nlohmann::json j = nlohmann::json::parse(file);
        loadJson(cfg, j, logging);
        Logger::info("Configuration loaded from {}", path);
        return true;
    }

    void ConfigProvider::loadJson(RuntimeConfig& cfg, const nlohmann::json& j, LoggingOptions* logging) {
        cfg.fromJson(j);

        if (logging && j.contains("logging")) {
            auto& log = j["logging"];
            logging->file = log.value("file", logging->file);
            logging->level = log.value("level", logging->level);
            logging->console = log.value("console", logging->console);
        }
    }

    std::vector<int> ConfigProvider::parseSchedule(const std::string& text) {
        std::vector<int> schedule;
        std::stringstream ss(text);
        std::string item;

        while (std::getline(ss, item, ',')) {
            size_t used = 0;
            int value = 0;
            try {
                value = std::stoi(item, &used);
            }
            catch (const std::exception&) {
                throw std::invalid_argument("bad schedule entry '" + item + "'");
            }
            if (used != item.size() || value < 1) {
                throw std::invalid_argument("bad schedule entry '" + item + "'");
            }
            schedule.push_back(value);
        }

        return schedule;
    }

    std::optional<int> ConfigProvider::promptInt(std::istream& in, std::ostream& out,
        const std::string& prompt, int min, int max) {
        while (true) {
            out << prompt << std::flush;

            std::string line;
            if (!std::getline(in, line)) {
                return std::nullopt;
            }

            size_t used = 0;
            int value = 0;
            try {
                value = std::stoi(line, &used);
            }
            catch (const std::exception&) {
                out << "Please enter a whole number.\n";
                continue;
            }

            while (used < line.size() && std::isspace(static_cast<unsigned char>(line[used]))) used++;
            if (used != line.size()) {
                out << "Please enter a whole number.\n";
                continue;
            }
            if (value < min || value > max) {
                out << "Please enter a number between " << min << " and " << max << ".\n";
                continue;
            }
            return value;
        }
    }

    std::optional<int> ConfigProvider::promptAgentCount(std::istream& in, std::ostream& out) {
        return promptInt(in, out, "Enter number of people in the simulation: ",
            1, std::numeric_limits<int>::max());
    }

    std::optional<int> ConfigProvider::promptInterval(std::istream& in, std::ostream& out, int horizon) {
        return promptInt(in, out,
            "Enter number of years to simulate before update (1-" + std::to_string(horizon) + "): ",
            1, horizon);
    }

} // namespace herd
