#pragma once

#include "core/RuntimeConfig.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace herd {

    // Not part of RuntimeConfig, keeps Logger decoupled from the model
    struct LoggingOptions {
        std::string file = "herd_sim.log";
        std::string level = "info";
        bool console = true;
    };

    /// Supplies run parameters from a JSON file and from interactive prompts.
    /// Everything it hands over has passed RuntimeConfig::validate() or the
    /// prompt's own range check.
    class ConfigProvider {
    public:
        // Merge-patches cfg from a JSON file.  A missing file logs a warning and
        // returns false; malformed JSON or bad values throw.
        static bool loadFile(RuntimeConfig& cfg, const std::string& path, LoggingOptions* logging = nullptr);

        static void loadJson(RuntimeConfig& cfg, const nlohmann::json& j, LoggingOptions* logging = nullptr);

        // "5,5,10" -> {5, 5, 10}; throws std::invalid_argument on junk
        static std::vector<int> parseSchedule(const std::string& text);

        // Re-asks until an integer in [min, max] is entered; nullopt on end of input
        static std::optional<int> promptInt(std::istream& in, std::ostream& out,
            const std::string& prompt, int min, int max);

        static std::optional<int> promptAgentCount(std::istream& in, std::ostream& out);

        // Accepts [1, horizon]; overshooting the remaining periods is left to
        // the engine, which clamps and reports it
        static std::optional<int> promptInterval(std::istream& in, std::ostream& out, int horizon);
    };

} // namespace herd
