#include "engine/Simulation.hpp"
#include "cli/ConfigProvider.hpp"
#include "report/ReportGenerator.hpp"
#include "report/HistoryExporter.hpp"
#include "utils/Logger.hpp"
#include "utils/Random.hpp"
#include <iostream>
#include <optional>

using namespace herd;

namespace {

    // Flags given on the command line; applied over the config file
    struct CliOverrides {
        std::optional<int> agents;
        std::optional<int> horizon;
        std::optional<uint32_t> seed;
        std::optional<std::string> startState;
        std::optional<std::vector<int>> schedule;
        std::optional<std::string> historyJson;
        std::optional<std::string> historyCsv;
        std::optional<std::string> logLevel;
        std::optional<std::string> logFile;
        bool noChart = false;
    };

    void printUsage() {
        std::cout << "Market Participation Simulator\n"
            << "Usage: herd_sim [options]\n"
            << "Options:\n"
            << "  --config <path>         JSON config file (optional)\n"
            << "  --agents <n>            Number of agents (default: 100)\n"
            << "  --horizon <years>       Years to simulate (default: 20)\n"
            << "  --schedule <a,b,...>    Report after each interval of years\n"
            << "  --seed <n>              Random seed, 0 = nondeterministic (default: 0)\n"
            << "  --start-state <state>   up|down|flat|crash|boom (default: flat)\n"
            << "  --interactive           Prompt for agent count and each interval\n"
            << "  --history-json <path>   Write history and summaries as JSON\n"
            << "  --history-csv <path>    Write per-year history as CSV\n"
            << "  --no-chart              Skip the console value chart\n"
            << "  --log-level <level>     trace|debug|info|warn|error|off (default: info)\n"
            << "  --log-file <path>       Log file, empty to disable (default: herd_sim.log)\n"
            << "  --help                  Show this help\n";
    }

    void applyOverrides(const CliOverrides& cli, RuntimeConfig& cfg, LoggingOptions& logging) {
        if (cli.agents) cfg.simulation.agentCount = *cli.agents;
        if (cli.horizon) cfg.simulation.horizon = *cli.horizon;
        if (cli.seed) cfg.simulation.seed = *cli.seed;
        if (cli.startState) cfg.simulation.startState = *cli.startState;
        if (cli.schedule) cfg.simulation.stepSchedule = *cli.schedule;
        if (cli.historyJson) cfg.output.historyJson = *cli.historyJson;
        if (cli.historyCsv) cfg.output.historyCsv = *cli.historyCsv;
        if (cli.noChart) cfg.output.chart = false;
        if (cli.logLevel) logging.level = *cli.logLevel;
        if (cli.logFile) logging.file = *cli.logFile;
    }

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath;
    bool interactive = false;
    CliOverrides cli;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                configPath = argv[++i];
            }
            else if (arg == "--agents" && i + 1 < argc) {
                cli.agents = std::stoi(argv[++i]);
            }
            else if (arg == "--horizon" && i + 1 < argc) {
                cli.horizon = std::stoi(argv[++i]);
            }
            else if (arg == "--schedule" && i + 1 < argc) {
                cli.schedule = ConfigProvider::parseSchedule(argv[++i]);
            }
            else if (arg == "--seed" && i + 1 < argc) {
                cli.seed = static_cast<uint32_t>(std::stoul(argv[++i]));
            }
            else if (arg == "--start-state" && i + 1 < argc) {
                cli.startState = argv[++i];
            }
            else if (arg == "--history-json" && i + 1 < argc) {
                cli.historyJson = argv[++i];
            }
            else if (arg == "--history-csv" && i + 1 < argc) {
                cli.historyCsv = argv[++i];
            }
            else if (arg == "--log-level" && i + 1 < argc) {
                cli.logLevel = argv[++i];
            }
            else if (arg == "--log-file" && i + 1 < argc) {
                cli.logFile = argv[++i];
            }
            else if (arg == "--interactive") {
                interactive = true;
            }
            else if (arg == "--no-chart") {
                cli.noChart = true;
            }
            else if (arg == "--help") {
                printUsage();
                return 0;
            }
            else {
                std::cerr << "Unknown option: " << arg << " (see --help)\n";
                return 1;
            }
        }
    }
    catch (const std::exception& e) {
        std::cerr << "Invalid command line: " << e.what() << "\n";
        return 1;
    }

    try {
        RuntimeConfig cfg;
        LoggingOptions logging;

        if (!configPath.empty()) {
            ConfigProvider::loadFile(cfg, configPath, &logging);
        }
        applyOverrides(cli, cfg, logging);

        Logger::init(logging.file, logging.level, logging.console);
        Logger::info("=== Market Participation Simulator ===");

        if (interactive && !cli.agents) {
            auto count = ConfigProvider::promptAgentCount(std::cin, std::cout);
            if (!count) {
                Logger::error("No agent count entered");
                return 1;
            }
            cfg.simulation.agentCount = *count;
        }

        cfg.validate();

        Random rng(cfg.simulation.seed);
        Logger::info("Seed: {}", rng.getSeed());

        Simulation sim(cfg, rng);
        sim.setIntervalCallback([&sim](const IntervalReport& report) {
            if (report.clamped) {
                std::cout << "Adjusting to " << report.simulated << " year(s) to stay within "
                    << sim.getHorizon() << "-year limit.\n";
            }
            std::cout << ReportGenerator::formatInterval(report);
        });

        if (interactive) {
            while (!sim.isFinished()) {
                int year = sim.getCurrentPeriod();
                std::cout << "\nYear " << year << " - " << year + 1 << " Simulation\n";
                auto interval = ConfigProvider::promptInterval(std::cin, std::cout, sim.getHorizon());
                if (!interval) {
                    Logger::warn("Input closed at year {}, running the remaining {} year(s)",
                        year, sim.getRemainingPeriods());
                    sim.runInterval(sim.getRemainingPeriods());
                    break;
                }
                sim.runInterval(*interval);
            }
        }
        else {
            sim.run(cfg.simulation.stepSchedule);
        }

        std::cout << ReportGenerator::formatFinalSummary(sim);

        if (cfg.output.chart) {
            std::cout << HistoryExporter::renderChart(sim.getHistory());
        }

        bool exportsOk = true;
        if (!cfg.output.historyJson.empty()) {
            exportsOk = HistoryExporter::exportToJson(sim, cfg.output.historyJson) && exportsOk;
        }
        if (!cfg.output.historyCsv.empty()) {
            exportsOk = HistoryExporter::exportToCsv(sim.getHistory(), cfg.output.historyCsv) && exportsOk;
        }

        Logger::info("Done after {} years, final market index {:.4f}",
            sim.getCurrentPeriod(), sim.getMarketIndex());
        Logger::get()->flush();

        return exportsOk ? 0 : 1;
    }
    catch (const std::exception& e) {
        Logger::error("Fatal error: {}", e.what());
        return 1;
    }
}
