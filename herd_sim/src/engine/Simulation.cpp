#include "Simulation.hpp"
#include "utils/Logger.hpp"
#include <numeric>
#include <stdexcept>

namespace herd {

    Simulation::Simulation(const RuntimeConfig& cfg, RandomSource& rng)
        : Simulation(cfg,
            AgentFactory::createPopulation(cfg.simulation.agentCount, cfg.agent.initialValue,
                cfg.personalities, cfg.reentry, rng),
            rng)
    {
    }

    Simulation::Simulation(const RuntimeConfig& cfg, std::vector<Agent> agents, RandomSource& rng)
        : cfg_(cfg)
        , rng_(rng)
        , market_(cfg.transitions, cfg.multipliers, cfg.participation)
        , agents_(std::move(agents))
        , horizon_(cfg.simulation.horizon)
        , currentState_(cfg.getStartState())
        , marketIndex_(cfg.simulation.initialMarketIndex)
    {
        history_.reserve(horizon_ > 0 ? static_cast<size_t>(horizon_) : 0);

        Logger::info("Simulation initialized with {} agents, horizon {} periods, start state {}",
            agents_.size(), horizon_, toString(currentState_));
    }

    double Simulation::participationRatio() const {
        if (agents_.empty()) return 0.0;
        return static_cast<double>(activeCount()) / static_cast<double>(agents_.size());
    }

    int Simulation::activeCount() const {
        int count = 0;
        for (const auto& agent : agents_) {
            if (agent.isActive()) count++;
        }
        return count;
    }

    std::vector<double> Simulation::activeValues() const {
        std::vector<double> values;
        for (const auto& agent : agents_) {
            if (agent.isActive()) values.push_back(agent.getValue());
        }
        return values;
    }

    std::vector<double> Simulation::inactiveValues() const {
        std::vector<double> values;
        for (const auto& agent : agents_) {
            if (!agent.isActive()) values.push_back(agent.getValue());
        }
        return values;
    }

    double Simulation::totalActiveValue() const {
        auto values = activeValues();
        return std::accumulate(values.begin(), values.end(), 0.0);
    }

    std::optional<PeriodRecord> Simulation::step() {
        if (isFinished()) {
            Logger::warn("Horizon of {} periods reached, not stepping", horizon_);
            return std::nullopt;
        }

        // Taken before any agent moves this period
        double ratio = participationRatio();

        MarketState next = market_.transition(currentState_, ratio, rng_);
        currentState_ = next;
        marketIndex_ *= market_.valueMultiplier(next);

        for (auto& agent : agents_) {
            agent.decide(next, marketIndex_, rng_);
            agent.updateValue(next, market_);
        }

        PeriodRecord record;
        record.period = getCurrentPeriod();
        record.state = next;
        record.activeValue = totalActiveValue();
        record.marketIndex = marketIndex_;
        record.participationRatio = ratio;
        history_.push_back(record);

        Logger::debug("Period {}: {} (index {:.4f}, participation {:.2f}, active value {:.2f})",
            record.period + 1, toString(next), marketIndex_, ratio, record.activeValue);

        return record;
    }

    IntervalReport Simulation::runInterval(int periods) {
        if (periods < 1) {
            throw std::invalid_argument("interval must be at least 1 period, got " + std::to_string(periods));
        }

        IntervalReport report;
        report.startPeriod = getCurrentPeriod();
        report.requested = periods;

        int remaining = getRemainingPeriods();
        int toRun = periods;
        if (toRun > remaining) {
            toRun = remaining;
            report.clamped = true;
            Logger::debug("Interval of {} period(s) clamped to {} by the {}-period horizon",
                periods, toRun, horizon_);
        }

        for (int i = 0; i < toRun; ++i) {
            auto record = step();
            if (!record) break;
            report.states.push_back(record->state);
            report.simulated++;
        }

        report.activeValues = activeValues();
        report.inactiveValues = inactiveValues();

        Logger::info("Interval at period {}: {} period(s) simulated, {} active / {} exited",
            report.startPeriod + 1, report.simulated,
            report.activeValues.size(), report.inactiveValues.size());

        if (intervalCallback_) {
            intervalCallback_(report);
        }

        return report;
    }

    std::vector<IntervalReport> Simulation::run(const std::vector<int>& schedule) {
        std::vector<IntervalReport> reports;

        for (int periods : schedule) {
            if (isFinished()) {
                Logger::warn("Schedule continues past the {}-period horizon, ignoring the rest", horizon_);
                break;
            }
            reports.push_back(runInterval(periods));
        }

        if (!isFinished()) {
            if (!schedule.empty()) {
                Logger::warn("Schedule ends at period {}, running remaining {} period(s)",
                    getCurrentPeriod(), getRemainingPeriods());
            }
            reports.push_back(runInterval(getRemainingPeriods()));
        }

        return reports;
    }

    nlohmann::json Simulation::getStateJson() const {
        nlohmann::json state;
        state["period"] = getCurrentPeriod();
        state["horizon"] = horizon_;
        state["finished"] = isFinished();
        state["marketState"] = toString(currentState_);
        state["marketIndex"] = marketIndex_;
        state["participationRatio"] = participationRatio();
        state["agents"] = agents_.size();
        state["active"] = activeCount();
        state["totalActiveValue"] = totalActiveValue();
        state["seed"] = cfg_.simulation.seed;
        return state;
    }

    nlohmann::json Simulation::getHistoryJson() const {
        nlohmann::json periods = nlohmann::json::array();
        for (const auto& record : history_) {
            periods.push_back({
                {"year", record.period + 1},
                {"state", toString(record.state)},
                {"activeValue", record.activeValue},
                {"marketIndex", record.marketIndex},
                {"participationRatio", record.participationRatio}
            });
        }
        return periods;
    }

} // namespace herd
