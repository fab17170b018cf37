#pragma once

#include "MarketModel.hpp"
#include "agents/Agent.hpp"
#include "core/RuntimeConfig.hpp"
#include "utils/Random.hpp"
#include <functional>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

namespace herd {

    // Outcome of one scheduled block of periods
    struct IntervalReport {
        int startPeriod = 0;          // first period of the interval (0-based)
        int requested = 0;
        int simulated = 0;
        bool clamped = false;         // requested overshot the horizon
        std::vector<MarketState> states;
        std::vector<double> activeValues;     // snapshot at interval end
        std::vector<double> inactiveValues;
    };

    /// Year-by-year driver of the market / population feedback loop.
    ///
    /// Per period: snapshot participation, draw the next market state, move
    /// the market index, let every agent decide and then revalue, record the
    /// period.  Never runs past the configured horizon.
    class Simulation {
    public:
        // Builds the market and a random population from cfg.
        // cfg and rng must outlive the simulation.
        Simulation(const RuntimeConfig& cfg, RandomSource& rng);

        // Uses the given population instead of generating one
        Simulation(const RuntimeConfig& cfg, std::vector<Agent> agents, RandomSource& rng);

        // One period; nullopt once the horizon is reached
        std::optional<PeriodRecord> step();

        // min(periods, remaining) periods; throws std::invalid_argument if periods < 1
        IntervalReport runInterval(int periods);

        // Runs the schedule to the horizon, remainder as a final interval
        std::vector<IntervalReport> run(const std::vector<int>& schedule);

        // Status
        int getCurrentPeriod() const { return static_cast<int>(history_.size()); }
        int getHorizon() const { return horizon_; }
        int getRemainingPeriods() const { return horizon_ - getCurrentPeriod(); }
        bool isFinished() const { return getRemainingPeriods() <= 0; }
        MarketState getCurrentState() const { return currentState_; }
        double getMarketIndex() const { return marketIndex_; }

        // Active count / total, 0 for an empty population
        double participationRatio() const;
        int activeCount() const;

        std::vector<double> activeValues() const;
        std::vector<double> inactiveValues() const;
        double totalActiveValue() const;

        const SimulationHistory& getHistory() const { return history_; }
        const std::vector<Agent>& getAgents() const { return agents_; }
        const MarketModel& getMarket() const { return market_; }

        using IntervalCallback = std::function<void(const IntervalReport&)>;
        void setIntervalCallback(IntervalCallback cb) { intervalCallback_ = std::move(cb); }

        nlohmann::json getStateJson() const;
        nlohmann::json getHistoryJson() const;

    private:
        const RuntimeConfig& cfg_;
        RandomSource& rng_;
        MarketModel market_;
        std::vector<Agent> agents_;

        int horizon_;
        MarketState currentState_;
        double marketIndex_;
        SimulationHistory history_;

        IntervalCallback intervalCallback_;
    };

} // namespace herd
