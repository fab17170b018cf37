#pragma once

#include "core/Types.hpp"
#include "core/PersonalityTable.hpp"
#include "agents/ReentryPolicy.hpp"
#include "utils/Random.hpp"
#include <vector>

namespace herd {

    class MarketModel;

    // Investor with a fixed personality and a binary in/out position.
    // decide() must run before updateValue() within a period: an agent that
    // re-enters takes this period's move, one that exits does not.
    class Agent {
    public:
        Agent(AgentId id, Personality personality, double initialValue,
            const PersonalityTable& profiles, const ReentryPolicy& reentry);

        // React to the market state just revealed for this period
        void decide(MarketState newState, double marketIndex, RandomSource& rng);

        // Rescale value by the state's multiplier while active
        void updateValue(MarketState state, const MarketModel& market);

        // Getters
        AgentId getId() const { return id_; }
        Personality getPersonality() const { return personality_; }
        double getValue() const { return value_; }
        bool isActive() const { return status_ == ParticipationStatus::ACTIVE; }
        ParticipationStatus getStatus() const { return status_; }
        int getExitCount() const { return exits_; }
        int getReentryCount() const { return reentries_; }

    private:
        AgentId id_;
        Personality personality_;
        double value_;
        ParticipationStatus status_ = ParticipationStatus::ACTIVE;

        const PersonalityTable* profiles_;
        const ReentryPolicy* reentry_;

        int exits_ = 0;
        int reentries_ = 0;
    };

    // Builds agents that share one profile table and re-entry policy
    class AgentFactory {
    public:
        static Agent createAgent(AgentId id, Personality personality, double initialValue,
            const PersonalityTable& profiles, const ReentryPolicy& reentry);

        // ids 1..count, personalities drawn uniformly
        static std::vector<Agent> createPopulation(int count, double initialValue,
            const PersonalityTable& profiles, const ReentryPolicy& reentry,
            RandomSource& rng);
    };

} // namespace herd
