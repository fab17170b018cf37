#include "Agent.hpp"
#include "engine/MarketModel.hpp"
#include "utils/Logger.hpp"

namespace herd {

    Agent::Agent(AgentId id, Personality personality, double initialValue,
        const PersonalityTable& profiles, const ReentryPolicy& reentry)
        : id_(id)
        , personality_(personality)
        , value_(initialValue)
        , profiles_(&profiles)
        , reentry_(&reentry)
    {
    }

    void Agent::decide(MarketState newState, double marketIndex, RandomSource& rng) {
        StayLookup stay = profiles_->lookup(personality_, newState);

        if (status_ == ParticipationStatus::INACTIVE) {
            double chance = reentry_->chance(marketIndex);
            if (rng.uniform01() < chance) {
                status_ = ParticipationStatus::ACTIVE;
                reentries_++;
            }
            return;
        }

        if (rng.uniform01() > stay.probability) {
            status_ = ParticipationStatus::INACTIVE;
            exits_++;
            Logger::trace("Agent {} ({}) exits on {} (stay {:.2f}{})",
                id_, toString(personality_), toString(newState), stay.probability,
                stay.source == StaySource::DEFAULT ? ", default" : "");
        }
    }

    void Agent::updateValue(MarketState state, const MarketModel& market) {
        if (status_ == ParticipationStatus::ACTIVE) {
            value_ *= market.valueMultiplier(state);
        }
    }

    // AgentFactory implementation

    Agent AgentFactory::createAgent(AgentId id, Personality personality, double initialValue,
        const PersonalityTable& profiles, const ReentryPolicy& reentry) {
        return Agent(id, personality, initialValue, profiles, reentry);
    }

    std::vector<Agent> AgentFactory::createPopulation(int count, double initialValue,
        const PersonalityTable& profiles, const ReentryPolicy& reentry,
        RandomSource& rng) {
        std::vector<Agent> agents;
        if (count <= 0) return agents;
        agents.reserve(static_cast<size_t>(count));

        const int lastType = static_cast<int>(kAllPersonalities.size()) - 1;
        for (int i = 0; i < count; ++i) {
            Personality p = kAllPersonalities[static_cast<size_t>(rng.uniformInt(0, lastType))];
            agents.push_back(createAgent(static_cast<AgentId>(i + 1), p, initialValue, profiles, reentry));
        }

        return agents;
    }

} // namespace herd
