#pragma once

#include "Types.hpp"
#include <map>

namespace herd {

    // Where a stay-in probability came from
    enum class StaySource {
        TABLE,
        DEFAULT
    };

    struct StayLookup {
        double probability;
        MarketState bucket;   // bucket actually looked up (crash folds into down)
        StaySource source;
    };

    /// Per-personality probability that an active agent stays invested after
    /// seeing a given market state.  Only up/down/flat buckets exist in the
    /// reference profiles; crash is read from the down bucket and every
    /// other miss (boom, or a bucket removed by configuration) resolves to
    /// kDefaultStayProbability.
    class PersonalityTable {
    public:
        static constexpr double kDefaultStayProbability = 0.6;

        PersonalityTable() = default;

        static PersonalityTable defaults();

        void set(Personality personality, MarketState bucket, double probability);
        void erase(Personality personality, MarketState bucket);

        // Total over {personality x state}; never throws
        StayLookup lookup(Personality personality, MarketState state) const;

        double stayProbability(Personality personality, MarketState state) const {
            return lookup(personality, state).probability;
        }

        bool hasEntry(Personality personality, MarketState bucket) const;

        static MarketState bucketFor(MarketState state) {
            return state == MarketState::CRASH ? MarketState::DOWN : state;
        }

        const std::map<Personality, std::map<MarketState, double>>& entries() const { return entries_; }

        // Throw std::invalid_argument if any probability is outside [0, 1]
        void validate() const;

    private:
        std::map<Personality, std::map<MarketState, double>> entries_;
    };

} // namespace herd
