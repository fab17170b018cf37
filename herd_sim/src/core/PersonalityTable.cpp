#include "PersonalityTable.hpp"
#include <stdexcept>

namespace herd {

    PersonalityTable PersonalityTable::defaults() {
        PersonalityTable table;
        auto row = [&table](Personality p, double up, double down, double flat) {
            table.set(p, MarketState::UP, up);
            table.set(p, MarketState::DOWN, down);
            table.set(p, MarketState::FLAT, flat);
        };

        row(Personality::RISK_TAKER, 0.90, 0.75, 0.80);
        row(Personality::CAUTIOUS,   0.95, 0.40, 0.60);
        row(Personality::GREEDY,     0.99, 0.65, 0.70);
        row(Personality::AVERAGE,    0.85, 0.50, 0.65);
        return table;
    }

    void PersonalityTable::set(Personality personality, MarketState bucket, double probability) {
        entries_[personality][bucket] = probability;
    }

    void PersonalityTable::erase(Personality personality, MarketState bucket) {
        auto it = entries_.find(personality);
        if (it != entries_.end()) {
            it->second.erase(bucket);
        }
    }

    StayLookup PersonalityTable::lookup(Personality personality, MarketState state) const {
        MarketState bucket = bucketFor(state);

        auto pIt = entries_.find(personality);
        if (pIt != entries_.end()) {
            auto bIt = pIt->second.find(bucket);
            if (bIt != pIt->second.end()) {
                return { bIt->second, bucket, StaySource::TABLE };
            }
        }

        // Boom always lands here with the reference profiles
        return { kDefaultStayProbability, bucket, StaySource::DEFAULT };
    }

    bool PersonalityTable::hasEntry(Personality personality, MarketState bucket) const {
        auto it = entries_.find(personality);
        return it != entries_.end() && it->second.count(bucket) > 0;
    }

    void PersonalityTable::validate() const {
        for (const auto& [personality, buckets] : entries_) {
            for (const auto& [bucket, p] : buckets) {
                if (!(p >= 0.0 && p <= 1.0)) {
                    throw std::invalid_argument("stay-in probability for " + toString(personality)
                        + "/" + toString(bucket) + " must be in [0, 1], got " + std::to_string(p));
                }
            }
        }
    }

} // namespace herd
