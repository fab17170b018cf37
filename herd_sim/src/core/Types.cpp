#include "Types.hpp"

namespace herd {

    std::string toString(MarketState state) {
        switch (state) {
        case MarketState::UP:    return "up";
        case MarketState::DOWN:  return "down";
        case MarketState::FLAT:  return "flat";
        case MarketState::CRASH: return "crash";
        case MarketState::BOOM:  return "boom";
        }
        return "unknown";
    }

    std::string toString(Personality personality) {
        switch (personality) {
        case Personality::RISK_TAKER: return "risk_taker";
        case Personality::CAUTIOUS:   return "cautious";
        case Personality::GREEDY:     return "greedy";
        case Personality::AVERAGE:    return "average";
        }
        return "unknown";
    }

    std::string toString(ParticipationStatus status) {
        return status == ParticipationStatus::ACTIVE ? "active" : "inactive";
    }

    std::optional<MarketState> parseMarketState(const std::string& name) {
        for (MarketState state : kAllMarketStates) {
            if (toString(state) == name) return state;
        }
        return std::nullopt;
    }

    std::optional<Personality> parsePersonality(const std::string& name) {
        for (Personality p : kAllPersonalities) {
            if (toString(p) == name) return p;
        }
        return std::nullopt;
    }

} // namespace herd
