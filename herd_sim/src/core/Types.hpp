#pragma once

#include <string>
#include <cstdint>
#include <optional>
#include <vector>
#include <array>

namespace herd {

    using AgentId = uint64_t;

    enum class MarketState {
        UP,
        DOWN,
        FLAT,
        CRASH,
        BOOM
    };

    // Canonical order, also the order used for weighted sampling
    inline constexpr std::array<MarketState, 5> kAllMarketStates = {
        MarketState::UP,
        MarketState::DOWN,
        MarketState::FLAT,
        MarketState::CRASH,
        MarketState::BOOM
    };

    enum class Personality {
        RISK_TAKER,
        CAUTIOUS,
        GREEDY,
        AVERAGE
    };

    inline constexpr std::array<Personality, 4> kAllPersonalities = {
        Personality::RISK_TAKER,
        Personality::CAUTIOUS,
        Personality::GREEDY,
        Personality::AVERAGE
    };

    enum class ParticipationStatus {
        ACTIVE,
        INACTIVE
    };

    // One simulated period
    struct PeriodRecord {
        int period = 0;                    // 0-based
        MarketState state = MarketState::FLAT;
        double activeValue = 0.0;          // sum of value over active agents after the period
        double marketIndex = 1.0;          // cumulative multiplier product after the period
        double participationRatio = 1.0;   // snapshot used for the transition draw
    };

    using SimulationHistory = std::vector<PeriodRecord>;

    // Lower-case names ("up", "risk_taker") used in config files and exports
    std::string toString(MarketState state);
    std::string toString(Personality personality);
    std::string toString(ParticipationStatus status);

    std::optional<MarketState> parseMarketState(const std::string& name);
    std::optional<Personality> parsePersonality(const std::string& name);

} // namespace herd
