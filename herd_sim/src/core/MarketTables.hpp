#pragma once

#include "Types.hpp"
#include <map>

namespace herd {

    using Distribution = std::map<MarketState, double>;
    using TransitionMatrix = std::map<MarketState, Distribution>;
    using ValueMultipliers = std::map<MarketState, double>;

    // Tolerance for "sums to 1" checks on transition rows
    inline constexpr double kProbabilityTolerance = 1e-9;

    // Low participation makes the market more bearish
    struct ParticipationFeedback {
        double threshold = 0.5;     // adjustment applies when ratio < threshold
        double downBoost = 0.05;
        double upPenalty = 0.03;    // floored at 0
        double boomPenalty = 0.01;  // floored at 0
    };

    TransitionMatrix defaultTransitionMatrix();
    ValueMultipliers defaultValueMultipliers();

    double rowTotal(const Distribution& row);

    // Throw std::invalid_argument describing the first violation found
    void validateTransitionMatrix(const TransitionMatrix& matrix);
    void validateValueMultipliers(const ValueMultipliers& multipliers);
    void validateParticipationFeedback(const ParticipationFeedback& feedback);

} // namespace herd
