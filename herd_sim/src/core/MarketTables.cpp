#include "MarketTables.hpp"
#include <cmath>
#include <string>
#include <utility>
#include <stdexcept>

namespace herd {

    TransitionMatrix defaultTransitionMatrix() {
        using S = MarketState;
        return {
            {S::UP,    {{S::UP, 0.4},  {S::DOWN, 0.3},  {S::FLAT, 0.25}, {S::CRASH, 0.025}, {S::BOOM, 0.025}}},
            {S::DOWN,  {{S::UP, 0.3},  {S::DOWN, 0.4},  {S::FLAT, 0.25}, {S::CRASH, 0.05},  {S::BOOM, 0.0}}},
            {S::FLAT,  {{S::UP, 0.35}, {S::DOWN, 0.3},  {S::FLAT, 0.3},  {S::CRASH, 0.025}, {S::BOOM, 0.025}}},
            {S::CRASH, {{S::UP, 0.4},  {S::DOWN, 0.3},  {S::FLAT, 0.25}, {S::CRASH, 0.025}, {S::BOOM, 0.025}}},
            {S::BOOM,  {{S::UP, 0.3},  {S::DOWN, 0.25}, {S::FLAT, 0.4},  {S::CRASH, 0.025}, {S::BOOM, 0.025}}}
        };
    }

    ValueMultipliers defaultValueMultipliers() {
        return {
            {MarketState::UP, 1.1},
            {MarketState::DOWN, 0.9},
            {MarketState::FLAT, 1.0},
            {MarketState::CRASH, 0.6},
            {MarketState::BOOM, 1.3}
        };
    }

    double rowTotal(const Distribution& row) {
        double total = 0.0;
        for (const auto& [_, p] : row) {
            total += p;
        }
        return total;
    }

    void validateTransitionMatrix(const TransitionMatrix& matrix) {
        for (MarketState from : kAllMarketStates) {
            auto it = matrix.find(from);
            if (it == matrix.end()) {
                throw std::invalid_argument("transition matrix has no row for '" + toString(from) + "'");
            }

            for (const auto& [to, p] : it->second) {
                if (!(p >= 0.0) || !std::isfinite(p)) {
                    throw std::invalid_argument("transition " + toString(from) + " -> " + toString(to)
                        + " has invalid probability " + std::to_string(p));
                }
            }

            double total = rowTotal(it->second);
            if (std::abs(total - 1.0) > kProbabilityTolerance) {
                throw std::invalid_argument("transition row '" + toString(from)
                    + "' sums to " + std::to_string(total) + ", expected 1.0");
            }
        }
    }

    void validateValueMultipliers(const ValueMultipliers& multipliers) {
        for (MarketState state : kAllMarketStates) {
            auto it = multipliers.find(state);
            if (it == multipliers.end()) {
                throw std::invalid_argument("no value multiplier for '" + toString(state) + "'");
            }
            if (!(it->second > 0.0) || !std::isfinite(it->second)) {
                throw std::invalid_argument("value multiplier for '" + toString(state)
                    + "' must be positive, got " + std::to_string(it->second));
            }
        }
    }

    void validateParticipationFeedback(const ParticipationFeedback& feedback) {
        if (!std::isfinite(feedback.threshold) || feedback.threshold < 0.0 || feedback.threshold > 1.0) {
            throw std::invalid_argument("participation threshold must be in [0, 1], got "
                + std::to_string(feedback.threshold));
        }

        const std::pair<const char*, double> adjustments[] = {
            {"downBoost", feedback.downBoost},
            {"upPenalty", feedback.upPenalty},
            {"boomPenalty", feedback.boomPenalty}
        };
        for (const auto& [name, value] : adjustments) {
            if (!(value >= 0.0) || !std::isfinite(value)) {
                throw std::invalid_argument(std::string("participation ") + name
                    + " must be non-negative, got " + std::to_string(value));
            }
        }
    }

} // namespace herd
