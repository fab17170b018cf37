#pragma once

#include "core/Types.hpp"
#include "core/MarketTables.hpp"
#include "utils/Random.hpp"

namespace herd {

    // Markov-chain market with participation feedback on the transition row
    class MarketModel {
    public:
        // Throws std::invalid_argument if a table or the feedback is malformed
        MarketModel(TransitionMatrix baseMatrix,
            ValueMultipliers multipliers,
            ParticipationFeedback feedback = {});

        // Pure: returns a new matrix, base is left untouched.
        // ratio >= feedback.threshold returns base unchanged.
        static TransitionMatrix adjustForParticipation(const TransitionMatrix& base,
            double participationRatio,
            const ParticipationFeedback& feedback = {});

        TransitionMatrix adjustedMatrix(double participationRatio) const {
            return adjustForParticipation(baseMatrix_, participationRatio, feedback_);
        }

        Distribution adjustedRow(MarketState from, double participationRatio) const;

        // Single weighted draw from the adjusted row of currentState
        MarketState transition(MarketState currentState, double participationRatio,
            RandomSource& rng) const;

        double valueMultiplier(MarketState state) const;

        const TransitionMatrix& getBaseMatrix() const { return baseMatrix_; }
        const ValueMultipliers& getValueMultipliers() const { return multipliers_; }
        const ParticipationFeedback& getFeedback() const { return feedback_; }

    private:
        const TransitionMatrix baseMatrix_;
        const ValueMultipliers multipliers_;
        const ParticipationFeedback feedback_;

        static Distribution adjustRow(const Distribution& row, double participationRatio,
            const ParticipationFeedback& feedback);
    };

} // namespace herd
