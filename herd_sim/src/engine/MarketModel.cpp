#include "MarketModel.hpp"
#include <algorithm>
#include <stdexcept>

namespace herd {

    MarketModel::MarketModel(TransitionMatrix baseMatrix,
        ValueMultipliers multipliers,
        ParticipationFeedback feedback)
        : baseMatrix_(std::move(baseMatrix))
        , multipliers_(std::move(multipliers))
        , feedback_(feedback)
    {
        validateTransitionMatrix(baseMatrix_);
        validateValueMultipliers(multipliers_);
        validateParticipationFeedback(feedback_);
    }

    Distribution MarketModel::adjustRow(const Distribution& row, double participationRatio,
        const ParticipationFeedback& feedback) {
        if (participationRatio >= feedback.threshold) {
            return row;
        }

        Distribution adjusted = row;
        adjusted[MarketState::DOWN] += feedback.downBoost;
        adjusted[MarketState::UP] = std::max(0.0, adjusted[MarketState::UP] - feedback.upPenalty);
        adjusted[MarketState::BOOM] = std::max(0.0, adjusted[MarketState::BOOM] - feedback.boomPenalty);

        double total = rowTotal(adjusted);
        if (total <= 0.0) {
            return row;
        }

        for (auto& [_, p] : adjusted) {
            p /= total;
        }
        return adjusted;
    }

    TransitionMatrix MarketModel::adjustForParticipation(const TransitionMatrix& base,
        double participationRatio,
        const ParticipationFeedback& feedback) {
        TransitionMatrix adjusted;
        for (const auto& [from, row] : base) {
            adjusted.emplace(from, adjustRow(row, participationRatio, feedback));
        }
        return adjusted;
    }

    Distribution MarketModel::adjustedRow(MarketState from, double participationRatio) const {
        return adjustRow(baseMatrix_.at(from), participationRatio, feedback_);
    }

    MarketState MarketModel::transition(MarketState currentState, double participationRatio,
        RandomSource& rng) const {
        Distribution row = adjustedRow(currentState, participationRatio);

        std::vector<double> weights;
        weights.reserve(kAllMarketStates.size());
        for (MarketState to : kAllMarketStates) {
            auto it = row.find(to);
            weights.push_back(it != row.end() ? it->second : 0.0);
        }

        size_t idx = rng.weightedIndex(weights);
        if (idx >= kAllMarketStates.size()) {
            throw std::out_of_range("weighted draw returned index " + std::to_string(idx));
        }
        return kAllMarketStates[idx];
    }

    double MarketModel::valueMultiplier(MarketState state) const {
        return multipliers_.at(state);
    }

} // namespace herd
