#pragma once

#include "Types.hpp"
#include "MarketTables.hpp"
#include "PersonalityTable.hpp"
#include "agents/ReentryPolicy.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdint>

namespace herd {

    /// Every tunable knob of a run, with the reference values as defaults so
    /// an empty config reproduces the hand-tuned model.  Built once at start
    /// up (defaults, then config file, then command-line flags) and handed by
    /// const reference to the Simulation, which never modifies it.

    struct RuntimeConfig {

        // ---- Run shape -----------------------------------------------------------
        struct SimulationParams {
            int    agentCount = 100;
            int    horizon = 20;                 // periods (years)
            std::string startState = "flat";
            double initialMarketIndex = 1.0;
            uint32_t seed = 0;                   // 0 = nondeterministic
            std::vector<int> stepSchedule;       // empty = whole horizon at once
        } simulation;

        // ---- Agent endowment -----------------------------------------------------
        struct AgentParams {
            double initialValue = 1000.0;
        } agent;

        ReentryPolicy reentry;
        ParticipationFeedback participation;

        // ---- Market tables -------------------------------------------------------
        TransitionMatrix transitions = defaultTransitionMatrix();
        ValueMultipliers multipliers = defaultValueMultipliers();

        PersonalityTable personalities = PersonalityTable::defaults();

        // ---- Outputs -------------------------------------------------------------
        struct OutputParams {
            std::string historyJson;     // empty = skip
            std::string historyCsv;      // empty = skip
            bool chart = true;
        } output;

        MarketState getStartState() const {
            auto state = parseMarketState(simulation.startState);
            if (!state) {
                throw std::invalid_argument("unknown start state '" + simulation.startState + "'");
            }
            return *state;
        }

        /// Throws std::invalid_argument on the first invalid value
        void validate() const {
            if (simulation.agentCount <= 0) {
                throw std::invalid_argument("agentCount must be positive, got "
                    + std::to_string(simulation.agentCount));
            }
            if (simulation.horizon <= 0) {
                throw std::invalid_argument("horizon must be positive, got "
                    + std::to_string(simulation.horizon));
            }
            for (int step : simulation.stepSchedule) {
                if (step < 1) {
                    throw std::invalid_argument("stepSchedule entries must be >= 1, got "
                        + std::to_string(step));
                }
            }
            getStartState();
            if (!(agent.initialValue > 0.0)) {
                throw std::invalid_argument("initialValue must be positive");
            }
            if (!(simulation.initialMarketIndex > 0.0)) {
                throw std::invalid_argument("initialMarketIndex must be positive");
            }
            for (double c : { reentry.baseChance, reentry.deepDiscountChance, reentry.discountChance }) {
                if (!(c >= 0.0 && c <= 1.0)) {
                    throw std::invalid_argument("re-entry chances must be in [0, 1]");
                }
            }
            validateTransitionMatrix(transitions);
            validateValueMultipliers(multipliers);
            validateParticipationFeedback(participation);
            personalities.validate();
        }

        // ==== JSON serialisation ==================================================

        nlohmann::json toJson() const {
            nlohmann::json j;

            j["simulation"] = {
                {"agentCount",         simulation.agentCount},
                {"horizon",            simulation.horizon},
                {"startState",         simulation.startState},
                {"initialMarketIndex", simulation.initialMarketIndex},
                {"seed",               simulation.seed},
                {"stepSchedule",       simulation.stepSchedule}
            };

            j["agent"] = {
                {"initialValue", agent.initialValue}
            };

            j["reentry"] = {
                {"baseChance",         reentry.baseChance},
                {"deepDiscountIndex",  reentry.deepDiscountIndex},
                {"deepDiscountChance", reentry.deepDiscountChance},
                {"discountIndex",      reentry.discountIndex},
                {"discountChance",     reentry.discountChance}
            };

            j["participation"] = {
                {"threshold",   participation.threshold},
                {"downBoost",   participation.downBoost},
                {"upPenalty",   participation.upPenalty},
                {"boomPenalty", participation.boomPenalty}
            };

            nlohmann::json t = nlohmann::json::object();
            for (const auto& [from, row] : transitions) {
                for (const auto& [to, p] : row) {
                    t[toString(from)][toString(to)] = p;
                }
            }
            j["transitions"] = t;

            nlohmann::json m = nlohmann::json::object();
            for (const auto& [state, mult] : multipliers) {
                m[toString(state)] = mult;
            }
            j["multipliers"] = m;

            nlohmann::json p = nlohmann::json::object();
            for (const auto& [personality, buckets] : personalities.entries()) {
                for (const auto& [bucket, prob] : buckets) {
                    p[toString(personality)][toString(bucket)] = prob;
                }
            }
            j["personalities"] = p;

            j["output"] = {
                {"historyJson", output.historyJson},
                {"historyCsv",  output.historyCsv},
                {"chart",       output.chart}
            };

            return j;
        }

        /// Merge-patch: only the keys present in `j` are updated; everything
        /// else keeps its current/default value.  Table entries are patched
        /// cell by cell.
        void fromJson(const nlohmann::json& j) {
            auto get = [](const nlohmann::json& obj, const char* key, auto& dst) {
                if (obj.contains(key)) dst = obj[key].get<std::remove_reference_t<decltype(dst)>>();
                };

            if (j.contains("simulation")) {
                auto& s = j["simulation"];
                get(s, "agentCount", simulation.agentCount);
                get(s, "horizon", simulation.horizon);
                get(s, "startState", simulation.startState);
                get(s, "initialMarketIndex", simulation.initialMarketIndex);
                get(s, "seed", simulation.seed);
                get(s, "stepSchedule", simulation.stepSchedule);
            }

            if (j.contains("agent")) {
                get(j["agent"], "initialValue", agent.initialValue);
            }

            if (j.contains("reentry")) {
                auto& r = j["reentry"];
                get(r, "baseChance", reentry.baseChance);
                get(r, "deepDiscountIndex", reentry.deepDiscountIndex);
                get(r, "deepDiscountChance", reentry.deepDiscountChance);
                get(r, "discountIndex", reentry.discountIndex);
                get(r, "discountChance", reentry.discountChance);
            }

            if (j.contains("participation")) {
                auto& p = j["participation"];
                get(p, "threshold", participation.threshold);
                get(p, "downBoost", participation.downBoost);
                get(p, "upPenalty", participation.upPenalty);
                get(p, "boomPenalty", participation.boomPenalty);
            }

            if (j.contains("transitions")) {
                for (const auto& [fromName, row] : j["transitions"].items()) {
                    MarketState from = stateKey(fromName);
                    for (const auto& [toName, prob] : row.items()) {
                        transitions[from][stateKey(toName)] = prob.get<double>();
                    }
                }
            }

            if (j.contains("multipliers")) {
                for (const auto& [name, mult] : j["multipliers"].items()) {
                    multipliers[stateKey(name)] = mult.get<double>();
                }
            }

            if (j.contains("personalities")) {
                for (const auto& [name, buckets] : j["personalities"].items()) {
                    auto personality = parsePersonality(name);
                    if (!personality) {
                        throw std::invalid_argument("unknown personality '" + name + "'");
                    }
                    for (const auto& [bucketName, prob] : buckets.items()) {
                        if (prob.is_null()) {
                            personalities.erase(*personality, stateKey(bucketName));
                        }
                        else {
                            personalities.set(*personality, stateKey(bucketName), prob.get<double>());
                        }
                    }
                }
            }

            if (j.contains("output")) {
                auto& o = j["output"];
                get(o, "historyJson", output.historyJson);
                get(o, "historyCsv", output.historyCsv);
                get(o, "chart", output.chart);
            }
        }

    private:
        static MarketState stateKey(const std::string& name) {
            auto state = parseMarketState(name);
            if (!state) {
                throw std::invalid_argument("unknown market state '" + name + "'");
            }
            return *state;
        }
    };

} // namespace herd
