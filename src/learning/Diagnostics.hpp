#pragma once

#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "Belief.hpp"

namespace posetal::learning {

// Statistics for a single observation round
struct RoundStats {
    int round = 0;
    std::string observation;       // Observed profile, as described by the game
    double concentration = 0.0;    // Largest candidate weight after the update
    double entropy = 0.0;          // Belief entropy after the update (nats)
    int support = 0;               // Candidates with non-zero weight
    bool informative = true;       // False when the observation supported no candidate
    std::vector<std::string> leaders;  // Most likely orders after the update

    nlohmann::json to_json() const {
        return {
            {"round", round},
            {"observation", observation},
            {"concentration", concentration},
            {"entropy", entropy},
            {"support", support},
            {"informative", informative},
            {"leaders", leaders}
        };
    }
};

// Full trace of a learning session
struct LearningTrace {
    std::vector<RoundStats> rounds;
    bool concentrated = false;
    int total_rounds = 0;
    std::string termination_reason;

    void add_round(const RoundStats& stats) {
        rounds.push_back(stats);
        total_rounds = static_cast<int>(rounds.size());
    }

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["concentrated"] = concentrated;
        j["total_rounds"] = total_rounds;
        j["termination_reason"] = termination_reason;
        j["rounds"] = nlohmann::json::array();
        for (const auto& r : rounds) {
            j["rounds"].push_back(r.to_json());
        }
        return j;
    }
};

// Callback type for round updates
// Receives round stats and the belief after the update
using RoundCallback = std::function<void(const RoundStats&, const BeliefState&)>;

} // namespace posetal::learning
