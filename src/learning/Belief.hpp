#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "../order/PriorityOrder.hpp"

namespace posetal::learning {

// How a likelihood vector reshapes the belief
enum class UpdateMode : uint8_t {
    Probability = 0,  // multiply by the likelihood and renormalize
    Max = 1           // winner-take-all: best posterior scores share the mass
};

inline std::string update_mode_to_string(UpdateMode m) {
    switch (m) {
        case UpdateMode::Probability: return "probability";
        case UpdateMode::Max:         return "max";
    }
    return "unknown";
}

// Weights at or below this distance from the maximum count as tied
constexpr double kTieTolerance = 1e-12;

struct BeliefUpdate;

// Probability distribution over candidate priority orders.
//
// Immutable value: updates produce a new belief. Candidates are unique and
// the weights always sum to 1.
class BeliefState {
public:
    // Equal weight on every candidate.
    // Throws InvalidBeliefError on an empty or duplicated candidate set.
    static BeliefState uniform(std::vector<order::PriorityOrder> candidates);

    // Normalized copy of prior.
    // Throws InvalidBeliefError on size mismatch, negative or non-finite
    // weights, or zero total mass.
    static BeliefState from_prior(std::vector<order::PriorityOrder> candidates, const Eigen::VectorXd& prior);

    int size() const { return static_cast<int>(candidates_.size()); }
    const std::vector<order::PriorityOrder>& candidates() const { return candidates_; }
    const order::PriorityOrder& candidate(int i) const { return candidates_.at(i); }
    const Eigen::VectorXd& weights() const { return weights_; }

    double probability(int i) const { return weights_(i); }

    // Weight of a given order, 0 if it is not a candidate
    double probability(const order::PriorityOrder& po) const;
    std::optional<int> find(const order::PriorityOrder& po) const;

    // Every candidate tied for the largest weight
    std::vector<int> most_likely() const;
    std::vector<order::PriorityOrder> most_likely_orders() const;

    // Largest single weight
    double concentration() const { return weights_.maxCoeff(); }

    // Shannon entropy in nats
    double entropy() const;

    // Number of candidates with non-zero weight
    int support() const;

    // Draw a candidate index according to the weights
    int sample(std::mt19937& rng) const;

    nlohmann::json to_json() const;

private:
    BeliefState(std::vector<order::PriorityOrder> candidates, Eigen::VectorXd weights)
        : candidates_(std::move(candidates)), weights_(std::move(weights)) {}

    friend BeliefUpdate update_belief(const BeliefState&, const Eigen::VectorXd&, UpdateMode);

    std::vector<order::PriorityOrder> candidates_;
    Eigen::VectorXd weights_;
};

// Result of one update step
struct BeliefUpdate {
    BeliefState belief;
    bool informative = true;  // false when the evidence gave zero support and the prior was kept
};

// Apply one likelihood vector (one entry per candidate, each >= 0).
//
// Probability mode: posterior ∝ prior .* likelihood.
// Max mode: candidates maximizing prior .* likelihood share the mass equally;
// when that product vanishes everywhere the argmax of the likelihood alone
// takes the mass instead.
// If the evidence supports no candidate at all the prior is returned
// unchanged and flagged as uninformative.
// Throws InvalidBeliefError on a malformed likelihood.
BeliefUpdate update_belief(const BeliefState& prior, const Eigen::VectorXd& likelihood, UpdateMode mode);

} // namespace posetal::learning
