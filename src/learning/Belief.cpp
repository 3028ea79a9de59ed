#include "Belief.hpp"
#include "../common/Errors.hpp"
#include <cmath>
#include <set>

namespace posetal::learning {

namespace {

void check_candidates(const std::vector<order::PriorityOrder>& candidates) {
    if (candidates.empty()) {
        throw InvalidBeliefError("Belief needs at least one candidate order");
    }
    std::set<order::PriorityOrder> seen;
    for (const auto& c : candidates) {
        if (!seen.insert(c).second) {
            throw InvalidBeliefError("Duplicate candidate order: " + c.to_string());
        }
    }
}

void check_weights(const Eigen::VectorXd& w, int expected, const char* what) {
    if (w.size() != expected) {
        throw InvalidBeliefError(std::string(what) + " has " + std::to_string(w.size()) +
                                 " entries, expected " + std::to_string(expected));
    }
    for (int i = 0; i < w.size(); ++i) {
        if (!std::isfinite(w(i)) || w(i) < 0.0) {
            throw InvalidBeliefError(std::string(what) + " entry " + std::to_string(i) +
                                     " is negative or not finite");
        }
    }
}

} // namespace

BeliefState BeliefState::uniform(std::vector<order::PriorityOrder> candidates) {
    check_candidates(candidates);
    const int n = static_cast<int>(candidates.size());
    return BeliefState(std::move(candidates), Eigen::VectorXd::Constant(n, 1.0 / n));
}

BeliefState BeliefState::from_prior(std::vector<order::PriorityOrder> candidates, const Eigen::VectorXd& prior) {
    check_candidates(candidates);
    check_weights(prior, static_cast<int>(candidates.size()), "Prior");

    const double total = prior.sum();
    if (total <= 0.0) {
        throw InvalidBeliefError("Prior has zero total mass");
    }
    return BeliefState(std::move(candidates), prior / total);
}

std::optional<int> BeliefState::find(const order::PriorityOrder& po) const {
    for (int i = 0; i < size(); ++i) {
        if (candidates_[i] == po) return i;
    }
    return std::nullopt;
}

double BeliefState::probability(const order::PriorityOrder& po) const {
    auto i = find(po);
    return i ? weights_(*i) : 0.0;
}

std::vector<int> BeliefState::most_likely() const {
    const double best = weights_.maxCoeff();
    std::vector<int> result;
    for (int i = 0; i < size(); ++i) {
        if (best - weights_(i) <= kTieTolerance) result.push_back(i);
    }
    return result;
}

std::vector<order::PriorityOrder> BeliefState::most_likely_orders() const {
    std::vector<order::PriorityOrder> result;
    for (int i : most_likely()) {
        result.push_back(candidates_[i]);
    }
    return result;
}

double BeliefState::entropy() const {
    double h = 0.0;
    for (int i = 0; i < size(); ++i) {
        if (weights_(i) > 0.0) h -= weights_(i) * std::log(weights_(i));
    }
    return h;
}

int BeliefState::support() const {
    int count = 0;
    for (int i = 0; i < size(); ++i) {
        if (weights_(i) > 0.0) ++count;
    }
    return count;
}

int BeliefState::sample(std::mt19937& rng) const {
    std::discrete_distribution<int> dist(weights_.data(), weights_.data() + weights_.size());
    return dist(rng);
}

nlohmann::json BeliefState::to_json() const {
    nlohmann::json j;
    j["candidates"] = nlohmann::json::array();
    for (int i = 0; i < size(); ++i) {
        j["candidates"].push_back({
            {"order", candidates_[i].to_string()},
            {"weight", weights_(i)}
        });
    }
    j["concentration"] = concentration();
    j["entropy"] = entropy();

    nlohmann::json leaders = nlohmann::json::array();
    for (int i : most_likely()) {
        leaders.push_back(candidates_[i].to_string());
    }
    j["most_likely"] = leaders;
    return j;
}

BeliefUpdate update_belief(const BeliefState& prior, const Eigen::VectorXd& likelihood, UpdateMode mode) {
    check_weights(likelihood, prior.size(), "Likelihood");

    const Eigen::VectorXd products = prior.weights_.cwiseProduct(likelihood);

    if (mode == UpdateMode::Probability) {
        const double total = products.sum();
        if (total <= 0.0) {
            return {prior, false};
        }
        return {BeliefState(prior.candidates_, products / total), true};
    }

    // Winner-take-all; fall back to the raw scores when the prior rules out
    // every candidate the evidence supports
    const Eigen::VectorXd* scores = &products;
    if (products.maxCoeff() <= 0.0) {
        if (likelihood.maxCoeff() <= 0.0) {
            return {prior, false};
        }
        scores = &likelihood;
    }

    const double best = scores->maxCoeff();
    Eigen::VectorXd next = Eigen::VectorXd::Zero(prior.size());
    for (int i = 0; i < prior.size(); ++i) {
        if (best - (*scores)(i) <= kTieTolerance * best) next(i) = 1.0;
    }
    return {BeliefState(prior.candidates_, next / next.sum()), true};
}

} // namespace posetal::learning
