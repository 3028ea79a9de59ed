#include "LearningFramework.hpp"
#include "../common/Errors.hpp"
#include <cstdio>

namespace posetal::learning {

LearningFramework::LearningFramework(
    const game::PosetalGame& true_game,
    std::map<std::string, BeliefState> priors,
    FrameworkConfig config
)
    : true_game_(true_game),
      config_(config),
      cache_(config.equilibrium),
      rng_(config.seed)
{
    for (const auto& p : true_game_.players()) {
        auto it = priors.find(p.id());
        if (it == priors.end()) {
            throw InvalidBeliefError("No prior belief for player " + p.id());
        }
        for (const auto& candidate : it->second.candidates()) {
            true_game_.check_order(candidate);
        }
        beliefs_.push_back(std::move(it->second));
    }
    if (priors.size() != beliefs_.size()) {
        throw InvalidBeliefError("Prior beliefs given for players outside the game");
    }

    belief_history_.push_back(beliefs_);
}

VotingRule LearningFramework::rule() const {
    return config_.mode == UpdateMode::Max ? VotingRule::Max : VotingRule::Sum;
}

std::map<int, BeliefState> LearningFramework::beliefs_about_others(int player) const {
    std::map<int, BeliefState> others;
    for (int j = 0; j < true_game_.num_players(); ++j) {
        if (j != player) others.emplace(j, beliefs_[j]);
    }
    return others;
}

Eigen::VectorXd LearningFramework::action_distribution(int player, const order::PriorityOrder& hypothesis) {
    return compute_action_distribution(
        true_game_, player, hypothesis, beliefs_about_others(player), rule(), cache_);
}

game::ActionProfile LearningFramework::run_iteration() {
    const int n = true_game_.num_players();

    // Play: every player acts on its true order
    std::vector<game::ActionIndex> actions(n);
    for (int i = 0; i < n; ++i) {
        const Eigen::VectorXd dist = action_distribution(i, true_game_.player(i).priority_order());
        std::discrete_distribution<int> pick(dist.data(), dist.data() + dist.size());
        actions[i] = pick(rng_);
    }
    const game::ActionProfile played(actions);

    // Learn: likelihood of each player's action under each of its candidates,
    // all computed against the beliefs held before this round
    std::vector<BeliefState> next;
    for (int i = 0; i < n; ++i) {
        const BeliefState& prior = beliefs_[i];
        Eigen::VectorXd likelihood(prior.size());
        for (int c = 0; c < prior.size(); ++c) {
            likelihood(c) = action_distribution(i, prior.candidate(c))(played[i]);
        }
        next.push_back(update_belief(prior, likelihood, UpdateMode::Probability).belief);
    }
    beliefs_ = std::move(next);

    action_history_.push_back(played);
    belief_history_.push_back(beliefs_);

    if (config_.verbose) {
        std::printf("  Iteration %d: %s", iterations(), true_game_.describe(played).c_str());
        for (int i = 0; i < n; ++i) {
            std::printf(" %s=%.4f", true_game_.player(i).id().c_str(), beliefs_[i].concentration());
        }
        std::printf("\n");
    }

    return played;
}

std::vector<game::ActionProfile> LearningFramework::simulate(int n) {
    std::vector<game::ActionProfile> played;
    for (int k = 0; k < n; ++k) {
        played.push_back(run_iteration());
    }
    return played;
}

std::map<std::string, BeliefState> LearningFramework::current_beliefs() const {
    std::map<std::string, BeliefState> result;
    for (int i = 0; i < true_game_.num_players(); ++i) {
        result.emplace(true_game_.player(i).id(), beliefs_[i]);
    }
    return result;
}

const BeliefState& LearningFramework::belief(const std::string& player_id) const {
    return beliefs_.at(true_game_.player_index(player_id));
}

std::map<std::string, order::PriorityOrder> LearningFramework::converged_orders() const {
    std::map<std::string, order::PriorityOrder> result;
    for (int i = 0; i < true_game_.num_players(); ++i) {
        result.emplace(true_game_.player(i).id(), beliefs_[i].candidate(beliefs_[i].most_likely().front()));
    }
    return result;
}

nlohmann::json LearningFramework::to_json() const {
    nlohmann::json j;
    j["mode"] = update_mode_to_string(config_.mode);
    j["equilibrium"] = solver::concept_to_string(config_.equilibrium);
    j["seed"] = config_.seed;
    j["iterations"] = iterations();

    j["actions"] = nlohmann::json::array();
    for (const auto& profile : action_history_) {
        j["actions"].push_back(true_game_.profile_to_json(profile));
    }

    j["beliefs"] = nlohmann::json::object();
    for (int i = 0; i < true_game_.num_players(); ++i) {
        nlohmann::json trajectory = nlohmann::json::array();
        for (const auto& snapshot : belief_history_) {
            trajectory.push_back(std::vector<double>(
                snapshot[i].weights().data(), snapshot[i].weights().data() + snapshot[i].size()));
        }
        nlohmann::json entry = beliefs_[i].to_json();
        entry["trajectory"] = trajectory;
        entry["true_order"] = true_game_.player(i).priority_order().to_string();
        j["beliefs"][true_game_.player(i).id()] = entry;
    }
    return j;
}

} // namespace posetal::learning
