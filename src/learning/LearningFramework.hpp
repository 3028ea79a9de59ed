#pragma once

#include <map>
#include <random>
#include <string>
#include <vector>
#include "Belief.hpp"
#include "WeightedVoting.hpp"
#include "../game/PosetalGame.hpp"
#include "../solver/EquilibriumFinder.hpp"

namespace posetal::learning {

struct FrameworkConfig {
    UpdateMode mode = UpdateMode::Probability;  // Probability votes by sum, Max votes by max
    solver::EquilibriumConcept equilibrium = solver::EquilibriumConcept::Admissible;
    unsigned seed = 42;
    bool verbose = false;
};

// Repeated play in which every player learns every other player's order.
//
// Each round every player samples an action from its weighted-voting
// distribution (true order, current beliefs about the others); afterwards
// each player's belief is updated by Bayes' rule with the likelihood of the
// action it was seen to play. The true orders stay hidden from the beliefs
// but drive the sampled actions. Runs are deterministic given the seed.
class LearningFramework {
public:
    // priors must hold exactly one belief per player id.
    // Throws InvalidBeliefError on missing or unknown players and
    // InvalidGameError on candidates over unknown metrics.
    LearningFramework(
        const game::PosetalGame& true_game,
        std::map<std::string, BeliefState> priors,
        FrameworkConfig config = {}
    );

    // Play one round and update every belief; returns the profile played
    game::ActionProfile run_iteration();

    // Play n rounds; returns the profiles played
    std::vector<game::ActionProfile> simulate(int n);

    // Weighted-voting distribution of player under hypothesis, given the
    // current beliefs about everyone else
    Eigen::VectorXd action_distribution(int player, const order::PriorityOrder& hypothesis);

    // Current belief about each player, keyed by player id
    std::map<std::string, BeliefState> current_beliefs() const;
    const BeliefState& belief(const std::string& player_id) const;

    // Beliefs (in player order) at the start and after every round
    const std::vector<std::vector<BeliefState>>& belief_history() const { return belief_history_; }
    const std::vector<game::ActionProfile>& action_history() const { return action_history_; }

    // First most likely order of each player's belief
    std::map<std::string, order::PriorityOrder> converged_orders() const;

    int iterations() const { return static_cast<int>(action_history_.size()); }
    const solver::EquilibriumCache& cache() const { return cache_; }
    nlohmann::json to_json() const;

private:
    game::PosetalGame true_game_;
    FrameworkConfig config_;
    std::vector<BeliefState> beliefs_;
    solver::EquilibriumCache cache_;
    std::mt19937 rng_;

    std::vector<std::vector<BeliefState>> belief_history_;
    std::vector<game::ActionProfile> action_history_;

    VotingRule rule() const;
    std::map<int, BeliefState> beliefs_about_others(int player) const;
};

} // namespace posetal::learning
