#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <map>
#include <string>
#include "Belief.hpp"
#include "../game/PosetalGame.hpp"
#include "../solver/EquilibriumFinder.hpp"

namespace posetal::learning {

// How the votes of the other players' order profiles are aggregated
enum class VotingRule : uint8_t {
    Sum = 0,  // expected vote: sum of profile probability x indicator
    Max = 1   // most probable supporting profile
};

inline std::string voting_rule_to_string(VotingRule r) {
    switch (r) {
        case VotingRule::Sum: return "sum";
        case VotingRule::Max: return "max";
    }
    return "unknown";
}

// 1 for each action of player that appears in some profile of equilibria, 0 otherwise
Eigen::VectorXd action_votes(const game::ProfileSet& equilibria, int player, int num_actions);

// 1 for each action a of player such that profile with player's action
// replaced by a is in equilibria, 0 otherwise
Eigen::VectorXd action_votes_at(
    const game::ProfileSet& equilibria,
    const game::ActionProfile& profile,
    int player,
    int num_actions
);

// Scale votes into a distribution; uniform when no action received a vote
Eigen::VectorXd normalize_votes(const Eigen::VectorXd& votes);

// Predicted action distribution of player under a hypothesised order.
//
// Every combination of the other players' candidate orders votes, with its
// joint belief weight, for the actions player takes in the equilibria of the
// game in which those orders hold. Players without an entry in others are
// taken at their order in game. Combinations with zero weight are skipped.
// Equilibria are memoized in cache, which must only ever see games sharing
// the action and outcome structure of game.
Eigen::VectorXd compute_action_distribution(
    const game::PosetalGame& game,
    int player,
    const order::PriorityOrder& hypothesis,
    const std::map<int, BeliefState>& others,
    VotingRule rule,
    solver::EquilibriumCache& cache
);

} // namespace posetal::learning
