#include "WeightedVoting.hpp"
#include "../common/Errors.hpp"

namespace posetal::learning {

Eigen::VectorXd action_votes(const game::ProfileSet& equilibria, int player, int num_actions) {
    Eigen::VectorXd votes = Eigen::VectorXd::Zero(num_actions);
    for (const auto& profile : equilibria) {
        votes(profile[player]) = 1.0;
    }
    return votes;
}

Eigen::VectorXd action_votes_at(
    const game::ProfileSet& equilibria,
    const game::ActionProfile& profile,
    int player,
    int num_actions
) {
    Eigen::VectorXd votes = Eigen::VectorXd::Zero(num_actions);
    for (game::ActionIndex a = 0; a < num_actions; ++a) {
        if (equilibria.count(profile.with_action(player, a))) votes(a) = 1.0;
    }
    return votes;
}

Eigen::VectorXd normalize_votes(const Eigen::VectorXd& votes) {
    const double total = votes.sum();
    if (total <= 0.0) {
        return Eigen::VectorXd::Constant(votes.size(), 1.0 / votes.size());
    }
    return votes / total;
}

Eigen::VectorXd compute_action_distribution(
    const game::PosetalGame& game,
    int player,
    const order::PriorityOrder& hypothesis,
    const std::map<int, BeliefState>& others,
    VotingRule rule,
    solver::EquilibriumCache& cache
) {
    if (player < 0 || player >= game.num_players()) {
        throw InvalidGameError("Player index out of range: " + std::to_string(player));
    }
    if (others.count(player)) {
        throw InvalidBeliefError("Belief about the voting player itself");
    }

    // Players whose order is uncertain, and an odometer over their candidates
    std::vector<int> uncertain;
    std::vector<const BeliefState*> beliefs;
    for (const auto& [p, belief] : others) {
        if (p < 0 || p >= game.num_players()) {
            throw InvalidGameError("Player index out of range: " + std::to_string(p));
        }
        uncertain.push_back(p);
        beliefs.push_back(&belief);
    }
    std::vector<int> digit(uncertain.size(), 0);

    std::vector<order::PriorityOrder> orders = game.orders();
    orders[player] = hypothesis;

    const int num_actions = game.player(player).num_actions();
    Eigen::VectorXd votes = Eigen::VectorXd::Zero(num_actions);

    while (true) {
        double joint = 1.0;
        for (size_t k = 0; k < uncertain.size(); ++k) {
            joint *= beliefs[k]->probability(digit[k]);
            orders[uncertain[k]] = beliefs[k]->candidate(digit[k]);
        }

        if (joint > 0.0) {
            const Eigen::VectorXd hit = action_votes(cache.find(game, orders), player, num_actions);
            if (rule == VotingRule::Sum) {
                votes += joint * hit;
            } else {
                votes = votes.cwiseMax(joint * hit);
            }
        }

        // Advance the odometer, last player fastest
        int k = static_cast<int>(uncertain.size()) - 1;
        while (k >= 0 && ++digit[k] == beliefs[k]->size()) {
            digit[k] = 0;
            --k;
        }
        if (k < 0) break;
    }

    return normalize_votes(votes);
}

} // namespace posetal::learning
