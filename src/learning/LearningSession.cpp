#include "LearningSession.hpp"
#include "WeightedVoting.hpp"
#include "../common/Errors.hpp"
#include <cstdio>
#include <map>

namespace posetal::learning {

namespace {

BeliefState initial_belief(
    std::vector<order::PriorityOrder> candidates,
    const std::optional<Eigen::VectorXd>& prior
) {
    if (prior) {
        return BeliefState::from_prior(std::move(candidates), *prior);
    }
    return BeliefState::uniform(std::move(candidates));
}

} // namespace

LearningSession::LearningSession(
    const game::PosetalGame& game,
    const std::string& player_id,
    std::vector<order::PriorityOrder> candidates,
    LearningConfig config,
    const std::optional<Eigen::VectorXd>& prior
)
    : game_(game),
      player_(game.player_index(player_id)),
      config_(config),
      belief_(initial_belief(std::move(candidates), prior))
{
    precompute();
    history_.push_back(belief_.weights());
}

void LearningSession::precompute() {
    const int n = belief_.size();
    const std::string& id = game_.player(player_).id();

    // Substitution validates each candidate against the game's metrics
    for (int c = 0; c < n; ++c) {
        const std::map<std::string, order::PriorityOrder> substitution{{id, belief_.candidate(c)}};
        candidate_games_.push_back(game_.with_orders(substitution));
    }

    equilibria_.assign(n, game::ProfileSet{});
    distributions_.assign(n, Eigen::VectorXd());
    const int num_actions = game_.player(player_).num_actions();

    // Candidates are independent; each iteration writes only slot c
#ifdef _OPENMP
    #pragma omp parallel for schedule(dynamic) if(config_.parallel)
#endif
    for (int c = 0; c < n; ++c) {
        equilibria_[c] = solver::find_equilibria(candidate_games_[c], config_.equilibrium);
        distributions_[c] = normalize_votes(action_votes(equilibria_[c], player_, num_actions));
    }
}

Eigen::VectorXd LearningSession::scores(const game::ActionProfile& observed) const {
    game_.check_profile(observed);

    const int n = belief_.size();
    const int num_actions = game_.player(player_).num_actions();
    Eigen::VectorXd result(n);
    for (int c = 0; c < n; ++c) {
        switch (config_.evidence) {
            case Evidence::ProfileVote:
                result(c) = equilibria_[c].count(observed)
                    ? 1.0 / static_cast<double>(equilibria_[c].size()) : 0.0;
                break;
            case Evidence::ActionVote: {
                const Eigen::VectorXd votes = action_votes_at(equilibria_[c], observed, player_, num_actions);
                const double total = votes.sum();
                result(c) = total > 0.0 ? votes(observed[player_]) / total : 0.0;
                break;
            }
            case Evidence::Profile:
                result(c) = equilibria_[c].count(observed) ? 1.0 : 0.0;
                break;
            case Evidence::BestResponse:
                result(c) = candidate_games_[c].best_responses(player_, observed).count(observed[player_])
                    ? 1.0 : 0.0;
                break;
        }
    }
    return result;
}

const RoundStats& LearningSession::observe(const game::ActionProfile& observed) {
    const Eigen::VectorXd likelihood = scores(observed);
    BeliefUpdate update = update_belief(belief_, likelihood, config_.mode);
    belief_ = std::move(update.belief);
    rounds_++;

    RoundStats stats;
    stats.round = rounds_;
    stats.observation = game_.describe(observed);
    stats.concentration = belief_.concentration();
    stats.entropy = belief_.entropy();
    stats.support = belief_.support();
    stats.informative = update.informative;
    for (const auto& po : belief_.most_likely_orders()) {
        stats.leaders.push_back(po.to_string());
    }

    trace_.add_round(stats);
    trace_.concentrated = is_concentrated();
    history_.push_back(belief_.weights());

    if (config_.verbose) {
        std::printf("  Round %d: %s concentration=%.4f entropy=%.4f support=%d%s\n",
                    stats.round, stats.observation.c_str(), stats.concentration,
                    stats.entropy, stats.support, stats.informative ? "" : " (uninformative)");
    }

    if (callback_) {
        (*callback_)(stats, belief_);
    }

    return trace_.rounds.back();
}

const LearningTrace& LearningSession::run(const std::vector<game::ActionProfile>& observations) {
    size_t next = 0;
    while (true) {
        if (is_concentrated()) {
            trace_.termination_reason = "Belief concentrated";
            break;
        }
        if (rounds_ >= config_.max_rounds) {
            trace_.termination_reason = "Max rounds reached";
            break;
        }
        if (next >= observations.size()) {
            trace_.termination_reason = "Observations exhausted";
            break;
        }
        observe(observations[next++]);
    }
    trace_.concentrated = is_concentrated();
    return trace_;
}

LearningSession start_learning_session(
    const game::PosetalGame& game,
    const std::string& player_id,
    std::vector<order::PriorityOrder> candidates,
    LearningConfig config,
    const std::optional<Eigen::VectorXd>& prior
) {
    return LearningSession(game, player_id, std::move(candidates), config, prior);
}

} // namespace posetal::learning
