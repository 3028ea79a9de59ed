#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "Belief.hpp"
#include "Diagnostics.hpp"
#include "../game/PosetalGame.hpp"
#include "../solver/EquilibriumFinder.hpp"

namespace posetal::learning {

// What an observed profile is checked against for each candidate order.
// The observed profile is taken to be an equilibrium of the true game.
enum class Evidence : uint8_t {
    ProfileVote = 0,   // each equilibrium casts one equal vote; share won by the observed profile
    ActionVote = 1,    // equilibrium actions of the target against the observed opponents; share of the observed action
    Profile = 2,       // 1 if the observed profile is an equilibrium under the candidate
    BestResponse = 3   // 1 if the observed action is a best response to the others' actions
};

inline std::string evidence_to_string(Evidence e) {
    switch (e) {
        case Evidence::ProfileVote:  return "profile_vote";
        case Evidence::ActionVote:   return "action_vote";
        case Evidence::Profile:      return "profile";
        case Evidence::BestResponse: return "best_response";
    }
    return "unknown";
}

struct LearningConfig {
    UpdateMode mode = UpdateMode::Probability;
    solver::EquilibriumConcept equilibrium = solver::EquilibriumConcept::Admissible;
    Evidence evidence = Evidence::ProfileVote;
    int max_rounds = 100;                    // Upper bound on rounds consumed by run()
    double concentration_threshold = 0.99;   // run() stops once one candidate holds this much
    bool parallel = false;                   // Score candidates across OpenMP threads
    bool verbose = false;                    // Print one line per round
};

// Infers one player's priority order from observed play.
//
// The other players' orders are taken as known (their orders in the game).
// Every candidate's equilibrium set is fixed for the session and computed once
// at construction; each observation then only rescales the belief.
class LearningSession {
public:
    // Throws InvalidGameError for an unknown player or candidates over
    // unknown metrics, InvalidBeliefError for an invalid candidate set or prior
    LearningSession(
        const game::PosetalGame& game,
        const std::string& player_id,
        std::vector<order::PriorityOrder> candidates,
        LearningConfig config = {},
        const std::optional<Eigen::VectorXd>& prior = std::nullopt
    );

    // Score the candidates against one observed profile and update the belief.
    // Throws InvalidGameError if observed is not a profile of the game.
    const RoundStats& observe(const game::ActionProfile& observed);

    // Observe in sequence until max_rounds is reached, the belief
    // concentrates, or the observations run out
    const LearningTrace& run(const std::vector<game::ActionProfile>& observations);

    // Likelihood of observed under each candidate, without updating
    Eigen::VectorXd scores(const game::ActionProfile& observed) const;

    // Predicted action distribution of the target under candidate c,
    // opponents' actions unknown
    const Eigen::VectorXd& action_distribution(int c) const { return distributions_.at(c); }

    // Equilibria of the game with candidate c substituted
    const game::ProfileSet& equilibria(int c) const { return equilibria_.at(c); }

    BeliefState belief() const { return belief_; }
    std::vector<order::PriorityOrder> most_likely() const { return belief_.most_likely_orders(); }
    bool is_concentrated() const { return belief_.concentration() >= config_.concentration_threshold; }

    int rounds() const { return rounds_; }
    const LearningTrace& trace() const { return trace_; }

    // Weights before the first round and after every round
    const std::vector<Eigen::VectorXd>& history() const { return history_; }

    int player() const { return player_; }
    const game::PosetalGame& source_game() const { return game_; }
    const LearningConfig& config() const { return config_; }

    // Set callback for round updates
    void set_callback(RoundCallback callback) { callback_ = callback; }

private:
    game::PosetalGame game_;
    int player_;
    LearningConfig config_;
    BeliefState belief_;

    std::vector<game::PosetalGame> candidate_games_;
    std::vector<game::ProfileSet> equilibria_;
    std::vector<Eigen::VectorXd> distributions_;

    int rounds_ = 0;
    LearningTrace trace_;
    std::vector<Eigen::VectorXd> history_;
    std::optional<RoundCallback> callback_;

    void precompute();
};

// Entry point matching the learning API: a session over player_id's candidates
LearningSession start_learning_session(
    const game::PosetalGame& game,
    const std::string& player_id,
    std::vector<order::PriorityOrder> candidates,
    LearningConfig config = {},
    const std::optional<Eigen::VectorXd>& prior = std::nullopt
);

} // namespace posetal::learning
