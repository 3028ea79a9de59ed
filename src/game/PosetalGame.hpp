#pragma once

#include <Eigen/Dense>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>
#include "GameTypes.hpp"
#include "../order/PriorityOrder.hpp"

namespace posetal::game {

// Player of a posetal game: identity, actions, and a priority order over
// the metrics it cares about (a subset of the game's metrics).
class Player {
public:
    // Throws EmptyActionSpaceError if actions is empty and
    // InvalidGameError on duplicate action names
    Player(std::string id, std::vector<std::string> actions, order::PriorityOrder order);

    const std::string& id() const { return id_; }
    const std::vector<std::string>& actions() const { return actions_; }
    int num_actions() const { return static_cast<int>(actions_.size()); }
    const std::string& action_name(ActionIndex a) const { return actions_.at(a); }
    const order::PriorityOrder& priority_order() const { return order_; }

    // Throws InvalidGameError for unknown actions
    ActionIndex action_index(const std::string& action) const;

    // Same player with another priority order
    Player with_order(order::PriorityOrder order) const;

private:
    std::string id_;
    std::vector<std::string> actions_;
    order::PriorityOrder order_;
};

// Finite pure-strategy game whose players compare outcomes through the
// partial preorder induced by their priority orders.
//
// The outcome function is evaluated once per profile when the game is built
// and tabulated; the game is immutable afterwards. with_orders() shares the
// metric list and the outcome table with the new game.
class PosetalGame {
public:
    // Validate and assemble a game.
    // Throws InvalidGameError if a player's order names an unknown metric,
    // if player ids or metric names repeat, or if outcome_fn is not total
    // (throws, returns a vector of the wrong length, or a non-finite value).
    // Throws EmptyActionSpaceError through Player construction.
    static PosetalGame build(
        std::vector<Metric> metrics,
        std::vector<Player> players,
        const OutcomeFunction& outcome_fn
    );

    // Metrics
    const std::vector<Metric>& metrics() const { return *metrics_; }
    int num_metrics() const { return static_cast<int>(metrics_->size()); }
    int metric_index(const std::string& name) const;

    // Players
    const std::vector<Player>& players() const { return players_; }
    int num_players() const { return static_cast<int>(players_.size()); }
    const Player& player(int i) const { return players_.at(i); }
    int player_index(const std::string& id) const;

    // Throws InvalidGameError if po names a metric outside the game
    void check_order(const order::PriorityOrder& po) const;

    // Priority order of each player, in player order
    std::vector<order::PriorityOrder> orders() const;

    // Profile space
    int num_profiles() const { return index_.total(); }
    const ProfileIndex& profile_index() const { return index_; }
    ProfileRange profiles() const { return ProfileRange(index_); }
    ActionProfile profile_at(int pos) const { return index_.profile_at(pos); }
    int index_of(const ActionProfile& profile) const;

    // Throws InvalidGameError unless profile has one in-range action per player
    void check_profile(const ActionProfile& profile) const;

    // Build a profile from action names, given in player order or keyed by player id
    ActionProfile make_profile(const std::vector<std::string>& action_names) const;
    ActionProfile make_profile(const std::map<std::string, std::string>& by_player) const;

    // "(P1=A, P2=B)"
    std::string describe(const ActionProfile& profile) const;
    nlohmann::json profile_to_json(const ActionProfile& profile) const;

    // Tabulated metric vector of a profile
    const Eigen::VectorXd& outcome(const ActionProfile& profile) const;
    double metric_value(const ActionProfile& profile, const std::string& metric) const;

    // How player ranks x against y.
    //
    // x <= y iff every metric of the player's order on which x is better has a
    // strictly more important metric on which y is better. Greater when only
    // y <= x holds, Less when only x <= y, Equal when both, Incomparable when
    // neither: a disagreement that no higher metric settles leaves the two
    // outcomes incomparable rather than tied.
    order::Comparison preference(int player, const ActionProfile& x, const ActionProfile& y) const;
    order::Comparison preference(const std::string& player_id, const ActionProfile& x, const ActionProfile& y) const;

    // Profiles differing from profile only in player's action
    std::vector<ActionProfile> deviations(const ActionProfile& profile, int player) const;

    // Actions of player that are maximal against its own alternatives,
    // the other players' actions being fixed by profile
    std::set<ActionIndex> best_responses(int player, const ActionProfile& profile) const;

    // Preorder induced on all profiles for one player, labelled by describe()
    order::Relation induced_preorder(int player) const;

    // Same game with some players' orders replaced.
    // Throws InvalidGameError for unknown player ids or orders over unknown metrics.
    PosetalGame with_orders(const std::map<std::string, order::PriorityOrder>& orders) const;
    PosetalGame with_orders(const std::vector<order::PriorityOrder>& orders) const;

    // True when both games were derived from one build() and so share the
    // metric list and outcome table
    bool shares_outcomes(const PosetalGame& other) const {
        return metrics_ == other.metrics_ && outcomes_ == other.outcomes_;
    }

private:
    PosetalGame() = default;

    std::shared_ptr<const std::vector<Metric>> metrics_;
    std::vector<Player> players_;
    ProfileIndex index_;
    std::shared_ptr<const std::vector<Eigen::VectorXd>> outcomes_;

    // Per player: element id in its order -> game metric index
    std::vector<std::vector<int>> order_metrics_;

    std::vector<int> resolve_order_metrics(const Player& player) const;
};

} // namespace posetal::game
