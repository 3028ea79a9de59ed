#include "PosetalGame.hpp"
#include "../common/Errors.hpp"
#include <cmath>

namespace posetal::game {

// ============================================================================
// Player
// ============================================================================

Player::Player(std::string id, std::vector<std::string> actions, order::PriorityOrder order)
    : id_(std::move(id)), actions_(std::move(actions)), order_(std::move(order))
{
    if (actions_.empty()) {
        throw EmptyActionSpaceError("Player " + id_ + " has no actions");
    }
    std::set<std::string> seen;
    for (const auto& a : actions_) {
        if (!seen.insert(a).second) {
            throw InvalidGameError("Player " + id_ + " declares action " + a + " twice");
        }
    }
}

ActionIndex Player::action_index(const std::string& action) const {
    for (size_t i = 0; i < actions_.size(); ++i) {
        if (actions_[i] == action) return static_cast<ActionIndex>(i);
    }
    throw InvalidGameError("Unknown action " + action + " for player " + id_);
}

Player Player::with_order(order::PriorityOrder order) const {
    Player p = *this;
    p.order_ = std::move(order);
    return p;
}

// ============================================================================
// Construction
// ============================================================================

PosetalGame PosetalGame::build(
    std::vector<Metric> metrics,
    std::vector<Player> players,
    const OutcomeFunction& outcome_fn
) {
    if (players.empty()) {
        throw InvalidGameError("A game needs at least one player");
    }
    if (!outcome_fn) {
        throw InvalidGameError("Missing outcome function");
    }

    std::set<std::string> metric_names;
    for (const auto& m : metrics) {
        if (!metric_names.insert(m.name).second) {
            throw InvalidGameError("Duplicate metric: " + m.name);
        }
    }
    std::set<std::string> player_ids;
    for (const auto& p : players) {
        if (!player_ids.insert(p.id()).second) {
            throw InvalidGameError("Duplicate player: " + p.id());
        }
    }

    PosetalGame game;
    game.metrics_ = std::make_shared<const std::vector<Metric>>(std::move(metrics));
    game.players_ = std::move(players);

    for (const auto& p : game.players_) {
        game.order_metrics_.push_back(game.resolve_order_metrics(p));
    }

    std::vector<int> num_actions;
    for (const auto& p : game.players_) {
        num_actions.push_back(p.num_actions());
    }
    game.index_.build(num_actions);

    // Tabulate the outcome function; it must be total over the profile space
    auto outcomes = std::make_shared<std::vector<Eigen::VectorXd>>();
    outcomes->reserve(game.index_.total());
    for (int pos = 0; pos < game.index_.total(); ++pos) {
        const ActionProfile profile = game.index_.profile_at(pos);
        Eigen::VectorXd values;
        try {
            values = outcome_fn(profile);
        } catch (const std::exception& e) {
            throw InvalidGameError(
                "Outcome function failed on " + game.describe(profile) + ": " + e.what());
        }
        if (values.size() != game.num_metrics()) {
            throw InvalidGameError(
                "Outcome function returned " + std::to_string(values.size()) +
                " values for " + game.describe(profile) + ", expected " +
                std::to_string(game.num_metrics()));
        }
        if (!values.allFinite()) {
            throw InvalidGameError("Outcome function returned a non-finite value for " +
                                   game.describe(profile));
        }
        outcomes->push_back(std::move(values));
    }
    game.outcomes_ = std::move(outcomes);

    return game;
}

std::vector<int> PosetalGame::resolve_order_metrics(const Player& player) const {
    std::vector<int> ids;
    for (const auto& name : player.priority_order().elements()) {
        int found = -1;
        for (int m = 0; m < num_metrics(); ++m) {
            if ((*metrics_)[m].name == name) {
                found = m;
                break;
            }
        }
        if (found < 0) {
            throw InvalidGameError(
                "Priority order of player " + player.id() + " references unknown metric " + name);
        }
        ids.push_back(found);
    }
    return ids;
}

PosetalGame PosetalGame::with_orders(const std::map<std::string, order::PriorityOrder>& orders) const {
    PosetalGame game = *this;
    for (const auto& [id, po] : orders) {
        const int i = player_index(id);
        game.players_[i] = players_[i].with_order(po);
        game.order_metrics_[i] = game.resolve_order_metrics(game.players_[i]);
    }
    return game;
}

PosetalGame PosetalGame::with_orders(const std::vector<order::PriorityOrder>& orders) const {
    if (static_cast<int>(orders.size()) != num_players()) {
        throw InvalidGameError("Expected one order per player");
    }
    std::map<std::string, order::PriorityOrder> by_id;
    for (int i = 0; i < num_players(); ++i) {
        by_id.emplace(players_[i].id(), orders[i]);
    }
    return with_orders(by_id);
}

// ============================================================================
// Lookup
// ============================================================================

int PosetalGame::metric_index(const std::string& name) const {
    for (int m = 0; m < num_metrics(); ++m) {
        if ((*metrics_)[m].name == name) return m;
    }
    throw InvalidGameError("Unknown metric: " + name);
}

int PosetalGame::player_index(const std::string& id) const {
    for (int i = 0; i < num_players(); ++i) {
        if (players_[i].id() == id) return i;
    }
    throw InvalidGameError("Unknown player: " + id);
}

void PosetalGame::check_order(const order::PriorityOrder& po) const {
    for (const auto& name : po.elements()) {
        metric_index(name);
    }
}

std::vector<order::PriorityOrder> PosetalGame::orders() const {
    std::vector<order::PriorityOrder> result;
    for (const auto& p : players_) {
        result.push_back(p.priority_order());
    }
    return result;
}

void PosetalGame::check_profile(const ActionProfile& profile) const {
    if (!index_.is_valid(profile)) {
        throw InvalidGameError("Action profile does not match the game's action spaces");
    }
}

int PosetalGame::index_of(const ActionProfile& profile) const {
    check_profile(profile);
    return index_.index_of(profile);
}

ActionProfile PosetalGame::make_profile(const std::vector<std::string>& action_names) const {
    if (static_cast<int>(action_names.size()) != num_players()) {
        throw InvalidGameError("Expected one action per player");
    }
    std::vector<ActionIndex> actions;
    for (int i = 0; i < num_players(); ++i) {
        actions.push_back(players_[i].action_index(action_names[i]));
    }
    return ActionProfile(std::move(actions));
}

ActionProfile PosetalGame::make_profile(const std::map<std::string, std::string>& by_player) const {
    if (static_cast<int>(by_player.size()) != num_players()) {
        throw InvalidGameError("Expected one action per player");
    }
    std::vector<std::string> names;
    for (const auto& p : players_) {
        auto it = by_player.find(p.id());
        if (it == by_player.end()) {
            throw InvalidGameError("No action given for player " + p.id());
        }
        names.push_back(it->second);
    }
    return make_profile(names);
}

std::string PosetalGame::describe(const ActionProfile& profile) const {
    std::string out = "(";
    for (int i = 0; i < profile.size() && i < num_players(); ++i) {
        if (i > 0) out += ", ";
        out += players_[i].id() + "=" + players_[i].action_name(profile[i]);
    }
    out += ")";
    return out;
}

nlohmann::json PosetalGame::profile_to_json(const ActionProfile& profile) const {
    check_profile(profile);
    nlohmann::json j = nlohmann::json::object();
    for (int i = 0; i < num_players(); ++i) {
        j[players_[i].id()] = players_[i].action_name(profile[i]);
    }
    return j;
}

const Eigen::VectorXd& PosetalGame::outcome(const ActionProfile& profile) const {
    return (*outcomes_)[index_of(profile)];
}

double PosetalGame::metric_value(const ActionProfile& profile, const std::string& metric) const {
    return outcome(profile)(metric_index(metric));
}

// ============================================================================
// Preferences
// ============================================================================

order::Comparison PosetalGame::preference(int player, const ActionProfile& x, const ActionProfile& y) const {
    const order::PriorityOrder& po = players_.at(player).priority_order();
    const std::vector<int>& metric_ids = order_metrics_[player];
    const Eigen::VectorXd& vx = outcome(x);
    const Eigen::VectorXd& vy = outcome(y);

    // dir[e] = +1 if x is better on metric e, -1 if y is, 0 if tied
    const int k = po.size();
    std::vector<int> dir(k);
    for (int e = 0; e < k; ++e) {
        const int m = metric_ids[e];
        dir[e] = (*metrics_)[m].direction(vx(m), vy(m));
    }

    // Every metric favouring `side` must be overridden by a strictly more
    // important metric favouring the other side
    auto overridden = [&](int side) {
        for (int e = 0; e < k; ++e) {
            if (dir[e] != side) continue;
            bool beaten = false;
            for (int f = 0; f < k && !beaten; ++f) {
                beaten = dir[f] == -side && po.less(e, f);
            }
            if (!beaten) return false;
        }
        return true;
    };

    const bool x_leq_y = overridden(1);
    const bool y_leq_x = overridden(-1);

    if (x_leq_y && y_leq_x) return order::Comparison::Equal;
    if (y_leq_x) return order::Comparison::Greater;
    if (x_leq_y) return order::Comparison::Less;
    return order::Comparison::Incomparable;
}

order::Comparison PosetalGame::preference(
    const std::string& player_id,
    const ActionProfile& x,
    const ActionProfile& y
) const {
    return preference(player_index(player_id), x, y);
}

std::vector<ActionProfile> PosetalGame::deviations(const ActionProfile& profile, int player) const {
    check_profile(profile);
    std::vector<ActionProfile> result;
    for (ActionIndex a = 0; a < players_.at(player).num_actions(); ++a) {
        if (a != profile[player]) {
            result.push_back(profile.with_action(player, a));
        }
    }
    return result;
}

std::set<ActionIndex> PosetalGame::best_responses(int player, const ActionProfile& profile) const {
    check_profile(profile);
    std::set<ActionIndex> result;
    const int n = players_.at(player).num_actions();
    for (ActionIndex a = 0; a < n; ++a) {
        const ActionProfile candidate = profile.with_action(player, a);
        bool beaten = false;
        for (ActionIndex b = 0; b < n && !beaten; ++b) {
            if (b == a) continue;
            beaten = preference(player, profile.with_action(player, b), candidate) ==
                     order::Comparison::Greater;
        }
        if (!beaten) result.insert(a);
    }
    return result;
}

order::Relation PosetalGame::induced_preorder(int player) const {
    std::vector<std::string> labels;
    for (const ActionProfile& p : profiles()) {
        labels.push_back(describe(p));
    }

    order::Relation relation(labels);
    for (int x = 0; x < num_profiles(); ++x) {
        for (int y = 0; y < num_profiles(); ++y) {
            const order::Comparison c = preference(player, profile_at(x), profile_at(y));
            if (c == order::Comparison::Less || c == order::Comparison::Equal) {
                relation.add(x, y);
            }
        }
    }
    return relation;
}

} // namespace posetal::game
