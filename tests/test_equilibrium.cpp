// Tests for pure Nash, admissible and undominated equilibria

#include <catch2/catch.hpp>
#include <map>

#include "common/Errors.hpp"
#include "solver/EquilibriumFinder.hpp"

using namespace posetal;
using namespace posetal::game;
using namespace posetal::solver;
using order::PriorityOrder;

namespace {

// Same commute game as the model tests: route A dominates for both players
PosetalGame commute_game() {
    std::vector<Metric> metrics = {{"cost", Sense::Minimize}, {"time", Sense::Minimize}};
    std::vector<Player> players = {
        Player("P1", {"A", "B"}, PriorityOrder::total({"time", "cost"})),
        Player("P2", {"A", "B"}, PriorityOrder::total({"cost", "time"})),
    };
    std::map<std::vector<ActionIndex>, std::pair<double, double>> table = {
        {{0, 0}, {1.0, 1.0}},
        {{0, 1}, {3.0, 2.0}},
        {{1, 0}, {2.0, 3.0}},
        {{1, 1}, {4.0, 4.0}},
    };
    return PosetalGame::build(metrics, players, [table](const ActionProfile& p) {
        const auto& [cost, time] = table.at(p.actions());
        Eigen::VectorXd v(2);
        v << cost, time;
        return v;
    });
}

// One player, X is best on m1 and Y is best on m2
PosetalGame tradeoff_game(const PriorityOrder& po) {
    std::vector<Metric> metrics = {{"m1", Sense::Maximize}, {"m2", Sense::Maximize}};
    return PosetalGame::build(metrics, {Player("P1", {"X", "Y"}, po)}, [](const ActionProfile& p) {
        Eigen::VectorXd v(2);
        if (p[0] == 0) v << 1.0, 0.0;
        else v << 0.0, 1.0;
        return v;
    });
}

// Matching on A pays 2, matching on B pays 1, mismatch pays 0
PosetalGame coordination_game() {
    std::vector<Metric> metrics = {{"payoff", Sense::Maximize}};
    std::vector<Player> players = {
        Player("P1", {"A", "B"}, PriorityOrder::antichain({"payoff"})),
        Player("P2", {"A", "B"}, PriorityOrder::antichain({"payoff"})),
    };
    return PosetalGame::build(metrics, players, [](const ActionProfile& p) {
        Eigen::VectorXd v(1);
        if (p[0] != p[1]) v << 0.0;
        else v << (p[0] == 0 ? 2.0 : 1.0);
        return v;
    });
}

} // namespace

TEST_CASE("Dominant routes form the unique equilibrium", "[equilibrium][nash]") {
    PosetalGame g = commute_game();
    const ProfileSet expected = {ActionProfile({0, 0})};

    REQUIRE(find_pure_nash(g) == expected);
    REQUIRE(find_admissible(g) == expected);
    REQUIRE(find_undominated(g) == expected);

    REQUIRE(is_pure_nash(g, ActionProfile({0, 0})));
    REQUIRE(is_strict_nash(g, ActionProfile({0, 0})));
    REQUIRE_FALSE(is_admissible(g, ActionProfile({0, 1})));
    REQUIRE_FALSE(is_pure_nash(g, ActionProfile({1, 1})));
}

TEST_CASE("Incomparable deviations separate Nash from admissible", "[equilibrium][admissible]") {
    PosetalGame g = tradeoff_game(PriorityOrder::antichain({"m1", "m2"}));
    const ActionProfile x({0}), y({1});

    // Neither action is weakly preferred to the other
    REQUIRE(find_pure_nash(g).empty());
    REQUIRE(find_admissible(g) == ProfileSet{x, y});
    REQUIRE(find_undominated(g) == ProfileSet{x, y});
    REQUIRE_FALSE(is_strict_nash(g, x));
    REQUIRE_FALSE(pareto_dominates(g, x, y));
    REQUIRE_FALSE(pareto_dominates(g, y, x));

    SECTION("Ranking the metrics resolves the trade-off") {
        PosetalGame ranked = g.with_orders(std::vector<PriorityOrder>{PriorityOrder::total({"m2", "m1"})});
        REQUIRE(find_pure_nash(ranked) == ProfileSet{x});
        REQUIRE(find_admissible(ranked) == ProfileSet{x});
        REQUIRE(is_strict_nash(ranked, x));
    }
    SECTION("Tied metrics behave like unranked ones") {
        PosetalGame tied = g.with_orders(std::vector<PriorityOrder>{PriorityOrder::weak({{"m1", "m2"}})});
        REQUIRE(find_pure_nash(tied).empty());
        REQUIRE(find_admissible(tied).size() == 2);
    }
}

TEST_CASE("Coordination has two equilibria and one undominated", "[equilibrium][undominated]") {
    PosetalGame g = coordination_game();
    const ActionProfile aa({0, 0}), bb({1, 1});

    REQUIRE(find_pure_nash(g) == ProfileSet{aa, bb});
    REQUIRE(find_admissible(g) == ProfileSet{aa, bb});
    REQUIRE(pareto_dominates(g, aa, bb));
    REQUIRE_FALSE(pareto_dominates(g, bb, aa));
    REQUIRE(find_undominated(g) == ProfileSet{aa});

    REQUIRE(find_equilibria(g, EquilibriumConcept::PureNash) == find_pure_nash(g));
    REQUIRE(find_equilibria(g, EquilibriumConcept::Undominated) == ProfileSet{aa});
}

TEST_CASE("Indifference keeps every profile stable but none strict", "[equilibrium][ties]") {
    std::vector<Metric> metrics = {{"payoff", Sense::Maximize}};
    std::vector<Player> players = {
        Player("P1", {"A", "B"}, PriorityOrder::antichain({"payoff"})),
        Player("P2", {"A", "B", "C"}, PriorityOrder::antichain({"payoff"})),
    };
    PosetalGame g = PosetalGame::build(metrics, players, [](const ActionProfile&) {
        return Eigen::VectorXd::Constant(1, 3.0).eval();
    });

    REQUIRE(find_pure_nash(g).size() == 6);
    REQUIRE(find_admissible(g).size() == 6);
    // Nobody is strictly better off anywhere
    REQUIRE(find_undominated(g).size() == 6);
    for (const ActionProfile& p : g.profiles()) {
        REQUIRE_FALSE(is_strict_nash(g, p));
    }
}

TEST_CASE("Finder reports statistics and honours the parallel switch", "[equilibrium][stats]") {
    PosetalGame g = coordination_game();

    FinderStats stats;
    auto serial = find_pure_nash(g, FinderConfig{false}, &stats);
    REQUIRE(stats.profiles_checked == 4);
    REQUIRE(stats.equilibria == 2);
    REQUIRE(stats.num_threads == 1);

    FinderStats parallel_stats;
    auto parallel = find_pure_nash(g, FinderConfig{true}, &parallel_stats);
    REQUIRE(parallel == serial);
    REQUIRE(parallel_stats.num_threads >= 1);

    FinderStats undominated_stats;
    find_undominated(g, {}, &undominated_stats);
    REQUIRE(undominated_stats.equilibria == 1);
}

TEST_CASE("Malformed profiles are rejected", "[equilibrium][errors]") {
    PosetalGame g = commute_game();
    REQUIRE_THROWS_AS(is_pure_nash(g, ActionProfile({0})), InvalidGameError);
    REQUIRE_THROWS_AS(is_admissible(g, ActionProfile({0, 5})), InvalidGameError);
}

TEST_CASE("Cache memoizes equilibria per order assignment", "[equilibrium][cache]") {
    PosetalGame g = tradeoff_game(PriorityOrder::antichain({"m1", "m2"}));
    EquilibriumCache cache(EquilibriumConcept::PureNash);

    const std::vector<PriorityOrder> unranked = {PriorityOrder::antichain({"m1", "m2"})};
    const std::vector<PriorityOrder> m2_first = {PriorityOrder::total({"m1", "m2"})};

    REQUIRE(cache.find(g, unranked).empty());
    REQUIRE(cache.find(g, m2_first) == ProfileSet{ActionProfile({1})});
    REQUIRE(cache.find(g, unranked).empty());

    REQUIRE(cache.kind() == EquilibriumConcept::PureNash);
    REQUIRE(cache.size() == 2);
    REQUIRE(cache.misses() == 2);
    REQUIRE(cache.hits() == 1);

    cache.clear();
    REQUIRE(cache.size() == 0);
    REQUIRE(cache.hits() == 0);

    REQUIRE(concept_to_string(EquilibriumConcept::Admissible) == "admissible");
}

TEST_CASE("Cache is tied to the outcome table it was first used with", "[equilibrium][cache][errors]") {
    PosetalGame g = tradeoff_game(PriorityOrder::antichain({"m1", "m2"}));
    PosetalGame rebuilt = tradeoff_game(PriorityOrder::total({"m1", "m2"}));
    EquilibriumCache cache(EquilibriumConcept::PureNash);

    const std::vector<PriorityOrder> m2_first = {PriorityOrder::total({"m1", "m2"})};
    REQUIRE(cache.find(g, m2_first) == ProfileSet{ActionProfile({1})});

    // Same orders, separately built game: no stale answer
    REQUIRE(g.shares_outcomes(g.with_orders(m2_first)));
    REQUIRE_FALSE(g.shares_outcomes(rebuilt));
    REQUIRE_THROWS_AS(cache.find(rebuilt, m2_first), InvalidGameError);

    // Games derived from the first one are fine
    REQUIRE(cache.find(g.with_orders(m2_first), m2_first) == ProfileSet{ActionProfile({1})});
    REQUIRE(cache.hits() == 1);

    cache.clear();
    REQUIRE(cache.find(rebuilt, m2_first) == ProfileSet{ActionProfile({1})});
    REQUIRE_THROWS_AS(cache.find(g, m2_first), InvalidGameError);
}
