// Tests for priority orders over metrics

#include <catch2/catch.hpp>

#include "common/Errors.hpp"
#include "order/PriorityOrder.hpp"

using namespace posetal;
using namespace posetal::order;

TEST_CASE("Total order is a chain from low to high priority", "[priority][total]") {
    PriorityOrder po = PriorityOrder::total({"time", "cost", "safety"});

    REQUIRE(po.size() == 3);
    REQUIRE(po.is_partial_order());
    REQUIRE(po.is_total());
    REQUIRE(po.less("time", "cost"));
    REQUIRE(po.less("time", "safety"));  // transitive
    REQUIRE(po.greater("safety", "time"));
    REQUIRE(po.compare("cost", "time") == Comparison::Greater);
    REQUIRE(po.maximal() == std::set<std::string>{"safety"});
    REQUIRE(po.minimal() == std::set<std::string>{"time"});
}

TEST_CASE("Transitive comparisons never depend on the raw edges", "[priority][closure]") {
    // c <= b <= a, only adjacent pairs given
    PriorityOrder po = PriorityOrder::from_pairs({"a", "b", "c"}, {{"c", "b"}, {"b", "a"}});

    REQUIRE(po.leq("c", "a"));
    REQUIRE(po.less("c", "a"));
    REQUIRE_FALSE(po.leq("a", "c"));
    REQUIRE(po.relation().holds("c", "a"));
}

TEST_CASE("Label order does not affect equality", "[priority][canonical]") {
    PriorityOrder x = PriorityOrder::from_pairs({"b", "a"}, {{"a", "b"}});
    PriorityOrder y = PriorityOrder::from_pairs({"a", "b"}, {{"a", "b"}});
    PriorityOrder z = PriorityOrder::total({"b", "a"});

    REQUIRE(x == y);
    REQUIRE(x != z);
    REQUIRE(x.elements() == std::vector<std::string>{"a", "b"});
    REQUIRE((x < z) != (z < x));
}

TEST_CASE("Antichain has everything extremal", "[priority][antichain]") {
    PriorityOrder po = PriorityOrder::antichain({"x", "y", "z"});

    REQUIRE(po.compare("x", "y") == Comparison::Incomparable);
    REQUIRE(po.maximal().size() == 3);
    REQUIRE(po.minimal().size() == 3);
    REQUIRE(po.hasse_edges().empty());
    REQUIRE(po.is_partial_order());
    REQUIRE_FALSE(po.is_total());
}

TEST_CASE("Weak order ties metrics within a tier", "[priority][weak]") {
    PriorityOrder po = PriorityOrder::weak({{"comfort"}, {"cost", "time"}});

    REQUIRE(po.compare("cost", "time") == Comparison::Equal);
    REQUIRE(po.less("comfort", "cost"));
    REQUIRE_FALSE(po.is_partial_order());
    REQUIRE(po.maximal() == std::set<std::string>{"cost", "time"});

    auto tiers = po.tiers();
    REQUIRE(tiers.size() == 2);
    REQUIRE(tiers[0].size() == 1);
    REQUIRE(tiers[0][0] == std::vector<std::string>{"cost", "time"});
    REQUIRE(tiers[1][0] == std::vector<std::string>{"comfort"});
}

TEST_CASE("Partial factory rejects cycles", "[priority][errors]") {
    REQUIRE_THROWS_AS(
        PriorityOrder::partial({"a", "b"}, {{"a", "b"}, {"b", "a"}}),
        NotAPartialOrderError
    );
    REQUIRE_NOTHROW(PriorityOrder::partial({"a", "b", "c"}, {{"a", "b"}}));

    REQUIRE_THROWS_AS(PriorityOrder::from_pairs({"a"}, {{"a", "b"}}), InvalidRelationError);
    REQUIRE_THROWS_AS(PriorityOrder::total({"a", "a"}), InvalidRelationError);

    PriorityOrder po = PriorityOrder::total({"a", "b"});
    REQUIRE_THROWS_AS(po.leq("a", "zzz"), InvalidRelationError);
}

TEST_CASE("Hasse edges of a fork", "[priority][hasse]") {
    // safety above both cost and time, cost and time incomparable
    PriorityOrder po = PriorityOrder::partial(
        {"cost", "safety", "time"},
        {{"cost", "safety"}, {"time", "safety"}}
    );

    auto edges = po.hasse_edges();
    REQUIRE(edges.size() == 2);
    REQUIRE(po.maximal() == std::set<std::string>{"safety"});
    REQUIRE(po.minimal() == std::set<std::string>{"cost", "time"});
    REQUIRE(po.to_string() == "PriorityOrder(cost, safety, time | cost < safety, time < safety)");
}

TEST_CASE("Hasse edges skip transitive pairs", "[priority][hasse]") {
    PriorityOrder po = PriorityOrder::total({"a", "b", "c"});
    auto edges = po.hasse_edges();

    REQUIRE(edges.size() == 2);
    REQUIRE(edges[0] == std::make_pair(std::string("a"), std::string("b")));
    REQUIRE(edges[1] == std::make_pair(std::string("b"), std::string("c")));
}

TEST_CASE("Tiers group classes by depth from the top", "[priority][tiers]") {
    // d < b < a, c < a
    PriorityOrder po = PriorityOrder::partial(
        {"a", "b", "c", "d"},
        {{"b", "a"}, {"c", "a"}, {"d", "b"}}
    );
    auto tiers = po.tiers();

    REQUIRE(tiers.size() == 3);
    REQUIRE(tiers[0].size() == 1);
    REQUIRE(tiers[0][0] == std::vector<std::string>{"a"});
    REQUIRE(tiers[1].size() == 2);
    REQUIRE(tiers[2][0] == std::vector<std::string>{"d"});
}

TEST_CASE("Restriction keeps induced comparisons", "[priority][restrict]") {
    PriorityOrder po = PriorityOrder::total({"a", "b", "c"});
    PriorityOrder sub = po.restrict({"a", "c"});

    REQUIRE(sub.size() == 2);
    REQUIRE(sub.less("a", "c"));
    REQUIRE(sub == PriorityOrder::total({"a", "c"}));
    REQUIRE_THROWS_AS(po.restrict({"a", "x"}), InvalidRelationError);
}

TEST_CASE("Completions of a chain and a fork", "[priority][completions]") {
    PriorityOrder chain = PriorityOrder::total({"a", "b", "c"});
    auto chain_ext = chain.completions();
    REQUIRE(chain_ext.size() == 1);
    REQUIRE(chain_ext[0] == chain);

    PriorityOrder fork = PriorityOrder::partial({"a", "b", "c"}, {{"a", "c"}, {"b", "c"}});
    auto fork_ext = fork.completions();
    REQUIRE(fork_ext.size() == 2);
    REQUIRE(fork_ext[0] == PriorityOrder::total({"a", "b", "c"}));
    REQUIRE(fork_ext[1] == PriorityOrder::total({"b", "a", "c"}));

    // Every linear extension keeps the fork's comparisons
    for (const auto& ext : fork_ext) {
        REQUIRE(ext.less("a", "c"));
        REQUIRE(ext.less("b", "c"));
    }

    REQUIRE(PriorityOrder::antichain({"a", "b", "c"}).completions().size() == 6);
    REQUIRE_THROWS_AS(PriorityOrder::weak({{"a", "b"}}).completions(), NotAPartialOrderError);
}

TEST_CASE("Priority order serializes to JSON", "[priority][json]") {
    PriorityOrder po = PriorityOrder::total({"time", "cost"});
    auto j = po.to_json();

    REQUIRE(j["elements"] == nlohmann::json({"cost", "time"}));
    REQUIRE(j["hasse"].size() == 1);
    REQUIRE(j["hasse"][0][0] == "time");
    REQUIRE(j["hasse"][0][1] == "cost");
    REQUIRE(j["description"] == "PriorityOrder(cost, time | time < cost)");
}
