// Tests for binary relations: closure, properties, covering and extremal elements

#include <catch2/catch.hpp>

#include "common/Errors.hpp"
#include "order/Relation.hpp"

using namespace posetal;
using namespace posetal::order;

TEST_CASE("Relation stores exactly the pairs given", "[relation]") {
    Relation r = Relation::from_pairs({"a", "b", "c"}, {{"a", "b"}, {"b", "c"}});

    REQUIRE(r.size() == 3);
    REQUIRE(r.num_pairs() == 2);
    REQUIRE(r.holds("a", "b"));
    REQUIRE(r.holds("b", "c"));
    REQUIRE_FALSE(r.holds("a", "c"));
    REQUIRE_FALSE(r.holds("a", "a"));
}

TEST_CASE("Relation rejects out-of-domain input", "[relation][errors]") {
    REQUIRE_THROWS_AS(Relation::from_pairs({"a", "b"}, {{"a", "z"}}), InvalidRelationError);
    REQUIRE_THROWS_AS(Relation(std::vector<std::string>{"a", "a"}), InvalidRelationError);

    Relation r(std::vector<std::string>{"a", "b"});
    REQUIRE_THROWS_AS(r.add(0, 2), InvalidRelationError);
    REQUIRE_THROWS_AS(r.add(-1, 0), InvalidRelationError);
    REQUIRE_THROWS_AS(r.index_of("c"), InvalidRelationError);
    REQUIRE_FALSE(r.find("c").has_value());

    // Every domain error derives from PosetalError
    REQUIRE_THROWS_AS(r.index_of("c"), PosetalError);
}

TEST_CASE("Closure adds reflexive and transitive pairs", "[relation][closure]") {
    Relation r = Relation::from_pairs({"a", "b", "c", "d"}, {{"a", "b"}, {"b", "c"}, {"c", "d"}});
    Relation closed = close(r);

    REQUIRE(is_preorder(closed));
    REQUIRE(closed.holds("a", "d"));
    REQUIRE(closed.holds("b", "d"));
    REQUIRE(closed.holds("c", "c"));
    REQUIRE_FALSE(closed.holds("d", "a"));

    // A chain of 4: 4 reflexive + 6 strict pairs
    REQUIRE(closed.num_pairs() == 10);
}

TEST_CASE("Closure is idempotent", "[relation][closure]") {
    Relation r = Relation::from_pairs(
        {"a", "b", "c", "d", "e"},
        {{"a", "b"}, {"c", "b"}, {"b", "d"}, {"d", "e"}, {"e", "d"}}
    );
    Relation once = close(r);
    Relation twice = close(once);
    REQUIRE(once == twice);
}

TEST_CASE("Property checks on raw relations", "[relation][properties]") {
    Relation empty(std::vector<std::string>{"a", "b"});
    REQUIRE_FALSE(is_reflexive(empty));
    REQUIRE(is_transitive(empty));
    REQUIRE(is_antisymmetric(empty));
    REQUIRE_FALSE(is_total(empty));

    Relation cycle = Relation::from_pairs({"a", "b"}, {{"a", "b"}, {"b", "a"}});
    REQUIRE_FALSE(is_antisymmetric(cycle));
    REQUIRE_FALSE(is_partial_order(cycle));
    REQUIRE(is_total(cycle));

    Relation chain = Relation::from_pairs({"a", "b", "c"}, {{"a", "b"}, {"b", "c"}});
    REQUIRE_FALSE(is_transitive(chain));
    REQUIRE(is_partial_order(chain));
    REQUIRE(is_total(close(chain)));
}

TEST_CASE("Comparison consults the closure", "[relation][compare]") {
    Relation r = Relation::from_pairs({"a", "b", "c", "x"}, {{"a", "b"}, {"b", "c"}});

    // a <= c only through b
    REQUIRE(compare(r, 0, 2) == Comparison::Less);
    REQUIRE(compare(r, 2, 0) == Comparison::Greater);
    REQUIRE(compare(r, 1, 1) == Comparison::Equal);
    REQUIRE(compare(r, 0, 3) == Comparison::Incomparable);
    REQUIRE(reverse(compare(r, 0, 2)) == compare(r, 2, 0));
    REQUIRE_THROWS_AS(compare(r, 0, 4), InvalidRelationError);
}

TEST_CASE("Covering relation of a chain keeps only adjacent pairs", "[relation][hasse]") {
    Relation r = Relation::from_pairs({"a", "b", "c"}, {{"a", "b"}, {"b", "c"}, {"a", "c"}});
    Relation hasse = covering_relation(r);

    REQUIRE(hasse.num_pairs() == 2);
    REQUIRE(hasse.holds("a", "b"));
    REQUIRE(hasse.holds("b", "c"));
    REQUIRE_FALSE(hasse.holds("a", "c"));
    REQUIRE_FALSE(hasse.holds("a", "a"));
}

TEST_CASE("Covering relation of a diamond", "[relation][hasse]") {
    // bottom <= left, right <= top
    Relation r = Relation::from_pairs(
        {"bottom", "left", "right", "top"},
        {{"bottom", "left"}, {"bottom", "right"}, {"left", "top"}, {"right", "top"}}
    );
    Relation hasse = covering_relation(r);

    REQUIRE(hasse.num_pairs() == 4);
    REQUIRE_FALSE(hasse.holds("bottom", "top"));
}

TEST_CASE("Equivalent elements are never linked in the covering relation", "[relation][hasse]") {
    Relation r = Relation::from_pairs({"a", "b", "c"}, {{"a", "b"}, {"b", "a"}, {"b", "c"}});
    Relation hasse = covering_relation(r);

    REQUIRE_FALSE(hasse.holds("a", "b"));
    REQUIRE_FALSE(hasse.holds("b", "a"));
    REQUIRE(hasse.holds("a", "c"));
    REQUIRE(hasse.holds("b", "c"));
}

TEST_CASE("Minimal and maximal elements", "[relation][extremal]") {
    // a <= c, b <= c, d isolated
    Relation r = Relation::from_pairs({"a", "b", "c", "d"}, {{"a", "c"}, {"b", "c"}});

    REQUIRE(minimal_elements(r) == std::set<ElementId>{0, 1, 3});
    REQUIRE(maximal_elements(r) == std::set<ElementId>{2, 3});

    // Restricted to {a, b}: both are minimal and maximal
    REQUIRE(minimal_elements(r, {0, 1}) == std::set<ElementId>{0, 1});
    REQUIRE(maximal_elements(r, {0, 1}) == std::set<ElementId>{0, 1});

    REQUIRE_THROWS_AS(maximal_elements(r, {7}), InvalidRelationError);
}

TEST_CASE("Tied elements are all extremal", "[relation][extremal]") {
    Relation r = Relation::from_pairs({"a", "b", "c"}, {{"a", "b"}, {"b", "a"}, {"c", "a"}});

    REQUIRE(maximal_elements(r) == std::set<ElementId>{0, 1});
    REQUIRE(minimal_elements(r) == std::set<ElementId>{2});
}

TEST_CASE("Equivalence classes group mutually related elements", "[relation][classes]") {
    Relation r = Relation::from_pairs(
        {"a", "b", "c", "d"},
        {{"a", "c"}, {"c", "a"}, {"b", "d"}}
    );
    auto classes = equivalence_classes(r);

    REQUIRE(classes.size() == 3);
    REQUIRE(classes[0] == std::vector<ElementId>{0, 2});
    REQUIRE(classes[1] == std::vector<ElementId>{1});
    REQUIRE(classes[2] == std::vector<ElementId>{3});
}
