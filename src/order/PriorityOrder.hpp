#pragma once

#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "Relation.hpp"

namespace posetal::order {

// Priority order over metric names: a preorder stored as its closure.
//
// A pair (a, b) reads "b has at least the priority of a", so the maximal
// elements are the most important metrics. Lists passed to total() and
// weak() run from lowest to highest priority.
//
// The ground set is kept sorted so two orders over the same metrics compare
// equal regardless of the order in which their labels were supplied.
// Every query consults the closure, never the raw pairs.
class PriorityOrder {
public:
    PriorityOrder() = default;

    // Preorder generated by the given pairs.
    // Throws InvalidRelationError on out-of-domain pairs or duplicate labels.
    static PriorityOrder from_pairs(
        std::vector<std::string> elements,
        const std::vector<std::pair<std::string, std::string>>& pairs
    );

    // Preorder generated by an arbitrary relation (closed here)
    static PriorityOrder from_relation(const Relation& relation);

    // As from_pairs, but throws NotAPartialOrderError unless antisymmetric
    static PriorityOrder partial(
        std::vector<std::string> elements,
        const std::vector<std::pair<std::string, std::string>>& pairs
    );

    // Chain: low_to_high[0] < low_to_high[1] < ...
    static PriorityOrder total(const std::vector<std::string>& low_to_high);

    // Weak order: metrics inside a tier are equivalent, tiers strictly increase
    static PriorityOrder weak(const std::vector<std::vector<std::string>>& tiers_low_to_high);

    // No two distinct metrics comparable
    static PriorityOrder antichain(std::vector<std::string> elements);

    // Order comparisons (by metric name)
    bool leq(const std::string& a, const std::string& b) const;
    bool less(const std::string& a, const std::string& b) const;
    bool geq(const std::string& a, const std::string& b) const { return leq(b, a); }
    bool greater(const std::string& a, const std::string& b) const { return less(b, a); }
    Comparison compare(const std::string& a, const std::string& b) const;

    // Same queries by position in elements()
    bool leq(ElementId a, ElementId b) const { return closure_.holds(a, b); }
    bool less(ElementId a, ElementId b) const { return detail::strictly_below(closure_.adjacency(), a, b); }
    Comparison compare(ElementId a, ElementId b) const {
        return detail::compare_closed(closure_.adjacency(), a, b);
    }

    bool contains(const std::string& metric) const { return closure_.find(metric).has_value(); }
    ElementId index_of(const std::string& metric) const { return closure_.index_of(metric); }
    const std::vector<std::string>& elements() const { return closure_.elements(); }
    int size() const { return closure_.size(); }

    // The stored closure
    const Relation& relation() const { return closure_; }

    // Hasse edges (lower, higher)
    std::vector<std::pair<std::string, std::string>> hasse_edges() const;

    // Least / most important metrics
    std::set<std::string> minimal() const;
    std::set<std::string> maximal() const;

    // Equivalence classes grouped by depth from the top: tiers()[0] holds the
    // maximal classes, tiers()[k] the classes whose longest chain of strict
    // superiors has length k. Each tier is a list of classes.
    std::vector<std::vector<std::vector<std::string>>> tiers() const;

    bool is_partial_order() const { return is_antisymmetric(closure_); }
    bool is_total() const { return order::is_total(closure_); }

    // Induced sub-order on a subset of the metrics
    PriorityOrder restrict(const std::set<std::string>& subset) const;

    // All total orders extending this partial order (linear extensions),
    // in a deterministic order. Throws NotAPartialOrderError on a preorder
    // with equivalent distinct metrics.
    std::vector<PriorityOrder> completions() const;

    // Hasse-edge rendering, equivalence classes shown as {a, b}
    std::string to_string() const;

    nlohmann::json to_json() const;

    bool operator==(const PriorityOrder& other) const { return closure_ == other.closure_; }
    bool operator!=(const PriorityOrder& other) const { return !(*this == other); }
    bool operator<(const PriorityOrder& other) const;

private:
    explicit PriorityOrder(Relation closure) : closure_(std::move(closure)) {}

    Relation closure_;
};

} // namespace posetal::order
