#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace posetal::order {

// Element identifier: position of the label in the relation's ground set
using ElementId = int;

// Dense boolean adjacency. adj(a, b) == true reads "a <= b".
using Adjacency = Eigen::Matrix<bool, Eigen::Dynamic, Eigen::Dynamic>;

// Four-valued comparison result, always from the first argument's point of view.
// Incomparable is a regular answer, not an error.
enum class Comparison : uint8_t {
    Greater = 0,      // first strictly above second
    Less = 1,         // first strictly below second
    Equal = 2,        // identical or equivalent
    Incomparable = 3  // neither above nor below
};

inline std::string comparison_to_string(Comparison c) {
    switch (c) {
        case Comparison::Greater:      return "greater";
        case Comparison::Less:         return "less";
        case Comparison::Equal:        return "equal";
        case Comparison::Incomparable: return "incomparable";
    }
    return "unknown";
}

// Swap the point of view: compare(a, b) == reverse(compare(b, a))
inline Comparison reverse(Comparison c) {
    switch (c) {
        case Comparison::Greater: return Comparison::Less;
        case Comparison::Less:    return Comparison::Greater;
        default:                  return c;
    }
}

// Binary relation over a finite ground set of unique string labels.
//
// The raw pair set is stored as given; closure-dependent queries live in the
// free functions below and always work on close(relation).
class Relation {
public:
    Relation() = default;

    // Empty relation over the given ground set. Labels must be unique.
    explicit Relation(std::vector<std::string> elements);

    // Build from (a, b) pairs meaning a <= b.
    // Throws InvalidRelationError if a pair names an element outside the ground set.
    static Relation from_pairs(
        std::vector<std::string> elements,
        const std::vector<std::pair<std::string, std::string>>& pairs
    );

    // Add a <= b
    void add(ElementId a, ElementId b);
    void add(const std::string& a, const std::string& b);

    bool holds(ElementId a, ElementId b) const { return adj_(a, b); }
    bool holds(const std::string& a, const std::string& b) const;

    int size() const { return static_cast<int>(elements_.size()); }
    const std::vector<std::string>& elements() const { return elements_; }
    const std::string& label(ElementId id) const { return elements_.at(id); }

    // Look up an element, throwing InvalidRelationError if unknown
    ElementId index_of(const std::string& label) const;
    std::optional<ElementId> find(const std::string& label) const;

    const Adjacency& adjacency() const { return adj_; }

    // All stored pairs (a, b) in row-major order
    std::vector<std::pair<ElementId, ElementId>> pairs() const;
    int num_pairs() const;

    // Same labels in the same order and the same pairs
    bool operator==(const Relation& other) const;
    bool operator!=(const Relation& other) const { return !(*this == other); }

private:
    friend Relation close(const Relation& relation);

    std::vector<std::string> elements_;
    std::map<std::string, ElementId> index_;
    Adjacency adj_;
};

// Reflexive-transitive closure (Warshall). close(close(r)) == close(r).
Relation close(const Relation& relation);

bool is_reflexive(const Relation& relation);
bool is_transitive(const Relation& relation);
bool is_antisymmetric(const Relation& relation);
bool is_total(const Relation& relation);
bool is_preorder(const Relation& relation);

// True iff the closure is antisymmetric (it is reflexive and transitive by construction)
bool is_partial_order(const Relation& relation);

// Hasse edges (a, b): a strictly below b in the closure with no c strictly between.
// Equivalent elements of a preorder are never linked.
Relation covering_relation(const Relation& relation);

// Elements of subset with nothing in subset strictly below / above them.
// An empty subset stands for the whole ground set. Ties are all returned.
std::set<ElementId> minimal_elements(const Relation& relation, const std::set<ElementId>& subset = {});
std::set<ElementId> maximal_elements(const Relation& relation, const std::set<ElementId>& subset = {});

// Classify a against b using the closure
Comparison compare(const Relation& relation, ElementId a, ElementId b);

// Groups of mutually equivalent elements (a <= b and b <= a), in order of first member
std::vector<std::vector<ElementId>> equivalence_classes(const Relation& relation);

// ============================================================================
// Internal helpers working on an adjacency that is already closed
// ============================================================================

namespace detail {

inline bool strictly_below(const Adjacency& closed, ElementId a, ElementId b) {
    return closed(a, b) && !closed(b, a);
}

Comparison compare_closed(const Adjacency& closed, ElementId a, ElementId b);

std::set<ElementId> extremal_closed(
    const Adjacency& closed,
    const std::set<ElementId>& subset,
    bool maximal
);

Adjacency covering_closed(const Adjacency& closed);

void warshall(Adjacency& adj);

} // namespace detail

} // namespace posetal::order
