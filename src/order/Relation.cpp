#include "Relation.hpp"
#include "../common/Errors.hpp"

namespace posetal::order {

Relation::Relation(std::vector<std::string> elements)
    : elements_(std::move(elements))
{
    const int n = static_cast<int>(elements_.size());
    for (int i = 0; i < n; ++i) {
        if (!index_.emplace(elements_[i], i).second) {
            throw InvalidRelationError("Duplicate element in ground set: " + elements_[i]);
        }
    }
    adj_ = Adjacency::Constant(n, n, false);
}

Relation Relation::from_pairs(
    std::vector<std::string> elements,
    const std::vector<std::pair<std::string, std::string>>& pairs
) {
    Relation r(std::move(elements));
    for (const auto& [a, b] : pairs) {
        r.add(a, b);
    }
    return r;
}

void Relation::add(ElementId a, ElementId b) {
    if (a < 0 || b < 0 || a >= size() || b >= size()) {
        throw InvalidRelationError(
            "Pair (" + std::to_string(a) + ", " + std::to_string(b) +
            ") outside ground set of size " + std::to_string(size()));
    }
    adj_(a, b) = true;
}

void Relation::add(const std::string& a, const std::string& b) {
    adj_(index_of(a), index_of(b)) = true;
}

bool Relation::holds(const std::string& a, const std::string& b) const {
    return adj_(index_of(a), index_of(b));
}

ElementId Relation::index_of(const std::string& label) const {
    auto it = index_.find(label);
    if (it == index_.end()) {
        throw InvalidRelationError("Element not in ground set: " + label);
    }
    return it->second;
}

std::optional<ElementId> Relation::find(const std::string& label) const {
    auto it = index_.find(label);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::pair<ElementId, ElementId>> Relation::pairs() const {
    std::vector<std::pair<ElementId, ElementId>> result;
    for (int a = 0; a < size(); ++a) {
        for (int b = 0; b < size(); ++b) {
            if (adj_(a, b)) result.emplace_back(a, b);
        }
    }
    return result;
}

int Relation::num_pairs() const {
    return static_cast<int>(adj_.count());
}

bool Relation::operator==(const Relation& other) const {
    if (elements_ != other.elements_) return false;
    return adj_ == other.adj_;
}

// ============================================================================
// Closure and properties
// ============================================================================

namespace detail {

void warshall(Adjacency& adj) {
    const int n = static_cast<int>(adj.rows());
    for (int i = 0; i < n; ++i) {
        adj(i, i) = true;
    }
    for (int k = 0; k < n; ++k) {
        for (int i = 0; i < n; ++i) {
            if (!adj(i, k)) continue;
            for (int j = 0; j < n; ++j) {
                if (adj(k, j)) adj(i, j) = true;
            }
        }
    }
}

Comparison compare_closed(const Adjacency& closed, ElementId a, ElementId b) {
    const bool ab = closed(a, b);
    const bool ba = closed(b, a);
    if (ab && ba) return Comparison::Equal;
    if (ba) return Comparison::Greater;
    if (ab) return Comparison::Less;
    return Comparison::Incomparable;
}

std::set<ElementId> extremal_closed(
    const Adjacency& closed,
    const std::set<ElementId>& subset,
    bool maximal
) {
    std::set<ElementId> domain = subset;
    if (domain.empty()) {
        for (int i = 0; i < static_cast<int>(closed.rows()); ++i) domain.insert(i);
    }

    std::set<ElementId> result;
    for (ElementId x : domain) {
        bool dominated = false;
        for (ElementId y : domain) {
            // maximal: nothing strictly above x; minimal: nothing strictly below x
            if (maximal ? strictly_below(closed, x, y) : strictly_below(closed, y, x)) {
                dominated = true;
                break;
            }
        }
        if (!dominated) result.insert(x);
    }
    return result;
}

Adjacency covering_closed(const Adjacency& closed) {
    const int n = static_cast<int>(closed.rows());
    Adjacency cover = Adjacency::Constant(n, n, false);

    for (int a = 0; a < n; ++a) {
        for (int b = 0; b < n; ++b) {
            if (!strictly_below(closed, a, b)) continue;

            bool has_between = false;
            for (int c = 0; c < n && !has_between; ++c) {
                has_between = strictly_below(closed, a, c) && strictly_below(closed, c, b);
            }
            cover(a, b) = !has_between;
        }
    }
    return cover;
}

} // namespace detail

Relation close(const Relation& relation) {
    Relation closed = relation;
    detail::warshall(closed.adj_);
    return closed;
}

bool is_reflexive(const Relation& relation) {
    return relation.adjacency().diagonal().all();
}

bool is_transitive(const Relation& relation) {
    const Adjacency& adj = relation.adjacency();
    const int n = relation.size();
    for (int a = 0; a < n; ++a) {
        for (int b = 0; b < n; ++b) {
            if (!adj(a, b)) continue;
            for (int c = 0; c < n; ++c) {
                if (adj(b, c) && !adj(a, c)) return false;
            }
        }
    }
    return true;
}

bool is_antisymmetric(const Relation& relation) {
    const Adjacency& adj = relation.adjacency();
    const int n = relation.size();
    for (int a = 0; a < n; ++a) {
        for (int b = a + 1; b < n; ++b) {
            if (adj(a, b) && adj(b, a)) return false;
        }
    }
    return true;
}

bool is_total(const Relation& relation) {
    const Adjacency& adj = relation.adjacency();
    const int n = relation.size();
    for (int a = 0; a < n; ++a) {
        for (int b = a + 1; b < n; ++b) {
            if (!adj(a, b) && !adj(b, a)) return false;
        }
    }
    return true;
}

bool is_preorder(const Relation& relation) {
    return is_reflexive(relation) && is_transitive(relation);
}

bool is_partial_order(const Relation& relation) {
    return is_antisymmetric(close(relation));
}

Relation covering_relation(const Relation& relation) {
    const Relation closed = close(relation);
    Relation cover(relation.elements());
    const Adjacency hasse = detail::covering_closed(closed.adjacency());
    for (int a = 0; a < cover.size(); ++a) {
        for (int b = 0; b < cover.size(); ++b) {
            if (hasse(a, b)) cover.add(a, b);
        }
    }
    return cover;
}

std::set<ElementId> minimal_elements(const Relation& relation, const std::set<ElementId>& subset) {
    for (ElementId x : subset) {
        if (x < 0 || x >= relation.size()) {
            throw InvalidRelationError("Subset element outside ground set: " + std::to_string(x));
        }
    }
    return detail::extremal_closed(close(relation).adjacency(), subset, false);
}

std::set<ElementId> maximal_elements(const Relation& relation, const std::set<ElementId>& subset) {
    for (ElementId x : subset) {
        if (x < 0 || x >= relation.size()) {
            throw InvalidRelationError("Subset element outside ground set: " + std::to_string(x));
        }
    }
    return detail::extremal_closed(close(relation).adjacency(), subset, true);
}

Comparison compare(const Relation& relation, ElementId a, ElementId b) {
    if (a < 0 || b < 0 || a >= relation.size() || b >= relation.size()) {
        throw InvalidRelationError("Compared element outside ground set");
    }
    return detail::compare_closed(close(relation).adjacency(), a, b);
}

std::vector<std::vector<ElementId>> equivalence_classes(const Relation& relation) {
    const Adjacency closed = close(relation).adjacency();
    const int n = relation.size();

    std::vector<std::vector<ElementId>> classes;
    std::vector<bool> assigned(n, false);
    for (int a = 0; a < n; ++a) {
        if (assigned[a]) continue;
        std::vector<ElementId> cls;
        for (int b = a; b < n; ++b) {
            if (!assigned[b] && closed(a, b) && closed(b, a)) {
                cls.push_back(b);
                assigned[b] = true;
            }
        }
        classes.push_back(std::move(cls));
    }
    return classes;
}

} // namespace posetal::order
