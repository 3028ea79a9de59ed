#include "PriorityOrder.hpp"
#include "../common/Errors.hpp"
#include <algorithm>
#include <functional>

namespace posetal::order {

PriorityOrder PriorityOrder::from_relation(const Relation& relation) {
    // Canonical ground set: sorted labels
    std::vector<std::string> sorted = relation.elements();
    std::sort(sorted.begin(), sorted.end());

    Relation canonical(sorted);
    for (const auto& [a, b] : relation.pairs()) {
        canonical.add(relation.label(a), relation.label(b));
    }
    return PriorityOrder(close(canonical));
}

PriorityOrder PriorityOrder::from_pairs(
    std::vector<std::string> elements,
    const std::vector<std::pair<std::string, std::string>>& pairs
) {
    return from_relation(Relation::from_pairs(std::move(elements), pairs));
}

PriorityOrder PriorityOrder::partial(
    std::vector<std::string> elements,
    const std::vector<std::pair<std::string, std::string>>& pairs
) {
    PriorityOrder po = from_pairs(std::move(elements), pairs);
    if (!po.is_partial_order()) {
        throw NotAPartialOrderError("Relation is not antisymmetric: " + po.to_string());
    }
    return po;
}

PriorityOrder PriorityOrder::total(const std::vector<std::string>& low_to_high) {
    std::vector<std::pair<std::string, std::string>> pairs;
    for (size_t i = 0; i + 1 < low_to_high.size(); ++i) {
        pairs.emplace_back(low_to_high[i], low_to_high[i + 1]);
    }
    return partial(low_to_high, pairs);
}

PriorityOrder PriorityOrder::weak(const std::vector<std::vector<std::string>>& tiers_low_to_high) {
    std::vector<std::string> elements;
    std::vector<std::pair<std::string, std::string>> pairs;

    for (size_t t = 0; t < tiers_low_to_high.size(); ++t) {
        const auto& tier = tiers_low_to_high[t];
        for (const auto& m : tier) {
            elements.push_back(m);
            // Equivalence inside the tier
            for (const auto& other : tier) {
                pairs.emplace_back(m, other);
            }
            // Every metric of the next tier is strictly more important
            if (t + 1 < tiers_low_to_high.size()) {
                for (const auto& higher : tiers_low_to_high[t + 1]) {
                    pairs.emplace_back(m, higher);
                }
            }
        }
    }
    return from_pairs(std::move(elements), pairs);
}

PriorityOrder PriorityOrder::antichain(std::vector<std::string> elements) {
    return from_pairs(std::move(elements), {});
}

bool PriorityOrder::leq(const std::string& a, const std::string& b) const {
    return closure_.holds(a, b);
}

bool PriorityOrder::less(const std::string& a, const std::string& b) const {
    return less(closure_.index_of(a), closure_.index_of(b));
}

Comparison PriorityOrder::compare(const std::string& a, const std::string& b) const {
    return compare(closure_.index_of(a), closure_.index_of(b));
}

std::vector<std::pair<std::string, std::string>> PriorityOrder::hasse_edges() const {
    const Adjacency cover = detail::covering_closed(closure_.adjacency());
    std::vector<std::pair<std::string, std::string>> edges;
    for (int a = 0; a < size(); ++a) {
        for (int b = 0; b < size(); ++b) {
            if (cover(a, b)) edges.emplace_back(closure_.label(a), closure_.label(b));
        }
    }
    return edges;
}

std::set<std::string> PriorityOrder::minimal() const {
    std::set<std::string> names;
    for (ElementId id : detail::extremal_closed(closure_.adjacency(), {}, false)) {
        names.insert(closure_.label(id));
    }
    return names;
}

std::set<std::string> PriorityOrder::maximal() const {
    std::set<std::string> names;
    for (ElementId id : detail::extremal_closed(closure_.adjacency(), {}, true)) {
        names.insert(closure_.label(id));
    }
    return names;
}

std::vector<std::vector<std::vector<std::string>>> PriorityOrder::tiers() const {
    const auto classes = equivalence_classes(closure_);
    const int k = static_cast<int>(classes.size());

    // depth[c] = length of the longest chain of strictly higher classes above c
    std::vector<int> depth(k, -1);
    std::function<int(int)> depth_of = [&](int c) -> int {
        if (depth[c] >= 0) return depth[c];
        int d = 0;
        for (int other = 0; other < k; ++other) {
            if (less(classes[c].front(), classes[other].front())) {
                d = std::max(d, depth_of(other) + 1);
            }
        }
        depth[c] = d;
        return d;
    };

    int max_depth = -1;
    for (int c = 0; c < k; ++c) {
        max_depth = std::max(max_depth, depth_of(c));
    }

    std::vector<std::vector<std::vector<std::string>>> result(max_depth + 1);
    for (int c = 0; c < k; ++c) {
        std::vector<std::string> names;
        for (ElementId id : classes[c]) names.push_back(closure_.label(id));
        result[depth[c]].push_back(std::move(names));
    }
    return result;
}

PriorityOrder PriorityOrder::restrict(const std::set<std::string>& subset) const {
    std::vector<std::string> kept;
    for (const auto& m : subset) {
        if (!contains(m)) {
            throw InvalidRelationError("Cannot restrict to unknown metric: " + m);
        }
        kept.push_back(m);
    }

    Relation sub(kept);
    for (const auto& a : kept) {
        for (const auto& b : kept) {
            if (leq(a, b)) sub.add(a, b);
        }
    }
    return from_relation(sub);
}

std::vector<PriorityOrder> PriorityOrder::completions() const {
    if (!is_partial_order()) {
        throw NotAPartialOrderError("Completions require a partial order: " + to_string());
    }

    const int n = size();
    std::vector<PriorityOrder> result;
    std::vector<std::string> chain;
    std::vector<bool> used(n, false);

    // Repeatedly place a minimal element among the remaining ones
    std::function<void()> extend = [&]() {
        if (static_cast<int>(chain.size()) == n) {
            result.push_back(total(chain));
            return;
        }
        for (int x = 0; x < n; ++x) {
            if (used[x]) continue;
            bool has_remaining_below = false;
            for (int y = 0; y < n && !has_remaining_below; ++y) {
                has_remaining_below = !used[y] && less(y, x);
            }
            if (has_remaining_below) continue;

            used[x] = true;
            chain.push_back(closure_.label(x));
            extend();
            chain.pop_back();
            used[x] = false;
        }
    };
    extend();
    return result;
}

std::string PriorityOrder::to_string() const {
    const auto classes = equivalence_classes(closure_);

    // Render each element as its equivalence class
    std::vector<std::string> class_name(size());
    for (const auto& cls : classes) {
        std::string name;
        if (cls.size() == 1) {
            name = closure_.label(cls.front());
        } else {
            name = "{";
            for (size_t i = 0; i < cls.size(); ++i) {
                if (i > 0) name += ", ";
                name += closure_.label(cls[i]);
            }
            name += "}";
        }
        for (ElementId id : cls) class_name[id] = name;
    }

    std::string out = "PriorityOrder(";
    for (size_t i = 0; i < classes.size(); ++i) {
        if (i > 0) out += ", ";
        out += class_name[classes[i].front()];
    }
    out += " | ";

    // One edge per pair of class representatives
    std::set<std::pair<std::string, std::string>> edges;
    const Adjacency cover = detail::covering_closed(closure_.adjacency());
    for (int a = 0; a < size(); ++a) {
        for (int b = 0; b < size(); ++b) {
            if (cover(a, b)) edges.emplace(class_name[a], class_name[b]);
        }
    }
    bool first = true;
    for (const auto& [lo, hi] : edges) {
        if (!first) out += ", ";
        out += lo + " < " + hi;
        first = false;
    }
    out += ")";
    return out;
}

nlohmann::json PriorityOrder::to_json() const {
    nlohmann::json j;
    j["elements"] = elements();

    nlohmann::json hasse = nlohmann::json::array();
    for (const auto& [lo, hi] : hasse_edges()) {
        hasse.push_back({lo, hi});
    }
    j["hasse"] = hasse;

    nlohmann::json strict = nlohmann::json::array();
    for (const auto& [a, b] : closure_.pairs()) {
        if (a != b) strict.push_back({closure_.label(a), closure_.label(b)});
    }
    j["relation"] = strict;
    j["description"] = to_string();
    return j;
}

bool PriorityOrder::operator<(const PriorityOrder& other) const {
    if (elements() != other.elements()) {
        return elements() < other.elements();
    }
    const Adjacency& lhs = closure_.adjacency();
    const Adjacency& rhs = other.closure_.adjacency();
    for (int a = 0; a < size(); ++a) {
        for (int b = 0; b < size(); ++b) {
            if (lhs(a, b) != rhs(a, b)) return !lhs(a, b);
        }
    }
    return false;
}

} // namespace posetal::order
