#include "OrderEnumerator.hpp"
#include "../common/Errors.hpp"
#include <algorithm>
#include <numeric>
#include <set>

namespace posetal::order {

namespace {

// Bit position of the off-diagonal pair (a, b) in an n-element mask
int pair_bit(int n, int a, int b) {
    return a * (n - 1) + (b < a ? b : b - 1);
}

bool is_transitive_adjacency(const Adjacency& adj) {
    const int n = static_cast<int>(adj.rows());
    for (int a = 0; a < n; ++a) {
        for (int b = 0; b < n; ++b) {
            if (a == b || !adj(a, b)) continue;
            for (int c = 0; c < n; ++c) {
                if (adj(b, c) && !adj(a, c)) return false;
            }
        }
    }
    return true;
}

} // namespace

OrderEnumerator::OrderEnumerator(std::vector<std::string> metrics, EnumerationConfig config)
    : metrics_(std::move(metrics)), config_(config)
{
    const int n = static_cast<int>(metrics_.size());
    if (n > kMaxEnumerableMetrics) {
        throw EnumerationLimitError(
            "Enumerating orders is limited to " + std::to_string(kMaxEnumerableMetrics) +
            " metrics, got " + std::to_string(n));
    }
    std::set<std::string> unique(metrics_.begin(), metrics_.end());
    if (static_cast<int>(unique.size()) != n) {
        throw InvalidRelationError("Duplicate metric names passed to the order enumerator");
    }

    for (int a = 0; a < n; ++a) {
        for (int b = 0; b < n; ++b) {
            if (a != b) pairs_.emplace_back(a, b);
        }
    }
    mask_end_ = (n == 0) ? 0 : (uint64_t{1} << pairs_.size());

    if (config_.up_to_isomorphism) {
        std::vector<int> perm(n);
        std::iota(perm.begin(), perm.end(), 0);
        do {
            permutations_.push_back(perm);
        } while (std::next_permutation(perm.begin(), perm.end()));
    }
}

Adjacency OrderEnumerator::to_adjacency(uint64_t mask) const {
    const int n = static_cast<int>(metrics_.size());
    Adjacency adj = Adjacency::Identity(n, n);
    for (size_t bit = 0; bit < pairs_.size(); ++bit) {
        if (mask & (uint64_t{1} << bit)) {
            adj(pairs_[bit].first, pairs_[bit].second) = true;
        }
    }
    return adj;
}

bool OrderEnumerator::accepts(uint64_t mask) const {
    const Adjacency adj = to_adjacency(mask);
    if (!is_transitive_adjacency(adj)) return false;

    const int n = static_cast<int>(metrics_.size());
    bool antisymmetric = true;
    bool total = true;
    for (int a = 0; a < n; ++a) {
        for (int b = a + 1; b < n; ++b) {
            if (adj(a, b) && adj(b, a)) antisymmetric = false;
            if (!adj(a, b) && !adj(b, a)) total = false;
        }
    }

    switch (config_.order_class) {
        case OrderClass::Total:    return antisymmetric && total;
        case OrderClass::Weak:     return total;
        case OrderClass::Partial:  return antisymmetric;
        case OrderClass::Preorder: return true;
    }
    return false;
}

bool OrderEnumerator::is_canonical(uint64_t mask) const {
    const int n = static_cast<int>(metrics_.size());
    for (const auto& perm : permutations_) {
        uint64_t relabelled = 0;
        for (size_t bit = 0; bit < pairs_.size(); ++bit) {
            if (mask & (uint64_t{1} << bit)) {
                const auto& [a, b] = pairs_[bit];
                relabelled |= uint64_t{1} << pair_bit(n, perm[a], perm[b]);
            }
        }
        if (relabelled < mask) return false;
    }
    return true;
}

PriorityOrder OrderEnumerator::to_order(uint64_t mask) const {
    Relation r(metrics_);
    for (size_t bit = 0; bit < pairs_.size(); ++bit) {
        if (mask & (uint64_t{1} << bit)) {
            r.add(pairs_[bit].first, pairs_[bit].second);
        }
    }
    return PriorityOrder::from_relation(r);
}

std::optional<PriorityOrder> OrderEnumerator::next() {
    while (next_mask_ < mask_end_) {
        const uint64_t mask = next_mask_++;
        if (!accepts(mask)) continue;
        if (config_.up_to_isomorphism && !is_canonical(mask)) continue;
        return to_order(mask);
    }
    return std::nullopt;
}

void OrderEnumerator::reset() {
    next_mask_ = 0;
}

std::vector<PriorityOrder> OrderEnumerator::collect() const {
    OrderEnumerator pass = *this;
    pass.reset();

    std::vector<PriorityOrder> orders;
    while (auto order = pass.next()) {
        orders.push_back(std::move(*order));
    }
    return orders;
}

OrderEnumerator::Iterator::Iterator(OrderEnumerator* owner)
    : owner_(owner), current_(owner->next()) {}

OrderEnumerator::Iterator& OrderEnumerator::Iterator::operator++() {
    current_ = owner_->next();
    return *this;
}

OrderEnumerator::Iterator OrderEnumerator::begin() {
    reset();
    return Iterator(this);
}

OrderEnumerator enumerate_orders(const std::vector<std::string>& metrics, OrderClass order_class) {
    EnumerationConfig config;
    config.order_class = order_class;
    return OrderEnumerator(metrics, config);
}

int count_orders(const std::vector<std::string>& metrics, EnumerationConfig config) {
    OrderEnumerator enumerator(metrics, config);
    int count = 0;
    while (enumerator.next()) {
        ++count;
    }
    return count;
}

} // namespace posetal::order
