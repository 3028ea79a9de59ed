#pragma once

#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <vector>
#include "PriorityOrder.hpp"

namespace posetal::order {

// Class of relations produced by the enumerator
enum class OrderClass : uint8_t {
    Total = 0,     // chains
    Weak = 1,      // total preorders: ranked tiers of equivalent metrics
    Partial = 2,   // reflexive, transitive, antisymmetric
    Preorder = 3   // reflexive, transitive
};

inline std::string order_class_to_string(OrderClass c) {
    switch (c) {
        case OrderClass::Total:    return "total";
        case OrderClass::Weak:     return "weak";
        case OrderClass::Partial:  return "partial";
        case OrderClass::Preorder: return "preorder";
    }
    return "unknown";
}

struct EnumerationConfig {
    OrderClass order_class = OrderClass::Preorder;
    bool up_to_isomorphism = false;  // yield one representative per unlabelled shape
};

// Enumeration is exhaustive over 2^(n(n-1)) candidate relations
constexpr int kMaxEnumerableMetrics = 5;

// Lazy, finite, restartable sequence of every order of the configured class
// over a fixed metric set.
//
// Candidates are the bitmasks over the n(n-1) off-diagonal pairs, visited in
// increasing order. A mask is accepted when its reflexive relation is already
// transitive, so each preorder is met exactly once and the sequence is
// duplicate-free without remembering what was yielded. With
// up_to_isomorphism, only the smallest mask among all relabellings is kept.
//
// Labelled counts for n = 1..5:
//   preorders 1, 4, 29, 355, 6942    partial orders 1, 3, 19, 219, 4231
//   weak orders 1, 3, 13, 75, 541    total orders n!
class OrderEnumerator {
public:
    // Throws EnumerationLimitError above kMaxEnumerableMetrics metrics and
    // InvalidRelationError on duplicate metric names
    explicit OrderEnumerator(std::vector<std::string> metrics, EnumerationConfig config = {});

    // Next order, or nullopt once exhausted
    std::optional<PriorityOrder> next();

    // Restart from the first order
    void reset();

    // Drain a fresh pass into a vector (does not disturb the current position)
    std::vector<PriorityOrder> collect() const;

    const std::vector<std::string>& metrics() const { return metrics_; }
    const EnumerationConfig& config() const { return config_; }

    // Input iterator over a fresh pass, for range-for
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = PriorityOrder;
        using difference_type = std::ptrdiff_t;
        using pointer = const PriorityOrder*;
        using reference = const PriorityOrder&;

        Iterator() = default;
        explicit Iterator(OrderEnumerator* owner);

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        Iterator& operator++();
        bool operator==(const Iterator& other) const { return !current_ && !other.current_; }
        bool operator!=(const Iterator& other) const { return !(*this == other); }

    private:
        OrderEnumerator* owner_ = nullptr;
        std::optional<PriorityOrder> current_;
    };

    // begin() restarts the enumeration
    Iterator begin();
    Iterator end() { return Iterator(); }

private:
    std::vector<std::string> metrics_;
    EnumerationConfig config_;
    std::vector<std::pair<int, int>> pairs_;        // bit index -> (a, b)
    std::vector<std::vector<int>> permutations_;    // only for up_to_isomorphism
    uint64_t next_mask_ = 0;
    uint64_t mask_end_ = 0;

    bool accepts(uint64_t mask) const;
    bool is_canonical(uint64_t mask) const;
    Adjacency to_adjacency(uint64_t mask) const;
    PriorityOrder to_order(uint64_t mask) const;
};

// Convenience entry point
OrderEnumerator enumerate_orders(
    const std::vector<std::string>& metrics,
    OrderClass order_class = OrderClass::Preorder
);

// Number of orders a full pass yields
int count_orders(const std::vector<std::string>& metrics, EnumerationConfig config = {});

} // namespace posetal::order
