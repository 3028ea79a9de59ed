#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <functional>
#include <iterator>
#include <set>
#include <string>
#include <vector>

namespace posetal::game {

// Action identifier: position in the owning player's action list
using ActionIndex = int;

// Direction in which a metric improves
enum class Sense : uint8_t {
    Maximize = 0,  // larger values are better (payoff, fairness)
    Minimize = 1   // smaller values are better (cost, time)
};

inline std::string sense_to_string(Sense s) {
    switch (s) {
        case Sense::Maximize: return "maximize";
        case Sense::Minimize: return "minimize";
    }
    return "unknown";
}

// Named dimension of outcome evaluation. Immutable, identified by name.
struct Metric {
    std::string name;
    Sense sense = Sense::Maximize;

    // +1 if a is better than b on this metric, -1 if worse, 0 if equal
    int direction(double a, double b) const {
        if (a == b) return 0;
        const bool a_larger = a > b;
        return (a_larger == (sense == Sense::Maximize)) ? 1 : -1;
    }
};

// One chosen action per player, in the game's player order
class ActionProfile {
public:
    ActionProfile() = default;
    explicit ActionProfile(std::vector<ActionIndex> actions) : actions_(std::move(actions)) {}

    ActionIndex operator[](int player) const { return actions_[player]; }
    ActionIndex action(int player) const { return actions_.at(player); }
    int size() const { return static_cast<int>(actions_.size()); }
    const std::vector<ActionIndex>& actions() const { return actions_; }

    // Same profile with one player's action replaced
    ActionProfile with_action(int player, ActionIndex a) const {
        ActionProfile p = *this;
        p.actions_.at(player) = a;
        return p;
    }

    bool operator==(const ActionProfile& other) const { return actions_ == other.actions_; }
    bool operator!=(const ActionProfile& other) const { return actions_ != other.actions_; }
    bool operator<(const ActionProfile& other) const { return actions_ < other.actions_; }

private:
    std::vector<ActionIndex> actions_;
};

using ProfileSet = std::set<ActionProfile>;

// Maps each profile to one metric value per game metric
using OutcomeFunction = std::function<Eigen::VectorXd(const ActionProfile&)>;

// Mixed-radix mapping between linear positions and action profiles.
// The first player varies slowest, so position order equals
// lexicographic profile order.
class ProfileIndex {
public:
    void build(const std::vector<int>& num_actions) {
        radices_ = num_actions;
        strides_.assign(radices_.size(), 1);
        total_ = radices_.empty() ? 0 : 1;
        for (int i = static_cast<int>(radices_.size()) - 1; i >= 0; --i) {
            strides_[i] = total_;
            total_ *= radices_[i];
        }
    }

    // Number of profiles (product of action counts)
    int total() const { return total_; }

    int num_players() const { return static_cast<int>(radices_.size()); }
    int num_actions(int player) const { return radices_[player]; }

    ActionProfile profile_at(int pos) const {
        std::vector<ActionIndex> actions(radices_.size());
        for (size_t i = 0; i < radices_.size(); ++i) {
            actions[i] = (pos / strides_[i]) % radices_[i];
        }
        return ActionProfile(std::move(actions));
    }

    int index_of(const ActionProfile& p) const {
        int pos = 0;
        for (size_t i = 0; i < radices_.size(); ++i) {
            pos += p[static_cast<int>(i)] * strides_[i];
        }
        return pos;
    }

    // Shape check: one in-range action per player
    bool is_valid(const ActionProfile& p) const {
        if (p.size() != num_players()) return false;
        for (int i = 0; i < p.size(); ++i) {
            if (p[i] < 0 || p[i] >= radices_[i]) return false;
        }
        return true;
    }

private:
    std::vector<int> radices_;
    std::vector<int> strides_;
    int total_ = 0;
};

// Lazy range over every profile, materializing one at a time
class ProfileRange {
public:
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = ActionProfile;
        using difference_type = std::ptrdiff_t;
        using pointer = const ActionProfile*;
        using reference = ActionProfile;

        Iterator(const ProfileIndex* index, int pos) : index_(index), pos_(pos) {}

        ActionProfile operator*() const { return index_->profile_at(pos_); }
        Iterator& operator++() { ++pos_; return *this; }
        bool operator==(const Iterator& other) const { return pos_ == other.pos_; }
        bool operator!=(const Iterator& other) const { return pos_ != other.pos_; }

    private:
        const ProfileIndex* index_;
        int pos_;
    };

    explicit ProfileRange(const ProfileIndex& index) : index_(&index) {}

    Iterator begin() const { return Iterator(index_, 0); }
    Iterator end() const { return Iterator(index_, index_->total()); }
    int size() const { return index_->total(); }

private:
    const ProfileIndex* index_;
};

} // namespace posetal::game
