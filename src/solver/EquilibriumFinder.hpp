#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "../game/PosetalGame.hpp"

namespace posetal::solver {

// Which stability notion a profile must satisfy
enum class EquilibriumConcept : uint8_t {
    PureNash = 0,     // every deviation is weakly worse (incomparable deviations disqualify)
    Admissible = 1,   // no deviation is strictly better (incomparable deviations are tolerated)
    Undominated = 2   // admissible and not Pareto-dominated by another admissible profile
};

inline std::string concept_to_string(EquilibriumConcept c) {
    switch (c) {
        case EquilibriumConcept::PureNash:    return "pure_nash";
        case EquilibriumConcept::Admissible:  return "admissible";
        case EquilibriumConcept::Undominated: return "undominated";
    }
    return "unknown";
}

struct FinderConfig {
    bool parallel = false;  // split the profile scan across OpenMP threads when available
};

// Exhaustive search statistics
struct FinderStats {
    int profiles_checked = 0;
    int equilibria = 0;
    int num_threads = 1;
    double wall_time_ms = 0.0;
};

// Pure Nash: for every player, the profile is weakly preferred (Greater or
// Equal) to each unilateral deviation
bool is_pure_nash(const game::PosetalGame& game, const game::ActionProfile& profile);

// Admissible: no player has a unilateral deviation it strictly prefers
bool is_admissible(const game::PosetalGame& game, const game::ActionProfile& profile);

// Strict Nash: every unilateral deviation is strictly worse for the deviator
bool is_strict_nash(const game::PosetalGame& game, const game::ActionProfile& profile);

// x is weakly preferred by every player and strictly by at least one to y
bool pareto_dominates(const game::PosetalGame& game, const game::ActionProfile& x, const game::ActionProfile& y);

// Every profile satisfying the concept. Empty results are valid answers.
// O(|profiles| x |players| x |actions|) with an early exit per profile.
game::ProfileSet find_pure_nash(const game::PosetalGame& game, FinderConfig config = {}, FinderStats* stats = nullptr);
game::ProfileSet find_admissible(const game::PosetalGame& game, FinderConfig config = {}, FinderStats* stats = nullptr);
game::ProfileSet find_undominated(const game::PosetalGame& game, FinderConfig config = {}, FinderStats* stats = nullptr);

game::ProfileSet find_equilibria(
    const game::PosetalGame& game,
    EquilibriumConcept kind,
    FinderConfig config = {},
    FinderStats* stats = nullptr
);

// Memoized equilibrium search over games that share one action/outcome
// structure and differ only in their players' priority orders.
// The first game passed to find() fixes that structure; later calls with a
// game built separately throw InvalidGameError.
class EquilibriumCache {
public:
    explicit EquilibriumCache(EquilibriumConcept kind, FinderConfig config = {})
        : kind_(kind), config_(config) {}

    // Equilibria of base with the given order per player (in player order)
    const game::ProfileSet& find(
        const game::PosetalGame& base,
        const std::vector<order::PriorityOrder>& orders
    );

    EquilibriumConcept kind() const { return kind_; }
    size_t size() const { return cache_.size(); }
    int hits() const { return hits_; }
    int misses() const { return misses_; }
    void clear() { cache_.clear(); base_.reset(); hits_ = 0; misses_ = 0; }

private:
    EquilibriumConcept kind_;
    FinderConfig config_;
    std::optional<game::PosetalGame> base_;
    std::map<std::vector<order::PriorityOrder>, game::ProfileSet> cache_;
    int hits_ = 0;
    int misses_ = 0;
};

} // namespace posetal::solver
