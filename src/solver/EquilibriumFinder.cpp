#include "EquilibriumFinder.hpp"
#include "../common/Errors.hpp"
#include <chrono>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace posetal::solver {

namespace {

using order::Comparison;

// Profile survives when no deviation of any player yields a disqualifying comparison
template<typename Disqualifies>
bool survives_deviations(const game::PosetalGame& game, const game::ActionProfile& profile, Disqualifies&& disqualifies) {
    for (int p = 0; p < game.num_players(); ++p) {
        const int n = game.player(p).num_actions();
        for (game::ActionIndex a = 0; a < n; ++a) {
            if (a == profile[p]) continue;
            const Comparison c = game.preference(p, profile, profile.with_action(p, a));
            if (disqualifies(c)) return false;
        }
    }
    return true;
}

// Scan every profile; each work item writes only its own slot
template<typename Test>
game::ProfileSet scan_profiles(const game::PosetalGame& game, FinderConfig config, FinderStats* stats, Test&& test) {
    auto start = std::chrono::high_resolution_clock::now();

    const int total = game.num_profiles();
    std::vector<char> accepted(total, 0);
    int num_threads = 1;

#ifdef _OPENMP
    if (config.parallel) {
        num_threads = omp_get_max_threads();
        #pragma omp parallel for schedule(static)
        for (int pos = 0; pos < total; ++pos) {
            accepted[pos] = test(game.profile_at(pos)) ? 1 : 0;
        }
    } else {
        for (int pos = 0; pos < total; ++pos) {
            accepted[pos] = test(game.profile_at(pos)) ? 1 : 0;
        }
    }
#else
    (void)config;
    for (int pos = 0; pos < total; ++pos) {
        accepted[pos] = test(game.profile_at(pos)) ? 1 : 0;
    }
#endif

    game::ProfileSet result;
    for (int pos = 0; pos < total; ++pos) {
        if (accepted[pos]) result.insert(game.profile_at(pos));
    }

    if (stats) {
        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
        stats->profiles_checked = total;
        stats->equilibria = static_cast<int>(result.size());
        stats->num_threads = num_threads;
        stats->wall_time_ms = duration.count() / 1000.0;
    }
    return result;
}

} // namespace

bool is_pure_nash(const game::PosetalGame& game, const game::ActionProfile& profile) {
    game.check_profile(profile);
    return survives_deviations(game, profile, [](Comparison c) {
        return c == Comparison::Less || c == Comparison::Incomparable;
    });
}

bool is_admissible(const game::PosetalGame& game, const game::ActionProfile& profile) {
    game.check_profile(profile);
    return survives_deviations(game, profile, [](Comparison c) {
        return c == Comparison::Less;
    });
}

bool is_strict_nash(const game::PosetalGame& game, const game::ActionProfile& profile) {
    game.check_profile(profile);
    return survives_deviations(game, profile, [](Comparison c) {
        return c != Comparison::Greater;
    });
}

bool pareto_dominates(const game::PosetalGame& game, const game::ActionProfile& x, const game::ActionProfile& y) {
    bool strict = false;
    for (int p = 0; p < game.num_players(); ++p) {
        const Comparison c = game.preference(p, x, y);
        if (c == Comparison::Greater) {
            strict = true;
        } else if (c != Comparison::Equal) {
            return false;
        }
    }
    return strict;
}

game::ProfileSet find_pure_nash(const game::PosetalGame& game, FinderConfig config, FinderStats* stats) {
    return scan_profiles(game, config, stats, [&game](const game::ActionProfile& p) {
        return is_pure_nash(game, p);
    });
}

game::ProfileSet find_admissible(const game::PosetalGame& game, FinderConfig config, FinderStats* stats) {
    return scan_profiles(game, config, stats, [&game](const game::ActionProfile& p) {
        return is_admissible(game, p);
    });
}

game::ProfileSet find_undominated(const game::PosetalGame& game, FinderConfig config, FinderStats* stats) {
    const game::ProfileSet admissible = find_admissible(game, config, stats);

    game::ProfileSet result;
    for (const auto& candidate : admissible) {
        bool dominated = false;
        for (const auto& other : admissible) {
            if (other != candidate && pareto_dominates(game, other, candidate)) {
                dominated = true;
                break;
            }
        }
        if (!dominated) result.insert(candidate);
    }

    if (stats) {
        stats->equilibria = static_cast<int>(result.size());
    }
    return result;
}

game::ProfileSet find_equilibria(
    const game::PosetalGame& game,
    EquilibriumConcept kind,
    FinderConfig config,
    FinderStats* stats
) {
    switch (kind) {
        case EquilibriumConcept::PureNash:    return find_pure_nash(game, config, stats);
        case EquilibriumConcept::Admissible:  return find_admissible(game, config, stats);
        case EquilibriumConcept::Undominated: return find_undominated(game, config, stats);
    }
    return {};
}

const game::ProfileSet& EquilibriumCache::find(
    const game::PosetalGame& base,
    const std::vector<order::PriorityOrder>& orders
) {
    if (!base_) {
        base_ = base;
    } else if (!base_->shares_outcomes(base)) {
        throw InvalidGameError("Equilibrium cache used with a game of another outcome table");
    }

    auto it = cache_.find(orders);
    if (it != cache_.end()) {
        ++hits_;
        return it->second;
    }
    ++misses_;
    const game::PosetalGame game = base.with_orders(orders);
    auto inserted = cache_.emplace(orders, find_equilibria(game, kind_, config_));
    return inserted.first->second;
}

} // namespace posetal::solver
