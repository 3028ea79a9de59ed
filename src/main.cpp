// PosetalSolver: preference learning in posetal games
//
// Case study: a random game whose players rank metrics by hidden priority
// orders. Every player repeatedly plays from its weighted-voting action
// distribution and learns the other players' orders from what they play.
//
// Usage:
//   ./posetal_solver [options]
//
// Options:
//   --players <n>        Number of players (default: 3)
//   --actions <n>        Actions per player (default: 2)
//   --metrics <n>        Number of metrics (default: 2)
//   --steps <n>          Learning rounds per mode (default: 20)
//   --seed <n>           Random seed (default: 42)
//   --mode probability|max|both  Voting mode (default: both)
//   --order-class partial|preorder|weak|total  Candidate orders (default: partial)
//   --candidates <n>     Keep the first n candidate orders, 0 for all (default: 10)
//   --equilibrium admissible|pure_nash|undominated  (default: admissible)
//   --output <path>      Output JSON file (default: viz/learning_output.json)
//   --verbose            Print round details

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <map>
#include <random>
#include <string>
#include <vector>

#include "game/PosetalGame.hpp"
#include "learning/LearningFramework.hpp"
#include "order/OrderEnumerator.hpp"
#include "solver/EquilibriumFinder.hpp"
#include "telemetry/BeliefTelemetry.hpp"

using namespace posetal;

// Command line arguments
struct Args {
    int players = 3;
    int actions = 2;
    int metrics = 2;
    int steps = 20;
    unsigned seed = 42;
    std::string mode = "both";
    std::string order_class = "partial";
    int candidates = 10;
    std::string equilibrium = "admissible";
    std::string output_path = "viz/learning_output.json";
    bool verbose = false;
};

void print_usage() {
    std::cout << "PosetalSolver: preference learning in posetal games\n\n"
              << "Usage: posetal_solver [options]\n\n"
              << "Options:\n"
              << "  --players <n>        Number of players (default: 3)\n"
              << "  --actions <n>        Actions per player (default: 2)\n"
              << "  --metrics <n>        Number of metrics (default: 2)\n"
              << "  --steps <n>          Learning rounds per mode (default: 20)\n"
              << "  --seed <n>           Random seed (default: 42)\n"
              << "  --mode <m>           probability|max|both (default: both)\n"
              << "  --order-class <c>    partial|preorder|weak|total (default: partial)\n"
              << "  --candidates <n>     Keep the first n candidate orders, 0 for all (default: 10)\n"
              << "  --equilibrium <e>    admissible|pure_nash|undominated (default: admissible)\n"
              << "  --output <path>      JSON output file (default: viz/learning_output.json)\n"
              << "  --verbose            Print round details\n"
              << "  --help               Show this help\n";
}

Args parse_args(int argc, char* argv[]) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--players" && i + 1 < argc) {
            args.players = std::stoi(argv[++i]);
        } else if (arg == "--actions" && i + 1 < argc) {
            args.actions = std::stoi(argv[++i]);
        } else if (arg == "--metrics" && i + 1 < argc) {
            args.metrics = std::stoi(argv[++i]);
        } else if (arg == "--steps" && i + 1 < argc) {
            args.steps = std::stoi(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            args.seed = static_cast<unsigned>(std::stoul(argv[++i]));
        } else if (arg == "--mode" && i + 1 < argc) {
            args.mode = argv[++i];
        } else if (arg == "--order-class" && i + 1 < argc) {
            args.order_class = argv[++i];
        } else if (arg == "--candidates" && i + 1 < argc) {
            args.candidates = std::stoi(argv[++i]);
        } else if (arg == "--equilibrium" && i + 1 < argc) {
            args.equilibrium = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage();
            std::exit(1);
        }
    }
    return args;
}

order::OrderClass parse_order_class(const std::string& name) {
    if (name == "partial") return order::OrderClass::Partial;
    if (name == "preorder") return order::OrderClass::Preorder;
    if (name == "weak") return order::OrderClass::Weak;
    if (name == "total") return order::OrderClass::Total;
    throw std::invalid_argument("Unknown order class: " + name);
}

solver::EquilibriumConcept parse_equilibrium(const std::string& name) {
    if (name == "admissible") return solver::EquilibriumConcept::Admissible;
    if (name == "pure_nash") return solver::EquilibriumConcept::PureNash;
    if (name == "undominated") return solver::EquilibriumConcept::Undominated;
    throw std::invalid_argument("Unknown equilibrium concept: " + name);
}

std::vector<learning::UpdateMode> parse_modes(const std::string& name) {
    if (name == "probability") return {learning::UpdateMode::Probability};
    if (name == "max") return {learning::UpdateMode::Max};
    if (name == "both") return {learning::UpdateMode::Probability, learning::UpdateMode::Max};
    throw std::invalid_argument("Unknown mode: " + name);
}

// Metrics named M1..Mk, each with a uniform [0, 1] value per profile
std::vector<Eigen::VectorXd> random_outcomes(const game::ProfileIndex& index, int num_metrics, std::mt19937& rng) {
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    std::vector<Eigen::VectorXd> table(index.total(), Eigen::VectorXd(num_metrics));
    for (int m = 0; m < num_metrics; ++m) {
        for (int pos = 0; pos < index.total(); ++pos) {
            table[pos](m) = uniform(rng);
        }
    }
    return table;
}

int run(const Args& args) {
    if (args.players < 1 || args.actions < 1 || args.metrics < 1 || args.steps < 0) {
        throw std::invalid_argument("players, actions and metrics must be positive, steps non-negative");
    }

    std::mt19937 rng(args.seed);
    const solver::EquilibriumConcept equilibrium = parse_equilibrium(args.equilibrium);
    const std::vector<learning::UpdateMode> modes = parse_modes(args.mode);

    std::vector<game::Metric> metrics;
    std::vector<std::string> metric_names;
    for (int m = 0; m < args.metrics; ++m) {
        metric_names.push_back("M" + std::to_string(m + 1));
        metrics.push_back({metric_names.back(), game::Sense::Maximize});
    }

    std::vector<std::string> actions;
    for (int a = 0; a < args.actions; ++a) {
        actions.push_back("A" + std::to_string(a + 1));
    }

    // Candidate orders
    order::EnumerationConfig enum_config;
    enum_config.order_class = parse_order_class(args.order_class);
    std::vector<order::PriorityOrder> candidates = order::OrderEnumerator(metric_names, enum_config).collect();
    if (args.candidates > 0 && static_cast<int>(candidates.size()) > args.candidates) {
        candidates.erase(candidates.begin() + args.candidates, candidates.end());
    }

    std::cout << "Metrics: " << args.metrics << ", candidate "
              << order::order_class_to_string(enum_config.order_class) << " orders: "
              << candidates.size() << std::endl;

    // Random game with hidden true orders
    game::ProfileIndex index;
    index.build(std::vector<int>(args.players, args.actions));
    const std::vector<Eigen::VectorXd> table = random_outcomes(index, args.metrics, rng);

    std::uniform_int_distribution<int> pick(0, static_cast<int>(candidates.size()) - 1);
    std::vector<game::Player> players;
    for (int i = 0; i < args.players; ++i) {
        players.emplace_back("P" + std::to_string(i + 1), actions, candidates[pick(rng)]);
    }

    const game::PosetalGame true_game = game::PosetalGame::build(
        metrics, players,
        [&table, &index](const game::ActionProfile& p) { return table[index.index_of(p)]; });

    std::cout << "Players: " << true_game.num_players()
              << ", profiles: " << true_game.num_profiles() << std::endl;
    for (const auto& p : true_game.players()) {
        std::cout << "  " << p.id() << " true order: " << p.priority_order().to_string() << std::endl;
    }

    solver::FinderStats finder_stats;
    const game::ProfileSet equilibria = solver::find_equilibria(true_game, equilibrium, {}, &finder_stats);
    std::cout << solver::concept_to_string(equilibrium) << " equilibria: " << equilibria.size()
              << " (" << finder_stats.profiles_checked << " profiles checked)" << std::endl;
    for (const auto& e : equilibria) {
        std::cout << "  " << true_game.describe(e) << std::endl;
    }
    std::cout << std::endl;

    // Telemetry
    telemetry::BeliefTelemetry recorder(args.output_path);
    std::cout << "Writing telemetry to: " << args.output_path << "\n\n";

    nlohmann::json header;
    header["seed"] = args.seed;
    header["metrics"] = metric_names;
    header["equilibrium"] = solver::concept_to_string(equilibrium);
    header["candidates"] = nlohmann::json::array();
    for (const auto& c : candidates) {
        header["candidates"].push_back(c.to_string());
    }
    header["true_orders"] = nlohmann::json::object();
    for (const auto& p : true_game.players()) {
        header["true_orders"][p.id()] = p.priority_order().to_string();
    }
    header["equilibria"] = nlohmann::json::array();
    for (const auto& e : equilibria) {
        header["equilibria"].push_back(true_game.profile_to_json(e));
    }
    recorder.set_header(header);

    nlohmann::json summary = nlohmann::json::object();
    auto start_time = std::chrono::high_resolution_clock::now();

    for (learning::UpdateMode mode : modes) {
        const std::string mode_name = learning::update_mode_to_string(mode);
        std::cout << "Learning (" << mode_name << " mode)...\n";

        std::map<std::string, learning::BeliefState> priors;
        for (const auto& p : true_game.players()) {
            priors.emplace(p.id(), learning::BeliefState::uniform(candidates));
        }

        learning::FrameworkConfig config;
        config.mode = mode;
        config.equilibrium = equilibrium;
        config.seed = args.seed;
        config.verbose = args.verbose;

        learning::LearningFramework framework(true_game, priors, config);

        for (int step = 0; step < args.steps; ++step) {
            const game::ActionProfile played = framework.run_iteration();
            for (const auto& [id, belief] : framework.current_beliefs()) {
                learning::RoundStats stats;
                stats.round = step + 1;
                stats.observation = true_game.describe(played);
                stats.concentration = belief.concentration();
                stats.entropy = belief.entropy();
                stats.support = belief.support();
                for (const auto& po : belief.most_likely_orders()) {
                    stats.leaders.push_back(po.to_string());
                }
                recorder.log_round(telemetry::BeliefSnapshot::from_round(mode_name + "/" + id, stats, belief));
            }
        }

        for (const auto& [id, learned] : framework.converged_orders()) {
            const auto& truth = true_game.player(true_game.player_index(id)).priority_order();
            std::cout << "  " << id << ": learned " << learned.to_string()
                      << ", P(true order) = " << std::fixed << std::setprecision(4)
                      << framework.belief(id).probability(truth)
                      << (learned == truth ? "  [match]" : "") << std::endl;
        }
        std::cout << "  Equilibrium cache: " << framework.cache().size() << " entries, "
                  << framework.cache().hits() << " hits\n\n";

        summary[mode_name] = framework.to_json();
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    std::cout << "Time: " << duration.count() << " ms\n";

    recorder.finish(summary);
    std::cout << "Learning data written to: " << args.output_path << std::endl;
    return 0;
}

int main(int argc, char* argv[]) {
    std::cout << "======================================\n";
    std::cout << "  PosetalSolver v1.0\n";
    std::cout << "  Preference Learning in Posetal Games\n";
    std::cout << "======================================\n\n";

    try {
        return run(parse_args(argc, argv));
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
