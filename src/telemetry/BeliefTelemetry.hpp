#pragma once

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../learning/Belief.hpp"
#include "../learning/Diagnostics.hpp"

namespace posetal::telemetry {

// Belief state after one round, tagged with the run it belongs to
struct BeliefSnapshot {
    std::string run;          // e.g. "probability" or "max"
    learning::RoundStats stats;
    std::vector<double> weights;

    nlohmann::json to_json() const {
        nlohmann::json j = stats.to_json();
        j["type"] = "round";
        j["run"] = run;
        j["weights"] = weights;
        return j;
    }

    static BeliefSnapshot from_round(
        const std::string& run,
        const learning::RoundStats& stats,
        const learning::BeliefState& belief
    ) {
        BeliefSnapshot snap;
        snap.run = run;
        snap.stats = stats;
        snap.weights.assign(belief.weights().data(), belief.weights().data() + belief.size());
        return snap;
    }
};

// File-based telemetry for learning runs. The whole history is rewritten
// after every round so a reader always sees a complete JSON document.
class BeliefTelemetry {
public:
    explicit BeliefTelemetry(const std::string& output_path)
        : path_(output_path) {
        write_file();
    }

    // Static description of the experiment (game, candidates, true orders)
    void set_header(const nlohmann::json& header) {
        header_ = header;
        write_file();
    }

    void log_round(const BeliefSnapshot& snapshot) {
        history_.push_back(snapshot.to_json());
        latest_ = history_.back();
        write_file();
    }

    // Attach a finished run's summary and mark the file complete
    void finish(const nlohmann::json& summary) {
        nlohmann::json completion;
        completion["type"] = "complete";
        completion["summary"] = summary;
        completion["total_rounds"] = history_.size();
        latest_ = completion;
        finished_ = true;
        write_file();
    }

    const std::string& path() const { return path_; }

private:
    void write_file() {
        nlohmann::json output;
        output["status"] = finished_ ? "complete" : "running";
        output["header"] = header_;
        output["round_count"] = history_.size();
        output["rounds"] = history_;
        output["latest"] = latest_;

        // Atomic write: temp file + rename so readers never see truncated JSON
        const std::filesystem::path target(path_);
        if (target.has_parent_path()) {
            std::filesystem::create_directories(target.parent_path());
        }
        const std::string tmp_path = path_ + ".tmp";
        std::ofstream f(tmp_path);
        if (!f.is_open()) {
            throw std::runtime_error("Cannot write telemetry file: " + tmp_path);
        }
        f << output.dump(2);
        f.close();
        std::filesystem::rename(tmp_path, path_);
    }

    std::string path_;
    nlohmann::json header_;
    std::vector<nlohmann::json> history_;
    nlohmann::json latest_;
    bool finished_ = false;
};

} // namespace posetal::telemetry
