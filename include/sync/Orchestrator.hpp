#pragma once

#include "sync/model/Pass.hpp"
#include "sync/model/Step.hpp"
#include "snapshot/Repository.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace sv::sync {

class Executor;

struct Options {
    bool simulate = false;  // report mutating operations instead of running them
    bool single = false;    // stop after the first completed pass
};

enum class StopReason { InSync, SinglePass, Simulated };

constexpr std::string_view to_string(const StopReason r) {
    switch (r) {
    case StopReason::InSync: return "in-sync";
    case StopReason::SinglePass: return "single-pass";
    case StopReason::Simulated: return "simulated";
    }
    return "unknown";
}

struct RunSummary {
    std::vector<model::Pass> passes;
    StopReason reason = StopReason::InSync;
};

/*
 * Mirrors the dated snapshots of a source volume onto a destination volume,
 * one snapshot per pass.
 *
 * Each pass lists both volumes afresh, takes the latest date missing at the
 * destination as target, and the destination snapshot closest to it (see
 * snapshot::distance) as base. The target is then built on the destination as
 * clone of base, barrier, structural diff, content transfer, read-only flag,
 * barrier. Newest first: later snapshots become the bases for older ones and
 * any fragmentation ends up in the older snapshots.
 *
 * Nothing is retried or rolled back. A pass that throws leaves whatever it
 * created behind, and a destination directory counts as synced from then on.
 */
class Orchestrator {
public:
    Orchestrator(std::filesystem::path source,
                 std::filesystem::path destination,
                 std::shared_ptr<const snapshot::Repository> repository,
                 std::shared_ptr<Executor> executor,
                 Options options = {});

    // Syncs the latest missing snapshot. Empty when nothing is missing.
    std::optional<model::Pass> syncOne();

    // Repeats syncOne until nothing is missing, or after one pass in single or
    // simulate mode (a simulated pass changes nothing, so it would repeat forever).
    RunSummary run();

    [[nodiscard]] model::Step state() const { return state_; }
    [[nodiscard]] const Options& options() const { return options_; }

private:
    void transition(model::Step next);

    [[nodiscard]] std::filesystem::path sourcePath(const snapshot::Date& d) const;
    [[nodiscard]] std::filesystem::path destinationPath(const snapshot::Date& d) const;

    std::filesystem::path source_;
    std::filesystem::path destination_;
    std::shared_ptr<const snapshot::Repository> repository_;
    std::shared_ptr<Executor> executor_;
    Options options_;
    model::Step state_ = model::Step::Idle;
};

}
