#include "sync/Orchestrator.hpp"
#include "sync/Executor.hpp"
#include "snapshot/BaseSelector.hpp"
#include "error/Errors.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <fmt/format.h>

using namespace sv::sync;
using namespace sv::sync::model;
using namespace sv::snapshot;
using namespace sv::logging;

namespace fs = std::filesystem;

Orchestrator::Orchestrator(fs::path source,
                           fs::path destination,
                           std::shared_ptr<const Repository> repository,
                           std::shared_ptr<Executor> executor,
                           const Options options)
    : source_(std::move(source)),
      destination_(std::move(destination)),
      repository_(std::move(repository)),
      executor_(std::move(executor)),
      options_(options) {
    if (!repository_) throw std::invalid_argument("Orchestrator requires a snapshot repository");
    if (!executor_) throw std::invalid_argument("Orchestrator requires an executor");
}

std::optional<Pass> Orchestrator::syncOne() {
    transition(Step::SelectTarget);

    const auto srcDates = repository_->listDates(source_);
    const auto dstDates = repository_->listDates(destination_);

    SnapshotSet missing;
    std::ranges::set_difference(srcDates, dstDates, std::inserter(missing, missing.end()));

    if (missing.empty()) {
        transition(Step::Done);
        return std::nullopt;
    }

    LogRegistry::sync()->debug("[Orchestrator] {} of {} source snapshots missing at destination",
                               missing.size(), srcDates.size());

    Pass pass;
    pass.start();
    pass.target = *missing.rbegin();

    transition(Step::SelectBase);
    if (dstDates.empty())
        throw error::PreconditionFailure(fmt::format(
            "No base snapshot available to start from in {}; seed it with an initial snapshot first",
            destination_.string()));

    const auto [base, dist] = BaseSelector::select(pass.target, dstDates);
    pass.base = base;
    pass.distance = dist;

    LogRegistry::sync()->info("[Orchestrator] Syncing {}, using {} as base (distance {}).",
                              pass.target.toString(), pass.base.toString(), pass.distance);

    const auto srcBase = sourcePath(pass.base);
    const auto srcTarget = sourcePath(pass.target);
    const auto dstBase = destinationPath(pass.base);
    const auto dstTarget = destinationPath(pass.target);

    transition(Step::Clone);
    executor_->clone(dstBase, dstTarget);

    transition(Step::Barrier1);
    LogRegistry::sync()->info("[Orchestrator] Waiting for sync of snapshot.");
    executor_->barrier(dstTarget);

    transition(Step::StructuralDiff);
    executor_->diff({srcBase, srcTarget, dstBase, dstTarget}, options_.simulate ? DiffMode::Simulate : DiffMode::Apply);

    transition(Step::ContentTransfer);
    executor_->transfer(srcTarget, dstTarget);

    transition(Step::MarkReadOnly);
    executor_->markReadOnly(dstTarget);

    transition(Step::Barrier2);
    executor_->barrier(dstTarget);

    pass.stop();
    transition(Step::Idle);

    LogRegistry::sync()->info("[Orchestrator] Synced {} in {} ms.", pass.target.toString(), pass.duration_ms());
    return pass;
}

RunSummary Orchestrator::run() {
    RunSummary summary;

    while (true) {
        auto pass = syncOne();

        if (!pass) {
            summary.reason = StopReason::InSync;
            LogRegistry::subvolsync()->info("[Orchestrator] {} is in sync with {}.",
                                            destination_.string(), source_.string());
            break;
        }

        summary.passes.push_back(*pass);

        if (options_.single) {
            summary.reason = StopReason::SinglePass;
            LogRegistry::subvolsync()->info("[Orchestrator] Stopping after one transfer because of --single.");
            break;
        }

        if (options_.simulate) {
            summary.reason = StopReason::Simulated;
            LogRegistry::subvolsync()->info("[Orchestrator] Stopping now to avoid endless loop because of --dry-run.");
            break;
        }
    }

    return summary;
}

void Orchestrator::transition(const Step next) {
    LogRegistry::sync()->trace("[Orchestrator] {} -> {}", to_string(state_), to_string(next));
    state_ = next;
}

fs::path Orchestrator::sourcePath(const Date& d) const { return source_ / d.toString(); }

fs::path Orchestrator::destinationPath(const Date& d) const { return destination_ / d.toString(); }
