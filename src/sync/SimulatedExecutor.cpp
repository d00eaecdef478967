#include "sync/SimulatedExecutor.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>

using namespace sv::sync;
using namespace sv::logging;

namespace fs = std::filesystem;

SimulatedExecutor::SimulatedExecutor(CommandBuilder commands, std::shared_ptr<Executor> diffDelegate)
    : commands_(std::move(commands)), diffDelegate_(std::move(diffDelegate)) {
    if (!diffDelegate_) throw std::invalid_argument("SimulatedExecutor requires a diff delegate");
}

void SimulatedExecutor::clone(const fs::path& base, const fs::path& target) { report(commands_.clone(base, target)); }

void SimulatedExecutor::barrier(const fs::path& path) { report(commands_.barrier(path)); }

void SimulatedExecutor::diff(const DiffPaths& paths, DiffMode) { diffDelegate_->diff(paths, DiffMode::Simulate); }

void SimulatedExecutor::transfer(const fs::path& sourceTree, const fs::path& destTree) {
    report(commands_.transfer(sourceTree, destTree));
}

void SimulatedExecutor::markReadOnly(const fs::path& path) { report(commands_.markReadOnly(path)); }

void SimulatedExecutor::report(Command cmd) {
    LogRegistry::process()->info("[SimulatedExecutor] Would run {}", cmd.str());
    reported_.push_back(std::move(cmd));
}
