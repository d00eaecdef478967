#include "sync/ProcessExecutor.hpp"
#include "util/process.hpp"
#include "error/Errors.hpp"
#include "logging/LogRegistry.hpp"

using namespace sv::sync;
using namespace sv::logging;

namespace fs = std::filesystem;

ProcessExecutor::ProcessExecutor(CommandBuilder commands) : commands_(std::move(commands)) {}

void ProcessExecutor::clone(const fs::path& base, const fs::path& target) { run(commands_.clone(base, target)); }

void ProcessExecutor::barrier(const fs::path& path) { run(commands_.barrier(path)); }

void ProcessExecutor::diff(const DiffPaths& paths, const DiffMode mode) { run(commands_.diff(paths, mode)); }

void ProcessExecutor::transfer(const fs::path& sourceTree, const fs::path& destTree) {
    run(commands_.transfer(sourceTree, destTree));
}

void ProcessExecutor::markReadOnly(const fs::path& path) { run(commands_.markReadOnly(path)); }

void ProcessExecutor::run(const Command& cmd) {
    LogRegistry::process()->info("[ProcessExecutor] Running {}", cmd.str());

    const auto status = util::runProcess(cmd.argv);
    if (!status.success()) throw error::ExternalToolFailure(cmd.step, cmd.str(), status.describe());

    LogRegistry::process()->debug("[ProcessExecutor] {} finished", cmd.step);
}
