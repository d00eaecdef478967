// Sync
#include "sync/Orchestrator.hpp"
#include "sync/ProcessExecutor.hpp"
#include "sync/SimulatedExecutor.hpp"
#include "snapshot/Repository.hpp"

// Misc
#include "cli/Args.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

// Libraries
#include <cstdlib>
#include <fmt/core.h>

using namespace sv::config;
using namespace sv::logging;
using namespace sv::snapshot;
using namespace sv::sync;

int main(const int argc, char** argv) {
    const auto inv = sv::cli::parseArgs(argc, argv);

    if (inv.status == sv::cli::ParseStatus::Help) {
        fmt::print("{}", sv::cli::usage());
        return EXIT_SUCCESS;
    }

    if (inv.status == sv::cli::ParseStatus::Invalid) {
        fmt::print(stderr, "{}\n\n{}", inv.error, sv::cli::usage());
        return EXIT_FAILURE;
    }

    try {
        ConfigRegistry::init(inv.configPath);
        LogRegistry::init();

        const auto commands = CommandBuilder::fromConfig(ConfigRegistry::get());
        const auto process = std::make_shared<ProcessExecutor>(commands);

        std::shared_ptr<Executor> executor = process;
        if (inv.options.simulate) executor = std::make_shared<SimulatedExecutor>(commands, process);

        Orchestrator orchestrator(inv.source, inv.destination, std::make_shared<LocalRepository>(), executor, inv.options);
        const auto summary = orchestrator.run();

        LogRegistry::subvolsync()->info("[✓] {} snapshot(s) synced ({}).", summary.passes.size(), to_string(summary.reason));
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        if (LogRegistry::isInitialized()) LogRegistry::subvolsync()->error("[-] Sync aborted: {}", e.what());
        else fmt::print(stderr, "[-] Sync aborted: {}\n", e.what());
        return EXIT_FAILURE;
    }
}
