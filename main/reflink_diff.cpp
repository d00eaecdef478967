// Reflink
#include "reflink/DirScan.hpp"
#include "reflink/Diff.hpp"
#include "reflink/clone.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

// Libraries
#include <cstdlib>
#include <string>
#include <vector>
#include <fmt/core.h>

using namespace sv::config;
using namespace sv::logging;
using namespace sv::reflink;

namespace {

constexpr auto USAGE = R"(subvolsync-reflink-diff: Replay likely moves as reflink copies.

Usage:
    subvolsync-reflink-diff apply   <src-base> <src-target> <dst-base> <dst-target>
    subvolsync-reflink-diff dry-run <src-base> <src-target> <dst-base> <dst-target>

Diffs the file hierarchy from src-base to src-target and detects potential
moves, based on files having the same mtime and size.

For every detected move, create a reflink:
  * With as source, the base file, but in the destination tree.
  * With as target, the target file, but in the destination tree.

In other words, this diffs src-base..src-target and replays that diff on
top of dst-base.

In "apply" mode the reflinks are created. In "dry-run" mode, we print
which reflinks would be created.

This is only a heuristic, but it sets up reflink sharing where possible,
and rsync can later fix everything up (metadata, changed files, new and
deleted files, etc.). When using rsync by itself, it would try to copy
the file, destroying potential sharing.
)";

}

int main(const int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);

    if (args.size() != 5 || (args[0] != "apply" && args[0] != "dry-run")) {
        fmt::print(stderr, "{}", USAGE);
        return EXIT_FAILURE;
    }

    const bool dryRun = args[0] == "dry-run";

    try {
        ConfigRegistry::init();
        LogRegistry::init();

        const auto base = scanDir(args[1]);
        const auto target = scanDir(args[2]);
        const auto copies = diff(base, target);

        if (dryRun) {
            for (const auto& c : copies) fmt::print("{} -> {}\n", c.src.string(), c.dst.string());
            return EXIT_SUCCESS;
        }

        const auto stats = applyCopies(copies, args[3], args[4]);
        LogRegistry::reflink()->info("[Reflink] {} reflinks created, {} skipped.", stats.cloned, stats.skipped);
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        if (LogRegistry::isInitialized()) LogRegistry::reflink()->error("[-] Reflink diff failed: {}", e.what());
        else fmt::print(stderr, "[-] Reflink diff failed: {}\n", e.what());
        return EXIT_FAILURE;
    }
}
