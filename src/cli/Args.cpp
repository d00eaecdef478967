#include "cli/Args.hpp"

#include <fmt/format.h>

namespace sv::cli {

namespace {

Invocation invalid(std::string msg) {
    Invocation inv;
    inv.status = ParseStatus::Invalid;
    inv.error = std::move(msg);
    return inv;
}

}

Invocation parseArgs(const std::vector<std::string>& args) {
    Invocation inv;
    std::vector<std::string> positionals;
    bool optionsDone = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];

        if (optionsDone || a.empty() || a.front() != '-' || a == "-") {
            positionals.push_back(a);
            continue;
        }

        if (a == "--") optionsDone = true;
        else if (a == "--dry-run") inv.options.simulate = true;
        else if (a == "--single") inv.options.single = true;
        else if (a == "-h" || a == "--help") inv.status = ParseStatus::Help;
        else if (a == "--config") {
            if (i + 1 >= args.size()) return invalid("--config requires a path");
            inv.configPath = args[++i];
        } else if (a.starts_with("--config=")) {
            const auto value = a.substr(std::string_view("--config=").size());
            if (value.empty()) return invalid("--config requires a path");
            inv.configPath = value;
        } else return invalid(fmt::format("Unknown option: {}", a));
    }

    if (inv.status == ParseStatus::Help) return inv;

    if (positionals.size() != 2)
        return invalid(fmt::format("Expected <source-dir> and <dest-dir>, got {} argument(s)", positionals.size()));

    inv.source = positionals[0];
    inv.destination = positionals[1];
    return inv;
}

Invocation parseArgs(const int argc, const char* const* argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return parseArgs(args);
}

std::string usage(const std::string_view program) {
    return fmt::format(R"({0} -- Mirror dated snapshots between two btrfs filesystems

Usage:

    {0} [--dry-run] [--single] [--config <path>] <source-dir> <dest-dir>

Options:

    --dry-run          Print commands that would be executed but do not execute them.
    --single           Stop after syncing one snapshot, even if more are missing.
    --config <path>    Read settings from this YAML file
                       (default: /etc/subvolsync/config.yaml when present).
    -h, --help         Show this text.

Source-dir should contain subvolumes named YYYY-MM-DD. Those are replicated as
read-only subvolumes in dest-dir, which must already hold at least one of them.

Snapshots are transferred newest first. Each one starts as a clone of the
destination snapshot nearest in date, where later snapshots are preferred over
earlier ones, then moved files are replayed as reflinks and rsync brings the
contents up to date. This keeps as much sharing between snapshots as possible
without relying on btrfs send/receive, so the two filesystems stay isolated.

This command might need to run as superuser.
)", program);
}

}
