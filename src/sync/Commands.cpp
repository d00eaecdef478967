#include "sync/Commands.hpp"
#include "util/process.hpp"

using namespace sv::sync;
using namespace sv::config;

namespace fs = std::filesystem;

std::string Command::str() const { return util::joinArgs(argv); }

CommandBuilder::CommandBuilder(ToolsConfig tools, TransferConfig transfer)
    : tools_(std::move(tools)), transfer_(std::move(transfer)) {}

CommandBuilder CommandBuilder::fromConfig(const Config& cfg) { return {cfg.tools, cfg.transfer}; }

Command CommandBuilder::clone(const fs::path& base, const fs::path& target) const {
    return {"clone", {tools_.btrfs, "subvolume", "snapshot", base.string(), target.string()}};
}

// "btrfs subvolume sync" waits per subvolume and has been seen polling forever
// (sleep + TREE_SEARCH ioctl in a loop); a whole filesystem sync does not.
Command CommandBuilder::barrier(const fs::path& path) const {
    return {"barrier", {tools_.btrfs, "filesystem", "sync", path.string()}};
}

Command CommandBuilder::diff(const DiffPaths& paths, const DiffMode mode) const {
    return {"structural-diff", {
        tools_.reflink_diff,
        std::string(to_string(mode)),
        paths.oldSource.string(),
        paths.newSource.string(),
        paths.oldDest.string(),
        paths.newDest.string(),
    }};
}

Command CommandBuilder::transfer(const fs::path& sourceTree, const fs::path& destTree) const {
    Command cmd{"content-transfer", {tools_.rsync}};
    cmd.argv.insert(cmd.argv.end(), transfer_.rsync_flags.begin(), transfer_.rsync_flags.end());
    // Trailing slash: copy the contents of the tree, not the tree itself.
    cmd.argv.push_back(sourceTree.string() + "/");
    cmd.argv.push_back(destTree.string());
    return cmd;
}

Command CommandBuilder::markReadOnly(const fs::path& path) const {
    return {"mark-readonly", {tools_.btrfs, "property", "set", "-t", "subvol", path.string(), "ro", "true"}};
}
