#pragma once

#include <filesystem>
#include <string_view>

namespace sv::sync {

enum class DiffMode { Simulate, Apply };

constexpr std::string_view to_string(const DiffMode m) {
    return m == DiffMode::Apply ? "apply" : "dry-run";
}

// The four trees the structural diff works on: the source-side change
// oldSource -> newSource is replayed onto newDest, sharing blocks with oldDest.
struct DiffPaths {
    std::filesystem::path oldSource, newSource, oldDest, newDest;
};

// Every side effect the orchestrator has on the destination volume goes
// through here. All calls block until the operation finished and throw on
// failure.
class Executor {
public:
    virtual ~Executor() = default;

    // Writable structural clone of an existing snapshot.
    virtual void clone(const std::filesystem::path& base, const std::filesystem::path& target) = 0;

    // Filesystem-wide durability barrier for the volume holding path.
    virtual void barrier(const std::filesystem::path& path) = 0;

    virtual void diff(const DiffPaths& paths, DiffMode mode) = 0;

    // Make destTree byte-identical to sourceTree.
    virtual void transfer(const std::filesystem::path& sourceTree, const std::filesystem::path& destTree) = 0;

    // Irreversible.
    virtual void markReadOnly(const std::filesystem::path& path) = 0;
};

}
