#pragma once

#include "sync/Executor.hpp"
#include "sync/Commands.hpp"

namespace sv::sync {

// Runs every operation as an external command and waits for it.
class ProcessExecutor final : public Executor {
public:
    explicit ProcessExecutor(CommandBuilder commands);

    void clone(const std::filesystem::path& base, const std::filesystem::path& target) override;
    void barrier(const std::filesystem::path& path) override;
    void diff(const DiffPaths& paths, DiffMode mode) override;
    void transfer(const std::filesystem::path& sourceTree, const std::filesystem::path& destTree) override;
    void markReadOnly(const std::filesystem::path& path) override;

private:
    static void run(const Command& cmd);

    CommandBuilder commands_;
};

}
