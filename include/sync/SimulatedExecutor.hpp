#pragma once

#include "sync/Executor.hpp"
#include "sync/Commands.hpp"

#include <memory>
#include <vector>

namespace sv::sync {

// Reports the command each mutating operation would run instead of running it.
// The structural diff has a side-effect free mode of its own, so it is handed
// to diffDelegate, always in DiffMode::Simulate.
class SimulatedExecutor final : public Executor {
public:
    SimulatedExecutor(CommandBuilder commands, std::shared_ptr<Executor> diffDelegate);

    void clone(const std::filesystem::path& base, const std::filesystem::path& target) override;
    void barrier(const std::filesystem::path& path) override;
    void diff(const DiffPaths& paths, DiffMode mode) override;
    void transfer(const std::filesystem::path& sourceTree, const std::filesystem::path& destTree) override;
    void markReadOnly(const std::filesystem::path& path) override;

    [[nodiscard]] const std::vector<Command>& reported() const { return reported_; }

private:
    void report(Command cmd);

    CommandBuilder commands_;
    std::shared_ptr<Executor> diffDelegate_;
    std::vector<Command> reported_;
};

}
