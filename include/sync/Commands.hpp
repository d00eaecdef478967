#pragma once

#include "sync/Executor.hpp"
#include "config/Config.hpp"

#include <string>
#include <vector>

namespace sv::sync {

struct Command {
    std::string step;
    std::vector<std::string> argv;

    [[nodiscard]] std::string str() const;
};

// Command lines for the external tools behind each executor operation.
class CommandBuilder {
public:
    CommandBuilder(config::ToolsConfig tools, config::TransferConfig transfer);

    static CommandBuilder fromConfig(const config::Config& cfg);

    [[nodiscard]] Command clone(const std::filesystem::path& base, const std::filesystem::path& target) const;
    [[nodiscard]] Command barrier(const std::filesystem::path& path) const;
    [[nodiscard]] Command diff(const DiffPaths& paths, DiffMode mode) const;
    [[nodiscard]] Command transfer(const std::filesystem::path& sourceTree, const std::filesystem::path& destTree) const;
    [[nodiscard]] Command markReadOnly(const std::filesystem::path& path) const;

private:
    config::ToolsConfig tools_;
    config::TransferConfig transfer_;
};

}
