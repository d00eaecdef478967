#pragma once

#include <stdexcept>
#include <string>

namespace sv::error {

// The destination has no snapshot that could serve as a base.
struct PreconditionFailure : std::runtime_error {
    explicit PreconditionFailure(const std::string& msg) : std::runtime_error(msg) {}
};

// A volume entry whose name is not a YYYY-MM-DD date.
struct InvalidSnapshotName : std::runtime_error {
    InvalidSnapshotName(const std::string& name, const std::string& volume);

    std::string name;
    std::string volume;
};

// An external command (btrfs, rsync, the reflink diff tool) did not exit cleanly.
struct ExternalToolFailure : std::runtime_error {
    ExternalToolFailure(const std::string& step, const std::string& command, const std::string& detail);

    std::string step;
    std::string command;
};

}
