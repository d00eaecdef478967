#include "error/Errors.hpp"

#include <fmt/format.h>

using namespace sv::error;

InvalidSnapshotName::InvalidSnapshotName(const std::string& name, const std::string& volume)
    : std::runtime_error(volume.empty()
                             ? fmt::format("Invalid snapshot name '{}', expected YYYY-MM-DD", name)
                             : fmt::format("Invalid snapshot name '{}' in {}, expected YYYY-MM-DD", name, volume)),
      name(name),
      volume(volume) {}

ExternalToolFailure::ExternalToolFailure(const std::string& step, const std::string& command, const std::string& detail)
    : std::runtime_error(fmt::format("[{}] Command failed ({}): {}", step, detail, command)),
      step(step),
      command(command) {}
