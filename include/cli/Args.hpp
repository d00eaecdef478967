#pragma once

#include "sync/Orchestrator.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sv::cli {

enum class ParseStatus { Ok, Help, Invalid };

struct Invocation {
    ParseStatus status = ParseStatus::Ok;
    std::string error;  // set when Invalid
    std::filesystem::path source, destination;
    std::optional<std::filesystem::path> configPath;
    sync::Options options;
};

// Options may appear anywhere; "--" ends option parsing. Exactly two positionals.
Invocation parseArgs(const std::vector<std::string>& args);
Invocation parseArgs(int argc, const char* const* argv);

std::string usage(std::string_view program = "subvolsync");

}
