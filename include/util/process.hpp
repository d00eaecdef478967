#pragma once

#include <string>
#include <vector>

namespace sv::util {

struct ExitStatus {
    bool exited = false;   // terminated normally
    int code = 0;          // exit code when exited
    int signal = 0;        // terminating signal otherwise

    [[nodiscard]] bool success() const { return exited && code == 0; }
    [[nodiscard]] std::string describe() const;
};

// Runs argv[0] (looked up in PATH) with the given arguments and blocks until it
// terminates. The child inherits stdin, stdout and stderr. A program that cannot
// be executed exits with status 127. Throws std::system_error if fork fails.
ExitStatus runProcess(const std::vector<std::string>& argv);

// Space-joined argv, quoting arguments that contain whitespace or quotes.
std::string joinArgs(const std::vector<std::string>& argv);

}
