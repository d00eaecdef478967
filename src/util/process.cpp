#include "util/process.hpp"

#include <algorithm>
#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <fmt/format.h>
#include <sys/wait.h>
#include <unistd.h>
#include <csignal>
#include <cstdio>
#include <cstring>

namespace sv::util {

std::string ExitStatus::describe() const {
    if (exited) return fmt::format("exit status {}", code);
    return fmt::format("killed by signal {} ({})", signal, strsignal(signal));
}

ExitStatus runProcess(const std::vector<std::string>& argv) {
    if (argv.empty()) throw std::invalid_argument("runProcess: empty argument list");

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    // Keep our buffered output ahead of the child's.
    std::fflush(nullptr);

    const pid_t pid = fork();
    if (pid < 0) throw std::system_error(errno, std::generic_category(), "Failed to fork " + argv.front());

    if (pid == 0) {
        execvp(args[0], args.data());
        _exit(127); // exec failed
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) throw std::system_error(errno, std::generic_category(), "Failed to wait for " + argv.front());
    }

    ExitStatus result;
    if (WIFEXITED(status)) {
        result.exited = true;
        result.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
    }
    return result;
}

static bool needsQuotes(const std::string& s) {
    if (s.empty()) return true;
    return std::ranges::any_of(s, [](const char c) { return c == ' ' || c == '\t' || c == '"' || c == '\'' || c == '\\'; });
}

std::string joinArgs(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out.push_back(' ');
        if (!needsQuotes(a)) {
            out += a;
            continue;
        }
        out.push_back('"');
        for (const char c : a) {
            if (c == '"' || c == '\\') out.push_back('\\');
            out.push_back(c);
        }
        out.push_back('"');
    }
    return out;
}

}
