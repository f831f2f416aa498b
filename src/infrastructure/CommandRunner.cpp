/**
 * @file CommandRunner.cpp
 * @brief Implementation of CommandRunner.
 */

#include "infrastructure/CommandRunner.hpp"
#include <cstdio>
#include <cstdlib>
#include <sys/wait.h>

namespace lexingest::infrastructure {

CommandRunner::CommandResult CommandRunner::Run(const std::string& cmd) {
    CommandResult result;
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) return result;

    char buffer[4096];
    std::size_t n = 0;
    while ((n = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        result.output.append(buffer, n);
    }

    int status = pclose(pipe);
    if (status != -1 && WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    }
    return result;
}

bool CommandRunner::HasTool(const std::string& tool) {
    std::string cmd = "command -v " + Quote(tool) + " >/dev/null 2>&1";
    int result = std::system(cmd.c_str());
    return result == 0;
}

std::string CommandRunner::Quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') quoted += "'\\''";
        else quoted += c;
    }
    quoted += "'";
    return quoted;
}

std::string CommandRunner::WithTimeout(const std::string& cmd, int seconds) {
    if (seconds <= 0) return cmd;
    static const bool hasTimeout = HasTool("timeout");
    if (!hasTimeout) return cmd;
    return "timeout " + std::to_string(seconds) + "s " + cmd;
}

} // namespace lexingest::infrastructure
