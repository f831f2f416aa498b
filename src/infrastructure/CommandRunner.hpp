/**
 * @file CommandRunner.hpp
 * @brief Helpers for running the external command-line tools used as extraction backends.
 */

#pragma once
#include <string>

namespace lexingest::infrastructure {

class CommandRunner {
public:
    struct CommandResult {
        std::string output;   ///< Captured stdout.
        int exitCode = -1;    ///< Process exit status, -1 when it could not be started or was killed.
    };

    /** @brief Runs a shell command and captures its stdout. */
    static CommandResult Run(const std::string& cmd);

    /** @brief Whether a tool is on PATH (`command -v`). */
    static bool HasTool(const std::string& tool);

    /** @brief Single-quotes an argument for /bin/sh. */
    static std::string Quote(const std::string& arg);

    /**
     * @brief Wraps a command in coreutils `timeout` when a limit is set and the tool exists.
     * @param cmd Command line.
     * @param seconds Wall-clock limit, 0 for none.
     */
    static std::string WithTimeout(const std::string& cmd, int seconds);
};

} // namespace lexingest::infrastructure
