/**
 * @file ProcessRunner.hpp
 * @brief Runs external command-line tools and captures their standard output.
 */

#pragma once
#include <string>

namespace editalflow::infrastructure {

class ProcessRunner {
public:
    struct CommandResult {
        std::string output;
        int exitCode = -1; ///< -1 when the process could not be started.
        bool succeeded() const { return exitCode == 0; }
    };

    /** @brief Runs a shell command, stderr discarded. */
    static CommandResult RunCommand(const std::string& cmd);

    /** @brief True if the tool is on PATH. */
    static bool HasTool(const std::string& tool);

    /** @brief Single-quotes an argument for /bin/sh. */
    static std::string ShellQuote(const std::string& arg);
};

} // namespace editalflow::infrastructure
