/**
 * @file ProcessRunner.cpp
 * @brief Implementation of ProcessRunner.
 */

#include "infrastructure/ProcessRunner.hpp"
#include <cstdio>
#include <cstdlib>
#include <sys/wait.h>

namespace editalflow::infrastructure {

ProcessRunner::CommandResult ProcessRunner::RunCommand(const std::string& cmd) {
    CommandResult result;
    const std::string fullCmd = cmd + " 2>/dev/null";
    FILE* pipe = popen(fullCmd.c_str(), "r");
    if (!pipe) return result;

    char buffer[4096];
    size_t n = 0;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        result.output.append(buffer, n);
    }
    int status = pclose(pipe);
    if (status == -1) {
        result.exitCode = -1;
    } else if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else {
        result.exitCode = 128;
    }
    return result;
}

bool ProcessRunner::HasTool(const std::string& tool) {
    std::string cmd = "command -v " + tool + " >/dev/null 2>&1";
    int result = std::system(cmd.c_str());
    return result == 0;
}

std::string ProcessRunner::ShellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace editalflow::infrastructure
