/**
 * @file CommandRunner.cpp
 * @brief Implementation of CommandRunner.
 */

#include "infrastructure/CommandRunner.hpp"
#include <cstdio>
#include <cstdlib>
#include <sys/wait.h>

namespace promptwarden::infrastructure {

namespace {

int DecodeStatus(int status) {
    if (status == -1) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

} // namespace

CommandRunner::Result CommandRunner::Run(const std::string& cmd) {
    Result result;
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) return result;

    char buffer[4096];
    size_t n = 0;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        result.output.append(buffer, n);
    }
    result.exitCode = DecodeStatus(pclose(pipe));
    return result;
}

int CommandRunner::RunWithCallback(const std::string& cmd, const std::function<void(const std::string&)>& lineCallback) {
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        if (lineCallback) lineCallback("[Error] popen failed to start command.");
        return -1;
    }
    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        std::string line(buffer);
        if (!line.empty() && line.back() == '\n') line.pop_back();
        if (lineCallback) lineCallback(line);
    }
    return DecodeStatus(pclose(pipe));
}

bool CommandRunner::HasTool(const std::string& tool) {
    std::string cmd = "command -v " + Quote(tool) + " >/dev/null 2>&1";
    return std::system(cmd.c_str()) == 0;
}

std::string CommandRunner::Quote(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

} // namespace promptwarden::infrastructure
