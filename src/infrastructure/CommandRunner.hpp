/**
 * @file CommandRunner.hpp
 * @brief Thin popen wrapper for the command-line converters (pdftotext, tesseract, ...).
 */

#pragma once
#include <functional>
#include <string>

namespace promptwarden::infrastructure {

class CommandRunner {
public:
    struct Result {
        int exitCode = -1;   ///< -1 when the process could not be started.
        std::string output;  ///< Captured stdout.
    };

    /** @brief Runs @p cmd through the shell and captures stdout. */
    static Result Run(const std::string& cmd);

    /** @brief Runs @p cmd and streams each stdout line to @p lineCallback. */
    static int RunWithCallback(const std::string& cmd, const std::function<void(const std::string&)>& lineCallback);

    /** @brief True if @p tool resolves on PATH. */
    static bool HasTool(const std::string& tool);

    /** @brief Single-quotes @p arg for safe use in a shell command line. */
    static std::string Quote(const std::string& arg);
};

} // namespace promptwarden::infrastructure
