#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace platform {

    struct ProcessResult {
        int exitCode{-1};
        // stdout and stderr, interleaved
        std::string output;
    };

    /**
     * Run a command to completion with the given arguments, capturing its output. A child that
     * cannot exec exits with 127. Throws std::system_error if the child cannot be started.
     */
    [[nodiscard]] ProcessResult runProcess(
        const std::filesystem::path &command, const std::vector<std::string> &args);

} // namespace platform
