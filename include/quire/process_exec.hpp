#pragma once

#include "quire/utility.hpp"

#include <chrono>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

namespace quire {

struct ProcessOptions {
    std::optional<std::string> working_dir;
    /// Variables to extend/override the parent environment with.
    std::optional<std::unordered_map<std::string, std::string>> env;
    /// Zero means no limit.
    std::chrono::milliseconds timeout{0};
};

/**
 * @brief Executes a subprocess and waits for it.
 *
 * Output goes to the parent's stdout/stderr. The child is terminated (then killed) when
 * the timeout elapses or @p stop is requested.
 *
 * @param args The command line arguments (first argument is the executable).
 * @return The exit code of the process, or an error if it could not be started, timed out
 *         or was cancelled.
 */
Result<int> process_exec(std::vector<std::string> &&args, const ProcessOptions &options = {}, std::stop_token stop = {});

} // namespace quire
