#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include "constants.h"

namespace droidrun {

struct ProcessOptions {
    std::string working_dir;
    std::map<std::string, std::string> environment;  // Added to the inherited environment
    std::chrono::seconds timeout = std::chrono::seconds(DEFAULT_BUILD_TIMEOUT_SECONDS);
    size_t max_output_bytes = MAX_BUILD_OUTPUT_SIZE;
};

// Process execution result
struct ProcessResult {
    int exit_code = -1;        // Exit status, or -signal when killed
    std::string output;        // Interleaved stdout + stderr (tail if truncated)
    bool timed_out = false;    // Killed by the wall-clock watchdog
    bool output_truncated = false;
    std::string error_message; // Set when the process could not be started
    std::chrono::milliseconds wall_time{0};

    bool succeeded() const { return error_message.empty() && !timed_out && exit_code == 0; }
};

// Runs a command in its own process group with a wall-clock limit.
// No isolation: the command runs with the worker's own privileges.
class ProcessRunner {
public:
    static ProcessResult run(const std::vector<std::string>& command,
                             const ProcessOptions& options);
};

} // namespace droidrun
