#pragma once

#include <string>
#include <chrono>
#include <functional>
#include <optional>
#include "task.h"
#include "process_runner.h"

namespace droidrun {

// Terminal outcome of building and running one staged project
struct BuildOutcome {
    TaskStatus status = TaskStatus::ERROR;  // COMPLETE, ERROR or TIMEOUT
    std::string payload;                    // base64 artifact or diagnostic
};

// Phase names written as Running progress text
using ProgressCallback = std::function<void(const std::string& phase)>;

// Seam between the executor and the toolchain. Implementations report build
// and run failures through the outcome and do not throw for them.
class BuildRunner {
public:
    virtual ~BuildRunner() = default;

    virtual BuildOutcome build_and_run(const ProjectConfig& project,
                                       const std::string& staged_dir,
                                       const ProgressCallback& progress) = 0;
};

// Runs the project's configured build and run commands as child processes,
// then base64-encodes the artifact the run left behind.
class CommandBuildRunner : public BuildRunner {
public:
    explicit CommandBuildRunner(
        std::chrono::seconds step_timeout = std::chrono::seconds(DEFAULT_BUILD_TIMEOUT_SECONDS));

    BuildOutcome build_and_run(const ProjectConfig& project,
                               const std::string& staged_dir,
                               const ProgressCallback& progress) override;

private:
    std::chrono::seconds step_timeout_;

    // nullopt when the step succeeded
    std::optional<BuildOutcome> run_step(const std::string& step,
                                         const std::vector<std::string>& command,
                                         const std::string& staged_dir);
};

} // namespace droidrun
