#include "build_runner.h"
#include "encoding.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace droidrun {

CommandBuildRunner::CommandBuildRunner(std::chrono::seconds step_timeout)
    : step_timeout_(step_timeout) {}

std::optional<BuildOutcome> CommandBuildRunner::run_step(
    const std::string& step, const std::vector<std::string>& command,
    const std::string& staged_dir) {
    if (command.empty()) {
        return BuildOutcome{TaskStatus::ERROR, step + " command not configured"};
    }

    ProcessOptions options;
    options.working_dir = staged_dir;
    options.timeout = step_timeout_;
    options.environment["DROIDRUN_PROJECT_DIR"] = staged_dir;

    std::cout << "[Build] Running " << step << " step: " << command[0] << std::endl;
    ProcessResult result = ProcessRunner::run(command, options);
    std::cout << "[Build] " << step << " step finished in " << result.wall_time.count()
              << "ms (exit " << result.exit_code << ")" << std::endl;

    BuildOutcome outcome;
    if (result.timed_out) {
        outcome.status = TaskStatus::TIMEOUT;
        outcome.payload = step + " exceeded time limit of " +
                          std::to_string(step_timeout_.count()) + "s\n" + result.output;
        return outcome;
    }
    if (!result.error_message.empty()) {
        outcome.status = TaskStatus::ERROR;
        outcome.payload = step + " could not start: " + result.error_message;
        return outcome;
    }
    if (result.exit_code != 0) {
        outcome.status = TaskStatus::ERROR;
        std::ostringstream msg;
        msg << step << " failed (exit " << result.exit_code << ")";
        if (result.output_truncated) msg << "; output truncated";
        msg << "\n" << result.output;
        outcome.payload = msg.str();
        return outcome;
    }
    return std::nullopt;
}

BuildOutcome CommandBuildRunner::build_and_run(const ProjectConfig& project,
                                               const std::string& staged_dir,
                                               const ProgressCallback& progress) {
    if (progress) progress("Building");
    if (auto failed = run_step("Build", project.build_command, staged_dir)) {
        return *failed;
    }

    if (!project.run_command.empty()) {
        if (progress) progress("Running");
        if (auto failed = run_step("Run", project.run_command, staged_dir)) {
            return *failed;
        }
    }

    BuildOutcome outcome;
    fs::path artifact = fs::path(staged_dir) / project.artifact;
    std::ifstream in(artifact, std::ios::binary);
    if (!in.is_open()) {
        outcome.status = TaskStatus::ERROR;
        outcome.payload = "No result image found at " + project.artifact;
        return outcome;
    }
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    outcome.status = TaskStatus::COMPLETE;
    outcome.payload = Encoding::base64_encode(bytes);
    std::cout << "[Build] Artifact " << project.artifact << " (" << bytes.size()
              << " bytes) encoded" << std::endl;
    return outcome;
}

} // namespace droidrun
