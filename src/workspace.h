#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "task.h"

namespace droidrun {

// Fresh copy of a project for one ticket at <workspace_root>/<ticket>/<project>.
// The ticket directory is removed when the StagedProject is destroyed.
class StagedProject {
public:
    // Copies the project, pruning .git and .gradle.
    // Throws TaskError(PROJECT_MISCONFIGURED) if the source is missing,
    // TaskError(INTERNAL) if the copy fails.
    StagedProject(const ProjectConfig& project, const std::string& workspace_root,
                  const std::string& ticket);
    ~StagedProject();

    StagedProject(const StagedProject&) = delete;
    StagedProject& operator=(const StagedProject&) = delete;

    const std::filesystem::path& path() const { return project_path_; }

    // Writes each patch in order, so a later patch for the same file wins.
    // Throws TaskError(BAD_REQUEST, "contents malformed ...") for a filename
    // outside the project, TaskError(INTERNAL) on a write failure.
    void apply_patches(const std::vector<Patch>& patches);

    // Path of a patch relative to the project root, or nullopt when the
    // filename is not "<project>/<relative path>" or escapes the project
    static std::optional<std::filesystem::path> rehome(const std::string& project_name,
                                                       const std::string& filename);

private:
    std::string project_name_;
    std::filesystem::path ticket_path_;
    std::filesystem::path project_path_;
};

// True when either directory is, or lies inside, the other once both are
// resolved. Staging and result cleanup both remove <root>/<ticket>, so a
// worker must not run with overlapping workspace and results roots.
bool directories_overlap(const std::string& a, const std::string& b);

} // namespace droidrun
