#include "workspace.h"
#include "encoding.h"
#include "errors.h"

#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace droidrun {

namespace {

// Not needed for a build and expensive to copy
const char* const PRUNED_DIRS[] = {".git", ".gradle"};

bool is_pruned(const fs::path& name) {
    for (const char* pruned : PRUNED_DIRS) {
        if (name == pruned) return true;
    }
    return false;
}

fs::path resolved(const std::string& dir) {
    std::error_code ec;
    fs::path path = fs::weakly_canonical(fs::absolute(dir), ec);
    if (ec) path = fs::absolute(dir).lexically_normal();
    if (path.has_relative_path() && path.filename().empty()) path = path.parent_path();
    return path;
}

// True when every component of prefix starts path
bool starts_with(const fs::path& path, const fs::path& prefix) {
    auto p = path.begin();
    for (auto q = prefix.begin(); q != prefix.end(); ++q, ++p) {
        if (p == path.end() || *p != *q) return false;
    }
    return true;
}

} // namespace

bool directories_overlap(const std::string& a, const std::string& b) {
    fs::path ra = resolved(a);
    fs::path rb = resolved(b);
    return starts_with(ra, rb) || starts_with(rb, ra);
}

StagedProject::StagedProject(const ProjectConfig& project, const std::string& workspace_root,
                             const std::string& ticket)
    : project_name_(project.name),
      ticket_path_(fs::path(workspace_root) / ticket),
      project_path_(ticket_path_ / project.name) {
    std::error_code ec;
    if (!fs::is_directory(project.path, ec)) {
        throw TaskError(ErrorCode::PROJECT_MISCONFIGURED,
                        "Project " + project.name + " not found at " + project.path);
    }

    fs::remove_all(ticket_path_, ec);
    fs::create_directories(project_path_, ec);
    if (ec) {
        throw TaskError(ErrorCode::INTERNAL,
                        "Unable to create " + project_path_.string() + ": " + ec.message());
    }

    for (const auto& entry : fs::directory_iterator(project.path, ec)) {
        if (is_pruned(entry.path().filename())) continue;
        fs::copy(entry.path(), project_path_ / entry.path().filename(),
                 fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
        if (ec) break;
    }
    if (ec) {
        fs::remove_all(ticket_path_, ec);
        throw TaskError(ErrorCode::INTERNAL, "Unable to stage project " + project.name);
    }

    std::cout << "[Workspace] Project " << project.name << " staged into "
              << project_path_.string() << std::endl;
}

StagedProject::~StagedProject() {
    std::error_code ec;
    fs::remove_all(ticket_path_, ec);
    if (ec) {
        std::cerr << "[Workspace] Unable to remove " << ticket_path_.string() << ": "
                  << ec.message() << std::endl;
    }
}

std::optional<fs::path> StagedProject::rehome(const std::string& project_name,
                                              const std::string& filename) {
    fs::path path(filename);
    if (path.empty() || path.is_absolute()) return std::nullopt;

    auto it = path.begin();
    if (it == path.end() || *it != project_name) return std::nullopt;
    ++it;

    fs::path relative;
    for (; it != path.end(); ++it) {
        if (*it == "..") return std::nullopt;
        if (*it == "." || it->empty()) continue;
        relative /= *it;
    }
    if (relative.empty()) return std::nullopt;
    return relative;
}

void StagedProject::apply_patches(const std::vector<Patch>& patches) {
    for (const auto& patch : patches) {
        auto relative = rehome(project_name_, patch.filename);
        if (!relative) {
            throw TaskError(ErrorCode::BAD_REQUEST, "contents malformed: " + patch.filename);
        }

        fs::path target = project_path_ / *relative;
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);

        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw TaskError(ErrorCode::INTERNAL, "Unable to write patch " + patch.filename);
        }
        out << patch.contents;
        out.close();
        if (!out) {
            throw TaskError(ErrorCode::INTERNAL, "Unable to write patch " + patch.filename);
        }

        std::cout << "[Workspace] Patched " << relative->string() << " ("
                  << patch.contents.size() << " bytes, sha256 "
                  << Encoding::sha256_string(patch.contents).substr(0, 16) << ")" << std::endl;
    }
}

} // namespace droidrun
