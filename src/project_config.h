#pragma once

#include <string>
#include <map>
#include <vector>
#include <json/json.h>
#include "task.h"

namespace droidrun {

// Table of projects a worker can build, loaded from config.json:
//
//   {
//     "Sample": {
//       "path": "Sample",                    (optional, default: the key)
//       "editorFile": "app/src/main/java/.../MainActivity.java",
//       "buildCommand": ["./gradlew", "assembleDebug"],
//       "runCommand": ["./run_screenshot.sh"],  (optional)
//       "artifact": "out/screenshot.jpg"
//     }
//   }
//
// Relative paths are resolved against the directory holding config.json.
class ProjectTable {
public:
    ProjectTable() = default;

    // Throws TaskError(PROJECT_MISCONFIGURED) if unreadable or malformed
    static ProjectTable load(const std::string& config_path);

    // base_dir resolves relative "path" entries
    static ProjectTable from_json(const Json::Value& root, const std::string& base_dir);

    void add(const ProjectConfig& project);

    // nullptr when the project is not configured
    const ProjectConfig* find(const std::string& name) const;

    std::vector<std::string> names() const;
    size_t size() const { return projects_.size(); }

private:
    std::map<std::string, ProjectConfig> projects_;
};

} // namespace droidrun
