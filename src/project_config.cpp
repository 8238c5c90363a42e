#include "project_config.h"
#include "errors.h"
#include "wire.h"

#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace droidrun {

namespace {

std::vector<std::string> read_argv(const Json::Value& value, const std::string& project,
                                   const std::string& key) {
    std::vector<std::string> argv;
    if (value.isNull()) return argv;
    if (!value.isArray()) {
        throw TaskError(ErrorCode::PROJECT_MISCONFIGURED,
                        "Project " + project + ": " + key + " must be an array of strings");
    }
    for (const auto& arg : value) {
        if (!arg.isString()) {
            throw TaskError(ErrorCode::PROJECT_MISCONFIGURED,
                            "Project " + project + ": " + key + " must be an array of strings");
        }
        argv.push_back(arg.asString());
    }
    return argv;
}

std::string read_string(const Json::Value& entry, const std::string& project,
                        const std::string& key, bool required) {
    const Json::Value& value = entry[key];
    if (value.isNull() && !required) return "";
    if (!value.isString() || (required && value.asString().empty())) {
        throw TaskError(ErrorCode::PROJECT_MISCONFIGURED,
                        "Project " + project + ": missing " + key);
    }
    return value.asString();
}

} // namespace

ProjectTable ProjectTable::load(const std::string& config_path) {
    std::ifstream in(config_path);
    if (!in.is_open()) {
        throw TaskError(ErrorCode::PROJECT_MISCONFIGURED,
                        "Unable to read project config " + config_path);
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    Json::Value root;
    try {
        root = parse_json(text);
    } catch (const TaskError& e) {
        throw TaskError(ErrorCode::PROJECT_MISCONFIGURED,
                        "Project config " + config_path + ": " + e.what());
    }

    fs::path base = fs::absolute(fs::path(config_path)).parent_path();
    ProjectTable table = from_json(root, base.string());
    std::cout << "[Config] Loaded " << table.size() << " project(s) from " << config_path << std::endl;
    return table;
}

ProjectTable ProjectTable::from_json(const Json::Value& root, const std::string& base_dir) {
    if (!root.isObject()) {
        throw TaskError(ErrorCode::PROJECT_MISCONFIGURED, "Project config must be an object");
    }

    ProjectTable table;
    for (const auto& name : root.getMemberNames()) {
        const Json::Value& entry = root[name];
        if (!entry.isObject()) {
            throw TaskError(ErrorCode::PROJECT_MISCONFIGURED,
                            "Project " + name + ": entry must be an object");
        }

        ProjectConfig project;
        project.name = name;

        std::string path = read_string(entry, name, "path", false);
        fs::path project_path = path.empty() ? fs::path(name) : fs::path(path);
        if (project_path.is_relative()) project_path = fs::path(base_dir) / project_path;
        project.path = project_path.lexically_normal().string();

        project.editor_file = read_string(entry, name, "editorFile", true);
        project.build_command = read_argv(entry["buildCommand"], name, "buildCommand");
        if (project.build_command.empty()) {
            throw TaskError(ErrorCode::PROJECT_MISCONFIGURED,
                            "Project " + name + ": missing buildCommand");
        }
        project.run_command = read_argv(entry["runCommand"], name, "runCommand");
        project.artifact = read_string(entry, name, "artifact", true);

        table.add(project);
    }
    return table;
}

void ProjectTable::add(const ProjectConfig& project) {
    projects_[project.name] = project;
}

const ProjectConfig* ProjectTable::find(const std::string& name) const {
    auto it = projects_.find(name);
    return it == projects_.end() ? nullptr : &it->second;
}

std::vector<std::string> ProjectTable::names() const {
    std::vector<std::string> result;
    for (const auto& [name, project] : projects_) result.push_back(name);
    return result;
}

} // namespace droidrun
