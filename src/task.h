#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <json/json.h>

namespace droidrun {

// Task lifecycle. Created -> Running -> {Complete, Error, Timeout}.
enum class TaskStatus {
    CREATED,
    RUNNING,
    COMPLETE,
    ERROR,
    TIMEOUT
};

std::string task_status_to_string(TaskStatus status);
std::optional<TaskStatus> task_status_from_string(const std::string& name);
bool is_terminal(TaskStatus status);

// One file replacement applied to the staged project before building.
// filename is "<project>/<path inside project>".
struct Patch {
    std::string filename;
    std::string contents;
};

// What a poll sees for a ticket. Overwritten in place as the task progresses.
struct ResultRecord {
    std::string ticket;
    TaskStatus status = TaskStatus::CREATED;
    std::string payload;  // progress text, base64 image, or diagnostic
    std::chrono::system_clock::time_point written_at;

    bool operator==(const ResultRecord& other) const {
        return ticket == other.ticket && status == other.status &&
               payload == other.payload && written_at == other.written_at;
    }
    bool operator!=(const ResultRecord& other) const { return !(*this == other); }
};

// A project the worker knows how to build and run
struct ProjectConfig {
    std::string name;
    std::string path;                        // Golden copy of the sources
    std::string editor_file;                 // Relative to path; served by get-project
    std::vector<std::string> build_command;  // argv, run with cwd = staged copy
    std::vector<std::string> run_command;    // argv, optional
    std::string artifact;                    // Relative to staged copy; base64'd on success
};

// Answer to a successful create/accept: where the task now lives
struct TaskAssignment {
    std::string ticket;
    std::string worker_id;
};

// A project's editor file as served to the client. filename is
// "<project>/<path inside project>", the form patches use.
struct ProjectFile {
    std::string filename;
    std::string project_name;
    std::string contents;
};

// JSON conversions (jsoncpp). Parsing throws TaskError(BAD_REQUEST).
Json::Value patches_to_json(const std::vector<Patch>& patches);
std::vector<Patch> patches_from_json(const Json::Value& value);

// {"ticket", "workerId"}
Json::Value assignment_to_json(const TaskAssignment& assignment);
TaskAssignment assignment_from_json(const Json::Value& value);

// {"filename", "projectName", "contents"}
Json::Value project_file_to_json(const ProjectFile& file);
ProjectFile project_file_from_json(const Json::Value& value);

// {"status", "payload"}: the shape every status poll returns
Json::Value record_to_status_json(const ResultRecord& record);
ResultRecord record_from_status_json(const std::string& ticket, const Json::Value& value);

// {"status", "payload", "writtenAt"}: the shape stored on disk
Json::Value record_to_storage_json(const ResultRecord& record);
ResultRecord record_from_storage_json(const std::string& ticket, const Json::Value& value);

} // namespace droidrun
