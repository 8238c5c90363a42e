#include "task.h"
#include "errors.h"

namespace droidrun {

std::string task_status_to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::CREATED: return "created";
        case TaskStatus::RUNNING: return "running";
        case TaskStatus::COMPLETE: return "complete";
        case TaskStatus::ERROR: return "error";
        case TaskStatus::TIMEOUT: return "timeout";
    }
    return "error";
}

std::optional<TaskStatus> task_status_from_string(const std::string& name) {
    if (name == "created") return TaskStatus::CREATED;
    if (name == "running") return TaskStatus::RUNNING;
    if (name == "complete") return TaskStatus::COMPLETE;
    if (name == "error") return TaskStatus::ERROR;
    if (name == "timeout") return TaskStatus::TIMEOUT;
    return std::nullopt;
}

bool is_terminal(TaskStatus status) {
    return status == TaskStatus::COMPLETE ||
           status == TaskStatus::ERROR ||
           status == TaskStatus::TIMEOUT;
}

Json::Value patches_to_json(const std::vector<Patch>& patches) {
    Json::Value array(Json::arrayValue);
    for (const auto& patch : patches) {
        Json::Value item;
        item["filename"] = patch.filename;
        item["contents"] = patch.contents;
        array.append(item);
    }
    return array;
}

std::vector<Patch> patches_from_json(const Json::Value& value) {
    if (!value.isArray()) {
        throw TaskError(ErrorCode::BAD_REQUEST, "patches must be an array");
    }

    std::vector<Patch> patches;
    patches.reserve(value.size());
    for (const auto& item : value) {
        if (!item.isObject() || !item["filename"].isString() || !item["contents"].isString()) {
            throw TaskError(ErrorCode::BAD_REQUEST,
                            "each patch needs string filename and contents");
        }
        patches.push_back({item["filename"].asString(), item["contents"].asString()});
    }
    return patches;
}

Json::Value assignment_to_json(const TaskAssignment& assignment) {
    Json::Value json;
    json["ticket"] = assignment.ticket;
    json["workerId"] = assignment.worker_id;
    return json;
}

TaskAssignment assignment_from_json(const Json::Value& value) {
    if (!value.isObject() || !value["ticket"].isString() || !value["workerId"].isString()) {
        throw TaskError(ErrorCode::BAD_REQUEST, "assignment needs ticket and workerId");
    }
    return {value["ticket"].asString(), value["workerId"].asString()};
}

Json::Value project_file_to_json(const ProjectFile& file) {
    Json::Value json;
    json["filename"] = file.filename;
    json["projectName"] = file.project_name;
    json["contents"] = file.contents;
    return json;
}

ProjectFile project_file_from_json(const Json::Value& value) {
    if (!value.isObject() || !value["filename"].isString() ||
        !value["projectName"].isString() || !value["contents"].isString()) {
        throw TaskError(ErrorCode::BAD_REQUEST, "project needs filename, projectName and contents");
    }
    return {value["filename"].asString(), value["projectName"].asString(),
            value["contents"].asString()};
}

Json::Value record_to_status_json(const ResultRecord& record) {
    Json::Value json;
    json["status"] = task_status_to_string(record.status);
    json["payload"] = record.payload;
    return json;
}

ResultRecord record_from_status_json(const std::string& ticket, const Json::Value& value) {
    if (!value.isObject() || !value["status"].isString()) {
        throw TaskError(ErrorCode::BAD_REQUEST, "status response missing status");
    }

    auto status = task_status_from_string(value["status"].asString());
    if (!status) {
        throw TaskError(ErrorCode::BAD_REQUEST,
                        "unknown task status: " + value["status"].asString());
    }

    ResultRecord record;
    record.ticket = ticket;
    record.status = *status;
    record.payload = value["payload"].isString() ? value["payload"].asString() : "";
    record.written_at = std::chrono::system_clock::now();
    return record;
}

Json::Value record_to_storage_json(const ResultRecord& record) {
    Json::Value json = record_to_status_json(record);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        record.written_at.time_since_epoch()).count();
    json["writtenAt"] = static_cast<Json::Int64>(millis);
    return json;
}

ResultRecord record_from_storage_json(const std::string& ticket, const Json::Value& value) {
    ResultRecord record = record_from_status_json(ticket, value);
    if (!value["writtenAt"].isIntegral()) {
        throw TaskError(ErrorCode::BAD_REQUEST, "stored record missing writtenAt");
    }
    record.written_at = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(value["writtenAt"].asInt64()));
    return record;
}

} // namespace droidrun
