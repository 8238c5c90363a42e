#include <gtest/gtest.h>
#include "task.h"
#include "errors.h"
#include "wire.h"

using namespace droidrun;

// ============================================================================
// Status vocabulary
// ============================================================================

TEST(TaskStatusTest, WireNames) {
    EXPECT_EQ(task_status_to_string(TaskStatus::CREATED), "created");
    EXPECT_EQ(task_status_to_string(TaskStatus::RUNNING), "running");
    EXPECT_EQ(task_status_to_string(TaskStatus::COMPLETE), "complete");
    EXPECT_EQ(task_status_to_string(TaskStatus::ERROR), "error");
    EXPECT_EQ(task_status_to_string(TaskStatus::TIMEOUT), "timeout");

    EXPECT_EQ(task_status_from_string("complete"), TaskStatus::COMPLETE);
    EXPECT_FALSE(task_status_from_string("Complete").has_value());
    EXPECT_FALSE(task_status_from_string("done").has_value());
}

TEST(TaskStatusTest, TerminalStatuses) {
    EXPECT_FALSE(is_terminal(TaskStatus::CREATED));
    EXPECT_FALSE(is_terminal(TaskStatus::RUNNING));
    EXPECT_TRUE(is_terminal(TaskStatus::COMPLETE));
    EXPECT_TRUE(is_terminal(TaskStatus::ERROR));
    EXPECT_TRUE(is_terminal(TaskStatus::TIMEOUT));
}

// ============================================================================
// Patches
// ============================================================================

TEST(PatchJsonTest, KeepsOrder) {
    Json::Value json = parse_json(R"([
        {"filename": "Example/a.xml", "contents": "<x/>"},
        {"filename": "Example/a.xml", "contents": "<y/>"}
    ])");

    auto patches = patches_from_json(json);
    ASSERT_EQ(patches.size(), 2u);
    EXPECT_EQ(patches[0].contents, "<x/>");
    EXPECT_EQ(patches[1].contents, "<y/>");
    EXPECT_EQ(patches_to_json(patches), json);
}

TEST(PatchJsonTest, RejectsMalformedPatches) {
    EXPECT_THROW(patches_from_json(parse_json(R"({"filename": "a"})")), TaskError);
    EXPECT_THROW(patches_from_json(parse_json(R"([{"filename": "a"}])")), TaskError);
    EXPECT_THROW(patches_from_json(parse_json(R"([{"filename": 1, "contents": "x"}])")), TaskError);

    try {
        patches_from_json(parse_json("[42]"));
        FAIL() << "expected TaskError";
    } catch (const TaskError& e) {
        EXPECT_EQ(e.code(), ErrorCode::BAD_REQUEST);
    }
}

TEST(PatchJsonTest, EmptyListIsValid) {
    EXPECT_TRUE(patches_from_json(Json::Value(Json::arrayValue)).empty());
}

// ============================================================================
// Records
// ============================================================================

TEST(RecordJsonTest, StatusShape) {
    ResultRecord record;
    record.ticket = "t1";
    record.status = TaskStatus::COMPLETE;
    record.payload = "abc==";

    Json::Value json = record_to_status_json(record);
    EXPECT_EQ(json["status"].asString(), "complete");
    EXPECT_EQ(json["payload"].asString(), "abc==");
    EXPECT_FALSE(json.isMember("writtenAt"));

    ResultRecord parsed = record_from_status_json("t1", json);
    EXPECT_EQ(parsed.ticket, "t1");
    EXPECT_EQ(parsed.status, TaskStatus::COMPLETE);
    EXPECT_EQ(parsed.payload, "abc==");
}

TEST(RecordJsonTest, StorageShapeKeepsWrittenAtToTheMillisecond) {
    ResultRecord record;
    record.ticket = "t1";
    record.status = TaskStatus::RUNNING;
    record.written_at = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123));

    Json::Value json = record_to_storage_json(record);
    EXPECT_EQ(json["writtenAt"].asInt64(), 1700000000123);

    ResultRecord parsed = record_from_storage_json("t1", json);
    EXPECT_EQ(parsed, record);
}

TEST(RecordJsonTest, RejectsUnknownStatus) {
    EXPECT_THROW(record_from_status_json("t1", parse_json(R"({"status": "paused"})")), TaskError);
    EXPECT_THROW(record_from_status_json("t1", parse_json(R"({"payload": "x"})")), TaskError);
    EXPECT_THROW(record_from_storage_json("t1", parse_json(R"({"status": "error"})")), TaskError);
}

TEST(RecordJsonTest, MissingPayloadReadsAsEmpty) {
    ResultRecord parsed = record_from_status_json("t1", parse_json(R"({"status": "running"})"));
    EXPECT_EQ(parsed.status, TaskStatus::RUNNING);
    EXPECT_TRUE(parsed.payload.empty());
}

// ============================================================================
// Assignments and project files
// ============================================================================

TEST(AssignmentJsonTest, UsesCamelCaseWorkerId) {
    Json::Value json = assignment_to_json(TaskAssignment{"t1", "w1"});
    EXPECT_EQ(json["ticket"].asString(), "t1");
    EXPECT_EQ(json["workerId"].asString(), "w1");

    TaskAssignment parsed = assignment_from_json(json);
    EXPECT_EQ(parsed.ticket, "t1");
    EXPECT_EQ(parsed.worker_id, "w1");

    EXPECT_THROW(assignment_from_json(parse_json(R"({"ticket": "t1"})")), TaskError);
}

TEST(ProjectFileJsonTest, RoundTrip) {
    ProjectFile file{"Example/app/Main.java", "Example", "class Main {}"};
    Json::Value json = project_file_to_json(file);
    EXPECT_EQ(json["projectName"].asString(), "Example");

    ProjectFile parsed = project_file_from_json(json);
    EXPECT_EQ(parsed.filename, file.filename);
    EXPECT_EQ(parsed.project_name, file.project_name);
    EXPECT_EQ(parsed.contents, file.contents);
}
