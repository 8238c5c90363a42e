#include <gtest/gtest.h>
#include "result_store.h"
#include "errors.h"
#include "test_helpers.h"
#include <atomic>
#include <filesystem>
#include <memory>
#include <thread>

using namespace droidrun;
using namespace droidrun::testing_support;
namespace fs = std::filesystem;

namespace {

ResultRecord make_record(const std::string& ticket, TaskStatus status, const std::string& payload,
                         std::chrono::system_clock::time_point written_at =
                             std::chrono::system_clock::now()) {
    ResultRecord record;
    record.ticket = ticket;
    record.status = status;
    record.payload = payload;
    record.written_at = std::chrono::time_point_cast<std::chrono::milliseconds>(written_at);
    return record;
}

} // namespace

// ============================================================================
// Behavior shared by every store
// ============================================================================

class ResultStoreContractTest : public ::testing::TestWithParam<std::string> {
protected:
    std::string test_dir;
    std::unique_ptr<ResultStore> store;

    void SetUp() override {
        test_dir = make_temp_dir();
        if (GetParam() == "disk") {
            store = std::make_unique<DiskResultStore>(test_dir + "/results");
        } else {
            store = std::make_unique<MemoryResultStore>();
        }
    }

    void TearDown() override {
        store.reset();
        if (!test_dir.empty() && fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }
};

TEST_P(ResultStoreContractTest, CompleteRecordReadsBackIdentical) {
    ResultRecord written = make_record("t1", TaskStatus::COMPLETE, "abc==");
    store->write(written);

    auto read = store->read("t1");
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(*read, written);
}

TEST_P(ResultStoreContractTest, UnknownTicketReadsAsNothing) {
    EXPECT_FALSE(store->read("zzz").has_value());
}

TEST_P(ResultStoreContractTest, WriteOverwritesWholeRecord) {
    store->write(make_record("t1", TaskStatus::RUNNING, "Building"));
    store->write(make_record("t1", TaskStatus::ERROR, "compile error"));

    auto read = store->read("t1");
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(read->status, TaskStatus::ERROR);
    EXPECT_EQ(read->payload, "compile error");
}

TEST_P(ResultStoreContractTest, GarbageCollectionKeepsRunningAndFreshRecords) {
    auto now = std::chrono::system_clock::now();
    auto old = now - std::chrono::hours(2);
    store->write(make_record("old-done", TaskStatus::COMPLETE, "abc==", old));
    store->write(make_record("old-running", TaskStatus::RUNNING, "Building", old));
    store->write(make_record("fresh-done", TaskStatus::ERROR, "failed", now));

    size_t removed = store->collect_garbage(now - std::chrono::minutes(30));

    EXPECT_EQ(removed, 1u);
    EXPECT_FALSE(store->read("old-done").has_value());
    EXPECT_TRUE(store->read("old-running").has_value());
    EXPECT_TRUE(store->read("fresh-done").has_value());
}

TEST_P(ResultStoreContractTest, EraseRemovesRecord) {
    store->write(make_record("t1", TaskStatus::COMPLETE, "abc=="));
    EXPECT_TRUE(store->erase("t1"));
    EXPECT_FALSE(store->read("t1").has_value());
    EXPECT_FALSE(store->erase("t1"));
}

TEST_P(ResultStoreContractTest, ReadersNeverSeeTornRecords) {
    // Status and payload always change together; a reader must see a matching pair
    store->write(make_record("t1", TaskStatus::RUNNING, "running-0"));

    std::atomic<bool> done{false};
    std::atomic<int> torn{0};
    std::thread reader([&] {
        while (!done) {
            auto record = store->read("t1");
            if (!record) {
                ++torn;
                continue;
            }
            bool running = record->status == TaskStatus::RUNNING;
            bool running_payload = record->payload.rfind("running-", 0) == 0;
            if (running != running_payload) ++torn;
        }
    });

    for (int i = 0; i < 200; ++i) {
        if (i % 2 == 0) {
            store->write(make_record("t1", TaskStatus::ERROR, "error-" + std::to_string(i)));
        } else {
            store->write(make_record("t1", TaskStatus::RUNNING, "running-" + std::to_string(i)));
        }
    }
    done = true;
    reader.join();

    EXPECT_EQ(torn.load(), 0);
}

INSTANTIATE_TEST_SUITE_P(Stores, ResultStoreContractTest, ::testing::Values("memory", "disk"));

// ============================================================================
// Disk layout
// ============================================================================

class DiskResultStoreTest : public ::testing::Test {
protected:
    std::string test_dir;

    void SetUp() override { test_dir = make_temp_dir(); }

    void TearDown() override {
        if (!test_dir.empty() && fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }
};

TEST_F(DiskResultStoreTest, RecordLivesUnderTicketOutDirectory) {
    DiskResultStore store(test_dir);
    store.write(make_record("t1", TaskStatus::COMPLETE, "abc=="));

    fs::path expected = fs::path(test_dir) / "t1" / "out" / "result.json";
    EXPECT_EQ(store.record_path("t1"), expected);
    ASSERT_TRUE(fs::exists(expected));

    std::string text = read_file(expected);
    EXPECT_NE(text.find("\"status\":\"complete\""), std::string::npos) << text;
    EXPECT_NE(text.find("\"writtenAt\""), std::string::npos) << text;

    // No temp files left behind
    size_t files = 0;
    for (const auto& entry : fs::directory_iterator(expected.parent_path())) {
        (void)entry;
        ++files;
    }
    EXPECT_EQ(files, 1u);
}

TEST_F(DiskResultStoreTest, SurvivesReopen) {
    {
        DiskResultStore store(test_dir);
        store.write(make_record("t1", TaskStatus::ERROR, "build failed"));
    }
    DiskResultStore reopened(test_dir);
    auto read = reopened.read("t1");
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(read->payload, "build failed");
}

TEST_F(DiskResultStoreTest, MalformedFileReadsAsError) {
    DiskResultStore store(test_dir);
    write_file(store.record_path("t1"), "{not json");

    auto read = store.read("t1");
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(read->status, TaskStatus::ERROR);
    EXPECT_EQ(read->payload, "Test result malformed");
}

TEST_F(DiskResultStoreTest, RejectsTicketsThatAreNotDirectoryNames) {
    DiskResultStore store(test_dir);
    EXPECT_THROW(store.write(make_record("../escape", TaskStatus::COMPLETE, "x")), TaskError);
    EXPECT_THROW(store.write(make_record("", TaskStatus::COMPLETE, "x")), TaskError);
    EXPECT_FALSE(store.read("../escape").has_value());
    EXPECT_FALSE(fs::exists(fs::path(test_dir).parent_path() / "escape"));
}

TEST_F(DiskResultStoreTest, DirectoryWithoutRecordIsAgedByMtime) {
    DiskResultStore store(test_dir);
    fs::create_directories(fs::path(test_dir) / "orphan");

    // Fresh orphan stays
    EXPECT_EQ(store.collect_garbage(std::chrono::system_clock::now() - std::chrono::minutes(30)), 0u);
    EXPECT_TRUE(fs::exists(fs::path(test_dir) / "orphan"));

    // Everything older than the future goes
    EXPECT_EQ(store.collect_garbage(std::chrono::system_clock::now() + std::chrono::minutes(1)), 1u);
    EXPECT_FALSE(fs::exists(fs::path(test_dir) / "orphan"));
}

TEST_F(DiskResultStoreTest, ClearRemovesEverything) {
    DiskResultStore store(test_dir + "/results");
    store.write(make_record("t1", TaskStatus::COMPLETE, "abc=="));
    store.write(make_record("t2", TaskStatus::RUNNING, ""));

    store.clear();

    EXPECT_FALSE(store.read("t1").has_value());
    EXPECT_FALSE(store.read("t2").has_value());
    EXPECT_TRUE(fs::exists(test_dir + "/results"));
}

TEST(TicketValidationTest, AcceptsOnlyDirectorySafeNames) {
    EXPECT_TRUE(is_valid_ticket("t1"));
    EXPECT_TRUE(is_valid_ticket("0123456789abcdef0123456789abcdef"));
    EXPECT_TRUE(is_valid_ticket("a_b-C"));
    EXPECT_FALSE(is_valid_ticket(""));
    EXPECT_FALSE(is_valid_ticket("a/b"));
    EXPECT_FALSE(is_valid_ticket(".."));
    EXPECT_FALSE(is_valid_ticket(std::string(129, 'a')));
}
