/**
 * Task Lifecycle Integration Tests
 *
 * Balancer -> worker -> real child processes -> disk-backed results.
 * Build and run steps are small /bin/sh scripts standing in for the
 * Android toolchain.
 */

#include <gtest/gtest.h>
#include "balancer.h"
#include "build_runner.h"
#include "encoding.h"
#include "worker_service.h"
#include "test_helpers.h"
#include <filesystem>

namespace droidrun {
namespace {

namespace fs = std::filesystem;
using namespace testing_support;
using namespace std::chrono_literals;

std::vector<std::string> sh(const std::string& script) {
    return {"/bin/sh", "-c", script};
}

class TaskLifecycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = make_temp_dir();
        project = make_project(fs::path(test_dir) / "projects", "Example");
    }

    void TearDown() override {
        if (executor) executor->wait_idle();
        balancer.reset();
        service.reset();
        executor.reset();
        fs::remove_all(test_dir);
    }

    // Wires one worker behind a balancer using the current project config
    void start(std::chrono::seconds step_timeout = 30s) {
        projects.add(project);
        runner = std::make_unique<CommandBuildRunner>(step_timeout);
        store = std::make_unique<DiskResultStore>(results_dir());
        executor = std::make_unique<TaskExecutor>(lock, *store, *runner, workspace_dir());
        service = std::make_unique<WorkerService>("w1", projects, *store, lock, *executor);

        std::vector<std::unique_ptr<WorkerClient>> pool;
        pool.push_back(std::make_unique<LocalWorkerClient>("w1", *service));
        balancer = std::make_unique<Balancer>(std::move(pool), registry);
    }

    // Submits and waits for the worker to finish; returns the final record
    ResultRecord run(const std::vector<Patch>& patches, std::string* ticket_out = nullptr) {
        TaskAssignment assignment = balancer->create_task("Example", patches, "u1");
        if (ticket_out) *ticket_out = assignment.ticket;
        executor->wait_idle();
        return balancer->get_status(assignment.ticket);
    }

    std::string results_dir() const { return test_dir + "/results"; }
    std::string workspace_dir() const { return test_dir + "/workspace"; }

    std::string test_dir;
    ProjectConfig project;
    ProjectTable projects;
    WorkerLock lock;
    TaskRegistry registry;
    std::unique_ptr<CommandBuildRunner> runner;
    std::unique_ptr<DiskResultStore> store;
    std::unique_ptr<TaskExecutor> executor;
    std::unique_ptr<WorkerService> service;
    std::unique_ptr<Balancer> balancer;
};

// ============================================================================
// Successful runs
// ============================================================================

TEST_F(TaskLifecycleTest, PatchedSourceEndsUpInTheArtifact) {
    // Given: a build that compiles the patched file and a run that screenshots it
    project.build_command = sh("cat a.xml > build.out");
    project.run_command = sh("cp build.out screenshot.jpg");
    start();

    // When: the client submits a patch
    std::string ticket;
    ResultRecord record = run({{"Example/a.xml", "<x/>"}}, &ticket);

    // Then: the payload is the artifact, base64-encoded
    EXPECT_EQ(record.status, TaskStatus::COMPLETE);
    EXPECT_EQ(record.payload, Encoding::base64_encode("<x/>"));

    // And: the golden copy is untouched and the staged copy is gone
    EXPECT_FALSE(fs::exists(fs::path(project.path) / "a.xml"));
    EXPECT_FALSE(fs::exists(fs::path(workspace_dir()) / ticket));

    // And: the record is on disk where a restarted worker would find it
    DiskResultStore reopened(results_dir());
    auto stored = reopened.read(ticket);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, TaskStatus::COMPLETE);
}

TEST_F(TaskLifecycleTest, StepsSeeTheStagedDirectory) {
    project.build_command = sh("test -f \"$DROIDRUN_PROJECT_DIR/app/Main.java\" && "
                               "test ! -e .git && echo ok > screenshot.jpg");
    start();

    ResultRecord record = run({});
    EXPECT_EQ(record.status, TaskStatus::COMPLETE);
    EXPECT_EQ(record.payload, Encoding::base64_encode("ok\n"));
}

TEST_F(TaskLifecycleTest, WorkerTakesNextTaskAfterFinishing) {
    project.build_command = sh("echo img > screenshot.jpg");
    start();

    EXPECT_EQ(run({}).status, TaskStatus::COMPLETE);
    EXPECT_EQ(run({}).status, TaskStatus::COMPLETE);
    EXPECT_FALSE(lock.active());
    EXPECT_EQ(registry.size(), 2u);
}

// ============================================================================
// Failed runs
// ============================================================================

TEST_F(TaskLifecycleTest, BuildFailureIsAnErrorStatus) {
    project.build_command = sh("echo 'Main.java:1: error' >&2; exit 3");
    start();

    ResultRecord record = run({});
    EXPECT_EQ(record.status, TaskStatus::ERROR);
    EXPECT_EQ(record.payload.rfind("Build failed (exit 3)", 0), 0u);
    EXPECT_NE(record.payload.find("Main.java:1: error"), std::string::npos);

    // The lock is free again after a failure
    EXPECT_FALSE(lock.active());
}

TEST_F(TaskLifecycleTest, MissingArtifactIsAnErrorStatus) {
    project.build_command = sh("true");
    start();

    ResultRecord record = run({});
    EXPECT_EQ(record.status, TaskStatus::ERROR);
    EXPECT_EQ(record.payload, "No result image found at screenshot.jpg");
}

TEST_F(TaskLifecycleTest, PatchOutsideTheProjectIsAnErrorStatus) {
    project.build_command = sh("echo img > screenshot.jpg");
    start();

    ResultRecord record = run({{"Other/a.xml", "<x/>"}});
    EXPECT_EQ(record.status, TaskStatus::ERROR);
    EXPECT_NE(record.payload.find("contents malformed"), std::string::npos);
}

TEST_F(TaskLifecycleTest, SlowStepTimesOut) {
    project.build_command = sh("sleep 10");
    start(1s);

    auto begin = std::chrono::steady_clock::now();
    ResultRecord record = run({});

    EXPECT_EQ(record.status, TaskStatus::TIMEOUT);
    EXPECT_EQ(record.payload.rfind("Build exceeded time limit of 1s", 0), 0u);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 8s);
    EXPECT_FALSE(lock.active());
}

// ============================================================================
// Balancer bookkeeping
// ============================================================================

TEST_F(TaskLifecycleTest, OverdueTaskIsMarkedButWorkerRecordStillRelayed) {
    project.build_command = sh("sleep 1; echo img > screenshot.jpg");
    start();

    TaskAssignment assignment = balancer->create_task("Example", {}, "u1");
    ASSERT_TRUE(eventually([&] {
        balancer->housekeeping(0s, 3600s, 7200s);
        return registry.lookup(assignment.ticket)->last_status == TaskStatus::TIMEOUT;
    }));

    executor->wait_idle();

    // The worker finished after all; polls still show what it wrote
    EXPECT_EQ(balancer->get_status(assignment.ticket).status, TaskStatus::COMPLETE);
    EXPECT_EQ(registry.lookup(assignment.ticket)->last_status, TaskStatus::TIMEOUT);
}

} // namespace
} // namespace droidrun
