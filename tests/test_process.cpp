#include <gtest/gtest.h>
#include <platform/process.hpp>
#include <platform/platform.hpp>
#include <platform/worker_pool.hpp>
#include <atomic>
#include <chrono>
#include <stdexcept>

TEST(Process, CapturesBothStreamsAndExitCode) {
    auto r = platform::run_capture("/bin/sh", {"-c", "echo out; echo err >&2; exit 3"});
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_EQ(r.stdout_data, "out\n");
    EXPECT_EQ(r.stderr_data, "err\n");
    EXPECT_TRUE(r.failed());
}

TEST(Process, MissingProgramIs127) {
    auto r = platform::run_capture("/nonexistent/rentwatch-helper", {});
    EXPECT_EQ(r.exit_code, 127);
}

TEST(Process, TimeoutKillsChild) {
    auto start = std::chrono::steady_clock::now();
    auto r = platform::run_capture("/bin/sh", {"-c", "sleep 10"}, 200);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(r.exit_code, -1);
    EXPECT_NE(r.stderr_data.find("timed out"), std::string::npos);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(Platform, SleepReturnsEarlyWhenStopped) {
    std::atomic<bool> stop{true};
    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(platform::sleep_unless_stopped(10000, stop, 50));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));

    std::atomic<bool> go{false};
    EXPECT_FALSE(platform::sleep_unless_stopped(20, go, 5));
}

TEST(WorkerPool, DrainsQueueOnShutdown) {
    std::atomic<int> done{0};
    platform::WorkerPool pool(3);
    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(pool.submit([&done] { done++; }));
    }
    pool.shutdown();
    EXPECT_EQ(done.load(), 50);
    EXPECT_FALSE(pool.submit([&done] { done++; }));
}

TEST(WorkerPool, ThrowingJobDoesNotKillWorker) {
    std::atomic<int> done{0};
    platform::WorkerPool pool(1);
    pool.submit([] { throw std::runtime_error("boom"); });
    pool.submit([&done] { done++; });
    pool.shutdown();
    EXPECT_EQ(done.load(), 1);
}
