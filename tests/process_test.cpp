//! # Process Tests
//!
//! Exit codes, output capture, timeouts, cancellation and launch failures.

#include "common/process.hpp"

#include "test_helpers.hpp"

#include <atomic>
#include <gtest/gtest.h>
#include <thread>

using namespace cyforge;

TEST(RunProcessTest, CapturesStdoutAndStderr) {
    auto result = run_process({"/bin/sh", "-c", "echo out; echo err 1>&2"});
    EXPECT_TRUE(result.launched);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_NE(result.output.find("out\n"), std::string::npos);
    EXPECT_NE(result.output.find("err\n"), std::string::npos);
    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(result.cancelled);
}

TEST(RunProcessTest, ReportsExitCode) {
    auto result = run_process({"/bin/sh", "-c", "exit 7"});
    EXPECT_TRUE(result.launched);
    EXPECT_EQ(result.exit_code, 7);
}

TEST(RunProcessTest, LargeOutputIsNotTruncated) {
    auto result = run_process({"/bin/sh", "-c", "i=0; while [ $i -lt 5000 ]; do "
                                                "echo 0123456789012345678901234567890123456789; "
                                                "i=$((i+1)); done"});
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output.size(), 5000u * 41u);
}

TEST(RunProcessTest, MissingExecutableExits127) {
    auto result = run_process({"cyforge-no-such-program-xyz"});
    EXPECT_TRUE(result.launched);
    EXPECT_EQ(result.exit_code, 127);
}

TEST(RunProcessTest, EmptyCommandIsNotLaunched) {
    auto result = run_process({});
    EXPECT_FALSE(result.launched);
    EXPECT_EQ(result.exit_code, -1);
}

TEST(RunProcessTest, KilledBySignalMapsTo128PlusN) {
    auto result = run_process({"/bin/sh", "-c", "kill -9 $$"});
    EXPECT_EQ(result.exit_code, 128 + 9);
}

TEST(RunProcessTest, TimeoutKillsChild) {
    ProcessOptions opts;
    opts.timeout = std::chrono::seconds(1);
    opts.grace_period = std::chrono::milliseconds(100);

    auto result = run_process({"/bin/sh", "-c", "sleep 30"}, opts);
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_code, -1);
    EXPECT_LT(result.duration_ms, 10000);
    EXPECT_NE(result.output.find("timeout"), std::string::npos);
}

TEST(RunProcessTest, CancellationStopsChild) {
    CancellationToken token;
    ProcessOptions opts;
    opts.cancel = &token;
    opts.grace_period = std::chrono::milliseconds(100);

    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        token.cancel();
    });
    auto result = run_process({"/bin/sh", "-c", "sleep 30"}, opts);
    canceller.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, -1);
    EXPECT_LT(result.duration_ms, 10000);
}

TEST(RunProcessTest, ChildIgnoringSigtermIsKilled) {
    ProcessOptions opts;
    opts.timeout = std::chrono::seconds(1);
    opts.grace_period = std::chrono::milliseconds(200);

    auto result = run_process({"/bin/sh", "-c", "trap '' TERM; sleep 30"}, opts);
    EXPECT_TRUE(result.timed_out);
    EXPECT_LT(result.duration_ms, 10000);
}

class WorkingDirTest : public cyforge::testing::TempDirTest {};

TEST_F(WorkingDirTest, RunsInWorkingDir) {
    write("marker.txt", "here");
    ProcessOptions opts;
    opts.working_dir = root_.string();

    auto result = run_process({"/bin/sh", "-c", "cat marker.txt"}, opts);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "here");
}

TEST_F(WorkingDirTest, MissingWorkingDirExits126) {
    ProcessOptions opts;
    opts.working_dir = (root_ / "gone").string();

    auto result = run_process({"/bin/sh", "-c", "exit 0"}, opts);
    EXPECT_TRUE(result.launched);
    EXPECT_EQ(result.exit_code, 126);
}

TEST(RunProcessTest, LongArgumentListReachesChildIntact) {
    std::vector<std::string> argv = {"/bin/sh", "-c", "echo $#; echo \"$1|${300}\"", "sh"};
    for (int i = 1; i <= 300; ++i) {
        argv.push_back("arg" + std::to_string(i));
    }

    // Repeated launches from several threads at once
    std::vector<std::thread> threads;
    std::atomic<int> ok{0};
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 5; ++i) {
                auto result = run_process(argv);
                if (result.exit_code == 0 && result.output == "300\narg1|arg300\n")
                    ++ok;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(ok.load(), 20);
}

TEST(FormatCommandTest, QuotesArgumentsWithSpaces) {
    EXPECT_EQ(format_command({"cythonize", "-i", "my file.py"}), "cythonize -i \"my file.py\"");
    EXPECT_EQ(format_command({}), "");
}
