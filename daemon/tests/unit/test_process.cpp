/**
 * @file test_process.cpp
 * @brief Unit tests for Process and PosixSpawner
 */

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>
#include <signal.h>
#include <unistd.h>
#include "wardend/errors.h"
#include "wardend/logger.h"
#include "wardend/process/spawner.h"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class ProcessTest : public ::testing::Test {
protected:
    void SetUp() override {
        wardend::Logger::init(wardend::LogLevel::CRITICAL, false);
        temp_dir_ = fs::temp_directory_path() / ("wardend_process_test_" + std::to_string(getpid()));
        fs::create_directories(temp_dir_);
    }
    
    void TearDown() override {
        fs::remove_all(temp_dir_);
        wardend::Logger::shutdown();
    }
    
    static wardend::SpawnRequest shell(const std::string& script) {
        wardend::SpawnRequest request;
        request.command = "/bin/sh";
        request.args = {"-c", script};
        return request;
    }
    
    static bool wait_exit(wardend::Process& process, std::chrono::milliseconds timeout = 5000ms) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (process.poll()) {
            if (std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            std::this_thread::sleep_for(5ms);
        }
        return true;
    }
    
    static std::string read_all(int fd) {
        std::string data;
        char buffer[256];
        ssize_t n;
        while ((n = read(fd, buffer, sizeof(buffer))) > 0) {
            data.append(buffer, static_cast<size_t>(n));
        }
        return data;
    }
    
    wardend::PosixSpawner spawner_;
    fs::path temp_dir_;
};

// ============================================================================
// Spawning
// ============================================================================

TEST_F(ProcessTest, SpawnedProcessIsAliveWithPipes) {
    auto process = spawner_.spawn(shell("sleep 5"));
    
    EXPECT_GT(process->pid(), 0);
    EXPECT_TRUE(process->poll());
    EXPECT_TRUE(process->is_alive());
    EXPECT_NE(process->stdout_fd(), -1);
    EXPECT_NE(process->stderr_fd(), -1);
    EXPECT_EQ(process->describe_exit(), "running");
    
    process->kill_now();
    EXPECT_FALSE(process->is_alive());
}

TEST_F(ProcessTest, CommandResolvedThroughPath) {
    wardend::SpawnRequest request;
    request.command = "true";
    auto process = spawner_.spawn(request);
    
    ASSERT_TRUE(wait_exit(*process));
    EXPECT_EQ(process->describe_exit(), "exited with status 0");
}

TEST_F(ProcessTest, MissingCommandIsSpawnFailure) {
    wardend::SpawnRequest request;
    request.command = "wardend-no-such-binary";
    
    try {
        spawner_.spawn(request);
        FAIL() << "expected SpawnFailure";
    } catch (const wardend::SpawnFailure& e) {
        EXPECT_EQ(e.error_number(), ENOENT);
    }
}

TEST_F(ProcessTest, ExecFailureInChildIsReported) {
    fs::path script = temp_dir_ / "not-executable";
    std::ofstream(script) << "#!/bin/sh\nexit 0\n";
    fs::permissions(script, fs::perms::owner_read | fs::perms::owner_write);
    
    wardend::SpawnRequest request;
    request.command = script.string();
    
    try {
        spawner_.spawn(request);
        FAIL() << "expected SpawnFailure";
    } catch (const wardend::SpawnFailure& e) {
        EXPECT_EQ(e.error_number(), EACCES);
    }
}

TEST_F(ProcessTest, MissingWorkingDirectoryIsSpawnFailure) {
    auto request = shell("true");
    request.working_dir = (temp_dir_ / "missing").string();
    
    try {
        spawner_.spawn(request);
        FAIL() << "expected SpawnFailure";
    } catch (const wardend::SpawnFailure& e) {
        EXPECT_EQ(e.error_number(), ENOENT);
    }
}

TEST_F(ProcessTest, EmptyCommandIsSpawnFailure) {
    wardend::SpawnRequest request;
    EXPECT_THROW(spawner_.spawn(request), wardend::SpawnFailure);
}

// ============================================================================
// Environment, working directory and output
// ============================================================================

TEST_F(ProcessTest, OutputIsCaptured) {
    auto process = spawner_.spawn(shell("echo hello; echo oops >&2"));
    ASSERT_TRUE(wait_exit(*process));
    
    EXPECT_EQ(read_all(process->stdout_fd()), "hello\n");
    EXPECT_EQ(read_all(process->stderr_fd()), "oops\n");
}

TEST_F(ProcessTest, UncapturedOutputHasNoPipes) {
    auto request = shell("true");
    request.capture_output = false;
    auto process = spawner_.spawn(request);
    
    EXPECT_EQ(process->stdout_fd(), -1);
    EXPECT_EQ(process->stderr_fd(), -1);
    EXPECT_TRUE(wait_exit(*process));
}

TEST_F(ProcessTest, EnvironmentIsApplied) {
    auto request = shell("echo \"$WARDEND_TEST_VALUE\"");
    request.env["WARDEND_TEST_VALUE"] = "forty-two";
    auto process = spawner_.spawn(request);
    ASSERT_TRUE(wait_exit(*process));
    
    EXPECT_EQ(read_all(process->stdout_fd()), "forty-two\n");
}

TEST_F(ProcessTest, WithoutCopyEnvParentVariablesAreHidden) {
    setenv("WARDEND_PARENT_ONLY", "visible", 1);
    auto request = shell("echo \"[$WARDEND_PARENT_ONLY]\"");
    request.copy_env = false;
    auto process = spawner_.spawn(request);
    ASSERT_TRUE(wait_exit(*process));
    unsetenv("WARDEND_PARENT_ONLY");
    
    EXPECT_EQ(read_all(process->stdout_fd()), "[]\n");
}

TEST_F(ProcessTest, WorkingDirectoryIsApplied) {
    auto request = shell("pwd");
    request.working_dir = temp_dir_.string();
    auto process = spawner_.spawn(request);
    ASSERT_TRUE(wait_exit(*process));
    
    EXPECT_EQ(read_all(process->stdout_fd()),
              fs::canonical(temp_dir_).string() + "\n");
}

// ============================================================================
// Exit reporting
// ============================================================================

TEST_F(ProcessTest, ExitStatusIsDescribed) {
    auto process = spawner_.spawn(shell("exit 3"));
    ASSERT_TRUE(wait_exit(*process));
    
    EXPECT_EQ(process->describe_exit(), "exited with status 3");
    ASSERT_TRUE(process->wait_status().has_value());
}

TEST_F(ProcessTest, SignalDeathIsDescribed) {
    auto process = spawner_.spawn(shell("exec sleep 30"));
    EXPECT_TRUE(process->send_signal(SIGTERM));
    ASSERT_TRUE(wait_exit(*process));
    
    EXPECT_EQ(process->describe_exit(), "killed by SIGTERM");
    EXPECT_FALSE(process->send_signal(SIGTERM));
}

TEST_F(ProcessTest, KillNowReapsImmediately) {
    auto process = spawner_.spawn(shell("trap '' TERM; exec sleep 30"));
    process->kill_now();
    
    EXPECT_FALSE(process->is_alive());
    EXPECT_EQ(process->describe_exit(), "killed by SIGKILL");
    EXPECT_FALSE(process->poll());
}
