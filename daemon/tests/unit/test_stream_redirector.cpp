/**
 * @file test_stream_redirector.cpp
 * @brief Unit tests for StreamRedirector
 */

#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <fcntl.h>
#include <unistd.h>
#include "wardend/core/event_loop.h"
#include "wardend/core/handler_registry.h"
#include "wardend/errors.h"
#include "wardend/logger.h"
#include "wardend/process/stream_redirector.h"

using namespace std::chrono_literals;

namespace {

struct Line {
    std::string watcher;
    pid_t pid;
    std::string stream;
    std::string text;
};

/**
 * @brief Process over pipes the test writes into itself
 */
class PipeProcess : public wardend::Process {
public:
    static std::unique_ptr<PipeProcess> create(pid_t pid) {
        int out[2];
        int err[2];
        if (pipe2(out, O_NONBLOCK | O_CLOEXEC) != 0 || pipe2(err, O_NONBLOCK | O_CLOEXEC) != 0) {
            return nullptr;
        }
        return std::unique_ptr<PipeProcess>(new PipeProcess(pid, out, err));
    }
    
    ~PipeProcess() override {
        close_writers();
    }
    
    void write_stdout(const std::string& data) {
        ASSERT_EQ(write(out_writer_, data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }
    
    void write_stderr(const std::string& data) {
        ASSERT_EQ(write(err_writer_, data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }
    
    void close_writers() {
        if (out_writer_ != -1) {
            close(out_writer_);
            out_writer_ = -1;
        }
        if (err_writer_ != -1) {
            close(err_writer_);
            err_writer_ = -1;
        }
    }
    
    bool poll() override { return true; }
    bool send_signal(int) override { return true; }
    void kill_now() override { mark_exited(0); }
    
private:
    PipeProcess(pid_t pid, int out[2], int err[2])
        : wardend::Process(pid, out[0], err[0])
        , out_writer_(out[1])
        , err_writer_(err[1]) {
    }
    
    int out_writer_;
    int err_writer_;
};

} // namespace

class StreamRedirectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        wardend::Logger::init(wardend::LogLevel::CRITICAL, false);
        redirector_ = std::make_unique<wardend::StreamRedirector>(registry_,
            [this](const std::string& watcher, pid_t pid, const std::string& stream,
                   const std::string& line) {
                lines_.push_back(Line{watcher, pid, stream, line});
            });
    }
    
    void TearDown() override {
        redirector_.reset();
        wardend::Logger::shutdown();
    }
    
    void pump(size_t want_lines) {
        auto deadline = std::chrono::steady_clock::now() + 2s;
        while (lines_.size() < want_lines && std::chrono::steady_clock::now() < deadline) {
            loop_.run_once(20ms);
        }
    }
    
    wardend::EventLoop loop_;
    wardend::HandlerRegistry registry_{loop_};
    std::unique_ptr<wardend::StreamRedirector> redirector_;
    std::vector<Line> lines_;
};

TEST_F(StreamRedirectorTest, RegistersBothPipes) {
    auto process = PipeProcess::create(4242);
    ASSERT_NE(process, nullptr);
    
    auto redirection = redirector_->add_redirections("web", *process);
    redirection.commit();
    
    EXPECT_EQ(redirection.fds().size(), 2u);
    EXPECT_TRUE(registry_.is_registered(process->stdout_fd()));
    EXPECT_TRUE(registry_.is_registered(process->stderr_fd()));
    EXPECT_EQ(redirector_->active_streams(), 2u);
    
    EXPECT_EQ(redirector_->remove_redirections(*process), 2u);
    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(StreamRedirectorTest, CompleteLinesReachSink) {
    auto process = PipeProcess::create(4242);
    ASSERT_NE(process, nullptr);
    redirector_->add_redirections("web", *process).commit();
    
    process->write_stdout("first\nsecond\npart");
    process->write_stderr("warning\n");
    pump(3);
    
    ASSERT_EQ(lines_.size(), 3u);
    int stdout_lines = 0;
    for (const auto& line : lines_) {
        EXPECT_EQ(line.watcher, "web");
        EXPECT_EQ(line.pid, 4242);
        if (line.stream == "stdout") {
            ++stdout_lines;
        } else {
            EXPECT_EQ(line.stream, "stderr");
            EXPECT_EQ(line.text, "warning");
        }
    }
    EXPECT_EQ(stdout_lines, 2);
    
    // Partial line is flushed on removal
    redirector_->remove_redirections(*process);
    ASSERT_EQ(lines_.size(), 4u);
    EXPECT_EQ(lines_.back().text, "part");
}

TEST_F(StreamRedirectorTest, EndOfFileUnregistersStream) {
    auto process = PipeProcess::create(4242);
    ASSERT_NE(process, nullptr);
    redirector_->add_redirections("web", *process).commit();
    
    process->write_stdout("bye");
    process->close_writers();
    pump(1);
    
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (redirector_->active_streams() > 0 && std::chrono::steady_clock::now() < deadline) {
        loop_.run_once(20ms);
    }
    
    EXPECT_EQ(redirector_->active_streams(), 0u);
    EXPECT_EQ(registry_.size(), 0u);
    ASSERT_EQ(lines_.size(), 1u);
    EXPECT_EQ(lines_[0].text, "bye");
}

TEST_F(StreamRedirectorTest, UncommittedRedirectionIsRolledBack) {
    auto process = PipeProcess::create(4242);
    ASSERT_NE(process, nullptr);
    {
        auto redirection = redirector_->add_redirections("web", *process);
        EXPECT_EQ(registry_.size(), 2u);
    }
    EXPECT_EQ(registry_.size(), 0u);
    EXPECT_FALSE(loop_.has_handler(process->stdout_fd()));
    EXPECT_EQ(redirector_->active_streams(), 0u);
}

TEST_F(StreamRedirectorTest, ConflictRollsBackEarlierPipe) {
    auto process = PipeProcess::create(4242);
    ASSERT_NE(process, nullptr);
    registry_.register_fd(process->stderr_fd(), [](int, uint32_t) {});
    
    EXPECT_THROW(redirector_->add_redirections("web", *process), wardend::RegistrationConflict);
    
    EXPECT_FALSE(registry_.is_registered(process->stdout_fd()));
    EXPECT_TRUE(registry_.is_registered(process->stderr_fd()));
    EXPECT_EQ(redirector_->active_streams(), 0u);
    registry_.unregister_fd(process->stderr_fd());
}
