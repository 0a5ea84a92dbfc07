/**
 * @file test_arbiter.cpp
 * @brief Integration tests for Arbiter command serialization and the Reconciler
 */

#include <gtest/gtest.h>
#include <limits>
#include <signal.h>
#include <sys/types.h>
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <stdexcept>
#include <thread>
#include "support/fake_spawner.h"
#include "wardend/core/event_loop.h"
#include "wardend/core/handler_registry.h"
#include "wardend/errors.h"
#include "wardend/logger.h"
#include "wardend/process/stream_redirector.h"
#include "wardend/watcher/arbiter.h"
#include "wardend/watcher/reconciler.h"

using namespace std::chrono_literals;
using wardend::testing::FakeSpawner;

namespace {

wardend::WatcherConfig watcher_config(const std::string& name, int numprocesses, int priority = 0) {
    wardend::WatcherConfig config;
    config.name = name;
    config.cmd = "/usr/bin/" + name;
    config.numprocesses = numprocesses;
    config.priority = priority;
    config.graceful_timeout = 500ms;
    return config;
}

/**
 * @brief Holds the command gate on another thread until released
 */
class GateHolder {
public:
    GateHolder(wardend::CommandGate& gate, const std::string& command) {
        auto ready = acquired_.get_future();
        thread_ = std::thread([this, &gate, command]() {
            auto token = gate.acquire(command);
            acquired_.set_value();
            while (!release_.load()) {
                std::this_thread::sleep_for(5ms);
            }
        });
        ready.wait();
    }
    
    ~GateHolder() {
        release();
    }
    
    void release() {
        release_ = true;
        if (thread_.joinable()) {
            thread_.join();
        }
        if (releaser_.joinable()) {
            releaser_.join();
        }
    }
    
    void release_after(std::chrono::milliseconds delay) {
        releaser_ = std::thread([this, delay]() {
            std::this_thread::sleep_for(delay);
            release_ = true;
        });
    }

private:
    std::promise<void> acquired_;
    std::thread thread_;
    std::thread releaser_;
    std::atomic<bool> release_{false};
};

/**
 * @brief Multiplexer whose removals never take and whose overwrites fail
 */
class StuckMultiplexer : public wardend::IoMultiplexer {
public:
    void add_handler(int fd, wardend::IoHandler handler, uint32_t /*events*/) override {
        if (bindings_.count(fd)) {
            throw std::invalid_argument("fd " + std::to_string(fd) + " added twice");
        }
        bindings_[fd] = std::move(handler);
    }
    
    void replace_handler(int /*fd*/, wardend::IoHandler /*handler*/, uint32_t /*events*/) override {
        throw std::runtime_error("replace refused");
    }
    
    void remove_handler(int /*fd*/) override {}
    
    bool has_handler(int fd) const override {
        return bindings_.count(fd) > 0;
    }

private:
    std::map<int, wardend::IoHandler> bindings_;
};

} // namespace

class ArbiterTest : public ::testing::Test {
protected:
    void SetUp() override {
        wardend::Logger::init(wardend::LogLevel::CRITICAL, false);
        arbiter_ = std::make_unique<wardend::Arbiter>(spawner_, redirector_, registry_);
        arbiter_->set_command_timeout(50ms);
    }
    
    void TearDown() override {
        arbiter_->stop();
        arbiter_.reset();
        wardend::Logger::shutdown();
    }
    
    wardend::EventLoop loop_;
    wardend::HandlerRegistry registry_{loop_};
    wardend::StreamRedirector redirector_{registry_};
    FakeSpawner spawner_;
    std::unique_ptr<wardend::Arbiter> arbiter_;
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(ArbiterTest, StartsWatchersByPriority) {
    arbiter_->add_watcher(watcher_config("low", 1, 1));
    arbiter_->add_watcher(watcher_config("high", 1, 10));
    arbiter_->add_watcher(watcher_config("mid", 1, 5));
    
    ASSERT_TRUE(arbiter_->start());
    
    auto requests = spawner_.requests();
    ASSERT_EQ(requests.size(), 3u);
    EXPECT_EQ(requests[0].command, "/usr/bin/high");
    EXPECT_EQ(requests[1].command, "/usr/bin/mid");
    EXPECT_EQ(requests[2].command, "/usr/bin/low");
    EXPECT_TRUE(arbiter_->is_healthy());
}

TEST_F(ArbiterTest, StopsWatchersInReversePriority) {
    arbiter_->add_watcher(watcher_config("low", 1, 1));
    arbiter_->add_watcher(watcher_config("high", 1, 10));
    ASSERT_TRUE(arbiter_->start());
    auto states = spawner_.states();
    ASSERT_EQ(states.size(), 2u);
    
    arbiter_->stop();
    
    // states[0] belongs to "high", which started first
    EXPECT_GT(states[0]->signalled_at.load(), states[1]->signalled_at.load());
    EXPECT_FALSE(arbiter_->is_running());
    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(ArbiterTest, SkipsManualAndOnDemandWatchersAtStartup) {
    auto manual = watcher_config("manual", 1);
    manual.autostart = false;
    arbiter_->add_watcher(manual);
    arbiter_->add_watcher(watcher_config("auto", 1));
    
    ASSERT_TRUE(arbiter_->start());
    
    EXPECT_EQ(spawner_.spawn_calls(), 1u);
    EXPECT_EQ(arbiter_->watcher_status("manual")->state, wardend::WatcherState::STOPPED);
    
    arbiter_->start_watcher("manual");
    EXPECT_EQ(arbiter_->watcher_status("manual")->state, wardend::WatcherState::RUNNING);
}

TEST_F(ArbiterTest, AddWhileRunningStartsWatcher) {
    ASSERT_TRUE(arbiter_->start());
    arbiter_->add_watcher(watcher_config("late", 2));
    
    EXPECT_EQ(arbiter_->watcher_status("late")->live_processes(), 2u);
}

TEST_F(ArbiterTest, RejectsDuplicateAndInvalidWatchers) {
    arbiter_->add_watcher(watcher_config("web", 1));
    EXPECT_THROW(arbiter_->add_watcher(watcher_config("web", 1)), wardend::WardenError);
    
    auto invalid = watcher_config("broken", 1);
    invalid.cmd.clear();
    EXPECT_THROW(arbiter_->add_watcher(invalid), wardend::WardenError);
    EXPECT_EQ(arbiter_->watcher_count(), 1u);
}

TEST_F(ArbiterTest, UnknownWatcherReported) {
    EXPECT_THROW(arbiter_->start_watcher("ghost"), wardend::UnknownWatcher);
    EXPECT_THROW(arbiter_->watcher_status("ghost"), wardend::UnknownWatcher);
    EXPECT_THROW(arbiter_->remove_watcher("ghost"), wardend::UnknownWatcher);
    EXPECT_FALSE(arbiter_->gate().is_held());
}

TEST_F(ArbiterTest, RemoveStopsProcesses) {
    arbiter_->add_watcher(watcher_config("web", 2));
    ASSERT_TRUE(arbiter_->start());
    
    arbiter_->remove_watcher("web");
    
    EXPECT_EQ(arbiter_->watcher_count(), 0u);
    for (const auto& state : spawner_.states()) {
        EXPECT_FALSE(state->alive);
    }
    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(ArbiterTest, IncrAndDecrAdjustCount) {
    arbiter_->add_watcher(watcher_config("web", 1));
    ASSERT_TRUE(arbiter_->start());
    
    EXPECT_EQ(arbiter_->incr_watcher("web", 2), 3);
    EXPECT_EQ(arbiter_->watcher_status("web")->live_processes(), 3u);
    
    EXPECT_EQ(arbiter_->decr_watcher("web"), 2);
    EXPECT_EQ(arbiter_->decr_watcher("web", 10), 0);
    EXPECT_EQ(arbiter_->watcher_status("web")->live_processes(), 0u);
    
    EXPECT_THROW(arbiter_->incr_watcher("web", 0), wardend::WardenError);
    EXPECT_THROW(arbiter_->decr_watcher("web", -1), wardend::WardenError);
}

TEST_F(ArbiterTest, IncrRefusesCountPastLimit) {
    arbiter_->add_watcher(watcher_config("web", 1));
    ASSERT_TRUE(arbiter_->start());
    
    EXPECT_THROW(arbiter_->incr_watcher("web", std::numeric_limits<int>::max()), wardend::WardenError);
    EXPECT_THROW(arbiter_->incr_watcher("web", wardend::MAX_NUMPROCESSES), wardend::WardenError);
    
    auto status = arbiter_->watcher_status("web");
    EXPECT_EQ(status->desired, 1);
    EXPECT_EQ(status->live_processes(), 1u);
    EXPECT_FALSE(arbiter_->gate().is_held());
}

TEST_F(ArbiterTest, RestartReplacesPids) {
    arbiter_->add_watcher(watcher_config("web", 1));
    ASSERT_TRUE(arbiter_->start());
    pid_t before = arbiter_->watcher_status("web")->pids.at(0);
    
    arbiter_->restart_watcher("web");
    
    auto status = arbiter_->watcher_status("web");
    ASSERT_EQ(status->pids.size(), 1u);
    EXPECT_NE(status->pids[0], before);
}

TEST_F(ArbiterTest, DegradedWatcherMakesArbiterUnhealthy) {
    auto config = watcher_config("web", 1);
    config.max_retry = 0;
    arbiter_->add_watcher(config);
    spawner_.fail_every_spawn();
    
    ASSERT_TRUE(arbiter_->start());
    
    EXPECT_TRUE(arbiter_->watcher_status("web")->degraded);
    EXPECT_FALSE(arbiter_->is_healthy());
}

// ============================================================================
// Command gate
// ============================================================================

TEST_F(ArbiterTest, CommandRejectedWhileAnotherRuns) {
    arbiter_->add_watcher(watcher_config("web", 1));
    ASSERT_TRUE(arbiter_->start());
    
    GateHolder holder(arbiter_->gate(), "restart");
    try {
        arbiter_->stop_watcher("web");
        FAIL() << "stop should have been rejected";
    } catch (const wardend::GateBusy& e) {
        EXPECT_STREQ(e.what(), "cannot run stop: already running restart command");
    }
    holder.release();
    
    EXPECT_EQ(arbiter_->watcher_status("web")->state, wardend::WatcherState::RUNNING);
}

TEST_F(ArbiterTest, CommandWaitsForShortHolder) {
    arbiter_->add_watcher(watcher_config("web", 1));
    ASSERT_TRUE(arbiter_->start());
    arbiter_->set_command_timeout(2000ms);
    
    GateHolder holder(arbiter_->gate(), "restart");
    holder.release_after(100ms);
    
    EXPECT_NO_THROW(arbiter_->stop_watcher("web"));
    EXPECT_EQ(arbiter_->watcher_status("web")->state, wardend::WatcherState::STOPPED);
}

TEST_F(ArbiterTest, QueriesIgnoreGate) {
    arbiter_->add_watcher(watcher_config("web", 1));
    GateHolder holder(arbiter_->gate(), "reload");
    
    EXPECT_EQ(arbiter_->statuses().size(), 1u);
    EXPECT_EQ(arbiter_->watcher_names(), std::vector<std::string>{"web"});
}

TEST_F(ArbiterTest, ReapSkipsWhileCommandRuns) {
    arbiter_->add_watcher(watcher_config("web", 2));
    ASSERT_TRUE(arbiter_->start());
    spawner_.states().at(0)->alive = false;
    
    {
        GateHolder holder(arbiter_->gate(), "stop");
        EXPECT_EQ(arbiter_->reap_processes(), 0u);
    }
    EXPECT_EQ(arbiter_->reap_processes(), 1u);
    EXPECT_EQ(arbiter_->watcher_status("web")->live_processes(), 1u);
}

TEST_F(ArbiterTest, ReconcileRequiresToken) {
    wardend::GateToken empty;
    EXPECT_THROW(arbiter_->reconcile_all(empty), wardend::WardenError);
}

// ============================================================================
// Reconciler
// ============================================================================

TEST_F(ArbiterTest, ReconcilerRestoresCount) {
    arbiter_->add_watcher(watcher_config("web", 2));
    ASSERT_TRUE(arbiter_->start());
    wardend::Reconciler reconciler(*arbiter_, loop_, 1000ms);
    
    spawner_.states().at(1)->alive = false;
    ASSERT_TRUE(reconciler.tick());
    
    auto status = arbiter_->watcher_status("web");
    EXPECT_EQ(status->live_processes(), 2u);
    EXPECT_EQ(status->respawns, 1u);
    EXPECT_EQ(reconciler.ticks(), 1u);
}

TEST_F(ArbiterTest, ReconcilerSkipsWhileCommandRuns) {
    arbiter_->add_watcher(watcher_config("web", 2));
    ASSERT_TRUE(arbiter_->start());
    wardend::Reconciler reconciler(*arbiter_, loop_, 1000ms);
    spawner_.states().at(0)->alive = false;
    
    {
        GateHolder holder(arbiter_->gate(), "stop");
        EXPECT_FALSE(reconciler.tick());
    }
    EXPECT_EQ(reconciler.skipped(), 1u);
    EXPECT_EQ(reconciler.ticks(), 0u);
    EXPECT_EQ(spawner_.spawn_calls(), 2u);
    
    EXPECT_TRUE(reconciler.tick());
    EXPECT_EQ(spawner_.spawn_calls(), 3u);
}

TEST_F(ArbiterTest, ConcurrentStopAndReconcileNeverOverlap) {
    arbiter_->add_watcher(watcher_config("web", 3));
    ASSERT_TRUE(arbiter_->start());
    arbiter_->set_command_timeout(5000ms);
    wardend::Reconciler reconciler(*arbiter_, loop_, 1000ms);
    
    std::atomic<bool> done{false};
    std::thread ticker([&]() {
        while (!done.load()) {
            for (const auto& state : spawner_.states()) {
                state->alive = false;
            }
            reconciler.tick();
            std::this_thread::sleep_for(1ms);
        }
    });
    
    std::this_thread::sleep_for(20ms);
    arbiter_->stop_watcher("web");
    done = true;
    ticker.join();
    
    // A pass that ran after the stop left the watcher alone
    auto status = arbiter_->watcher_status("web");
    EXPECT_EQ(status->state, wardend::WatcherState::STOPPED);
    EXPECT_EQ(status->live_processes(), 0u);
    EXPECT_GT(reconciler.ticks() + reconciler.skipped(), 0u);
}

TEST_F(ArbiterTest, ReconcilerStopsWatcherWithNothingLeft) {
    auto config = watcher_config("job", 1);
    config.respawn = false;
    arbiter_->add_watcher(config);
    ASSERT_TRUE(arbiter_->start());
    wardend::Reconciler reconciler(*arbiter_, loop_, 1000ms);
    
    spawner_.states().at(0)->alive = false;
    ASSERT_TRUE(reconciler.tick());
    
    EXPECT_EQ(arbiter_->watcher_status("job")->state, wardend::WatcherState::STOPPED);
}

TEST_F(ArbiterTest, ReconcilerRunsFromLoopTimer) {
    arbiter_->add_watcher(watcher_config("web", 1));
    ASSERT_TRUE(arbiter_->start());
    wardend::Reconciler reconciler(*arbiter_, loop_, 20ms);
    ASSERT_TRUE(reconciler.start());
    
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (reconciler.ticks() < 3 && std::chrono::steady_clock::now() < deadline) {
        loop_.run_once(10ms);
    }
    reconciler.stop();
    
    EXPECT_GE(reconciler.ticks(), 3u);
    EXPECT_THROW(reconciler.set_interval(0ms), wardend::WardenError);
}

// ============================================================================
// Reload
// ============================================================================

TEST_F(ArbiterTest, ApplyConfigAddsRemovesAndUpdates) {
    arbiter_->add_watcher(watcher_config("keep", 1));
    arbiter_->add_watcher(watcher_config("drop", 1));
    arbiter_->add_watcher(watcher_config("swap", 1));
    ASSERT_TRUE(arbiter_->start());
    
    auto keep = watcher_config("keep", 2);
    auto swap = watcher_config("swap", 1);
    swap.args = {"--new-flag"};
    auto fresh = watcher_config("fresh", 1);
    
    auto summary = arbiter_->apply_config({keep, swap, fresh});
    
    EXPECT_EQ(summary.removed, std::vector<std::string>{"drop"});
    EXPECT_EQ(summary.added, std::vector<std::string>{"fresh"});
    EXPECT_EQ(summary.updated, (std::vector<std::string>{"keep", "swap"}));
    EXPECT_EQ(summary.restarted, std::vector<std::string>{"swap"});
    
    EXPECT_EQ(arbiter_->watcher_count(), 3u);
    EXPECT_EQ(arbiter_->watcher_status("keep")->live_processes(), 2u);
    EXPECT_EQ(arbiter_->watcher_status("fresh")->live_processes(), 1u);
    EXPECT_EQ(spawner_.requests().back().command, "/usr/bin/fresh");
}

TEST_F(ArbiterTest, ApplyConfigValidatesFirst) {
    arbiter_->add_watcher(watcher_config("web", 1));
    auto broken = watcher_config("other", 1);
    broken.numprocesses = -3;
    
    EXPECT_THROW(arbiter_->apply_config({broken}), wardend::WardenError);
    EXPECT_EQ(arbiter_->watcher_names(), std::vector<std::string>{"web"});
}

TEST_F(ArbiterTest, ReloadJsonSummary) {
    auto summary = arbiter_->apply_config({watcher_config("web", 1)});
    auto j = summary.to_json();
    
    EXPECT_EQ(j["added"], wardend::json::array({"web"}));
    EXPECT_TRUE(j["removed"].empty());
}

// ============================================================================
// Ledger divergence
// ============================================================================

TEST(ArbiterDivergenceTest, DivergenceInvokesFatalHandler) {
    wardend::Logger::init(wardend::LogLevel::CRITICAL, false);
    {
        StuckMultiplexer multiplexer;
        wardend::HandlerRegistry registry(multiplexer);
        wardend::StreamRedirector redirector(registry);
        FakeSpawner spawner;
        wardend::Arbiter arbiter(spawner, redirector, registry);
    
        std::string reason;
        int fatal_calls = 0;
        arbiter.set_fatal_handler([&](const std::string& why) {
            reason = why;
            ++fatal_calls;
        });
    
        arbiter.add_watcher(watcher_config("web", 1));
        arbiter.start_watcher("web");
        arbiter.stop_watcher("web");
        ASSERT_EQ(registry.pending_count(), 2u);
    
        // The new pipes reuse the stuck descriptor numbers
        EXPECT_THROW(arbiter.start_watcher("web"), wardend::LedgerDivergence);
        EXPECT_EQ(fatal_calls, 1);
        EXPECT_FALSE(reason.empty());
        EXPECT_FALSE(arbiter.gate().is_held());
    }
    wardend::Logger::shutdown();
}

// ============================================================================
// Real processes
// ============================================================================

TEST(ArbiterProcessTest, KilledProcessIsReplaced) {
    wardend::Logger::init(wardend::LogLevel::CRITICAL, false);
    {
        wardend::EventLoop loop;
        wardend::HandlerRegistry registry(loop);
        wardend::StreamRedirector redirector(registry);
        wardend::PosixSpawner spawner;
        wardend::Arbiter arbiter(spawner, redirector, registry);
        wardend::Reconciler reconciler(arbiter, loop, 1000ms);
    
        wardend::WatcherConfig config;
        config.name = "sleeper";
        config.cmd = "/bin/sleep";
        config.args = {"30"};
        config.numprocesses = 2;
        config.graceful_timeout = 2000ms;
        arbiter.add_watcher(config);
        ASSERT_TRUE(arbiter.start());
    
        auto pids = arbiter.watcher_status("sleeper")->pids;
        ASSERT_EQ(pids.size(), 2u);
        ASSERT_EQ(kill(pids[0], SIGKILL), 0);
        std::this_thread::sleep_for(200ms);
    
        ASSERT_TRUE(reconciler.tick());
    
        auto after = arbiter.watcher_status("sleeper")->pids;
        ASSERT_EQ(after.size(), 2u);
        EXPECT_EQ(std::count(after.begin(), after.end(), pids[0]), 0);
        EXPECT_EQ(std::count(after.begin(), after.end(), pids[1]), 1);
    
        arbiter.stop();
        for (pid_t pid : after) {
            EXPECT_EQ(kill(pid, 0), -1);
            EXPECT_EQ(errno, ESRCH);
        }
        EXPECT_EQ(registry.size(), 0u);
    }
    wardend::Logger::shutdown();
}
