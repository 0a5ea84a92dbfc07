/**
 * @file test_command_gate.cpp
 * @brief Unit tests for CommandGate and GateToken
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include "wardend/core/command_gate.h"
#include "wardend/errors.h"
#include "wardend/logger.h"

using namespace std::chrono_literals;

class CommandGateTest : public ::testing::Test {
protected:
    void SetUp() override {
        wardend::Logger::init(wardend::LogLevel::ERROR, false);
    }
    
    void TearDown() override {
        wardend::Logger::shutdown();
    }
    
    wardend::CommandGate gate_;
};

// ============================================================================
// Basic acquisition
// ============================================================================

TEST_F(CommandGateTest, IdleGateHasNoActiveCommand) {
    EXPECT_FALSE(gate_.is_held());
    EXPECT_EQ(gate_.active_command(), "");
}

TEST_F(CommandGateTest, AcquireRecordsActiveCommand) {
    auto token = gate_.acquire("start");
    
    EXPECT_TRUE(token.held());
    EXPECT_FALSE(token.nested());
    EXPECT_EQ(token.command(), "start");
    EXPECT_TRUE(gate_.is_held());
    EXPECT_TRUE(gate_.held_by_current_thread());
    EXPECT_EQ(gate_.active_command(), "start");
}

TEST_F(CommandGateTest, TokenDestructionFreesGate) {
    {
        auto token = gate_.acquire("stop");
        EXPECT_TRUE(gate_.is_held());
    }
    EXPECT_FALSE(gate_.is_held());
    EXPECT_EQ(gate_.active_command(), "");
}

TEST_F(CommandGateTest, ExplicitReleaseFreesGate) {
    auto token = gate_.acquire("stop");
    token.release();
    
    EXPECT_FALSE(token.held());
    EXPECT_FALSE(gate_.is_held());
    
    // Second release is a no-op
    token.release();
    EXPECT_FALSE(gate_.is_held());
}

TEST_F(CommandGateTest, MovedTokenKeepsGateHeld) {
    auto token = gate_.acquire("restart");
    wardend::GateToken moved = std::move(token);
    
    EXPECT_FALSE(token.held());
    EXPECT_TRUE(moved.held());
    EXPECT_TRUE(gate_.is_held());
    
    moved.release();
    EXPECT_FALSE(gate_.is_held());
}

TEST_F(CommandGateTest, AcquisitionsAreCounted) {
    gate_.acquire("start").release();
    gate_.acquire("stop").release();
    EXPECT_EQ(gate_.acquisitions(), 2u);
}

// ============================================================================
// Nesting on the owning thread
// ============================================================================

TEST_F(CommandGateTest, OwnerThreadMayNest) {
    auto outer = gate_.acquire("start");
    auto inner = gate_.acquire("stop");
    
    EXPECT_TRUE(inner.held());
    EXPECT_TRUE(inner.nested());
    // The outermost command stays the reported one
    EXPECT_EQ(gate_.active_command(), "start");
    
    inner.release();
    EXPECT_TRUE(gate_.is_held());
    EXPECT_EQ(gate_.active_command(), "start");
    
    outer.release();
    EXPECT_FALSE(gate_.is_held());
}

TEST_F(CommandGateTest, GateFreeOnlyAfterEveryTokenReleased) {
    auto outer = gate_.acquire("start");
    auto inner = gate_.acquire("incr");
    
    outer.release();
    EXPECT_TRUE(gate_.is_held());
    
    inner.release();
    EXPECT_FALSE(gate_.is_held());
    EXPECT_EQ(gate_.active_command(), "");
}

// ============================================================================
// Contention
// ============================================================================

TEST_F(CommandGateTest, OtherThreadGetsBusyImmediately) {
    auto token = gate_.acquire("start");
    
    std::string message;
    std::string active;
    std::thread other([&] {
        try {
            gate_.acquire("stop");
        } catch (const wardend::GateBusy& e) {
            message = e.what();
            active = e.active_command();
        }
    });
    other.join();
    
    EXPECT_EQ(message, "cannot run stop: already running start command");
    EXPECT_EQ(active, "start");
    EXPECT_EQ(gate_.busy_rejections(), 1u);
    EXPECT_EQ(gate_.active_command(), "start");
}

TEST_F(CommandGateTest, BoundedWaitSucceedsOnceHolderFinishes) {
    auto token = gate_.acquire("start");
    
    std::atomic<bool> acquired{false};
    std::thread waiter([&] {
        auto mine = gate_.acquire("stop", 2000ms);
        acquired = gate_.active_command() == "stop";
    });
    
    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(acquired.load());
    token.release();
    waiter.join();
    
    EXPECT_TRUE(acquired.load());
    EXPECT_FALSE(gate_.is_held());
}

TEST_F(CommandGateTest, BoundedWaitGivesUp) {
    auto token = gate_.acquire("start");
    
    bool busy = false;
    std::chrono::steady_clock::duration waited{};
    std::thread waiter([&] {
        auto begin = std::chrono::steady_clock::now();
        try {
            gate_.acquire("stop", 100ms);
        } catch (const wardend::GateBusy&) {
            busy = true;
        }
        waited = std::chrono::steady_clock::now() - begin;
    });
    waiter.join();
    
    EXPECT_TRUE(busy);
    EXPECT_GE(waited, 100ms);
    EXPECT_LT(waited, 2000ms);
}

TEST_F(CommandGateTest, BusyLeavesHolderUndisturbed) {
    auto token = gate_.acquire("reload");
    
    std::thread other([&] {
        EXPECT_THROW(gate_.acquire("reconcile"), wardend::GateBusy);
    });
    other.join();
    
    EXPECT_TRUE(token.held());
    EXPECT_TRUE(gate_.held_by_current_thread());
    EXPECT_EQ(gate_.active_command(), "reload");
}

TEST_F(CommandGateTest, CommandsNeverOverlap) {
    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};
    std::atomic<int> completed{0};
    
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 50; ++i) {
                auto token = gate_.acquire("cmd" + std::to_string(t), 5000ms);
                int now = ++inside;
                int seen = max_inside.load();
                while (now > seen && !max_inside.compare_exchange_weak(seen, now)) {
                }
                std::this_thread::yield();
                --inside;
                ++completed;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    
    EXPECT_EQ(max_inside.load(), 1);
    EXPECT_EQ(completed.load(), 400);
    EXPECT_FALSE(gate_.is_held());
}
