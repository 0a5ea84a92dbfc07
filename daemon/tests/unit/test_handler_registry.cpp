/**
 * @file test_handler_registry.cpp
 * @brief Unit tests for HandlerRegistry
 */

#include <gtest/gtest.h>
#include <map>
#include <stdexcept>
#include <fcntl.h>
#include <unistd.h>
#include "wardend/core/event_loop.h"
#include "wardend/core/handler_registry.h"
#include "wardend/errors.h"
#include "wardend/logger.h"

/**
 * @brief Multiplexer whose failures can be scripted
 */
class ScriptedMultiplexer : public wardend::IoMultiplexer {
public:
    void add_handler(int fd, wardend::IoHandler handler, uint32_t /*events*/) override {
        if (refuse_adds) {
            throw std::runtime_error("add refused");
        }
        if (bindings.count(fd)) {
            throw std::invalid_argument("fd " + std::to_string(fd) + " added twice");
        }
        bindings[fd] = std::move(handler);
    }
    
    void replace_handler(int fd, wardend::IoHandler handler, uint32_t /*events*/) override {
        if (refuse_replaces) {
            throw std::runtime_error("replace refused");
        }
        bindings[fd] = std::move(handler);
    }
    
    void remove_handler(int fd) override {
        ++removals;
        if (silent_removal_failures > 0) {
            // Reports nothing, keeps the binding
            --silent_removal_failures;
            return;
        }
        auto it = bindings.find(fd);
        if (it == bindings.end()) {
            throw std::out_of_range("fd " + std::to_string(fd) + " not registered");
        }
        bindings.erase(it);
        if (throw_after_removal) {
            throw std::runtime_error("late error");
        }
    }
    
    bool has_handler(int fd) const override {
        return bindings.count(fd) > 0;
    }
    
    void fire(int fd) {
        bindings.at(fd)(fd, wardend::IoEvents::READ);
    }
    
    std::map<int, wardend::IoHandler> bindings;
    int silent_removal_failures = 0;
    bool throw_after_removal = false;
    bool refuse_adds = false;
    bool refuse_replaces = false;
    int removals = 0;
};

class HandlerRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        wardend::Logger::init(wardend::LogLevel::CRITICAL, false);
    }
    
    void TearDown() override {
        wardend::Logger::shutdown();
    }
    
    ScriptedMultiplexer loop_;
    wardend::HandlerRegistry registry_{loop_};
};

// ============================================================================
// Normal operation
// ============================================================================

TEST_F(HandlerRegistryTest, RegisterBindsInLoop) {
    registry_.register_fd(7, [](int, uint32_t) {});
    
    EXPECT_TRUE(registry_.is_registered(7));
    EXPECT_FALSE(registry_.is_pending(7));
    EXPECT_TRUE(loop_.has_handler(7));
    EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(HandlerRegistryTest, DoubleRegisterIsConflict) {
    int first = 0;
    registry_.register_fd(7, [&](int, uint32_t) { ++first; });
    
    try {
        registry_.register_fd(7, [](int, uint32_t) {});
        FAIL() << "expected RegistrationConflict";
    } catch (const wardend::RegistrationConflict& e) {
        EXPECT_EQ(e.fd(), 7);
        EXPECT_EQ(std::string(e.what()), "fd 7 already registered");
    }
    
    // Original binding untouched
    loop_.fire(7);
    EXPECT_EQ(first, 1);
}

TEST_F(HandlerRegistryTest, UnregisterRemovesEverywhere) {
    registry_.register_fd(7, [](int, uint32_t) {});
    
    EXPECT_TRUE(registry_.unregister_fd(7));
    EXPECT_FALSE(registry_.is_registered(7));
    EXPECT_FALSE(loop_.has_handler(7));
}

TEST_F(HandlerRegistryTest, UnregisterUnknownReturnsFalse) {
    EXPECT_FALSE(registry_.unregister_fd(42));
    EXPECT_EQ(loop_.removals, 0);
}

TEST_F(HandlerRegistryTest, DescriptorsListsLedger) {
    registry_.register_fd(3, [](int, uint32_t) {});
    registry_.register_fd(5, [](int, uint32_t) {});
    
    auto fds = registry_.descriptors();
    ASSERT_EQ(fds.size(), 2u);
    EXPECT_EQ(fds[0], 3);
    EXPECT_EQ(fds[1], 5);
}

// ============================================================================
// Removal verification
// ============================================================================

TEST_F(HandlerRegistryTest, RemovalErrorAfterSuccessIsStillSuccess) {
    registry_.register_fd(7, [](int, uint32_t) {});
    loop_.throw_after_removal = true;
    
    EXPECT_TRUE(registry_.unregister_fd(7));
    EXPECT_FALSE(registry_.is_registered(7));
}

TEST_F(HandlerRegistryTest, SilentRemovalFailureKeepsEntryPending) {
    registry_.register_fd(7, [](int, uint32_t) {});
    loop_.silent_removal_failures = 1;
    
    EXPECT_FALSE(registry_.unregister_fd(7));
    EXPECT_TRUE(registry_.is_registered(7));
    EXPECT_TRUE(registry_.is_pending(7));
    EXPECT_EQ(registry_.pending_count(), 1u);
    EXPECT_TRUE(loop_.has_handler(7));
}

TEST_F(HandlerRegistryTest, RetryPendingClearsOnceLoopCooperates) {
    registry_.register_fd(7, [](int, uint32_t) {});
    registry_.register_fd(8, [](int, uint32_t) {});
    loop_.silent_removal_failures = 1;
    ASSERT_FALSE(registry_.unregister_fd(7));
    
    EXPECT_EQ(registry_.retry_pending(), 1u);
    EXPECT_FALSE(registry_.is_registered(7));
    EXPECT_FALSE(loop_.has_handler(7));
    // Live entries are not touched
    EXPECT_TRUE(registry_.is_registered(8));
    EXPECT_TRUE(loop_.has_handler(8));
}

// ============================================================================
// Descriptor reuse
// ============================================================================

TEST_F(HandlerRegistryTest, ReusedPendingDescriptorRegistersFresh) {
    registry_.register_fd(7, [](int, uint32_t) {});
    loop_.silent_removal_failures = 1;
    ASSERT_FALSE(registry_.unregister_fd(7));
    
    int fresh = 0;
    EXPECT_NO_THROW(registry_.register_fd(7, [&](int, uint32_t) { ++fresh; }));
    EXPECT_FALSE(registry_.is_pending(7));
    
    loop_.fire(7);
    EXPECT_EQ(fresh, 1);
}

TEST_F(HandlerRegistryTest, StuckPendingDescriptorIsOverwritten) {
    int stale = 0;
    registry_.register_fd(7, [&](int, uint32_t) { ++stale; });
    loop_.silent_removal_failures = 2;
    ASSERT_FALSE(registry_.unregister_fd(7));
    
    int fresh = 0;
    EXPECT_NO_THROW(registry_.register_fd(7, [&](int, uint32_t) { ++fresh; }));
    EXPECT_TRUE(registry_.is_registered(7));
    EXPECT_FALSE(registry_.is_pending(7));
    
    loop_.fire(7);
    EXPECT_EQ(fresh, 1);
    EXPECT_EQ(stale, 0);
}

TEST_F(HandlerRegistryTest, UnrecordedLoopBindingIsOverwritten) {
    int stale = 0;
    loop_.bindings[7] = [&](int, uint32_t) { ++stale; };
    
    int fresh = 0;
    EXPECT_NO_THROW(registry_.register_fd(7, [&](int, uint32_t) { ++fresh; }));
    EXPECT_TRUE(registry_.is_registered(7));
    
    loop_.fire(7);
    EXPECT_EQ(fresh, 1);
    EXPECT_EQ(stale, 0);
}

TEST_F(HandlerRegistryTest, AddFailureWithoutBindingPropagates) {
    loop_.refuse_adds = true;
    
    EXPECT_THROW(registry_.register_fd(7, [](int, uint32_t) {}), wardend::WardenError);
    EXPECT_FALSE(registry_.is_registered(7));
}

TEST_F(HandlerRegistryTest, FailedOverwriteIsDivergence) {
    loop_.bindings[7] = [](int, uint32_t) {};
    loop_.refuse_replaces = true;
    
    EXPECT_THROW(registry_.register_fd(7, [](int, uint32_t) {}), wardend::LedgerDivergence);
}

// ============================================================================
// Real event loop with OS descriptor reuse
// ============================================================================

TEST(HandlerRegistryLoopTest, DescriptorNumbersReusedAcrossCycles) {
    wardend::Logger::init(wardend::LogLevel::CRITICAL, false);
    wardend::EventLoop loop;
    wardend::HandlerRegistry registry(loop);
    
    int first_fd = -1;
    for (int cycle = 0; cycle < 4; ++cycle) {
        int fds[2];
        ASSERT_EQ(pipe2(fds, O_CLOEXEC), 0);
        if (cycle == 0) {
            first_fd = fds[0];
        } else {
            // The kernel hands back the lowest free numbers
            EXPECT_EQ(fds[0], first_fd);
        }
        
        EXPECT_NO_THROW(registry.register_fd(fds[0], [](int, uint32_t) {}));
        EXPECT_TRUE(loop.has_handler(fds[0]));
        EXPECT_TRUE(registry.unregister_fd(fds[0]));
        
        close(fds[0]);
        close(fds[1]);
    }
    
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(loop.handler_count(), 0u);
    wardend::Logger::shutdown();
}
