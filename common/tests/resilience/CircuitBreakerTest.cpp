/**
 * @file CircuitBreakerTest.cpp
 * @brief Машина состояний circuit breaker'а
 */

#include <gtest/gtest.h>

#include "resilience/CircuitBreaker.hpp"
#include "fakes/ManualClock.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace cafe;
using namespace cafe::resilience;
using std::chrono::milliseconds;

// ============================================================================
// Test Fixture
// ============================================================================

class CircuitBreakerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.failureThreshold = 3;
        config_.successThreshold = 2;
        config_.resetTimeout = milliseconds(1000);
        breaker_ = std::make_unique<CircuitBreaker>("catalog", config_, clock_.clock());
    }

    CallResult<int> callWith(FailureKind kind) {
        return breaker_->call<int>([this, kind] {
            ++invocations_;
            return CallResult<int>::failure(kind, "boom");
        });
    }

    CallResult<int> callOk() {
        return breaker_->call<int>([this] {
            ++invocations_;
            return CallResult<int>::success(42);
        });
    }

    void trip() {
        for (int i = 0; i < config_.failureThreshold; ++i) {
            callWith(FailureKind::Unavailable);
        }
        ASSERT_EQ(breaker_->state(), CircuitState::OPEN);
    }

    tests::ManualClock clock_;
    CircuitBreakerConfig config_;
    std::unique_ptr<CircuitBreaker> breaker_;
    int invocations_ = 0;
};

// ============================================================================
// ТЕСТЫ: CLOSED
// ============================================================================

TEST_F(CircuitBreakerTest, StartsClosed) {
    EXPECT_EQ(breaker_->state(), CircuitState::CLOSED);
    EXPECT_EQ(breaker_->consecutiveFailures(), 0);
    EXPECT_EQ(breaker_->timesOpened(), 0);
}

TEST_F(CircuitBreakerTest, Success_PassesResultThrough) {
    auto result = callOk();

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value(), 42);
    EXPECT_EQ(invocations_, 1);
}

TEST_F(CircuitBreakerTest, FailuresBelowThreshold_StayClosed) {
    callWith(FailureKind::Timeout);
    callWith(FailureKind::ConnectionRefused);

    EXPECT_EQ(breaker_->state(), CircuitState::CLOSED);
    EXPECT_EQ(breaker_->consecutiveFailures(), 2);
}

TEST_F(CircuitBreakerTest, SuccessResetsConsecutiveFailures) {
    callWith(FailureKind::Timeout);
    callWith(FailureKind::Timeout);
    callOk();
    callWith(FailureKind::Timeout);

    EXPECT_EQ(breaker_->state(), CircuitState::CLOSED);
    EXPECT_EQ(breaker_->consecutiveFailures(), 1);
}

TEST_F(CircuitBreakerTest, ClientErrors_AreNotCountedAsFailures) {
    for (int i = 0; i < 10; ++i) {
        callWith(FailureKind::NotFound);
        callWith(FailureKind::InvalidArgument);
    }

    EXPECT_EQ(breaker_->state(), CircuitState::CLOSED);
    EXPECT_EQ(breaker_->consecutiveFailures(), 0);
}

TEST_F(CircuitBreakerTest, InternalErrors_CountAsFailures) {
    for (int i = 0; i < config_.failureThreshold; ++i) {
        callWith(FailureKind::Internal);
    }

    EXPECT_EQ(breaker_->state(), CircuitState::OPEN);
}

// ============================================================================
// ТЕСТЫ: CLOSED -> OPEN
// ============================================================================

TEST_F(CircuitBreakerTest, NConsecutiveFailures_OpensExactlyOnce) {
    for (int n = 0; n < 10; ++n) {
        callWith(FailureKind::Unavailable);
    }

    EXPECT_EQ(breaker_->state(), CircuitState::OPEN);
    EXPECT_EQ(breaker_->timesOpened(), 1);
    EXPECT_EQ(invocations_, config_.failureThreshold);
}

TEST_F(CircuitBreakerTest, Open_ShortCircuitsWithoutInvokingOperation) {
    trip();
    invocations_ = 0;

    auto result = callOk();

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.kind(), FailureKind::DependencyUnavailable);
    EXPECT_EQ(invocations_, 0);
    EXPECT_EQ(breaker_->rejectedCalls(), 1);
}

TEST_F(CircuitBreakerTest, Open_MessageDoesNotMentionBreaker) {
    trip();

    auto result = callOk();

    EXPECT_EQ(result.message(), "service temporarily unavailable");
    EXPECT_EQ(result.message().find("breaker"), std::string::npos);
    EXPECT_EQ(result.message().find("circuit"), std::string::npos);
}

TEST_F(CircuitBreakerTest, Open_BeforeResetTimeout_StillRejects) {
    trip();
    clock_.advance(milliseconds(999));

    auto result = callOk();

    EXPECT_EQ(result.kind(), FailureKind::DependencyUnavailable);
    EXPECT_EQ(breaker_->state(), CircuitState::OPEN);
}

// ============================================================================
// ТЕСТЫ: OPEN -> HALF_OPEN -> CLOSED / OPEN
// ============================================================================

TEST_F(CircuitBreakerTest, AfterResetTimeout_TrialCallIsExecuted) {
    trip();
    invocations_ = 0;
    clock_.advance(milliseconds(1000));

    auto result = callOk();

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(invocations_, 1);
    EXPECT_EQ(breaker_->state(), CircuitState::HALF_OPEN);
    EXPECT_EQ(breaker_->consecutiveSuccesses(), 1);
}

TEST_F(CircuitBreakerTest, HalfOpen_SuccessThresholdReached_Closes) {
    trip();
    clock_.advance(milliseconds(1000));

    callOk();
    callOk();

    EXPECT_EQ(breaker_->state(), CircuitState::CLOSED);
    EXPECT_EQ(breaker_->consecutiveFailures(), 0);
}

TEST_F(CircuitBreakerTest, HalfOpen_SingleFailure_ReopensRegardlessOfSuccesses) {
    config_.successThreshold = 5;
    breaker_ = std::make_unique<CircuitBreaker>("catalog", config_, clock_.clock());
    trip();
    clock_.advance(milliseconds(1000));

    callOk();
    callOk();
    callOk();
    ASSERT_EQ(breaker_->state(), CircuitState::HALF_OPEN);

    callWith(FailureKind::Timeout);

    EXPECT_EQ(breaker_->state(), CircuitState::OPEN);
    EXPECT_EQ(breaker_->timesOpened(), 2);
}

TEST_F(CircuitBreakerTest, Reopened_WaitsFullResetTimeoutAgain) {
    trip();
    clock_.advance(milliseconds(1000));
    callWith(FailureKind::Timeout);
    ASSERT_EQ(breaker_->state(), CircuitState::OPEN);

    clock_.advance(milliseconds(500));
    EXPECT_EQ(callOk().kind(), FailureKind::DependencyUnavailable);

    clock_.advance(milliseconds(500));
    EXPECT_TRUE(callOk().ok());
}

TEST_F(CircuitBreakerTest, ResultRecordedWhileOpen_IsIgnored) {
    trip();

    breaker_->recordSuccess();
    breaker_->recordFailure();

    EXPECT_EQ(breaker_->state(), CircuitState::OPEN);
    EXPECT_EQ(breaker_->timesOpened(), 1);
}

// ============================================================================
// ТЕСТЫ: конфигурация и многопоточность
// ============================================================================

TEST_F(CircuitBreakerTest, InvalidThreshold_Throws) {
    CircuitBreakerConfig bad;
    bad.failureThreshold = 0;

    EXPECT_THROW(CircuitBreaker("users", bad), std::invalid_argument);
}

TEST_F(CircuitBreakerTest, ConcurrentFailures_OpenExactlyOnce) {
    config_.failureThreshold = 5;
    breaker_ = std::make_unique<CircuitBreaker>("users", config_, clock_.clock());

    std::vector<std::thread> threads;
    std::atomic<int> executed{0};
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this, &executed] {
            for (int i = 0; i < 50; ++i) {
                breaker_->call<int>([&executed] {
                    ++executed;
                    return CallResult<int>::failure(FailureKind::Unavailable, "down");
                });
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(breaker_->state(), CircuitState::OPEN);
    EXPECT_EQ(breaker_->timesOpened(), 1);
    EXPECT_EQ(executed.load() + breaker_->rejectedCalls(), 8 * 50);
}
