#pragma once

#include "resilience/CallResult.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

namespace cafe::resilience {

enum class CircuitState {
    CLOSED,
    OPEN,
    HALF_OPEN
};

inline std::string toString(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED: return "CLOSED";
        case CircuitState::OPEN: return "OPEN";
        case CircuitState::HALF_OPEN: return "HALF_OPEN";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Неизменяемая конфигурация breaker'а одной зависимости
 */
struct CircuitBreakerConfig {
    int failureThreshold = 3;                          ///< CLOSED → OPEN
    int successThreshold = 1;                          ///< HALF_OPEN → CLOSED
    std::chrono::milliseconds resetTimeout{30000};     ///< OPEN → HALF_OPEN
};

/**
 * @brief Circuit breaker для одной зависимости
 *
 * Машина состояний:
 * - CLOSED: вызовы проходят; failureThreshold подряд отказов → OPEN
 * - OPEN: вызовы сразу получают Failure(DependencyUnavailable), операция
 *   не вызывается; по истечении resetTimeout следующий вызов переводит в HALF_OPEN
 * - HALF_OPEN: successThreshold успехов → CLOSED; любой один отказ → OPEN
 *
 * Проверка состояния и запись результата: отдельные критические секции,
 * сама операция выполняется вне блокировки.
 *
 * NotFound / InvalidArgument: корректный ответ backend'а, записываются как успех.
 */
class CircuitBreaker {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    CircuitBreaker(std::string name, CircuitBreakerConfig config, Clock clock = defaultClock())
        : name_(std::move(name))
        , config_(config)
        , clock_(std::move(clock))
    {
        if (config_.failureThreshold < 1 || config_.successThreshold < 1) {
            throw std::invalid_argument("CircuitBreaker " + name_ + ": thresholds must be >= 1");
        }
    }

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    template <typename T>
    CallResult<T> call(const std::function<CallResult<T>()>& operation) {
        if (!tryAcquire()) {
            return CallResult<T>::failure(FailureKind::DependencyUnavailable,
                                          "service temporarily unavailable");
        }

        CallResult<T> result = operation();

        if (result.ok() || isClientError(result.kind())) {
            recordSuccess();
        } else {
            recordFailure();
        }
        return result;
    }

    /**
     * @brief Проверить, можно ли выполнять вызов
     *
     * В OPEN по истечении resetTimeout переводит в HALF_OPEN.
     */
    bool tryAcquire() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != CircuitState::OPEN) {
            return true;
        }
        if (clock_() - openedAt_ >= config_.resetTimeout) {
            transitionTo(CircuitState::HALF_OPEN);
            consecutiveSuccesses_ = 0;
            return true;
        }
        ++rejectedCalls_;
        return false;
    }

    void recordSuccess() {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (state_) {
            case CircuitState::CLOSED:
                consecutiveFailures_ = 0;
                break;
            case CircuitState::HALF_OPEN:
                ++consecutiveSuccesses_;
                if (consecutiveSuccesses_ >= config_.successThreshold) {
                    transitionTo(CircuitState::CLOSED);
                    consecutiveFailures_ = 0;
                    consecutiveSuccesses_ = 0;
                }
                break;
            case CircuitState::OPEN:
                // Вызов стартовал до открытия, его успех уже ничего не решает
                break;
        }
    }

    void recordFailure() {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (state_) {
            case CircuitState::CLOSED:
                ++consecutiveFailures_;
                if (consecutiveFailures_ >= config_.failureThreshold) {
                    open();
                }
                break;
            case CircuitState::HALF_OPEN:
                open();
                break;
            case CircuitState::OPEN:
                break;
        }
    }

    // ============================================
    // СОСТОЯНИЕ (для тестов, метрик, health)
    // ============================================

    CircuitState state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    int consecutiveFailures() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return consecutiveFailures_;
    }

    int consecutiveSuccesses() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return consecutiveSuccesses_;
    }

    /// Сколько раз breaker переходил в OPEN
    int64_t timesOpened() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return timesOpened_;
    }

    int64_t rejectedCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return rejectedCalls_;
    }

    const std::string& name() const { return name_; }
    const CircuitBreakerConfig& config() const { return config_; }

    static Clock defaultClock() {
        return [] { return std::chrono::steady_clock::now(); };
    }

private:
    const std::string name_;
    const CircuitBreakerConfig config_;
    Clock clock_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::CLOSED;
    int consecutiveFailures_ = 0;
    int consecutiveSuccesses_ = 0;
    std::chrono::steady_clock::time_point openedAt_{};
    int64_t timesOpened_ = 0;
    int64_t rejectedCalls_ = 0;

    // Вызывается под mutex_
    void open() {
        transitionTo(CircuitState::OPEN);
        openedAt_ = clock_();
        consecutiveSuccesses_ = 0;
        ++timesOpened_;
    }

    // Вызывается под mutex_
    void transitionTo(CircuitState next) {
        std::cout << "[CircuitBreaker:" << name_ << "] "
                  << toString(state_) << " -> " << toString(next) << std::endl;
        state_ = next;
    }
};

} // namespace cafe::resilience
