#pragma once

#include "resilience/FailureKind.hpp"
#include <algorithm>
#include <chrono>
#include <functional>
#include <stdexcept>

namespace cafe::resilience {

/**
 * @brief Политика повторов (неизменяемое значение)
 *
 * Задержка перед k-м повтором (k с нуля, без jitter):
 * `min(maxDelay, baseDelay * 2^k)`.
 */
class RetryPolicy {
public:
    using Classifier = std::function<bool(FailureKind)>;

    RetryPolicy(int maxAttempts,
                std::chrono::milliseconds baseDelay,
                std::chrono::milliseconds maxDelay,
                Classifier retryable = &isTransient)
        : maxAttempts_(maxAttempts)
        , baseDelay_(baseDelay)
        , maxDelay_(maxDelay)
        , retryable_(std::move(retryable))
    {
        if (maxAttempts_ < 1) {
            throw std::invalid_argument("RetryPolicy: maxAttempts must be >= 1");
        }
        if (baseDelay_.count() < 0 || maxDelay_ < baseDelay_) {
            throw std::invalid_argument("RetryPolicy: require 0 <= baseDelay <= maxDelay");
        }
    }

    int maxAttempts() const { return maxAttempts_; }
    std::chrono::milliseconds baseDelay() const { return baseDelay_; }
    std::chrono::milliseconds maxDelay() const { return maxDelay_; }

    bool isRetryable(FailureKind kind) const { return retryable_(kind); }

    /**
     * @brief Задержка перед повтором с индексом attemptIndex (без jitter)
     */
    std::chrono::milliseconds backoffDelay(int attemptIndex) const {
        auto delay = baseDelay_;
        for (int i = 0; i < attemptIndex; ++i) {
            if (delay >= maxDelay_) {
                break;
            }
            delay *= 2;
        }
        return std::min(delay, maxDelay_);
    }

    /// Одна попытка, без повторов
    static RetryPolicy noRetry() {
        return RetryPolicy(1, std::chrono::milliseconds(0), std::chrono::milliseconds(0));
    }

private:
    int maxAttempts_;
    std::chrono::milliseconds baseDelay_;
    std::chrono::milliseconds maxDelay_;
    Classifier retryable_;
};

} // namespace cafe::resilience
