#pragma once

#include "resilience/CallResult.hpp"
#include "resilience/RetryPolicy.hpp"
#include <chrono>
#include <functional>
#include <random>
#include <thread>

namespace cafe::resilience {

/**
 * @brief Исполнитель повторов с экспоненциальной задержкой и jitter
 *
 * Алгоритм:
 * - Success → сразу вернуть
 * - Failure с неповторяемым видом → вернуть как есть (одна попытка)
 * - Failure с повторяемым видом → пауза backoffDelay(k) + jitter [0, delay/2),
 *   затем снова; после maxAttempts вернуть последнюю Failure без изменений
 *
 * Пауза усыпляет только вызывающий поток. Sleeper подменяется в тестах.
 */
class RetryExecutor {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit RetryExecutor(RetryPolicy policy, Sleeper sleeper = defaultSleeper())
        : policy_(std::move(policy))
        , sleeper_(std::move(sleeper))
    {}

    template <typename T>
    CallResult<T> execute(const std::function<CallResult<T>()>& operation) const {
        for (int attempt = 0; ; ++attempt) {
            CallResult<T> result = operation();
            if (result.ok()) {
                return result;
            }
            if (!policy_.isRetryable(result.kind()) || attempt + 1 >= policy_.maxAttempts()) {
                return result;
            }
            sleeper_(withJitter(policy_.backoffDelay(attempt)));
        }
    }

    const RetryPolicy& policy() const { return policy_; }

    /// delay + случайное значение из [0, delay/2)
    static std::chrono::milliseconds withJitter(std::chrono::milliseconds delay) {
        auto half = delay.count() / 2;
        if (half <= 0) {
            return delay;
        }
        thread_local std::mt19937_64 rng(std::random_device{}());
        std::uniform_int_distribution<long long> dist(0, half - 1);
        return delay + std::chrono::milliseconds(dist(rng));
    }

    static Sleeper defaultSleeper() {
        return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }

private:
    RetryPolicy policy_;
    Sleeper sleeper_;
};

/**
 * @brief Сокращение для одного вызова с политикой
 */
template <typename T>
CallResult<T> withRetry(const RetryPolicy& policy, const std::function<CallResult<T>()>& operation) {
    return RetryExecutor(policy).execute<T>(operation);
}

} // namespace cafe::resilience
