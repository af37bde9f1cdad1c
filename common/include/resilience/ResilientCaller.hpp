#pragma once

#include "resilience/CallResult.hpp"
#include "resilience/CircuitBreakerRegistry.hpp"
#include "resilience/RetryExecutor.hpp"
#include "resilience/Timeout.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace cafe::resilience {

/**
 * @brief Полный набор resilience-параметров одной зависимости
 */
struct DependencyPolicy {
    std::chrono::milliseconds timeout{2000};
    RetryPolicy retry{3, std::chrono::milliseconds(100), std::chrono::milliseconds(2000)};
    CircuitBreakerConfig breaker;
};

/**
 * @brief Композиция timeout → retry → circuit breaker для одной зависимости
 *
 * `breaker.call(retry(timeout(raw)))`:
 * - timeout оборачивает одну сырую попытку
 * - retry повторяет попытки с таймаутом
 * - breaker видит всю последовательность повторов как ОДИН исход,
 *   поэтому повторы одного логического вызова не открывают breaker раньше времени
 */
class ResilientCaller {
public:
    ResilientCaller(std::string dependency,
                    DependencyPolicy policy,
                    std::shared_ptr<CircuitBreakerRegistry> registry,
                    RetryExecutor::Sleeper sleeper = RetryExecutor::defaultSleeper())
        : dependency_(std::move(dependency))
        , timeout_(policy.timeout)
        , retry_(policy.retry, std::move(sleeper))
        , breaker_(registry->getOrCreate(dependency_, policy.breaker))
    {}

    /**
     * @param raw Одна попытка вызова. Может быть брошена по таймауту, поэтому
     *            должна владеть своими данными (захват по значению / shared_ptr).
     */
    template <typename T>
    CallResult<T> call(std::function<CallResult<T>()> raw) {
        const auto timeout = timeout_;
        return breaker_->call<T>([&]() {
            return retry_.execute<T>([&]() {
                return withTimeout<T>(timeout, raw);
            });
        });
    }

    const std::string& dependency() const { return dependency_; }
    std::chrono::milliseconds timeout() const { return timeout_; }
    const std::shared_ptr<CircuitBreaker>& breaker() const { return breaker_; }

private:
    std::string dependency_;
    std::chrono::milliseconds timeout_;
    RetryExecutor retry_;
    std::shared_ptr<CircuitBreaker> breaker_;
};

} // namespace cafe::resilience
