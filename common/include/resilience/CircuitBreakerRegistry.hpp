#pragma once

#include "resilience/CircuitBreaker.hpp"
#include <ThreadSafeMap.hpp>
#include <memory>
#include <string>
#include <vector>
#include <iostream>

namespace cafe::resilience {

/**
 * @brief Реестр circuit breaker'ов: имя зависимости -> breaker
 *
 * Один на процесс, передаётся каждому адаптеру через конструктор (DI),
 * а не глобальная переменная. В тестах: свежий реестр на каждый тест.
 *
 * Breaker создаётся при первом обращении и живёт до конца процесса;
 * конфигурация первого обращения фиксируется навсегда.
 */
class CircuitBreakerRegistry {
public:
    explicit CircuitBreakerRegistry(CircuitBreaker::Clock clock = CircuitBreaker::defaultClock())
        : clock_(std::move(clock))
    {}

    std::shared_ptr<CircuitBreaker> getOrCreate(const std::string& dependency,
                                                const CircuitBreakerConfig& config) {
        return breakers_.findOrInsert(dependency, [&]() {
            std::cout << "[CircuitBreakerRegistry] Registered breaker for " << dependency
                      << " (failures=" << config.failureThreshold
                      << ", successes=" << config.successThreshold
                      << ", reset=" << config.resetTimeout.count() << "ms)" << std::endl;
            return std::make_shared<CircuitBreaker>(dependency, config, clock_);
        });
    }

    std::shared_ptr<CircuitBreaker> find(const std::string& dependency) const {
        return breakers_.find(dependency);
    }

    struct Snapshot {
        std::string dependency;
        CircuitState state;
        int consecutiveFailures;
        int64_t timesOpened;
    };

    std::vector<Snapshot> snapshot() const {
        std::vector<Snapshot> result;
        breakers_.forEach([&result](const std::string& name, const std::shared_ptr<CircuitBreaker>& b) {
            result.push_back({name, b->state(), b->consecutiveFailures(), b->timesOpened()});
        });
        return result;
    }

private:
    CircuitBreaker::Clock clock_;
    ThreadSafeMap<std::string, CircuitBreaker> breakers_;
};

} // namespace cafe::resilience
