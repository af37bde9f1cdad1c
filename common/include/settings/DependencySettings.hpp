#pragma once

#include "resilience/ResilientCaller.hpp"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>

namespace cafe::settings {

/**
 * @brief Resilience-настройки одной зависимости
 *
 * Читает из ENV с префиксом зависимости (например, USERS):
 * - USERS_TIMEOUT_MS
 * - USERS_RETRY_MAX_ATTEMPTS
 * - USERS_RETRY_BASE_DELAY_MS
 * - USERS_RETRY_MAX_DELAY_MS
 * - USERS_BREAKER_FAILURE_THRESHOLD
 * - USERS_BREAKER_SUCCESS_THRESHOLD
 * - USERS_BREAKER_RESET_TIMEOUT_MS
 *
 * @throws std::invalid_argument при нечисловом значении (ошибка старта)
 */
class DependencySettings {
public:
    struct Defaults {
        int timeoutMs = 2000;
        int maxAttempts = 3;
        int baseDelayMs = 100;
        int maxDelayMs = 2000;
        int failureThreshold = 3;
        int successThreshold = 1;
        int resetTimeoutMs = 30000;
    };

    DependencySettings(std::string serviceName, const std::string& envPrefix, const Defaults& defaults)
        : serviceName_(std::move(serviceName))
        , policy_(readPolicy(envPrefix, defaults))
    {
        std::cout << "[DependencySettings] " << serviceName_
                  << ": timeout=" << policy_.timeout.count() << "ms"
                  << " attempts=" << policy_.retry.maxAttempts()
                  << " breaker=" << policy_.breaker.failureThreshold << "/"
                  << policy_.breaker.resetTimeout.count() << "ms" << std::endl;
    }

    DependencySettings(std::string serviceName, resilience::DependencyPolicy policy)
        : serviceName_(std::move(serviceName))
        , policy_(std::move(policy))
    {}

    virtual ~DependencySettings() = default;

    /// Имя сервиса для discovery и имя breaker'а
    const std::string& getServiceName() const { return serviceName_; }

    const resilience::DependencyPolicy& getPolicy() const { return policy_; }

private:
    std::string serviceName_;
    resilience::DependencyPolicy policy_;

    static resilience::DependencyPolicy readPolicy(const std::string& prefix, const Defaults& d) {
        resilience::DependencyPolicy policy;
        policy.timeout = std::chrono::milliseconds(getIntOrDefault(prefix + "_TIMEOUT_MS", d.timeoutMs));
        policy.retry = resilience::RetryPolicy(
            getIntOrDefault(prefix + "_RETRY_MAX_ATTEMPTS", d.maxAttempts),
            std::chrono::milliseconds(getIntOrDefault(prefix + "_RETRY_BASE_DELAY_MS", d.baseDelayMs)),
            std::chrono::milliseconds(getIntOrDefault(prefix + "_RETRY_MAX_DELAY_MS", d.maxDelayMs)));
        policy.breaker.failureThreshold = getIntOrDefault(prefix + "_BREAKER_FAILURE_THRESHOLD", d.failureThreshold);
        policy.breaker.successThreshold = getIntOrDefault(prefix + "_BREAKER_SUCCESS_THRESHOLD", d.successThreshold);
        policy.breaker.resetTimeout = std::chrono::milliseconds(
            getIntOrDefault(prefix + "_BREAKER_RESET_TIMEOUT_MS", d.resetTimeoutMs));
        return policy;
    }

    static int getIntOrDefault(const std::string& name, int defaultValue) {
        const char* value = std::getenv(name.c_str());
        return value ? std::stoi(value) : defaultValue;
    }
};

/**
 * @brief Users backend: быстрый lookup, короткий дедлайн
 */
class UsersClientSettings : public DependencySettings {
public:
    UsersClientSettings() : DependencySettings("users", "USERS", Defaults{}) {}
    explicit UsersClientSettings(resilience::DependencyPolicy policy)
        : DependencySettings("users", std::move(policy)) {}
};

/**
 * @brief Catalog (menu) backend: быстрый lookup, короткий дедлайн
 */
class CatalogClientSettings : public DependencySettings {
public:
    CatalogClientSettings() : DependencySettings("catalog", "CATALOG", Defaults{}) {}
    explicit CatalogClientSettings(resilience::DependencyPolicy policy)
        : DependencySettings("catalog", std::move(policy)) {}
};

/**
 * @brief Orders backend: многошаговая запись, дедлайн длиннее
 *
 * order-service последовательно вызывает users, затем catalog, каждый со
 * своими повторами. При значениях по умолчанию это до
 * 2 * (3 * 2000 + 1.5 * (100 + 200)) = 12900 ms, поэтому ORDERS_TIMEOUT_MS
 * должен быть больше, иначе gateway повторяет ещё выполняющийся запрос.
 */
class OrdersClientSettings : public DependencySettings {
public:
    OrdersClientSettings() : DependencySettings("orders", "ORDERS", ordersDefaults()) {}
    explicit OrdersClientSettings(resilience::DependencyPolicy policy)
        : DependencySettings("orders", std::move(policy)) {}

private:
    static Defaults ordersDefaults() {
        Defaults d;
        d.timeoutMs = 15000;
        return d;
    }
};

} // namespace cafe::settings
