#pragma once

#include "discovery/IServiceResolver.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <map>
#include <string>

namespace cafe::discovery {

/**
 * @brief Статический resolver из переменных окружения (K8s ENV)
 *
 * Для сервиса "users" читает:
 * - USERS_SERVICE_HOST (default: задаётся в конструкторе)
 * - USERS_SERVICE_PORT
 *
 * Пустой host означает "нет живого инстанса".
 */
class EnvServiceResolver : public IServiceResolver {
public:
    /// defaults: имя сервиса -> адрес по умолчанию
    explicit EnvServiceResolver(std::map<std::string, ServiceAddress> defaults = {})
        : defaults_(std::move(defaults))
    {
        std::cout << "[EnvServiceResolver] Created with " << defaults_.size() << " defaults" << std::endl;
    }

    ServiceAddress resolve(const std::string& serviceName) override {
        std::string prefix = toEnvPrefix(serviceName);

        ServiceAddress address;
        auto it = defaults_.find(serviceName);
        if (it != defaults_.end()) {
            address = it->second;
        }

        if (const char* host = std::getenv((prefix + "_SERVICE_HOST").c_str())) {
            address.host = host;
        }
        if (const char* port = std::getenv((prefix + "_SERVICE_PORT").c_str())) {
            try {
                address.port = std::stoi(port);
            } catch (const std::exception&) {
                std::cerr << "[EnvServiceResolver] Invalid port for " << serviceName << ": " << port << std::endl;
                throw NoHealthyInstance(serviceName);
            }
        }

        if (address.host.empty() || address.port <= 0) {
            throw NoHealthyInstance(serviceName);
        }
        return address;
    }

    /// "catalog" -> "CATALOG", "order-service" -> "ORDER_SERVICE"
    static std::string toEnvPrefix(const std::string& serviceName) {
        std::string prefix = serviceName;
        std::transform(prefix.begin(), prefix.end(), prefix.begin(), [](unsigned char c) {
            return c == '-' ? '_' : static_cast<char>(std::toupper(c));
        });
        return prefix;
    }

private:
    const std::map<std::string, ServiceAddress> defaults_;
};

} // namespace cafe::discovery
