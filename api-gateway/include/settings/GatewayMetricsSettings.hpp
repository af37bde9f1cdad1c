#pragma once

#include "metrics/IMetricsSettings.hpp"
#include "resilience/FailureKind.hpp"
#include <string>
#include <vector>

namespace cafe::gateway::settings {

/**
 * @brief Метрики API gateway
 *
 * - http_requests_total{method,path}: входящие запросы
 * - backend_calls_total{dependency,outcome}: исходы вызовов backend'ов
 */
class GatewayMetricsSettings : public metrics::IMetricsSettings {
public:
    std::vector<metrics::MetricDefinition> getDefinitions() const override {
        return {
            {"http_requests_total", "Total HTTP requests", "counter"},
            {"backend_calls_total", "Backend calls by dependency and outcome", "counter"}
        };
    }

    std::vector<std::string> getAllKeys() const override {
        std::vector<std::string> keys = {
            "http_requests_total{method=\"GET\",path=\"/health\"}",
            "http_requests_total{method=\"GET\",path=\"/metrics\"}",
            "http_requests_total{method=\"GET\",path=\"/api/v1/users\"}",
            "http_requests_total{method=\"GET\",path=\"/api/v1/menu\"}",
            "http_requests_total{method=\"POST\",path=\"/api/v1/orders\"}",
            "http_requests_total{method=\"GET\",path=\"/api/v1/orders\"}"
        };

        for (const char* dependency : {"catalog", "orders", "users"}) {
            keys.push_back(backendKey(dependency, "OK"));
            for (auto kind : resilience::allFailureKinds()) {
                keys.push_back(backendKey(dependency, resilience::toString(kind)));
            }
        }
        return keys;
    }

private:
    static std::string backendKey(const std::string& dependency, const std::string& outcome) {
        return "backend_calls_total{dependency=\"" + dependency + "\",outcome=\"" + outcome + "\"}";
    }
};

} // namespace cafe::gateway::settings
