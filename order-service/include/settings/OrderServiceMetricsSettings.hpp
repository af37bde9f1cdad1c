#pragma once

#include "metrics/IMetricsSettings.hpp"
#include <string>
#include <vector>

namespace cafe::orders::settings {

/**
 * @brief Метрики order-service
 */
class OrderServiceMetricsSettings : public metrics::IMetricsSettings {
public:
    std::vector<metrics::MetricDefinition> getDefinitions() const override {
        return {
            {"http_requests_total", "Total HTTP requests", "counter"},
            {"orders_created_total", "Total orders created", "counter"},
            {"orders_rejected_total", "Total orders rejected", "counter"}
        };
    }

    std::vector<std::string> getAllKeys() const override {
        return {
            "http_requests_total{method=\"GET\",path=\"/health\"}",
            "http_requests_total{method=\"GET\",path=\"/metrics\"}",
            "http_requests_total{method=\"POST\",path=\"/api/v1/orders\"}",
            "http_requests_total{method=\"GET\",path=\"/api/v1/orders\"}",

            "orders_created_total",
            "orders_rejected_total{reason=\"INVALID_ARGUMENT\"}",
            "orders_rejected_total{reason=\"UNAVAILABLE\"}",
            "orders_rejected_total{reason=\"INTERNAL\"}"
        };
    }
};

} // namespace cafe::orders::settings
