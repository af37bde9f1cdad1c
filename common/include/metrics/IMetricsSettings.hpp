#pragma once

#include <string>
#include <vector>

namespace cafe::metrics {

/**
 * @brief Определение метрики: имя, описание и тип (для HELP и TYPE)
 */
struct MetricDefinition {
    std::string name;   ///< Имя метрики (например, "http_requests_total")
    std::string help;   ///< Описание для HELP
    std::string type;   ///< "counter"
};

/**
 * @brief Настройки метрик сервиса
 *
 * Каждый сервис перечисляет свои метрики и ключи заранее: они
 * инициализируются нулями и всегда присутствуют в выводе /metrics.
 * Ключи, появившиеся во время работы (новые labels), выводятся после них.
 */
class IMetricsSettings {
public:
    virtual ~IMetricsSettings() = default;

    virtual std::vector<MetricDefinition> getDefinitions() const = 0;

    /**
     * @return Ключи в формате "metric_name{label1=\"value1\"}"
     */
    virtual std::vector<std::string> getAllKeys() const = 0;
};

} // namespace cafe::metrics
