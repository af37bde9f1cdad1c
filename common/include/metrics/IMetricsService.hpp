#pragma once

#include <map>
#include <string>

namespace cafe::metrics {

/**
 * @brief Интерфейс сервиса метрик
 *
 * Counter метрики с опциональными labels, сериализация в формат Prometheus.
 *
 * @example
 * ```cpp
 * metrics->increment("backend_calls_total", {
 *     {"dependency", "catalog"},
 *     {"outcome", "TIMEOUT"}
 * });
 * std::string output = metrics->toPrometheusFormat();
 * ```
 */
class IMetricsService {
public:
    virtual ~IMetricsService() = default;

    /**
     * @brief Инкрементировать счётчик
     *
     * Ключ метрики: name{label1="value1",label2="value2"} (labels по алфавиту).
     * Несуществующий ключ создаётся со значением 1.
     */
    virtual void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) = 0;

    /**
     * @brief Prometheus text format (version 0.0.4)
     */
    virtual std::string toPrometheusFormat() const = 0;
};

} // namespace cafe::metrics
