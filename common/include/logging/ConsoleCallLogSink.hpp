#pragma once

#include "logging/ICallLogSink.hpp"
#include "metrics/IMetricsService.hpp"
#include <iostream>
#include <memory>
#include <mutex>

namespace cafe::logging {

/**
 * @brief Журнал вызовов в stdout + счётчик backend_calls_total{dependency,outcome}
 *
 * [CallLog] dependency=catalog operation=getCatalogItem outcome=TIMEOUT latency_ms=2004
 */
class ConsoleCallLogSink : public ICallLogSink {
public:
    explicit ConsoleCallLogSink(std::shared_ptr<metrics::IMetricsService> metrics)
        : metrics_(std::move(metrics))
    {}

    void record(const CallRecord& call) override {
        {
            std::lock_guard<std::mutex> lock(outMutex_);
            std::cout << "[CallLog] dependency=" << call.dependency
                      << " operation=" << call.operation
                      << " outcome=" << call.outcome
                      << " latency_ms=" << call.latency.count() << std::endl;
        }
        metrics_->increment("backend_calls_total", {
            {"dependency", call.dependency},
            {"outcome", call.outcome}
        });
    }

private:
    std::shared_ptr<metrics::IMetricsService> metrics_;
    std::mutex outMutex_;  // строки разных запросов не перемешиваются
};

} // namespace cafe::logging
