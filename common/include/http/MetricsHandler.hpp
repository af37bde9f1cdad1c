#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "metrics/IMetricsService.hpp"

#include <iostream>
#include <memory>

namespace cafe::http {

/**
 * @brief GET /metrics
 *
 * Content-Type: text/plain; version=0.0.4; charset=utf-8
 */
class MetricsHandler : public IHttpHandler {
public:
    explicit MetricsHandler(std::shared_ptr<metrics::IMetricsService> metrics)
        : metrics_(std::move(metrics))
    {
        std::cout << "[MetricsHandler] Created" << std::endl;
    }

    void handle(IRequest& /*req*/, IResponse& res) override {
        res.setStatus(200);
        res.setHeader("Content-Type", "text/plain; version=0.0.4; charset=utf-8");
        res.setBody(metrics_->toPrometheusFormat());
    }

private:
    std::shared_ptr<metrics::IMetricsService> metrics_;
};

} // namespace cafe::http
