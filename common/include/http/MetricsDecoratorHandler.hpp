#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "metrics/IMetricsService.hpp"

#include <iostream>
#include <memory>
#include <string>

namespace cafe::http {

/**
 * @brief Декоратор: считает http_requests_total{method,path} и делегирует
 *
 * Path нормализуется, чтобы ID не плодили ключи:
 * - /api/v1/orders/ord-xxx -> /api/v1/orders
 * - /api/v1/menu/espresso  -> /api/v1/menu
 * - /health                -> /health
 */
class MetricsDecoratorHandler : public IHttpHandler {
public:
    MetricsDecoratorHandler(
        std::shared_ptr<IHttpHandler> inner,
        std::shared_ptr<metrics::IMetricsService> metrics)
        : inner_(std::move(inner))
        , metrics_(std::move(metrics))
    {}

    void handle(IRequest& req, IResponse& res) override {
        metrics_->increment("http_requests_total", {
            {"method", req.getMethod()},
            {"path", normalizePath(req.getPath())}
        });

        inner_->handle(req, res);
    }

    /**
     * @brief /api/v1/<collection>/<id>[/...] -> /api/v1/<collection>, query string отбрасывается
     */
    static std::string normalizePath(const std::string& path) {
        std::string cleanPath = path.substr(0, path.find('?'));

        static const std::string apiPrefix = "/api/v1/";
        if (cleanPath.compare(0, apiPrefix.size(), apiPrefix) != 0) {
            return cleanPath;
        }

        size_t collectionEnd = cleanPath.find('/', apiPrefix.size());
        if (collectionEnd == std::string::npos) {
            return cleanPath;
        }
        return cleanPath.substr(0, collectionEnd);
    }

private:
    std::shared_ptr<IHttpHandler> inner_;
    std::shared_ptr<metrics::IMetricsService> metrics_;
};

} // namespace cafe::http
