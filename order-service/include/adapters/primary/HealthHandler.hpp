#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "resilience/CircuitBreakerRegistry.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace cafe::orders::adapters::primary {

/**
 * @brief GET /health: сервис жив + состояние breaker'ов зависимостей (users, catalog)
 */
class HealthHandler : public IHttpHandler {
public:
    explicit HealthHandler(std::shared_ptr<resilience::CircuitBreakerRegistry> breakers)
        : breakers_(std::move(breakers))
    {}

    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = "order-service";
        response["version"] = "1.0.0";

        nlohmann::json dependencies = nlohmann::json::object();
        for (const auto& b : breakers_->snapshot()) {
            dependencies[b.dependency] = resilience::toString(b.state);
        }
        response["dependencies"] = dependencies;

        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<resilience::CircuitBreakerRegistry> breakers_;
};

} // namespace cafe::orders::adapters::primary
