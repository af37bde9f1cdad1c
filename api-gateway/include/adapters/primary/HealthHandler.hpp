#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "resilience/CircuitBreakerRegistry.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace cafe::gateway::adapters::primary {

/**
 * @brief GET /health
 *
 * Gateway жив, пока отвечает сам; состояние backend'ов только для информации:
 * {"status":"healthy", "dependencies":{"users":{"state":"CLOSED", ...}}}
 */
class HealthHandler : public IHttpHandler {
public:
    explicit HealthHandler(std::shared_ptr<resilience::CircuitBreakerRegistry> breakers)
        : breakers_(std::move(breakers))
    {}

    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = "api-gateway";
        response["version"] = "1.0.0";

        nlohmann::json dependencies = nlohmann::json::object();
        for (const auto& b : breakers_->snapshot()) {
            dependencies[b.dependency] = {
                {"state", resilience::toString(b.state)},
                {"consecutive_failures", b.consecutiveFailures},
                {"times_opened", b.timesOpened}
            };
        }
        response["dependencies"] = dependencies;

        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<resilience::CircuitBreakerRegistry> breakers_;
};

} // namespace cafe::gateway::adapters::primary
