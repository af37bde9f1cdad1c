#pragma once

#include "clients/BackendInvoker.hpp"
#include "clients/IOrdersClient.hpp"
#include "domain/JsonMapping.hpp"
#include "http/Headers.hpp"
#include "settings/DependencySettings.hpp"
#include <iostream>
#include <memory>

namespace cafe::clients {

/**
 * @brief Orders backend (order-service)
 *
 * - POST /api/v1/orders (X-Idempotency-Key)
 * - GET  /api/v1/orders/{id}
 */
class OrdersClient : public IOrdersClient {
public:
    OrdersClient(
        std::shared_ptr<discovery::IServiceResolver> resolver,
        std::shared_ptr<transport::IBackendTransport> transport,
        std::shared_ptr<resilience::CircuitBreakerRegistry> registry,
        std::shared_ptr<settings::OrdersClientSettings> settings
    ) : invoker_(std::move(resolver), std::move(transport), std::move(registry), *settings)
    {
        std::cout << "[OrdersClient] Created, dependency: " << invoker_.serviceName() << std::endl;
    }

    resilience::CallResult<domain::Order> createOrder(const domain::OrderRequest& request) override {
        transport::BackendRequest backendRequest;
        backendRequest.method = "POST";
        backendRequest.path = "/api/v1/orders";
        backendRequest.body = domain::toJson(request).dump();
        if (!request.idempotencyKey.empty()) {
            backendRequest.headers[http::IDEMPOTENCY_KEY_HEADER] = request.idempotencyKey;
        }

        return invoker_.invoke<domain::Order>(
            backendRequest,
            [](const nlohmann::json& j) { return domain::orderFromJson(j); },
            "order endpoint not found");
    }

    resilience::CallResult<domain::Order> getOrder(const std::string& orderId) override {
        if (!isValidId(orderId)) {
            return resilience::CallResult<domain::Order>::failure(
                resilience::FailureKind::InvalidArgument, "invalid order id");
        }

        transport::BackendRequest request;
        request.method = "GET";
        request.path = "/api/v1/orders/" + orderId;

        return invoker_.invoke<domain::Order>(
            request,
            [](const nlohmann::json& j) { return domain::orderFromJson(j); },
            "order " + orderId + " not found");
    }

private:
    BackendInvoker invoker_;
};

} // namespace cafe::clients
