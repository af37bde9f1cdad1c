#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "clients/IOrdersClient.hpp"
#include "domain/JsonMapping.hpp"
#include "http/StatusMapping.hpp"
#include "logging/CallTimer.hpp"
#include "logging/ICallLogSink.hpp"
#include <iostream>
#include <memory>

namespace cafe::gateway::adapters::primary {

/**
 * @brief GET /api/v1/orders/{id} -> Orders backend
 */
class GetOrderHandler : public IHttpHandler {
public:
    GetOrderHandler(
        std::shared_ptr<clients::IOrdersClient> orders,
        std::shared_ptr<logging::ICallLogSink> callLog
    ) : orders_(std::move(orders))
      , callLog_(std::move(callLog))
    {
        std::cout << "[GetOrderHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            http::sendError(res, 405, "Method not allowed");
            return;
        }

        try {
            std::string orderId = req.getPathParam(0).value_or("");
            if (orderId.empty()) {
                http::sendError(res, 400, "Order ID is required");
                return;
            }

            auto result = logging::timedCall<domain::Order>(*callLog_, "orders", "getOrder",
                [this, &orderId] { return orders_->getOrder(orderId); });

            if (!result.ok()) {
                http::sendFailure(res, result.failure());
                return;
            }
            res.setResult(200, "application/json", domain::toJson(result.value()).dump());
        }
        catch (const std::exception& e) {
            std::cerr << "[GetOrderHandler] Error: " << e.what() << std::endl;
            http::sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<clients::IOrdersClient> orders_;
    std::shared_ptr<logging::ICallLogSink> callLog_;
};

} // namespace cafe::gateway::adapters::primary
