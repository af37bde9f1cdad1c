#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "domain/JsonMapping.hpp"
#include "http/StatusMapping.hpp"
#include "ports/input/IOrderService.hpp"
#include <iostream>
#include <memory>

namespace cafe::orders::adapters::primary {

/**
 * @brief GET /api/v1/orders/{id}: заказ по ID
 *
 * Роутер регистрирует с паттерном "/api/v1/orders/*"
 */
class GetOrderHandler : public IHttpHandler {
public:
    explicit GetOrderHandler(std::shared_ptr<ports::input::IOrderService> orderService)
        : orderService_(std::move(orderService))
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

            auto result = orderService_->getOrder(orderId);
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
    std::shared_ptr<ports::input::IOrderService> orderService_;
};

} // namespace cafe::orders::adapters::primary
