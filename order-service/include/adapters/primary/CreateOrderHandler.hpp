#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "domain/JsonMapping.hpp"
#include "http/Headers.hpp"
#include "http/StatusMapping.hpp"
#include "ports/input/IOrderService.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace cafe::orders::adapters::primary {

/**
 * @brief POST /api/v1/orders: создать заказ
 *
 * Body: {"user_id": "u-1", "items": [{"menu_item_id": "latte", "quantity": 2}]}
 * 201 + заказ, либо статус по виду ошибки.
 */
class CreateOrderHandler : public IHttpHandler {
public:
    explicit CreateOrderHandler(std::shared_ptr<ports::input::IOrderService> orderService)
        : orderService_(std::move(orderService))
    {
        std::cout << "[CreateOrderHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "POST") {
            http::sendError(res, 405, "Method not allowed");
            return;
        }

        try {
            auto body = nlohmann::json::parse(req.getBody());
            if (!body.is_object()) {
                http::sendError(res, 400, "Request body must be a JSON object");
                return;
            }

            auto request = domain::orderRequestFromJson(body);
            request.idempotencyKey = req.getHeader(http::IDEMPOTENCY_KEY_HEADER).value_or("");

            auto result = orderService_->createOrder(request);
            if (!result.ok()) {
                http::sendFailure(res, result.failure());
                return;
            }

            res.setResult(201, "application/json", domain::toJson(result.value()).dump());
        }
        catch (const nlohmann::json::exception& e) {
            http::sendError(res, 400, "Invalid JSON");
        }
        catch (const std::exception& e) {
            std::cerr << "[CreateOrderHandler] Error: " << e.what() << std::endl;
            http::sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IOrderService> orderService_;
};

} // namespace cafe::orders::adapters::primary
