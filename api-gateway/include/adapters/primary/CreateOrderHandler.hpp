#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "clients/IOrdersClient.hpp"
#include "domain/JsonMapping.hpp"
#include "http/Headers.hpp"
#include "http/StatusMapping.hpp"
#include "logging/CallTimer.hpp"
#include "logging/ICallLogSink.hpp"
#include <nlohmann/json.hpp>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <sstream>

namespace cafe::gateway::adapters::primary {

/**
 * @brief POST /api/v1/orders -> Orders backend (order-service)
 *
 * Ключ идемпотентности берётся из X-Idempotency-Key клиента или
 * генерируется здесь. Он один на все повторы этого вызова и
 * возвращается клиенту в том же заголовке.
 */
class CreateOrderHandler : public IHttpHandler {
public:
    CreateOrderHandler(
        std::shared_ptr<clients::IOrdersClient> orders,
        std::shared_ptr<logging::ICallLogSink> callLog
    ) : orders_(std::move(orders))
      , callLog_(std::move(callLog))
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
            if (request.userId.empty()) {
                http::sendError(res, 400, "user_id is required");
                return;
            }
            if (request.items.empty()) {
                http::sendError(res, 400, "items must not be empty");
                return;
            }
            request.idempotencyKey = req.getHeader(http::IDEMPOTENCY_KEY_HEADER)
                                         .value_or(generateIdempotencyKey());

            auto result = logging::timedCall<domain::Order>(*callLog_, "orders", "createOrder",
                [this, &request] { return orders_->createOrder(request); });

            res.setHeader(http::IDEMPOTENCY_KEY_HEADER, request.idempotencyKey);
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
    std::shared_ptr<clients::IOrdersClient> orders_;
    std::shared_ptr<logging::ICallLogSink> callLog_;

    static std::string generateIdempotencyKey() {
        thread_local std::mt19937_64 rng(std::random_device{}());
        std::uniform_int_distribution<uint64_t> dist;

        std::stringstream ss;
        ss << "gw-" << std::hex << std::setfill('0')
           << std::setw(16) << dist(rng) << std::setw(16) << dist(rng);
        return ss.str();
    }
};

} // namespace cafe::gateway::adapters::primary
