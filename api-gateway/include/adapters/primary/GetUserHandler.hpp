#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "clients/IUsersClient.hpp"
#include "domain/JsonMapping.hpp"
#include "http/StatusMapping.hpp"
#include "logging/CallTimer.hpp"
#include "logging/ICallLogSink.hpp"
#include <iostream>
#include <memory>

namespace cafe::gateway::adapters::primary {

/**
 * @brief GET /api/v1/users/{id} -> Users backend
 */
class GetUserHandler : public IHttpHandler {
public:
    GetUserHandler(
        std::shared_ptr<clients::IUsersClient> users,
        std::shared_ptr<logging::ICallLogSink> callLog
    ) : users_(std::move(users))
      , callLog_(std::move(callLog))
    {
        std::cout << "[GetUserHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            http::sendError(res, 405, "Method not allowed");
            return;
        }

        try {
            std::string userId = req.getPathParam(0).value_or("");
            if (userId.empty()) {
                http::sendError(res, 400, "User ID is required");
                return;
            }

            auto result = logging::timedCall<domain::UserSnapshot>(*callLog_, "users", "getUser",
                [this, &userId] { return users_->getUser(userId); });

            if (!result.ok()) {
                http::sendFailure(res, result.failure());
                return;
            }
            res.setResult(200, "application/json", domain::toJson(result.value()).dump());
        }
        catch (const std::exception& e) {
            std::cerr << "[GetUserHandler] Error: " << e.what() << std::endl;
            http::sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<clients::IUsersClient> users_;
    std::shared_ptr<logging::ICallLogSink> callLog_;
};

} // namespace cafe::gateway::adapters::primary
