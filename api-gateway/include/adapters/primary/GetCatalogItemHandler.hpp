#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "clients/ICatalogClient.hpp"
#include "domain/JsonMapping.hpp"
#include "http/StatusMapping.hpp"
#include "logging/CallTimer.hpp"
#include "logging/ICallLogSink.hpp"
#include <iostream>
#include <memory>

namespace cafe::gateway::adapters::primary {

/**
 * @brief GET /api/v1/menu/{id} -> Catalog backend
 */
class GetCatalogItemHandler : public IHttpHandler {
public:
    GetCatalogItemHandler(
        std::shared_ptr<clients::ICatalogClient> catalog,
        std::shared_ptr<logging::ICallLogSink> callLog
    ) : catalog_(std::move(catalog))
      , callLog_(std::move(callLog))
    {
        std::cout << "[GetCatalogItemHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            http::sendError(res, 405, "Method not allowed");
            return;
        }

        try {
            std::string itemId = req.getPathParam(0).value_or("");
            if (itemId.empty()) {
                http::sendError(res, 400, "Menu item ID is required");
                return;
            }

            auto result = logging::timedCall<domain::CatalogItem>(*callLog_, "catalog", "getCatalogItem",
                [this, &itemId] { return catalog_->getCatalogItem(itemId); });

            if (!result.ok()) {
                http::sendFailure(res, result.failure());
                return;
            }
            res.setResult(200, "application/json", domain::toJson(result.value()).dump());
        }
        catch (const std::exception& e) {
            std::cerr << "[GetCatalogItemHandler] Error: " << e.what() << std::endl;
            http::sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<clients::ICatalogClient> catalog_;
    std::shared_ptr<logging::ICallLogSink> callLog_;
};

} // namespace cafe::gateway::adapters::primary
