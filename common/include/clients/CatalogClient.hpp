#pragma once

#include "clients/BackendInvoker.hpp"
#include "clients/ICatalogClient.hpp"
#include "domain/JsonMapping.hpp"
#include "settings/DependencySettings.hpp"
#include <iostream>
#include <memory>

namespace cafe::clients {

/**
 * @brief Catalog (menu) backend: GET /api/v1/menu/{id}
 */
class CatalogClient : public ICatalogClient {
public:
    CatalogClient(
        std::shared_ptr<discovery::IServiceResolver> resolver,
        std::shared_ptr<transport::IBackendTransport> transport,
        std::shared_ptr<resilience::CircuitBreakerRegistry> registry,
        std::shared_ptr<settings::CatalogClientSettings> settings
    ) : invoker_(std::move(resolver), std::move(transport), std::move(registry), *settings)
    {
        std::cout << "[CatalogClient] Created, dependency: " << invoker_.serviceName() << std::endl;
    }

    resilience::CallResult<domain::CatalogItem> getCatalogItem(const std::string& itemId) override {
        if (!isValidId(itemId)) {
            return resilience::CallResult<domain::CatalogItem>::failure(
                resilience::FailureKind::InvalidArgument, "invalid menu item id");
        }

        transport::BackendRequest request;
        request.method = "GET";
        request.path = "/api/v1/menu/" + itemId;

        return invoker_.invoke<domain::CatalogItem>(
            request,
            [](const nlohmann::json& j) { return domain::catalogItemFromJson(j); },
            "menu item " + itemId + " not found");
    }

private:
    BackendInvoker invoker_;
};

} // namespace cafe::clients
