#pragma once

#include "clients/BackendInvoker.hpp"
#include "clients/IUsersClient.hpp"
#include "domain/JsonMapping.hpp"
#include "settings/DependencySettings.hpp"
#include <iostream>
#include <memory>

namespace cafe::clients {

/**
 * @brief Users backend через discovery + transport, с timeout/retry/breaker
 *
 * GET /api/v1/users/{id}
 */
class UsersClient : public IUsersClient {
public:
    UsersClient(
        std::shared_ptr<discovery::IServiceResolver> resolver,
        std::shared_ptr<transport::IBackendTransport> transport,
        std::shared_ptr<resilience::CircuitBreakerRegistry> registry,
        std::shared_ptr<settings::UsersClientSettings> settings
    ) : invoker_(std::move(resolver), std::move(transport), std::move(registry), *settings)
    {
        std::cout << "[UsersClient] Created, dependency: " << invoker_.serviceName() << std::endl;
    }

    resilience::CallResult<domain::UserSnapshot> getUser(const std::string& userId) override {
        if (!isValidId(userId)) {
            return resilience::CallResult<domain::UserSnapshot>::failure(
                resilience::FailureKind::InvalidArgument, "invalid user id");
        }

        transport::BackendRequest request;
        request.method = "GET";
        request.path = "/api/v1/users/" + userId;

        return invoker_.invoke<domain::UserSnapshot>(
            request,
            [](const nlohmann::json& j) { return domain::userFromJson(j); },
            "user " + userId + " not found");
    }

private:
    BackendInvoker invoker_;
};

} // namespace cafe::clients
