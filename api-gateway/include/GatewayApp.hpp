#pragma once

#include <BoostBeastApplication.hpp>
#include <HttpClient.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/DependencySettings.hpp"
#include "settings/GatewayMetricsSettings.hpp"

// Common: discovery, transport, resilience, backend clients, metrics, call log
#include "clients/CatalogClient.hpp"
#include "clients/OrdersClient.hpp"
#include "clients/UsersClient.hpp"
#include "discovery/EnvServiceResolver.hpp"
#include "logging/ConsoleCallLogSink.hpp"
#include "metrics/MetricsService.hpp"
#include "resilience/CircuitBreakerRegistry.hpp"
#include "transport/HttpBackendTransport.hpp"

// Primary Adapters
#include "adapters/primary/CreateOrderHandler.hpp"
#include "adapters/primary/GetCatalogItemHandler.hpp"
#include "adapters/primary/GetOrderHandler.hpp"
#include "adapters/primary/GetUserHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "http/MetricsDecoratorHandler.hpp"
#include "http/MetricsHandler.hpp"

#include <iostream>
#include <map>
#include <memory>

namespace di = boost::di;

namespace cafe::gateway {

/**
 * @brief API Gateway: HTTP/JSON снаружи -> Users, Catalog, Orders backends
 *
 * Каждый backend вызывается через timeout + retry + circuit breaker,
 * breaker'ы общие для всех запросов (один реестр на процесс).
 */
class GatewayApp : public BoostBeastApplication {
public:
    GatewayApp() { std::cout << "[GatewayApp] Initializing..." << std::endl; }
    ~GatewayApp() override { std::cout << "[GatewayApp] Shutting down..." << std::endl; }

protected:
    void loadEnvironment(int argc, char* argv[]) override {
        BoostBeastApplication::loadEnvironment(argc, argv);
        std::cout << "[GatewayApp] Environment loaded" << std::endl;
    }

    void configureInjection() override {
        std::cout << "[GatewayApp] Configuring DI..." << std::endl;

        // Классы с несколькими конструкторами создаются явно (см. OrderServiceApp)
        auto usersSettings = std::make_shared<cafe::settings::UsersClientSettings>();
        auto catalogSettings = std::make_shared<cafe::settings::CatalogClientSettings>();
        auto ordersSettings = std::make_shared<cafe::settings::OrdersClientSettings>();
        auto resolver = std::make_shared<discovery::EnvServiceResolver>(
            std::map<std::string, discovery::ServiceAddress>{
                {"users", {"users-service", 8080}},
                {"catalog", {"catalog-service", 8080}},
                {"orders", {"order-service", 8080}}
            });
        auto breakers = std::make_shared<resilience::CircuitBreakerRegistry>();

        auto injector = di::make_injector(
            di::bind<cafe::settings::UsersClientSettings>().to(usersSettings),
            di::bind<cafe::settings::CatalogClientSettings>().to(catalogSettings),
            di::bind<cafe::settings::OrdersClientSettings>().to(ordersSettings),
            di::bind<metrics::IMetricsSettings>().to<settings::GatewayMetricsSettings>().in(di::singleton),

            di::bind<discovery::IServiceResolver>().to(resolver),
            di::bind<resilience::CircuitBreakerRegistry>().to(breakers),
            di::bind<IHttpClient>().to<HttpClient>().in(di::singleton),
            di::bind<transport::IBackendTransport>().to<transport::HttpBackendTransport>().in(di::singleton),

            di::bind<clients::IUsersClient>().to<clients::UsersClient>().in(di::singleton),
            di::bind<clients::ICatalogClient>().to<clients::CatalogClient>().in(di::singleton),
            di::bind<clients::IOrdersClient>().to<clients::OrdersClient>().in(di::singleton),

            di::bind<metrics::IMetricsService>().to<metrics::MetricsService>().in(di::singleton),
            di::bind<logging::ICallLogSink>().to<logging::ConsoleCallLogSink>().in(di::singleton));

        auto metricsService = injector.create<std::shared_ptr<metrics::IMetricsService>>();
        auto withMetrics = [&metricsService](std::shared_ptr<IHttpHandler> handler) -> std::shared_ptr<IHttpHandler> {
            return std::make_shared<http::MetricsDecoratorHandler>(std::move(handler), metricsService);
        };

        handlers_[getHandlerKey("GET", "/health")] =
            withMetrics(injector.create<std::shared_ptr<adapters::primary::HealthHandler>>());
        handlers_[getHandlerKey("GET", "/metrics")] =
            withMetrics(injector.create<std::shared_ptr<http::MetricsHandler>>());

        handlers_[getHandlerKey("GET", "/api/v1/users/*")] =
            withMetrics(injector.create<std::shared_ptr<adapters::primary::GetUserHandler>>());
        handlers_[getHandlerKey("GET", "/api/v1/menu/*")] =
            withMetrics(injector.create<std::shared_ptr<adapters::primary::GetCatalogItemHandler>>());
        handlers_[getHandlerKey("POST", "/api/v1/orders")] =
            withMetrics(injector.create<std::shared_ptr<adapters::primary::CreateOrderHandler>>());
        handlers_[getHandlerKey("GET", "/api/v1/orders/*")] =
            withMetrics(injector.create<std::shared_ptr<adapters::primary::GetOrderHandler>>());

        std::cout << "[GatewayApp] Ready" << std::endl;
    }
};

} // namespace cafe::gateway
