#pragma once

#include <BoostBeastApplication.hpp>
#include <HttpClient.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/DependencySettings.hpp"
#include "settings/OrderServiceMetricsSettings.hpp"
#include "settings/OrderWorkflowSettings.hpp"

// Ports
#include "ports/input/IOrderService.hpp"
#include "ports/output/IIdempotencyRepository.hpp"
#include "ports/output/IOrderRepository.hpp"

// Common: discovery, transport, resilience, backend clients, metrics
#include "clients/CatalogClient.hpp"
#include "clients/UsersClient.hpp"
#include "discovery/EnvServiceResolver.hpp"
#include "metrics/MetricsService.hpp"
#include "resilience/CircuitBreakerRegistry.hpp"
#include "transport/HttpBackendTransport.hpp"

// Application
#include "application/OrderService.hpp"

// Secondary Adapters
#include "adapters/secondary/PostgresIdempotencyRepository.hpp"
#include "adapters/secondary/PostgresOrderRepository.hpp"

// Primary Adapters
#include "adapters/primary/CreateOrderHandler.hpp"
#include "adapters/primary/GetOrderHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/IdempotentHandler.hpp"
#include "http/MetricsDecoratorHandler.hpp"
#include "http/MetricsHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace cafe::orders {

/**
 * @brief Order Service: создание заказа поверх Users и Catalog
 *
 * Backend "orders" для API gateway.
 * Исходящие вызовы: users, catalog (timeout + retry + circuit breaker).
 */
class OrderServiceApp : public BoostBeastApplication {
public:
    OrderServiceApp() { std::cout << "[OrderServiceApp] Initializing..." << std::endl; }
    ~OrderServiceApp() override { std::cout << "[OrderServiceApp] Shutting down..." << std::endl; }

protected:
    void loadEnvironment(int argc, char* argv[]) override {
        BoostBeastApplication::loadEnvironment(argc, argv);
        std::cout << "[OrderServiceApp] Environment loaded" << std::endl;
    }

    void configureInjection() override {
        std::cout << "[OrderServiceApp] Configuring DI..." << std::endl;

        // Классы с несколькими конструкторами создаются явно:
        // DI выбрал бы самый длинный (для тестов), а нужен конструктор из ENV
        auto usersSettings = std::make_shared<cafe::settings::UsersClientSettings>();
        auto catalogSettings = std::make_shared<cafe::settings::CatalogClientSettings>();
        auto workflowSettings = std::make_shared<settings::OrderWorkflowSettings>();
        auto resolver = std::make_shared<discovery::EnvServiceResolver>(
            std::map<std::string, discovery::ServiceAddress>{
                {"users", {"users-service", 8080}},
                {"catalog", {"catalog-service", 8080}}
            });
        auto breakers = std::make_shared<resilience::CircuitBreakerRegistry>();

        auto injector = di::make_injector(
            di::bind<settings::DbSettings>().in(di::singleton),
            di::bind<cafe::settings::UsersClientSettings>().to(usersSettings),
            di::bind<cafe::settings::CatalogClientSettings>().to(catalogSettings),
            di::bind<settings::OrderWorkflowSettings>().to(workflowSettings),
            di::bind<metrics::IMetricsSettings>().to<settings::OrderServiceMetricsSettings>().in(di::singleton),

            di::bind<discovery::IServiceResolver>().to(resolver),
            di::bind<resilience::CircuitBreakerRegistry>().to(breakers),
            di::bind<IHttpClient>().to<HttpClient>().in(di::singleton),
            di::bind<transport::IBackendTransport>().to<transport::HttpBackendTransport>().in(di::singleton),

            di::bind<clients::IUsersClient>().to<clients::UsersClient>().in(di::singleton),
            di::bind<clients::ICatalogClient>().to<clients::CatalogClient>().in(di::singleton),

            di::bind<ports::output::IOrderRepository>()
                .to<adapters::secondary::PostgresOrderRepository>()
                .in(di::singleton),
            di::bind<ports::output::IIdempotencyRepository>()
                .to<adapters::secondary::PostgresIdempotencyRepository>()
                .in(di::singleton),

            di::bind<metrics::IMetricsService>().to<metrics::MetricsService>().in(di::singleton),
            di::bind<ports::input::IOrderService>().to<application::OrderService>().in(di::singleton));

        auto metricsService = injector.create<std::shared_ptr<metrics::IMetricsService>>();
        auto withMetrics = [&metricsService](std::shared_ptr<IHttpHandler> handler) -> std::shared_ptr<IHttpHandler> {
            return std::make_shared<http::MetricsDecoratorHandler>(std::move(handler), metricsService);
        };

        handlers_[getHandlerKey("GET", "/health")] =
            withMetrics(injector.create<std::shared_ptr<adapters::primary::HealthHandler>>());
        handlers_[getHandlerKey("GET", "/metrics")] =
            withMetrics(injector.create<std::shared_ptr<http::MetricsHandler>>());

        // Повтор создания заказа с тем же ключом возвращает первый ответ
        auto createOrderHandler = injector.create<std::shared_ptr<adapters::primary::CreateOrderHandler>>();
        auto idempotencyRepo = injector.create<std::shared_ptr<ports::output::IIdempotencyRepository>>();
        handlers_[getHandlerKey("POST", "/api/v1/orders")] = withMetrics(
            std::make_shared<adapters::primary::IdempotentHandler>(createOrderHandler, idempotencyRepo));

        handlers_[getHandlerKey("GET", "/api/v1/orders/*")] =
            withMetrics(injector.create<std::shared_ptr<adapters::primary::GetOrderHandler>>());

        std::cout << "[OrderServiceApp] Ready" << std::endl;
    }
};

} // namespace cafe::orders
