#pragma once

#include "application/CreateOrderWorkflow.hpp"
#include "clients/ICatalogClient.hpp"
#include "clients/IUsersClient.hpp"
#include "metrics/IMetricsService.hpp"
#include "ports/input/IOrderService.hpp"
#include "ports/output/IOrderRepository.hpp"
#include "settings/OrderWorkflowSettings.hpp"
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace cafe::orders::application {

/**
 * @brief Сервис заказов
 *
 * createOrder: валидация запроса, затем новый CreateOrderWorkflow на каждый вызов.
 * getOrder: чтение из хранилища.
 */
class OrderService : public ports::input::IOrderService {
public:
    OrderService(
        std::shared_ptr<clients::IUsersClient> users,
        std::shared_ptr<clients::ICatalogClient> catalog,
        std::shared_ptr<ports::output::IOrderRepository> repository,
        std::shared_ptr<settings::OrderWorkflowSettings> settings,
        std::shared_ptr<metrics::IMetricsService> metrics
    ) : users_(std::move(users))
      , catalog_(std::move(catalog))
      , repository_(std::move(repository))
      , settings_(std::move(settings))
      , metrics_(std::move(metrics))
    {
        std::cout << "[OrderService] Created" << std::endl;
    }

    resilience::CallResult<domain::Order> createOrder(const domain::OrderRequest& request) override {
        if (auto error = validate(request)) {
            return reject(resilience::Failure{resilience::FailureKind::InvalidArgument, *error});
        }

        CreateOrderWorkflow workflow(users_, catalog_, repository_, settings_->getFanOutLimit());
        auto result = workflow.run(request);
        if (!result.ok()) {
            return reject(result.failure());
        }

        metrics_->increment("orders_created_total");
        return result;
    }

    resilience::CallResult<domain::Order> getOrder(const std::string& orderId) override {
        try {
            auto order = repository_->findById(orderId);
            if (!order) {
                return resilience::CallResult<domain::Order>::failure(
                    resilience::FailureKind::NotFound, "order " + orderId + " not found");
            }
            return resilience::CallResult<domain::Order>::success(*order);
        } catch (const std::exception& e) {
            std::cerr << "[OrderService] getOrder failed: " << e.what() << std::endl;
            return resilience::CallResult<domain::Order>::failure(
                resilience::FailureKind::Internal, "failed to read order");
        }
    }

private:
    std::shared_ptr<clients::IUsersClient> users_;
    std::shared_ptr<clients::ICatalogClient> catalog_;
    std::shared_ptr<ports::output::IOrderRepository> repository_;
    std::shared_ptr<settings::OrderWorkflowSettings> settings_;
    std::shared_ptr<metrics::IMetricsService> metrics_;

    std::optional<std::string> validate(const domain::OrderRequest& request) const {
        if (request.userId.empty()) {
            return std::string("user_id is required");
        }
        if (request.items.empty()) {
            return std::string("order must contain at least one item");
        }
        if (static_cast<int>(request.items.size()) > settings_->getMaxLineItems()) {
            return "order must contain at most " + std::to_string(settings_->getMaxLineItems()) + " items";
        }
        for (const auto& item : request.items) {
            if (item.productRef.empty()) {
                return std::string("menu_item_id is required");
            }
            if (item.quantity <= 0) {
                return "quantity must be positive for " + item.productRef;
            }
            if (item.quantity > settings_->getMaxQuantity()) {
                return "quantity must be at most " + std::to_string(settings_->getMaxQuantity())
                    + " for " + item.productRef;
            }
        }
        return std::nullopt;
    }

    resilience::CallResult<domain::Order> reject(const resilience::Failure& failure) {
        metrics_->increment("orders_rejected_total", {{"reason", resilience::toString(failure.kind)}});
        return resilience::CallResult<domain::Order>::fail(failure);
    }
};

} // namespace cafe::orders::application
