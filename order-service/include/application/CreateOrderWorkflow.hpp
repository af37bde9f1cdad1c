#pragma once

#include "application/BoundedFanOut.hpp"
#include "clients/ICatalogClient.hpp"
#include "clients/IUsersClient.hpp"
#include "domain/Order.hpp"
#include "domain/OrderDraft.hpp"
#include "domain/OrderRequest.hpp"
#include "domain/WorkflowState.hpp"
#include "ports/output/IOrderRepository.hpp"
#include "resilience/CallResult.hpp"
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace cafe::orders::application {

/**
 * @brief Ошибка зависимости -> ошибка создания заказа
 *
 * - Timeout / ConnectionRefused / DependencyUnavailable / Unavailable -> Unavailable
 *   (вызывающий может повторить создание заказа целиком)
 * - NotFound -> InvalidArgument (неверная ссылка в запросе, а не сбой зависимости)
 * - InvalidArgument / Internal -> без изменений
 */
inline resilience::Failure toOrderFailure(const resilience::Failure& failure) {
    using resilience::FailureKind;
    switch (failure.kind) {
        case FailureKind::Timeout:
        case FailureKind::ConnectionRefused:
        case FailureKind::DependencyUnavailable:
        case FailureKind::Unavailable:
            return {FailureKind::Unavailable, failure.message};
        case FailureKind::NotFound:
            return {FailureKind::InvalidArgument, failure.message};
        default:
            return failure;
    }
}

/**
 * @brief Создание одного заказа
 *
 * Start -> ValidatingUser -> ResolvingItems -> Persisting -> {Completed | Failed}
 *
 * - пользователь проверяется первым: при любой ошибке Catalog не вызывается
 * - различные позиции меню запрашиваются параллельно (не больше fanOutLimit),
 *   первая ошибка сразу завершает заказ
 * - цена каждой строки фиксируется в черновике в момент получения
 * - в хранилище попадает только полностью собранный заказ
 *
 * Объект одноразовый: повторный run() бросает std::logic_error.
 */
class CreateOrderWorkflow {
public:
    CreateOrderWorkflow(
        std::shared_ptr<clients::IUsersClient> users,
        std::shared_ptr<clients::ICatalogClient> catalog,
        std::shared_ptr<ports::output::IOrderRepository> repository,
        int fanOutLimit
    ) : users_(std::move(users))
      , catalog_(std::move(catalog))
      , repository_(std::move(repository))
      , fanOutLimit_(fanOutLimit)
    {}

    resilience::CallResult<domain::Order> run(const domain::OrderRequest& request) {
        if (state_ != domain::WorkflowState::Start) {
            throw std::logic_error("CreateOrderWorkflow is single-use, state: " + domain::toString(state_));
        }

        draft_.requestedUserId = request.userId;
        draft_.requestedLineItems = request.items;

        transitionTo(domain::WorkflowState::ValidatingUser);
        auto user = users_->getUser(request.userId);
        if (!user.ok()) {
            return fail(user.failure());
        }
        draft_.resolvedUserSnapshot = user.value();

        transitionTo(domain::WorkflowState::ResolvingItems);
        auto items = resolveItems();
        if (!items.ok()) {
            return fail(items.failure());
        }
        for (const auto& line : draft_.requestedLineItems) {
            const auto& item = items.value().at(line.productRef);
            draft_.resolvedLineItems.push_back({line.productRef, item.name, line.quantity, item.price});
        }

        transitionTo(domain::WorkflowState::Persisting);
        if (!draft_.isComplete()) {
            return fail({resilience::FailureKind::Internal, "order draft is incomplete"});
        }

        domain::Order order;
        try {
            order = toOrder(draft_);
        } catch (const std::overflow_error&) {
            return fail({resilience::FailureKind::InvalidArgument, "order total is out of range"});
        }

        try {
            order.id = repository_->create(order);
        } catch (const std::exception& e) {
            std::cerr << "[CreateOrderWorkflow] Persist failed: " << e.what() << std::endl;
            return fail({resilience::FailureKind::Internal, "failed to store order"});
        }

        transitionTo(domain::WorkflowState::Completed);
        std::cout << "[CreateOrderWorkflow] Order " << order.id << " created for user " << order.userId
                  << ", total " << order.total.toDouble() << " " << order.total.currency << std::endl;
        return resilience::CallResult<domain::Order>::success(order);
    }

    domain::WorkflowState state() const { return state_; }

    const domain::OrderDraft& draft() const { return draft_; }

private:
    std::shared_ptr<clients::IUsersClient> users_;
    std::shared_ptr<clients::ICatalogClient> catalog_;
    std::shared_ptr<ports::output::IOrderRepository> repository_;
    int fanOutLimit_;

    domain::WorkflowState state_ = domain::WorkflowState::Start;
    domain::OrderDraft draft_;

    resilience::CallResult<std::map<std::string, domain::CatalogItem>> resolveItems() {
        std::vector<std::string> distinct;
        std::set<std::string> seen;
        for (const auto& line : draft_.requestedLineItems) {
            if (seen.insert(line.productRef).second) {
                distinct.push_back(line.productRef);
            }
        }

        auto catalog = catalog_;
        auto resolved = fanOut<domain::CatalogItem>(distinct, fanOutLimit_,
            [catalog](const std::string& productRef) -> resilience::CallResult<domain::CatalogItem> {
                auto item = catalog->getCatalogItem(productRef);
                if (item.ok() && !item.value().available) {
                    return resilience::CallResult<domain::CatalogItem>::failure(
                        resilience::FailureKind::InvalidArgument,
                        "menu item " + productRef + " is not available");
                }
                return item;
            });

        if (resolved.ok() && !sameCurrency(resolved.value())) {
            return resilience::CallResult<std::map<std::string, domain::CatalogItem>>::failure(
                resilience::FailureKind::Internal, "menu items are priced in different currencies");
        }
        return resolved;
    }

    static bool sameCurrency(const std::map<std::string, domain::CatalogItem>& items) {
        if (items.empty()) {
            return true;
        }
        const auto& currency = items.begin()->second.price.currency;
        for (const auto& [id, item] : items) {
            if (item.price.currency != currency) {
                return false;
            }
        }
        return true;
    }

    static domain::Order toOrder(const domain::OrderDraft& draft) {
        domain::Order order;
        order.userId = draft.resolvedUserSnapshot->id.empty()
            ? draft.requestedUserId
            : draft.resolvedUserSnapshot->id;
        for (const auto& line : draft.resolvedLineItems) {
            order.items.push_back({line.productRef, line.name, line.quantity, line.unitPriceSnapshot});
        }
        order.total = draft.total();
        order.status = domain::OrderStatus::PENDING;
        order.createdAt = domain::Timestamp::now();
        return order;
    }

    resilience::CallResult<domain::Order> fail(const resilience::Failure& cause) {
        auto failure = toOrderFailure(cause);
        std::cout << "[CreateOrderWorkflow] Failed in " << domain::toString(state_) << ": "
                  << resilience::toString(cause.kind) << " (" << cause.message << ")" << std::endl;
        transitionTo(domain::WorkflowState::Failed);
        return resilience::CallResult<domain::Order>::fail(failure);
    }

    void transitionTo(domain::WorkflowState next) {
        state_ = next;
    }
};

} // namespace cafe::orders::application
