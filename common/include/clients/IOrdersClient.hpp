#pragma once

#include "domain/Order.hpp"
#include "domain/OrderRequest.hpp"
#include "resilience/CallResult.hpp"
#include <string>

namespace cafe::clients {

/**
 * @brief Клиент Orders backend'а (order-service)
 */
class IOrdersClient {
public:
    virtual ~IOrdersClient() = default;

    /**
     * @brief Создать заказ
     *
     * Все повторы одного вызова несут один и тот же request.idempotencyKey,
     * поэтому повтор после таймаута не создаёт второй заказ.
     */
    virtual resilience::CallResult<domain::Order> createOrder(const domain::OrderRequest& request) = 0;

    virtual resilience::CallResult<domain::Order> getOrder(const std::string& orderId) = 0;
};

} // namespace cafe::clients
