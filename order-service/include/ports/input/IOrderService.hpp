#pragma once

#include "domain/Order.hpp"
#include "domain/OrderRequest.hpp"
#include "resilience/CallResult.hpp"
#include <string>

namespace cafe::orders::ports::input {

/**
 * @brief Интерфейс сервиса заказов
 */
class IOrderService {
public:
    virtual ~IOrderService() = default;

    /**
     * @brief Создать заказ (валидация, пользователь, цены, сохранение)
     *
     * Ошибки зависимостей: Unavailable (повторяемо вызывающим),
     * неизвестный пользователь/позиция: InvalidArgument.
     */
    virtual resilience::CallResult<domain::Order> createOrder(const domain::OrderRequest& request) = 0;

    /**
     * @brief Заказ по ID (NotFound, если нет)
     */
    virtual resilience::CallResult<domain::Order> getOrder(const std::string& orderId) = 0;
};

} // namespace cafe::orders::ports::input
