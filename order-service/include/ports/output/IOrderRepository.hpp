#pragma once

#include "domain/Order.hpp"
#include <optional>
#include <string>

namespace cafe::orders::ports::output {

/**
 * @brief Хранилище заказов
 *
 * Ошибки хранилища: исключения (std::exception).
 */
class IOrderRepository {
public:
    virtual ~IOrderRepository() = default;

    /**
     * @brief Сохранить заказ целиком (заказ + строки) в одной транзакции
     * @return ID, присвоенный заказу
     */
    virtual std::string create(const domain::Order& order) = 0;

    virtual std::optional<domain::Order> findById(const std::string& orderId) = 0;
};

} // namespace cafe::orders::ports::output
