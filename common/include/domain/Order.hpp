#pragma once

#include "domain/Money.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/OrderStatus.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace cafe::domain {

/**
 * @brief Строка заказа с ценой, зафиксированной в момент создания
 *
 * Снимок цены: последующие изменения меню не меняют уже созданный заказ.
 */
struct OrderLine {
    std::string productRef;
    std::string name;
    int64_t quantity = 0;
    Money unitPrice;
};

/**
 * @brief Заказ
 */
struct Order {
    std::string id;
    std::string userId;
    std::vector<OrderLine> items;
    Money total;
    OrderStatus status = OrderStatus::PENDING;
    Timestamp createdAt;
};

} // namespace cafe::domain
