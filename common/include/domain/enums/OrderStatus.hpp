#pragma once

#include <string>

namespace cafe::domain {

/**
 * @brief Жизненный цикл заказа в кафе
 *
 * Заказ создаётся в PENDING; остальные статусы выставляет кухня.
 */
enum class OrderStatus {
    PENDING,
    PREPARING,
    READY,
    COMPLETED
};

inline std::string toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING: return "PENDING";
        case OrderStatus::PREPARING: return "PREPARING";
        case OrderStatus::READY: return "READY";
        case OrderStatus::COMPLETED: return "COMPLETED";
        default: return "UNKNOWN";
    }
}

inline OrderStatus parseOrderStatus(const std::string& str) {
    if (str == "PREPARING") return OrderStatus::PREPARING;
    if (str == "READY") return OrderStatus::READY;
    if (str == "COMPLETED") return OrderStatus::COMPLETED;
    return OrderStatus::PENDING;
}

} // namespace cafe::domain
