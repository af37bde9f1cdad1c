#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace cafe::domain {

struct LineItemRequest {
    std::string productRef;     // id позиции меню
    int64_t quantity = 0;
};

/**
 * @brief Запрос на создание заказа
 *
 * idempotencyKey одинаков для всех повторов одного логического запроса.
 */
struct OrderRequest {
    std::string userId;
    std::vector<LineItemRequest> items;
    std::string idempotencyKey;
};

} // namespace cafe::domain
