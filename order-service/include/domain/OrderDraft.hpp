#pragma once

#include "domain/Money.hpp"
#include "domain/OrderRequest.hpp"
#include "domain/UserSnapshot.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cafe::domain {

/**
 * @brief Строка черновика с зафиксированной ценой
 */
struct ResolvedLineItem {
    std::string productRef;
    std::string name;
    int64_t quantity = 0;
    Money unitPriceSnapshot;
};

/**
 * @brief Черновик заказа внутри одного запуска workflow
 *
 * Сохраняется только когда пользователь подтверждён и у каждой строки
 * есть цена. Частично заполненный черновик не сохраняется никогда.
 */
struct OrderDraft {
    std::string requestedUserId;
    std::vector<LineItemRequest> requestedLineItems;
    std::optional<UserSnapshot> resolvedUserSnapshot;
    std::vector<ResolvedLineItem> resolvedLineItems;

    bool isComplete() const {
        return resolvedUserSnapshot.has_value()
            && !requestedLineItems.empty()
            && resolvedLineItems.size() == requestedLineItems.size();
    }

    Money total() const {
        Money sum;
        if (!resolvedLineItems.empty()) {
            sum.currency = resolvedLineItems.front().unitPriceSnapshot.currency;
        }
        for (const auto& line : resolvedLineItems) {
            sum = sum + line.unitPriceSnapshot * line.quantity;
        }
        return sum;
    }
};

} // namespace cafe::domain
