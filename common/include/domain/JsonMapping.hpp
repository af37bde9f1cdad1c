#pragma once

#include "domain/CatalogItem.hpp"
#include "domain/Order.hpp"
#include "domain/OrderRequest.hpp"
#include "domain/UserSnapshot.hpp"
#include <nlohmann/json.hpp>

/**
 * JSON представление доменных объектов (общий wire-формат gateway и order-service)
 */
namespace cafe::domain {

inline nlohmann::json toJson(const UserSnapshot& user) {
    return {
        {"id", user.id},
        {"name", user.name},
        {"email", user.email}
    };
}

inline UserSnapshot userFromJson(const nlohmann::json& j) {
    UserSnapshot user;
    user.id = j.value("id", "");
    user.name = j.value("name", "");
    user.email = j.value("email", "");
    return user;
}

inline nlohmann::json toJson(const CatalogItem& item) {
    return {
        {"id", item.id},
        {"name", item.name},
        {"description", item.description},
        {"price", item.price.toDouble()},
        {"currency", item.price.currency},
        {"available", item.available}
    };
}

inline CatalogItem catalogItemFromJson(const nlohmann::json& j) {
    CatalogItem item;
    item.id = j.value("id", "");
    item.name = j.value("name", "");
    item.description = j.value("description", "");
    item.price = Money::fromDouble(j.value("price", 0.0), j.value("currency", "USD"));
    item.available = j.value("available", true);
    return item;
}

inline nlohmann::json toJson(const OrderRequest& request) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& item : request.items) {
        items.push_back({{"menu_item_id", item.productRef}, {"quantity", item.quantity}});
    }
    return {{"user_id", request.userId}, {"items", items}};
}

/**
 * @throws nlohmann::json::exception при неверных типах полей
 */
inline OrderRequest orderRequestFromJson(const nlohmann::json& j) {
    OrderRequest request;
    request.userId = j.value("user_id", "");
    for (const auto& item : j.value("items", nlohmann::json::array())) {
        LineItemRequest line;
        line.productRef = item.value("menu_item_id", "");
        line.quantity = item.value("quantity", static_cast<int64_t>(0));
        request.items.push_back(line);
    }
    return request;
}

inline nlohmann::json toJson(const Order& order) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& line : order.items) {
        items.push_back({
            {"menu_item_id", line.productRef},
            {"name", line.name},
            {"quantity", line.quantity},
            {"unit_price", line.unitPrice.toDouble()}
        });
    }
    return {
        {"id", order.id},
        {"user_id", order.userId},
        {"status", toString(order.status)},
        {"total", order.total.toDouble()},
        {"currency", order.total.currency},
        {"created_at", order.createdAt.toString()},
        {"items", items}
    };
}

inline Order orderFromJson(const nlohmann::json& j) {
    Order order;
    order.id = j.value("id", "");
    order.userId = j.value("user_id", "");
    order.status = parseOrderStatus(j.value("status", "PENDING"));
    std::string currency = j.value("currency", "USD");
    order.total = Money::fromDouble(j.value("total", 0.0), currency);
    if (j.contains("created_at")) {
        order.createdAt = Timestamp::fromString(j.value("created_at", ""));
    }
    for (const auto& item : j.value("items", nlohmann::json::array())) {
        OrderLine line;
        line.productRef = item.value("menu_item_id", "");
        line.name = item.value("name", "");
        line.quantity = item.value("quantity", static_cast<int64_t>(0));
        line.unitPrice = Money::fromDouble(item.value("unit_price", 0.0), currency);
        order.items.push_back(line);
    }
    return order;
}

} // namespace cafe::domain
