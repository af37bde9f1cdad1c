#pragma once

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace cafe::orders::settings {

/**
 * @brief Настройки создания заказа
 *
 * - ORDER_FANOUT_LIMIT: максимум одновременных запросов к Catalog на один заказ
 * - ORDER_MAX_LINE_ITEMS: максимум строк в заказе
 * - ORDER_MAX_QUANTITY: максимум единиц в одной строке
 */
class OrderWorkflowSettings {
public:
    OrderWorkflowSettings()
        : OrderWorkflowSettings(getIntOrDefault("ORDER_FANOUT_LIMIT", 4),
                                getIntOrDefault("ORDER_MAX_LINE_ITEMS", 50),
                                getIntOrDefault("ORDER_MAX_QUANTITY", 1000))
    {
        std::cout << "[OrderWorkflowSettings] fanout=" << fanOutLimit_
                  << " maxLineItems=" << maxLineItems_
                  << " maxQuantity=" << maxQuantity_ << std::endl;
    }

    OrderWorkflowSettings(int fanOutLimit, int maxLineItems, int maxQuantity = 1000)
        : fanOutLimit_(fanOutLimit)
        , maxLineItems_(maxLineItems)
        , maxQuantity_(maxQuantity)
    {
        if (fanOutLimit_ < 1) {
            throw std::invalid_argument("ORDER_FANOUT_LIMIT must be >= 1");
        }
        if (maxLineItems_ < 1) {
            throw std::invalid_argument("ORDER_MAX_LINE_ITEMS must be >= 1");
        }
        if (maxQuantity_ < 1) {
            throw std::invalid_argument("ORDER_MAX_QUANTITY must be >= 1");
        }
    }

    int getFanOutLimit() const { return fanOutLimit_; }
    int getMaxLineItems() const { return maxLineItems_; }
    int getMaxQuantity() const { return maxQuantity_; }

private:
    int fanOutLimit_;
    int maxLineItems_;
    int maxQuantity_;

    static int getIntOrDefault(const char* name, int defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::stoi(value) : defaultValue;
    }
};

} // namespace cafe::orders::settings
