#pragma once

#include <chrono>
#include <string>

namespace cafe::logging {

/**
 * @brief Запись об одном входящем вызове, проксированном в backend
 */
struct CallRecord {
    std::string dependency;          ///< users / catalog / orders
    std::string operation;           ///< getUser, getCatalogItem, createOrder, ...
    std::string outcome;             ///< "OK" или имя FailureKind
    std::chrono::milliseconds latency{0};
};

} // namespace cafe::logging
