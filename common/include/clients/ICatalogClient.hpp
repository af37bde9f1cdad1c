#pragma once

#include "domain/CatalogItem.hpp"
#include "resilience/CallResult.hpp"
#include <string>

namespace cafe::clients {

/**
 * @brief Клиент Catalog (menu) backend'а
 */
class ICatalogClient {
public:
    virtual ~ICatalogClient() = default;

    virtual resilience::CallResult<domain::CatalogItem> getCatalogItem(const std::string& itemId) = 0;
};

} // namespace cafe::clients
