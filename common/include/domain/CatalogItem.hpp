#pragma once

#include "domain/Money.hpp"
#include <string>

namespace cafe::domain {

/**
 * @brief Позиция меню (Catalog backend)
 */
struct CatalogItem {
    std::string id;
    std::string name;
    std::string description;
    Money price;
    bool available = true;
};

} // namespace cafe::domain
