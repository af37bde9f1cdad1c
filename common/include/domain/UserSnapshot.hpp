#pragma once

#include <string>

namespace cafe::domain {

/**
 * @brief Пользователь, как его вернул Users backend
 */
struct UserSnapshot {
    std::string id;
    std::string name;
    std::string email;
};

} // namespace cafe::domain
