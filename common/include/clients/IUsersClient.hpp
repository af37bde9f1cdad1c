#pragma once

#include "domain/UserSnapshot.hpp"
#include "resilience/CallResult.hpp"
#include <string>

namespace cafe::clients {

/**
 * @brief Клиент Users backend'а
 */
class IUsersClient {
public:
    virtual ~IUsersClient() = default;

    /**
     * @brief Получить пользователя по ID
     * @return UserSnapshot или Failure (NotFound, если пользователя нет)
     */
    virtual resilience::CallResult<domain::UserSnapshot> getUser(const std::string& userId) = 0;
};

} // namespace cafe::clients
