#pragma once

#include <string>

namespace cafe::domain {

/**
 * @brief Сохранённый ответ на запрос с X-Idempotency-Key
 */
struct IdempotencyRecord {
    std::string key;
    int status = 0;
    std::string body;
};

} // namespace cafe::domain
