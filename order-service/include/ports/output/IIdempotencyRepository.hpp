#pragma once

#include "domain/IdempotencyRecord.hpp"
#include <optional>
#include <string>

namespace cafe::orders::ports::output {

/**
 * @brief Хранилище ответов на создание заказа по ключу идемпотентности
 *
 * Запись с ключом не перезаписывается: побеждает первый сохранённый ответ.
 * Ошибки хранилища пробрасываются исключениями (pqxx::failure и т.п.).
 */
class IIdempotencyRepository {
public:
    virtual ~IIdempotencyRepository() = default;

    virtual std::optional<domain::IdempotencyRecord> findByKey(const std::string& key) = 0;

    /// Сохранить, если ключа ещё нет; существующая запись остаётся как есть
    virtual void saveIfAbsent(const domain::IdempotencyRecord& record) = 0;
};

} // namespace cafe::orders::ports::output
