#pragma once

#include "ports/output/IIdempotencyRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace cafe::orders::adapters::secondary {

/**
 * @brief Сохранённые ответы по X-Idempotency-Key (PostgreSQL)
 */
class PostgresIdempotencyRepository : public ports::output::IIdempotencyRepository {
public:
    explicit PostgresIdempotencyRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS idempotency_keys (
                key VARCHAR(128) PRIMARY KEY,
                response_status INTEGER NOT NULL,
                response_body TEXT NOT NULL,
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");
        txn.commit();
        std::cout << "[PostgresIdempotencyRepository] Connected to " << settings_->getName() << std::endl;
    }

    std::optional<domain::IdempotencyRecord> findByKey(const std::string& key) override {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);
        auto result = txn.exec_params(
            "SELECT key, response_status, response_body FROM idempotency_keys WHERE key = $1", key);
        txn.commit();
        if (result.empty()) {
            return std::nullopt;
        }
        return domain::IdempotencyRecord{
            result[0][0].as<std::string>(),
            result[0][1].as<int>(),
            result[0][2].as<std::string>()};
    }

    void saveIfAbsent(const domain::IdempotencyRecord& record) override {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);
        txn.exec_params(
            "INSERT INTO idempotency_keys (key, response_status, response_body) VALUES ($1, $2, $3) "
            "ON CONFLICT (key) DO NOTHING",
            record.key, record.status, record.body);
        txn.commit();
        std::cout << "[PostgresIdempotencyRepository] Saved key: " << record.key << std::endl;
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace cafe::orders::adapters::secondary
