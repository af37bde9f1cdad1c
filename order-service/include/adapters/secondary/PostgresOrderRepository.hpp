#pragma once

#include "ports/output/IOrderRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <random>
#include <sstream>

namespace cafe::orders::adapters::secondary {

/**
 * @brief PostgreSQL хранилище заказов
 *
 * Заказ и его строки пишутся одной транзакцией: либо заказ виден целиком,
 * либо не виден вообще. Цены хранятся как units + nano без потери точности.
 */
class PostgresOrderRepository : public ports::output::IOrderRepository {
public:
    explicit PostgresOrderRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
        , rng_(std::random_device{}())
    {
        initSchema();
        std::cout << "[PostgresOrderRepository] Initialized (" << settings_->getName() << ")" << std::endl;
    }

    std::string create(const domain::Order& order) override {
        std::string orderId = generateOrderId();

        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params(
                "INSERT INTO orders "
                "(order_id, user_id, status, total_units, total_nano, currency, created_at) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7::timestamptz)",
                orderId,
                order.userId,
                domain::toString(order.status),
                order.total.units,
                order.total.nano,
                order.total.currency,
                order.createdAt.toString()
            );

            int position = 0;
            for (const auto& line : order.items) {
                txn.exec_params(
                    "INSERT INTO order_items "
                    "(order_id, position, menu_item_id, name, quantity, unit_price_units, unit_price_nano) "
                    "VALUES ($1, $2, $3, $4, $5, $6, $7)",
                    orderId,
                    position++,
                    line.productRef,
                    line.name,
                    line.quantity,
                    line.unitPrice.units,
                    line.unitPrice.nano
                );
            }

            txn.commit();
            std::cout << "[PostgresOrderRepository] Saved order: " << orderId << std::endl;
            return orderId;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrderRepository] create error: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Order> findById(const std::string& orderId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto orderRows = txn.exec_params(
                "SELECT order_id, user_id, status, total_units, total_nano, currency, "
                "       to_char(created_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS') AS created_at "
                "FROM orders WHERE order_id = $1",
                orderId
            );
            if (orderRows.empty()) {
                txn.commit();
                return std::nullopt;
            }

            auto itemRows = txn.exec_params(
                "SELECT menu_item_id, name, quantity, unit_price_units, unit_price_nano "
                "FROM order_items WHERE order_id = $1 ORDER BY position",
                orderId
            );
            txn.commit();

            return rowsToOrder(orderRows[0], itemRows);
        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrderRepository] findById error: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
    std::mutex rngMutex_;
    std::mt19937_64 rng_;

    std::string generateOrderId() {
        std::uniform_int_distribution<uint64_t> dist;
        uint64_t id;
        {
            std::lock_guard<std::mutex> lock(rngMutex_);
            id = dist(rng_);
        }

        std::stringstream ss;
        ss << "ord-" << std::hex << std::setfill('0') << std::setw(16) << id;
        return ss.str();
    }

    void initSchema() {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS orders (
                order_id VARCHAR(64) PRIMARY KEY,
                user_id VARCHAR(128) NOT NULL,
                status VARCHAR(16) NOT NULL,
                total_units BIGINT NOT NULL,
                total_nano INTEGER NOT NULL,
                currency VARCHAR(8) NOT NULL,
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            );

            CREATE TABLE IF NOT EXISTS order_items (
                order_id VARCHAR(64) NOT NULL REFERENCES orders(order_id) ON DELETE CASCADE,
                position INTEGER NOT NULL,
                menu_item_id VARCHAR(128) NOT NULL,
                name VARCHAR(256) NOT NULL,
                quantity BIGINT NOT NULL,
                unit_price_units BIGINT NOT NULL,
                unit_price_nano INTEGER NOT NULL,
                PRIMARY KEY (order_id, position)
            );

            CREATE INDEX IF NOT EXISTS idx_orders_user ON orders(user_id);
        )");

        txn.commit();
        std::cout << "[PostgresOrderRepository] Schema initialized" << std::endl;
    }

    static domain::Order rowsToOrder(const pqxx::row& row, const pqxx::result& items) {
        domain::Order order;
        order.id = row["order_id"].as<std::string>();
        order.userId = row["user_id"].as<std::string>();
        order.status = domain::parseOrderStatus(row["status"].as<std::string>());
        std::string currency = row["currency"].as<std::string>();
        order.total = domain::Money(row["total_units"].as<int64_t>(), row["total_nano"].as<int32_t>(), currency);
        order.createdAt = domain::Timestamp::fromString(row["created_at"].as<std::string>());

        for (const auto& item : items) {
            domain::OrderLine line;
            line.productRef = item["menu_item_id"].as<std::string>();
            line.name = item["name"].as<std::string>();
            line.quantity = item["quantity"].as<int64_t>();
            line.unitPrice = domain::Money(
                item["unit_price_units"].as<int64_t>(), item["unit_price_nano"].as<int32_t>(), currency);
            order.items.push_back(line);
        }
        return order;
    }
};

} // namespace cafe::orders::adapters::secondary
