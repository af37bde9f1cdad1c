#pragma once

#include "ports/output/IOrderRepository.hpp"
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>

namespace cafe::orders::tests::mocks {

/**
 * @brief In-Memory реализация хранилища заказов для unit-тестов
 */
class InMemoryOrderRepository : public ports::output::IOrderRepository {
public:
    std::string create(const domain::Order& order) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failWrites_) {
            throw std::runtime_error("connection to orders_db lost");
        }
        std::string id = "ord-" + std::to_string(++sequence_);
        domain::Order stored = order;
        stored.id = id;
        orders_[id] = stored;
        return id;
    }

    std::optional<domain::Order> findById(const std::string& orderId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failReads_) {
            throw std::runtime_error("connection to orders_db lost");
        }
        auto it = orders_.find(orderId);
        if (it == orders_.end()) return std::nullopt;
        return it->second;
    }

    // Test helpers
    void setFailWrites(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        failWrites_ = fail;
    }

    void setFailReads(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        failReads_ = fail;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return orders_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, domain::Order> orders_;
    int sequence_ = 0;
    bool failWrites_ = false;
    bool failReads_ = false;
};

} // namespace cafe::orders::tests::mocks
