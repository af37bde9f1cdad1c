#pragma once

#include "clients/ICatalogClient.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <thread>

namespace cafe::orders::tests::mocks {

/**
 * @brief Меню в памяти
 *
 * Вызывается из потоков fan-out, поэтому потокобезопасен.
 * Считает вызовы и максимум одновременных вызовов.
 */
class StubCatalogClient : public clients::ICatalogClient {
public:
    void setItem(const std::string& id, const std::string& name, domain::Money price, bool available = true) {
        std::lock_guard<std::mutex> lock(mutex_);
        items_[id] = domain::CatalogItem{id, name, "", price, available};
    }

    void failItem(const std::string& id, resilience::FailureKind kind, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_[id] = resilience::Failure{kind, message};
    }

    void setLatency(std::chrono::milliseconds latency) {
        std::lock_guard<std::mutex> lock(mutex_);
        latency_ = latency;
    }

    resilience::CallResult<domain::CatalogItem> getCatalogItem(const std::string& itemId) override {
        ++calls_;
        int now = ++inFlight_;
        int seen = maxInFlight_.load();
        while (now > seen && !maxInFlight_.compare_exchange_weak(seen, now)) {
        }

        std::chrono::milliseconds latency;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            latency = latency_;
            ++callsById_[itemId];
        }
        if (latency.count() > 0) {
            std::this_thread::sleep_for(latency);
        }

        auto result = lookup(itemId);
        --inFlight_;
        return result;
    }

    int callCount() const { return calls_.load(); }

    int callCount(const std::string& itemId) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = callsById_.find(itemId);
        return it == callsById_.end() ? 0 : it->second;
    }

    int maxInFlight() const { return maxInFlight_.load(); }

private:
    std::mutex mutex_;
    std::map<std::string, domain::CatalogItem> items_;
    std::map<std::string, resilience::Failure> failures_;
    std::map<std::string, int> callsById_;
    std::chrono::milliseconds latency_{0};
    std::atomic<int> calls_{0};
    std::atomic<int> inFlight_{0};
    std::atomic<int> maxInFlight_{0};

    resilience::CallResult<domain::CatalogItem> lookup(const std::string& itemId) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto failure = failures_.find(itemId);
        if (failure != failures_.end()) {
            return resilience::CallResult<domain::CatalogItem>::fail(failure->second);
        }
        auto it = items_.find(itemId);
        if (it == items_.end()) {
            return resilience::CallResult<domain::CatalogItem>::failure(
                resilience::FailureKind::NotFound, "menu item " + itemId + " not found");
        }
        return resilience::CallResult<domain::CatalogItem>::success(it->second);
    }
};

} // namespace cafe::orders::tests::mocks
