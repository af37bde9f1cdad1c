#pragma once

#include "metrics/IMetricsService.hpp"
#include "metrics/IMetricsSettings.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace cafe::metrics {

/**
 * @brief Потокобезопасные счётчики
 *
 * - shared_mutex: чтение под shared lock, новые ключи под unique lock
 * - сами счётчики атомарные, инкремент существующего ключа без эксклюзивной блокировки
 * - ключи не вытесняются
 */
class MetricsService : public IMetricsService {
public:
    explicit MetricsService(std::shared_ptr<IMetricsSettings> settings)
        : settings_(std::move(settings))
    {
        for (const auto& key : settings_->getAllKeys()) {
            counters_[key] = std::make_unique<std::atomic<int64_t>>(0);
            order_.push_back(key);
        }

        std::cout << "[MetricsService] Initialized with "
                  << counters_.size() << " metrics" << std::endl;
    }

    void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) override {
        std::string key = buildKey(name, labels);

        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = counters_.find(key);
            if (it != counters_.end()) {
                it->second->fetch_add(1, std::memory_order_relaxed);
                return;
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = counters_.find(key);
        if (it != counters_.end()) {
            it->second->fetch_add(1, std::memory_order_relaxed);
        } else {
            counters_[key] = std::make_unique<std::atomic<int64_t>>(1);
            order_.push_back(key);
        }
    }

    std::string toPrometheusFormat() const override {
        std::ostringstream oss;

        for (const auto& def : settings_->getDefinitions()) {
            oss << "# HELP " << def.name << " " << def.help << "\n";
            oss << "# TYPE " << def.name << " " << def.type << "\n";
        }

        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& key : order_) {
            oss << key << " " << counters_.at(key)->load(std::memory_order_relaxed) << "\n";
        }

        return oss.str();
    }

    /// Текущее значение (0 для неизвестного ключа)
    int64_t value(const std::string& name, const std::map<std::string, std::string>& labels = {}) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = counters_.find(buildKey(name, labels));
        return it != counters_.end() ? it->second->load(std::memory_order_relaxed) : 0;
    }

    static std::string buildKey(
        const std::string& name,
        const std::map<std::string, std::string>& labels
    ) {
        if (labels.empty()) {
            return name;
        }

        std::ostringstream oss;
        oss << name << "{";
        bool first = true;
        for (const auto& [k, v] : labels) {
            if (!first) oss << ",";
            oss << k << "=\"" << v << "\"";
            first = false;
        }
        oss << "}";
        return oss.str();
    }

private:
    std::shared_ptr<IMetricsSettings> settings_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<std::atomic<int64_t>>> counters_;
    std::vector<std::string> order_;  // порядок вывода: сначала заранее объявленные ключи
};

} // namespace cafe::metrics
