#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <functional>

/**
 * @brief Потокобезопасная map ключ -> shared_ptr<V>
 *
 * Read-mostly: чтения под shared_lock, запись под unique_lock.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    void insert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_[key] = value;
    }

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    /**
     * @brief Найти значение или атомарно создать его через factory
     *
     * factory вызывается не более одного раза на ключ, даже при гонке
     * нескольких потоков за один и тот же ключ.
     */
    std::shared_ptr<V> findOrInsert(const K &key, const std::function<std::shared_ptr<V>()> &factory)
    {
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = map_.find(key);
            if (it != map_.end())
                return it->second;
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end())
            return it->second;

        auto value = factory();
        map_[key] = value;
        return value;
    }

    bool erase(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    void forEach(const std::function<void(const K &, const std::shared_ptr<V> &)> &visitor) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto &[key, value] : map_)
            visitor(key, value);
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};
