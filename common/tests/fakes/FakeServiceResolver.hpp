#pragma once

#include "discovery/IServiceResolver.hpp"
#include <map>
#include <mutex>
#include <string>

namespace cafe::tests {

/**
 * @brief Resolver со статической таблицей; неизвестное имя -> NoHealthyInstance
 */
class FakeServiceResolver : public discovery::IServiceResolver {
public:
    void add(const std::string& service, const std::string& host, int port) {
        std::lock_guard<std::mutex> lock(mutex_);
        addresses_[service] = discovery::ServiceAddress{host, port};
    }

    void remove(const std::string& service) {
        std::lock_guard<std::mutex> lock(mutex_);
        addresses_.erase(service);
    }

    discovery::ServiceAddress resolve(const std::string& serviceName) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++resolveCount_;
        auto it = addresses_.find(serviceName);
        if (it == addresses_.end()) {
            throw discovery::NoHealthyInstance(serviceName);
        }
        return it->second;
    }

    int resolveCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return resolveCount_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, discovery::ServiceAddress> addresses_;
    int resolveCount_ = 0;
};

} // namespace cafe::tests
