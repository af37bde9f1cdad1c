#pragma once

#include "clients/IUsersClient.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <optional>

namespace cafe::orders::tests::mocks {

/**
 * @brief Users backend в памяти: известные пользователи + принудительная ошибка
 */
class StubUsersClient : public clients::IUsersClient {
public:
    void addUser(const std::string& id, const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        users_[id] = domain::UserSnapshot{id, name, name + "@example.com"};
    }

    void failWith(resilience::FailureKind kind, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        forced_ = resilience::Failure{kind, message};
    }

    resilience::CallResult<domain::UserSnapshot> getUser(const std::string& userId) override {
        ++calls_;
        std::lock_guard<std::mutex> lock(mutex_);
        if (forced_) {
            return resilience::CallResult<domain::UserSnapshot>::fail(*forced_);
        }
        auto it = users_.find(userId);
        if (it == users_.end()) {
            return resilience::CallResult<domain::UserSnapshot>::failure(
                resilience::FailureKind::NotFound, "user " + userId + " not found");
        }
        return resilience::CallResult<domain::UserSnapshot>::success(it->second);
    }

    int callCount() const { return calls_.load(); }

private:
    std::mutex mutex_;
    std::map<std::string, domain::UserSnapshot> users_;
    std::optional<resilience::Failure> forced_;
    std::atomic<int> calls_{0};
};

} // namespace cafe::orders::tests::mocks
