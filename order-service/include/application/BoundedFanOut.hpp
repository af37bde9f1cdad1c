#pragma once

#include "resilience/CallResult.hpp"
#include <algorithm>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace cafe::orders::application {

/**
 * @brief Параллельный вызов для набора ключей с ограничением и ранним выходом
 *
 * - не больше `limit` вызовов одновременно
 * - первая неудача сразу возвращается вызывающему, новые ключи больше не берутся
 * - уже начатые вызовы дорабатывают в фоне, их результаты отбрасываются
 *
 * Рабочие потоки владеют состоянием через shared_ptr, поэтому
 * вызывающий может вернуться раньше них.
 *
 * @example
 * ```cpp
 * auto result = fanOut<CatalogItem>({"latte", "muffin"}, 4,
 *     [catalog](const std::string& id) { return catalog->getCatalogItem(id); });
 * ```
 */
template <typename T>
resilience::CallResult<std::map<std::string, T>> fanOut(
    const std::vector<std::string>& keys,
    int limit,
    std::function<resilience::CallResult<T>(const std::string&)> call)
{
    using Results = std::map<std::string, T>;

    struct State {
        std::mutex mutex;
        std::condition_variable done;
        std::deque<std::string> pending;
        Results results;
        std::optional<resilience::Failure> failure;
        size_t remaining = 0;
    };

    if (keys.empty()) {
        return resilience::CallResult<Results>::success({});
    }

    auto state = std::make_shared<State>();
    state->pending.assign(keys.begin(), keys.end());
    state->remaining = keys.size();

    size_t workers = std::min(keys.size(), static_cast<size_t>(limit < 1 ? 1 : limit));
    for (size_t i = 0; i < workers; ++i) {
        std::thread([state, call]() {
            for (;;) {
                std::string key;
                {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    if (state->failure || state->pending.empty()) {
                        return;
                    }
                    key = std::move(state->pending.front());
                    state->pending.pop_front();
                }

                resilience::CallResult<T> result = resilience::CallResult<T>::failure(
                    resilience::FailureKind::Internal, "call did not complete");
                try {
                    result = call(key);
                } catch (const std::exception& e) {
                    result = resilience::CallResult<T>::failure(resilience::FailureKind::Internal, e.what());
                } catch (...) {
                    result = resilience::CallResult<T>::failure(
                        resilience::FailureKind::Internal, "unknown exception");
                }

                std::lock_guard<std::mutex> lock(state->mutex);
                if (state->failure) {
                    return;  // заказ уже отклонён, результат никому не нужен
                }
                if (result.ok()) {
                    state->results.emplace(key, result.value());
                    --state->remaining;
                } else {
                    state->failure = result.failure();
                }
                state->done.notify_all();
            }
        }).detach();
    }

    std::unique_lock<std::mutex> lock(state->mutex);
    state->done.wait(lock, [&state] { return state->failure.has_value() || state->remaining == 0; });

    if (state->failure) {
        return resilience::CallResult<Results>::fail(*state->failure);
    }
    return resilience::CallResult<Results>::success(state->results);
}

} // namespace cafe::orders::application
