#pragma once

#include "resilience/CallResult.hpp"
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <thread>
#include <string>

namespace cafe::resilience {

/**
 * @brief Выполнить операцию с дедлайном
 *
 * Операция запускается в отдельном потоке. Если к дедлайну результата нет,
 * возвращается Failure(Timeout), а операция брошена: поток доработает в фоне,
 * результат будет отброшен. Отмена на стороне backend: best-effort
 * (адаптер передаёт дедлайн в заголовке запроса).
 *
 * ВАЖНО: operation может пережить вызывающего, поэтому она должна владеть
 * всем, что использует (shared_ptr, копии аргументов), а не ссылаться
 * на стек или `this` вызывающего.
 *
 * Любое исключение из operation превращается в Failure(Internal).
 */
template <typename T>
CallResult<T> withTimeout(std::chrono::milliseconds deadline,
                          std::function<CallResult<T>()> operation) {
    auto promise = std::make_shared<std::promise<CallResult<T>>>();
    auto future = promise->get_future();

    std::thread([promise, op = std::move(operation)]() {
        try {
            promise->set_value(op());
        } catch (const std::exception& e) {
            promise->set_value(CallResult<T>::failure(FailureKind::Internal, e.what()));
        } catch (...) {
            promise->set_value(CallResult<T>::failure(FailureKind::Internal, "unknown exception"));
        }
    }).detach();

    if (future.wait_for(deadline) != std::future_status::ready) {
        return CallResult<T>::failure(
            FailureKind::Timeout,
            "no response within " + std::to_string(deadline.count()) + " ms");
    }
    return future.get();
}

} // namespace cafe::resilience
