#pragma once

#include "resilience/FailureKind.hpp"
#include <string>
#include <variant>
#include <stdexcept>
#include <utility>

namespace cafe::resilience {

/**
 * @brief Описание неудачи: вид + человекочитаемое сообщение
 */
struct Failure {
    FailureKind kind = FailureKind::Internal;
    std::string message;
};

/**
 * @brief Результат вызова зависимости: Success(payload) | Failure(kind, message)
 *
 * Контракт, который возвращает каждый backend-адаптер.
 *
 * @example
 * ```cpp
 * auto result = usersClient->getUser("42");
 * if (!result.ok()) {
 *     return CallResult<Order>::fail(result.failure());
 * }
 * ```
 */
template <typename T>
class CallResult {
public:
    static CallResult success(T value) {
        return CallResult(std::variant<T, Failure>(std::in_place_index<0>, std::move(value)));
    }

    static CallResult failure(FailureKind kind, std::string message) {
        return CallResult(std::variant<T, Failure>(std::in_place_index<1>, Failure{kind, std::move(message)}));
    }

    static CallResult fail(Failure failure) {
        return CallResult(std::variant<T, Failure>(std::in_place_index<1>, std::move(failure)));
    }

    bool ok() const { return outcome_.index() == 0; }

    const T& value() const {
        if (!ok()) {
            throw std::logic_error("CallResult::value() on failure: " + failure().message);
        }
        return std::get<0>(outcome_);
    }

    T& value() {
        if (!ok()) {
            throw std::logic_error("CallResult::value() on failure: " + failure().message);
        }
        return std::get<0>(outcome_);
    }

    const Failure& failure() const {
        if (ok()) {
            throw std::logic_error("CallResult::failure() on success");
        }
        return std::get<1>(outcome_);
    }

    FailureKind kind() const { return failure().kind; }
    const std::string& message() const { return failure().message; }

    // Перенос неудачи в результат другого типа с сохранением вида ошибки
    template <typename U>
    CallResult<U> propagate() const {
        return CallResult<U>::fail(failure());
    }

    /// "OK" или имя вида ошибки (для логов и метрик)
    std::string outcomeName() const {
        return ok() ? "OK" : toString(failure().kind);
    }

private:
    explicit CallResult(std::variant<T, Failure> outcome) : outcome_(std::move(outcome)) {}

    std::variant<T, Failure> outcome_;
};

} // namespace cafe::resilience
