#pragma once

#include <string>
#include <vector>

namespace cafe::resilience {

/**
 * @brief Классификация неудачного вызова зависимости
 *
 * Единый словарь ошибок для всех backend-адаптеров. Вид ошибки
 * сохраняется без изменений до слоя трансляции протокола.
 */
enum class FailureKind {
    Timeout,
    ConnectionRefused,
    DependencyUnavailable,   // открытый circuit breaker или нет живого инстанса
    NotFound,
    InvalidArgument,
    Unavailable,
    Internal
};

inline std::string toString(FailureKind kind) {
    switch (kind) {
        case FailureKind::Timeout: return "TIMEOUT";
        case FailureKind::ConnectionRefused: return "CONNECTION_REFUSED";
        case FailureKind::DependencyUnavailable: return "DEPENDENCY_UNAVAILABLE";
        case FailureKind::NotFound: return "NOT_FOUND";
        case FailureKind::InvalidArgument: return "INVALID_ARGUMENT";
        case FailureKind::Unavailable: return "UNAVAILABLE";
        case FailureKind::Internal: return "INTERNAL";
        default: return "UNKNOWN";
    }
}

inline std::vector<FailureKind> allFailureKinds() {
    return {
        FailureKind::Timeout,
        FailureKind::ConnectionRefused,
        FailureKind::DependencyUnavailable,
        FailureKind::NotFound,
        FailureKind::InvalidArgument,
        FailureKind::Unavailable,
        FailureKind::Internal
    };
}

/**
 * @brief Ошибки, которые правдоподобно временные
 *
 * DependencyUnavailable сюда не входит: повтор при открытом breaker
 * только тратит бюджет попыток.
 */
inline bool isTransient(FailureKind kind) {
    return kind == FailureKind::Timeout
        || kind == FailureKind::ConnectionRefused
        || kind == FailureKind::Unavailable;
}

/**
 * @brief Клиентские ошибки: backend корректно ответил "нет"
 *
 * Не повторяются и не засчитываются breaker'у как отказ.
 */
inline bool isClientError(FailureKind kind) {
    return kind == FailureKind::NotFound || kind == FailureKind::InvalidArgument;
}

} // namespace cafe::resilience
