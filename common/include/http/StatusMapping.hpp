#pragma once

#include "resilience/CallResult.hpp"
#include "resilience/FailureKind.hpp"
#include <IResponse.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace cafe::http {

/**
 * @brief FailureKind -> HTTP статус
 *
 * | Kind                  | HTTP |
 * |-----------------------|------|
 * | NotFound              | 404  |
 * | InvalidArgument       | 400  |
 * | DependencyUnavailable | 503  |
 * | Timeout               | 503  |
 * | ConnectionRefused     | 503  |
 * | Unavailable           | 503  |
 * | Internal              | 500  |
 */
inline int toHttpStatus(resilience::FailureKind kind) {
    using resilience::FailureKind;
    switch (kind) {
        case FailureKind::NotFound:              return 404;
        case FailureKind::InvalidArgument:       return 400;
        case FailureKind::DependencyUnavailable: return 503;
        case FailureKind::Timeout:               return 503;
        case FailureKind::ConnectionRefused:     return 503;
        case FailureKind::Unavailable:           return 503;
        case FailureKind::Internal:              return 500;
    }
    return 500;
}

/**
 * @brief Сообщение для клиента
 *
 * NotFound / InvalidArgument несут сообщение backend'а как есть.
 * Для остальных видов детали (адреса, breaker, retry) наружу не уходят.
 */
inline std::string toClientMessage(const resilience::Failure& failure) {
    using resilience::FailureKind;
    switch (failure.kind) {
        case FailureKind::NotFound:
        case FailureKind::InvalidArgument:
            return failure.message;
        case FailureKind::DependencyUnavailable:
        case FailureKind::ConnectionRefused:
        case FailureKind::Unavailable:
            return "Service temporarily unavailable";
        case FailureKind::Timeout:
            return "Service temporarily unavailable, request timed out";
        case FailureKind::Internal:
            return "Internal server error";
    }
    return "Internal server error";
}

inline void sendError(IResponse& res, int status, const std::string& message) {
    nlohmann::json error;
    error["error"] = message;
    res.setResult(status, "application/json", error.dump());
}

inline void sendFailure(IResponse& res, const resilience::Failure& failure) {
    sendError(res, toHttpStatus(failure.kind), toClientMessage(failure));
}

} // namespace cafe::http
