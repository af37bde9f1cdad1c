#pragma once

#include "discovery/IServiceResolver.hpp"
#include "resilience/CallResult.hpp"
#include "resilience/ResilientCaller.hpp"
#include "settings/DependencySettings.hpp"
#include "transport/IBackendTransport.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

namespace cafe::clients {

/**
 * @brief HTTP статус ответа backend'а -> вид ошибки
 */
inline resilience::FailureKind classifyStatus(int status) {
    using resilience::FailureKind;
    switch (status) {
        case 400: return FailureKind::InvalidArgument;
        case 404: return FailureKind::NotFound;
        case 408:
        case 504: return FailureKind::Timeout;
        case 502:
        case 503: return FailureKind::Unavailable;
        default: return FailureKind::Internal;
    }
}

/**
 * @brief Идентификатор, который безопасно подставлять в путь запроса
 */
inline bool isValidId(const std::string& id) {
    if (id.empty() || id.size() > 128) {
        return false;
    }
    for (char c : id) {
        if (c == '/' || c == '?' || c == '#' || c == '%' || c == ' ' || static_cast<unsigned char>(c) < 0x20) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Общая часть всех backend-адаптеров
 *
 * Один логический вызов:
 * breaker( retry( timeout( resolve → transport → decode ) ) )
 *
 * Трансляция ошибок:
 * - NoHealthyInstance      → DependencyUnavailable (учитывается breaker'ом)
 * - TransportError         → ConnectionRefused
 * - 404 / 400 / 503 / 5xx  → NotFound / InvalidArgument / Unavailable / Internal
 * - битый JSON в ответе    → Internal
 */
class BackendInvoker {
public:
    BackendInvoker(
        std::shared_ptr<discovery::IServiceResolver> resolver,
        std::shared_ptr<transport::IBackendTransport> transport,
        std::shared_ptr<resilience::CircuitBreakerRegistry> registry,
        const settings::DependencySettings& settings
    ) : serviceName_(settings.getServiceName())
      , resolver_(std::move(resolver))
      , transport_(std::move(transport))
      , caller_(settings.getServiceName(), settings.getPolicy(), std::move(registry))
    {}

    /**
     * @param request        запрос к backend'у
     * @param decode         JSON тела 2xx ответа -> T
     * @param notFoundMessage сообщение для NotFound (видно клиенту)
     */
    template <typename T>
    resilience::CallResult<T> invoke(
        transport::BackendRequest request,
        std::function<T(const nlohmann::json&)> decode,
        std::string notFoundMessage)
    {
        // Всё, что нужно попытке, захватывается по значению:
        // брошенная по таймауту попытка может пережить этот объект.
        auto resolver = resolver_;
        auto transport = transport_;
        auto serviceName = serviceName_;
        auto deadline = caller_.timeout();

        auto result = caller_.call<T>(
            [resolver, transport, serviceName, deadline, request, decode, notFoundMessage]()
                -> resilience::CallResult<T>
            {
                using resilience::CallResult;
                using resilience::FailureKind;

                discovery::ServiceAddress address;
                try {
                    address = resolver->resolve(serviceName);
                } catch (const discovery::NoHealthyInstance& e) {
                    return CallResult<T>::failure(FailureKind::DependencyUnavailable, e.what());
                }

                transport::BackendResponse response;
                try {
                    response = transport->call(address, request, deadline);
                } catch (const transport::TransportError& e) {
                    return CallResult<T>::failure(FailureKind::ConnectionRefused, e.what());
                }

                if (response.status < 200 || response.status >= 300) {
                    auto kind = classifyStatus(response.status);
                    std::string detail = errorDetail(response);
                    if (kind == FailureKind::NotFound) {
                        return CallResult<T>::failure(kind, notFoundMessage);
                    }
                    if (kind == FailureKind::InvalidArgument) {
                        return CallResult<T>::failure(kind, detail.empty() ? "invalid request" : detail);
                    }
                    std::string message = serviceName + " returned " + std::to_string(response.status);
                    return CallResult<T>::failure(kind, detail.empty() ? message : message + ": " + detail);
                }

                try {
                    return CallResult<T>::success(decode(nlohmann::json::parse(response.body)));
                } catch (const nlohmann::json::exception& e) {
                    return CallResult<T>::failure(
                        FailureKind::Internal,
                        serviceName + " returned malformed payload: " + e.what());
                }
            });

        if (!result.ok() && !resilience::isClientError(result.kind())) {
            std::cerr << "[BackendInvoker:" << serviceName_ << "] " << request.method << " " << request.path
                      << " failed: " << result.outcomeName() << " (" << result.message() << ")" << std::endl;
        }
        return result;
    }

    const std::string& serviceName() const { return serviceName_; }
    const std::shared_ptr<resilience::CircuitBreaker>& breaker() const { return caller_.breaker(); }

private:
    std::string serviceName_;
    std::shared_ptr<discovery::IServiceResolver> resolver_;
    std::shared_ptr<transport::IBackendTransport> transport_;
    resilience::ResilientCaller caller_;

    // Сообщение backend'а из {"error": "..."}, если есть
    static std::string errorDetail(const transport::BackendResponse& response) {
        try {
            auto body = nlohmann::json::parse(response.body);
            if (body.is_object()) {
                return body.value("error", "");
            }
        } catch (const nlohmann::json::exception&) {
            // тело не JSON: остаётся только статус
        }
        return "";
    }
};

} // namespace cafe::clients
