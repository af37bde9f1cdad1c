#pragma once

#include "discovery/IServiceResolver.hpp"
#include <chrono>
#include <map>
#include <stdexcept>
#include <string>

namespace cafe::transport {

/**
 * @brief Унарный запрос к backend'у (метод + путь + JSON тело)
 */
struct BackendRequest {
    std::string method = "GET";
    std::string path;
    std::string body;
    std::map<std::string, std::string> headers;
};

/**
 * @brief Ответ backend'а: статус + тело
 */
struct BackendResponse {
    int status = 0;
    std::string body;
};

/**
 * @brief Ошибка транспорта: до backend'а не достучались
 */
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Сырой транспорт: один унарный вызов с дедлайном
 */
class IBackendTransport {
public:
    virtual ~IBackendTransport() = default;

    /**
     * @throws TransportError если соединение не установлено
     */
    virtual BackendResponse call(
        const discovery::ServiceAddress& address,
        const BackendRequest& request,
        std::chrono::milliseconds deadline) = 0;
};

} // namespace cafe::transport
