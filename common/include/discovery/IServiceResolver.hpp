#pragma once

#include <stdexcept>
#include <string>

namespace cafe::discovery {

/**
 * @brief Сетевой адрес инстанса сервиса
 */
struct ServiceAddress {
    std::string host;
    int port = 0;

    std::string toString() const { return host + ":" + std::to_string(port); }
};

/**
 * @brief Нет ни одного живого инстанса сервиса
 */
class NoHealthyInstance : public std::runtime_error {
public:
    explicit NoHealthyInstance(const std::string& service)
        : std::runtime_error("no healthy instance of " + service)
        , service_(service)
    {}

    const std::string& service() const { return service_; }

private:
    std::string service_;
};

/**
 * @brief Интерфейс service discovery: имя сервиса -> адрес
 *
 * Логика адаптеров одинакова, чем бы ни был реализован resolve():
 * статической конфигурацией, DNS или реестром сервисов.
 */
class IServiceResolver {
public:
    virtual ~IServiceResolver() = default;

    /**
     * @throws NoHealthyInstance если сервис не найден
     */
    virtual ServiceAddress resolve(const std::string& serviceName) = 0;
};

} // namespace cafe::discovery
