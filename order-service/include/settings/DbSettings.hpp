#pragma once

#include <cstdlib>
#include <string>

namespace cafe::orders::settings {

/**
 * @brief Настройки подключения к PostgreSQL (ORDER_DB_*)
 */
class DbSettings {
public:
    DbSettings()
    {
        host_ = getEnvOrDefault("ORDER_DB_HOST", "order-postgres");
        port_ = std::stoi(getEnvOrDefault("ORDER_DB_PORT", "5432"));
        name_ = getEnvOrDefault("ORDER_DB_NAME", "orders_db");
        user_ = getEnvOrDefault("ORDER_DB_USER", "orders_user");
        password_ = getEnvOrDefault("ORDER_DB_PASSWORD", "orders_secret_password");
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getName() const { return name_; }
    std::string getUser() const { return user_; }
    std::string getPassword() const { return password_; }

    std::string getConnectionString() const
    {
        return "host=" + host_ + " port=" + std::to_string(port_) +
               " dbname=" + name_ + " user=" + user_ + " password=" + password_;
    }

private:
    std::string host_;
    int port_;
    std::string name_;
    std::string user_;
    std::string password_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue)
    {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace cafe::orders::settings
