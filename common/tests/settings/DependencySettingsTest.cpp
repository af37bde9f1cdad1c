#include <gtest/gtest.h>

#include "settings/DependencySettings.hpp"

#include <chrono>
#include <cstdlib>
#include <stdexcept>

using namespace cafe;
using std::chrono::milliseconds;

namespace {

void clearPrefix(const std::string& prefix) {
    for (const char* suffix : {"_TIMEOUT_MS", "_RETRY_MAX_ATTEMPTS", "_RETRY_BASE_DELAY_MS",
                               "_RETRY_MAX_DELAY_MS", "_BREAKER_FAILURE_THRESHOLD",
                               "_BREAKER_SUCCESS_THRESHOLD", "_BREAKER_RESET_TIMEOUT_MS"}) {
        unsetenv((prefix + suffix).c_str());
    }
}

// Худший случай одного вызова через ResilientCaller: все попытки до таймаута
// и максимальный jitter на каждой паузе
milliseconds worstCase(const resilience::DependencyPolicy& policy) {
    milliseconds total = policy.timeout * policy.retry.maxAttempts();
    for (int k = 0; k + 1 < policy.retry.maxAttempts(); ++k) {
        total += policy.retry.backoffDelay(k) * 3 / 2;
    }
    return total;
}

} // namespace

class DependencySettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        clearPrefix("USERS");
        clearPrefix("CATALOG");
        clearPrefix("ORDERS");
    }

    void TearDown() override {
        SetUp();
    }
};

TEST_F(DependencySettingsTest, Defaults_LookupsShortOrdersLonger) {
    settings::UsersClientSettings users;
    settings::OrdersClientSettings orders;

    EXPECT_EQ(users.getServiceName(), "users");
    EXPECT_EQ(users.getPolicy().timeout, milliseconds(2000));
    EXPECT_EQ(users.getPolicy().retry.maxAttempts(), 3);
    EXPECT_EQ(users.getPolicy().breaker.failureThreshold, 3);
    EXPECT_EQ(orders.getServiceName(), "orders");
    EXPECT_EQ(orders.getPolicy().timeout, milliseconds(15000));
}

TEST_F(DependencySettingsTest, OrdersTimeout_CoversNestedUsersAndCatalogCalls) {
    settings::UsersClientSettings users;
    settings::CatalogClientSettings catalog;
    settings::OrdersClientSettings orders;

    auto nested = worstCase(users.getPolicy()) + worstCase(catalog.getPolicy());

    EXPECT_EQ(nested, milliseconds(12900));
    EXPECT_GT(orders.getPolicy().timeout, nested);
}

TEST_F(DependencySettingsTest, EnvOverride_Applied) {
    setenv("CATALOG_TIMEOUT_MS", "750", 1);
    setenv("CATALOG_RETRY_MAX_ATTEMPTS", "5", 1);

    settings::CatalogClientSettings catalog;

    EXPECT_EQ(catalog.getPolicy().timeout, milliseconds(750));
    EXPECT_EQ(catalog.getPolicy().retry.maxAttempts(), 5);
}

TEST_F(DependencySettingsTest, NonNumericValue_Throws) {
    setenv("ORDERS_TIMEOUT_MS", "fast", 1);

    EXPECT_THROW(settings::OrdersClientSettings(), std::invalid_argument);
}
