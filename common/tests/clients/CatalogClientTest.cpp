/**
 * @file CatalogClientTest.cpp
 */

#include <gtest/gtest.h>

#include "clients/CatalogClient.hpp"
#include "fakes/FakeBackendTransport.hpp"
#include "fakes/FakeServiceResolver.hpp"

using namespace cafe;
using namespace cafe::clients;
using namespace cafe::resilience;
using cafe::tests::FakeBackendTransport;
using cafe::tests::FakeServiceResolver;
using std::chrono::milliseconds;

class CatalogClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        DependencyPolicy policy;
        policy.timeout = milliseconds(100);
        policy.retry = RetryPolicy(2, milliseconds(1), milliseconds(1));

        resolver_ = std::make_shared<FakeServiceResolver>();
        resolver_->add("catalog", "catalog-service", 8080);
        transport_ = std::make_shared<FakeBackendTransport>();
        client_ = std::make_shared<CatalogClient>(
            resolver_, transport_, std::make_shared<CircuitBreakerRegistry>(),
            std::make_shared<settings::CatalogClientSettings>(policy));
    }

    std::shared_ptr<FakeServiceResolver> resolver_;
    std::shared_ptr<FakeBackendTransport> transport_;
    std::shared_ptr<CatalogClient> client_;
};

TEST_F(CatalogClientTest, GetCatalogItem_DecodesPriceAndAvailability) {
    transport_->script("GET", "/api/v1/menu/latte", {FakeBackendTransport::respond(200,
        R"({"id":"latte","name":"Latte","description":"Milk coffee","price":4.5,"currency":"EUR","available":false})")});

    auto result = client_->getCatalogItem("latte");

    ASSERT_TRUE(result.ok());
    const auto& item = result.value();
    EXPECT_EQ(item.id, "latte");
    EXPECT_EQ(item.name, "Latte");
    EXPECT_EQ(item.description, "Milk coffee");
    EXPECT_EQ(item.price, domain::Money(4, 500000000, "EUR"));
    EXPECT_FALSE(item.available);
}

TEST_F(CatalogClientTest, MissingItem_NotFoundMessage) {
    auto result = client_->getCatalogItem("unicorn-frappe");

    EXPECT_EQ(result.kind(), FailureKind::NotFound);
    EXPECT_EQ(result.message(), "menu item unicorn-frappe not found");
}

TEST_F(CatalogClientTest, InvalidId_NoBackendCall) {
    auto result = client_->getCatalogItem("");

    EXPECT_EQ(result.kind(), FailureKind::InvalidArgument);
    EXPECT_EQ(result.message(), "invalid menu item id");
    EXPECT_EQ(transport_->callCount(), 0u);
}

TEST_F(CatalogClientTest, GatewayTimeoutStatus_ClassifiedAsTimeout_Retried) {
    transport_->script("GET", "/api/v1/menu/latte", {FakeBackendTransport::respond(504, "")});

    auto result = client_->getCatalogItem("latte");

    EXPECT_EQ(result.kind(), FailureKind::Timeout);
    EXPECT_EQ(transport_->callCount(), 2u);
}
