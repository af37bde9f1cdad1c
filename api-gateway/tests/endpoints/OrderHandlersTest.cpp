/**
 * @file OrderHandlersTest.cpp
 * @brief POST /api/v1/orders и GET /api/v1/orders/{id} в gateway
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/CreateOrderHandler.hpp"
#include "adapters/primary/GetOrderHandler.hpp"
#include "../mocks/MockBackendClients.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace cafe;
using namespace cafe::gateway::adapters::primary;
using namespace cafe::gateway::tests;
using resilience::CallResult;
using resilience::FailureKind;
using ::testing::_;
using ::testing::DoAll;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SaveArg;

// ============================================================================
// Test Fixture
// ============================================================================

class GatewayOrderHandlersTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockOrders_ = std::make_shared<MockOrdersClient>();
        mockCallLog_ = std::make_shared<NiceMock<MockCallLogSink>>();
        createHandler_ = std::make_unique<CreateOrderHandler>(mockOrders_, mockCallLog_);
        getHandler_ = std::make_unique<GetOrderHandler>(mockOrders_, mockCallLog_);
    }

    SimpleRequest postOrder(const std::string& body, const std::string& idempotencyKey = "") {
        SimpleRequest req;
        req.setMethod("POST");
        req.setPath("/api/v1/orders");
        req.setBody(body);
        if (!idempotencyKey.empty()) {
            req.setHeader("X-Idempotency-Key", idempotencyKey);
        }
        return req;
    }

    static domain::Order createTestOrder() {
        domain::Order order;
        order.id = "ord-7";
        order.userId = "42";
        order.items.push_back({"latte", "Latte", 1, domain::Money(4, 500000000, "USD")});
        order.total = domain::Money(4, 500000000, "USD");
        return order;
    }

    const std::string validBody_ = R"({"user_id":"42","items":[{"menu_item_id":"latte","quantity":1}]})";

    std::shared_ptr<MockOrdersClient> mockOrders_;
    std::shared_ptr<NiceMock<MockCallLogSink>> mockCallLog_;
    std::unique_ptr<CreateOrderHandler> createHandler_;
    std::unique_ptr<GetOrderHandler> getHandler_;
};

// ============================================================================
// ТЕСТЫ: POST /api/v1/orders
// ============================================================================

TEST_F(GatewayOrderHandlersTest, Create_Success_Returns201_EchoesClientKey) {
    domain::OrderRequest forwarded;
    EXPECT_CALL(*mockOrders_, createOrder(_))
        .WillOnce(DoAll(SaveArg<0>(&forwarded), Return(CallResult<domain::Order>::success(createTestOrder()))));

    auto req = postOrder(validBody_, "client-key-1");
    SimpleResponse res;

    createHandler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 201);
    EXPECT_EQ(nlohmann::json::parse(res.getBody())["id"], "ord-7");
    EXPECT_EQ(forwarded.idempotencyKey, "client-key-1");
    EXPECT_EQ(forwarded.userId, "42");
    EXPECT_EQ(res.getHeader("X-Idempotency-Key").value_or(""), "client-key-1");
}

TEST_F(GatewayOrderHandlersTest, Create_NoClientKey_GeneratesOne) {
    domain::OrderRequest forwarded;
    EXPECT_CALL(*mockOrders_, createOrder(_))
        .WillOnce(DoAll(SaveArg<0>(&forwarded), Return(CallResult<domain::Order>::success(createTestOrder()))));

    auto req = postOrder(validBody_);
    SimpleResponse res;

    createHandler_->handle(req, res);

    EXPECT_EQ(forwarded.idempotencyKey.rfind("gw-", 0), 0u);
    EXPECT_EQ(forwarded.idempotencyKey.size(), 3u + 32u);
    EXPECT_EQ(res.getHeader("X-Idempotency-Key").value_or(""), forwarded.idempotencyKey);
}

TEST_F(GatewayOrderHandlersTest, Create_GeneratedKeysDiffer) {
    std::vector<std::string> keys;
    EXPECT_CALL(*mockOrders_, createOrder(_))
        .Times(2)
        .WillRepeatedly([&keys](const domain::OrderRequest& request) {
            keys.push_back(request.idempotencyKey);
            return CallResult<domain::Order>::success(createTestOrder());
        });

    for (int i = 0; i < 2; ++i) {
        auto req = postOrder(validBody_);
        SimpleResponse res;
        createHandler_->handle(req, res);
    }

    ASSERT_EQ(keys.size(), 2u);
    EXPECT_NE(keys[0], keys[1]);
}

TEST_F(GatewayOrderHandlersTest, Create_Timeout_Returns503_KeyStillReturned) {
    EXPECT_CALL(*mockOrders_, createOrder(_))
        .WillOnce(Return(CallResult<domain::Order>::failure(FailureKind::Timeout, "no response within 8000 ms")));

    auto req = postOrder(validBody_, "client-key-2");
    SimpleResponse res;

    createHandler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 503);
    EXPECT_EQ(res.getHeader("X-Idempotency-Key").value_or(""), "client-key-2");
}

TEST_F(GatewayOrderHandlersTest, Create_OrderServiceRejects_Returns400WithReason) {
    EXPECT_CALL(*mockOrders_, createOrder(_))
        .WillOnce(Return(CallResult<domain::Order>::failure(FailureKind::InvalidArgument, "user 42 not found")));

    auto req = postOrder(validBody_);
    SimpleResponse res;

    createHandler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(nlohmann::json::parse(res.getBody())["error"], "user 42 not found");
}

TEST_F(GatewayOrderHandlersTest, Create_MissingUserId_Returns400_NoBackendCall) {
    EXPECT_CALL(*mockOrders_, createOrder(_)).Times(0);

    auto req = postOrder(R"({"items":[{"menu_item_id":"latte","quantity":1}]})");
    SimpleResponse res;

    createHandler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(nlohmann::json::parse(res.getBody())["error"], "user_id is required");
}

TEST_F(GatewayOrderHandlersTest, Create_EmptyItems_Returns400_NoBackendCall) {
    EXPECT_CALL(*mockOrders_, createOrder(_)).Times(0);

    auto req = postOrder(R"({"user_id":"42","items":[]})");
    SimpleResponse res;

    createHandler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(nlohmann::json::parse(res.getBody())["error"], "items must not be empty");
}

TEST_F(GatewayOrderHandlersTest, Create_BrokenJson_Returns400) {
    EXPECT_CALL(*mockOrders_, createOrder(_)).Times(0);

    auto req = postOrder("not json");
    SimpleResponse res;

    createHandler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

// ============================================================================
// ТЕСТЫ: GET /api/v1/orders/{id}
// ============================================================================

TEST_F(GatewayOrderHandlersTest, Get_Found_Returns200) {
    EXPECT_CALL(*mockOrders_, getOrder("ord-7"))
        .WillOnce(Return(CallResult<domain::Order>::success(createTestOrder())));

    SimpleRequest req;
    req.setMethod("GET");
    req.setPath("/api/v1/orders/ord-7");
    req.setPathPattern("/api/v1/orders/*");
    SimpleResponse res;

    getHandler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["id"], "ord-7");
    EXPECT_EQ(json["status"], "PENDING");
}

TEST_F(GatewayOrderHandlersTest, Get_OrdersDown_Returns503) {
    EXPECT_CALL(*mockOrders_, getOrder("ord-7"))
        .WillOnce(Return(CallResult<domain::Order>::failure(
            FailureKind::ConnectionRefused, "connection to order-service:8080 refused")));

    SimpleRequest req;
    req.setMethod("GET");
    req.setPath("/api/v1/orders/ord-7");
    req.setPathPattern("/api/v1/orders/*");
    SimpleResponse res;

    getHandler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 503);
    auto error = nlohmann::json::parse(res.getBody())["error"].get<std::string>();
    EXPECT_EQ(error.find("order-service:8080"), std::string::npos);
}
