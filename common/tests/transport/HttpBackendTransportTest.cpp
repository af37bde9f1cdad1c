#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "transport/HttpBackendTransport.hpp"
#include <IHttpClient.hpp>
#include <SimpleResponse.hpp>

using namespace cafe;
using namespace cafe::transport;
using ::testing::_;
using ::testing::Return;

// ============================================================================
// Mocks
// ============================================================================

class MockHttpClient : public IHttpClient {
public:
    MOCK_METHOD(bool, send, (const IRequest& req, IResponse& res), (override));
};

// ============================================================================
// Test Fixture
// ============================================================================

class HttpBackendTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockHttpClient_ = std::make_shared<MockHttpClient>();
        transport_ = std::make_shared<HttpBackendTransport>(mockHttpClient_);
        address_ = discovery::ServiceAddress{"catalog-service", 8080};
    }

    std::shared_ptr<MockHttpClient> mockHttpClient_;
    std::shared_ptr<HttpBackendTransport> transport_;
    discovery::ServiceAddress address_;
};

// ============================================================================
// ТЕСТЫ: call
// ============================================================================

TEST_F(HttpBackendTransportTest, Get_SendsToResolvedAddress_ReturnsStatusAndBody) {
    EXPECT_CALL(*mockHttpClient_, send(_, _))
        .WillOnce([](const IRequest& req, IResponse& res) {
            EXPECT_EQ(req.getMethod(), "GET");
            EXPECT_EQ(req.getPath(), "/api/v1/menu/latte");
            EXPECT_EQ(req.getIp(), "catalog-service");
            EXPECT_EQ(req.getPort(), 8080);

            auto& simpleRes = dynamic_cast<SimpleResponse&>(res);
            simpleRes.setStatus(200);
            simpleRes.setBody(R"({"id":"latte"})");
            return true;
        });

    BackendRequest request;
    request.path = "/api/v1/menu/latte";
    auto response = transport_->call(address_, request, std::chrono::milliseconds(2000));

    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body, R"({"id":"latte"})");
}

TEST_F(HttpBackendTransportTest, PassesDeadlineAndCustomHeaders) {
    EXPECT_CALL(*mockHttpClient_, send(_, _))
        .WillOnce([](const IRequest& req, IResponse& res) {
            EXPECT_EQ(req.getHeader("X-Request-Deadline-Ms").value_or(""), "8000");
            EXPECT_EQ(req.getHeader("X-Idempotency-Key").value_or(""), "k-1");
            EXPECT_EQ(req.getHeader("Content-Type").value_or(""), "application/json");
            EXPECT_EQ(req.getBody(), R"({"user_id":"42"})");

            dynamic_cast<SimpleResponse&>(res).setStatus(201);
            return true;
        });

    BackendRequest request;
    request.method = "POST";
    request.path = "/api/v1/orders";
    request.body = R"({"user_id":"42"})";
    request.headers["X-Idempotency-Key"] = "k-1";

    auto response = transport_->call(address_, request, std::chrono::milliseconds(8000));

    EXPECT_EQ(response.status, 201);
}

TEST_F(HttpBackendTransportTest, NonSuccessStatus_ReturnedNotThrown) {
    EXPECT_CALL(*mockHttpClient_, send(_, _))
        .WillOnce([](const IRequest&, IResponse& res) {
            auto& simpleRes = dynamic_cast<SimpleResponse&>(res);
            simpleRes.setStatus(503);
            simpleRes.setBody("");
            return true;
        });

    auto response = transport_->call(address_, BackendRequest{}, std::chrono::milliseconds(100));

    EXPECT_EQ(response.status, 503);
}

TEST_F(HttpBackendTransportTest, SendFailed_ThrowsTransportError) {
    EXPECT_CALL(*mockHttpClient_, send(_, _)).WillOnce(Return(false));

    EXPECT_THROW(transport_->call(address_, BackendRequest{}, std::chrono::milliseconds(100)),
                 TransportError);
}

TEST_F(HttpBackendTransportTest, ClientThrows_ThrowsTransportError) {
    EXPECT_CALL(*mockHttpClient_, send(_, _))
        .WillOnce([](const IRequest&, IResponse&) -> bool {
            throw std::runtime_error("Connection refused");
        });

    try {
        transport_->call(address_, BackendRequest{}, std::chrono::milliseconds(100));
        FAIL() << "TransportError expected";
    } catch (const TransportError& e) {
        EXPECT_NE(std::string(e.what()).find("catalog-service:8080"), std::string::npos);
    }
}
