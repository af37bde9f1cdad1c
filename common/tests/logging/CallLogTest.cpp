#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "logging/CallTimer.hpp"
#include "logging/ConsoleCallLogSink.hpp"
#include "metrics/MetricsService.hpp"

#include <thread>

using namespace cafe;
using namespace cafe::logging;
using namespace cafe::resilience;
using ::testing::_;
using ::testing::Field;
using ::testing::AllOf;

// ============================================================================
// Mocks
// ============================================================================

class MockCallLogSink : public ICallLogSink {
public:
    MOCK_METHOD(void, record, (const CallRecord& call), (override));
};

class EmptyMetricsSettings : public metrics::IMetricsSettings {
public:
    std::vector<metrics::MetricDefinition> getDefinitions() const override { return {}; }
    std::vector<std::string> getAllKeys() const override { return {}; }
};

// ============================================================================
// ТЕСТЫ: timedCall
// ============================================================================

TEST(CallTimerTest, Success_RecordsOkOutcome) {
    MockCallLogSink sink;
    EXPECT_CALL(sink, record(AllOf(
        Field(&CallRecord::dependency, "users"),
        Field(&CallRecord::operation, "getUser"),
        Field(&CallRecord::outcome, "OK"))));

    auto result = timedCall<int>(sink, "users", "getUser", [] { return CallResult<int>::success(1); });

    EXPECT_TRUE(result.ok());
}

TEST(CallTimerTest, Failure_RecordsKindAndLatency) {
    MockCallLogSink sink;
    CallRecord recorded;
    EXPECT_CALL(sink, record(_)).WillOnce([&recorded](const CallRecord& call) { recorded = call; });

    auto result = timedCall<int>(sink, "catalog", "getCatalogItem", [] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return CallResult<int>::failure(FailureKind::Timeout, "no response within 10 ms");
    });

    EXPECT_EQ(result.kind(), FailureKind::Timeout);
    EXPECT_EQ(recorded.outcome, "TIMEOUT");
    EXPECT_GE(recorded.latency.count(), 20);
}

// ============================================================================
// ТЕСТЫ: ConsoleCallLogSink
// ============================================================================

TEST(ConsoleCallLogSinkTest, Record_CountsByDependencyAndOutcome) {
    auto metrics = std::make_shared<metrics::MetricsService>(std::make_shared<EmptyMetricsSettings>());
    ConsoleCallLogSink sink(metrics);

    sink.record({"orders", "createOrder", "OK", std::chrono::milliseconds(12)});
    sink.record({"orders", "createOrder", "OK", std::chrono::milliseconds(8)});
    sink.record({"orders", "getOrder", "NOT_FOUND", std::chrono::milliseconds(3)});

    EXPECT_EQ(metrics->value("backend_calls_total", {{"dependency", "orders"}, {"outcome", "OK"}}), 2);
    EXPECT_EQ(metrics->value("backend_calls_total", {{"dependency", "orders"}, {"outcome", "NOT_FOUND"}}), 1);
}
