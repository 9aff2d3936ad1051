#include <gtest/gtest.h>
#include <licenseguard/events.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace licenseguard {
namespace {

// ==================== EventBus Tests ====================

class EventBusTest : public ::testing::Test {
  protected:
    EventBus bus;
};

TEST_F(EventBusTest, CanSubscribeAndReceiveEvents) {
    bool called = false;
    LicenseStatus received = LicenseStatus::Unconfigured;

    auto sub = bus.on(events::STATUS_CHANGED, [&](const EventData& data) {
        called = true;
        received = data.state.status;
    });

    EventData data;
    data.state.status = LicenseStatus::Validated;
    bus.emit(events::STATUS_CHANGED, data);

    EXPECT_TRUE(called);
    EXPECT_EQ(received, LicenseStatus::Validated);
}

TEST_F(EventBusTest, SubscriptionCanBeCancelled) {
    int call_count = 0;

    auto sub = bus.on("test:event", [&](const EventData& /*data*/) { call_count++; });

    bus.emit("test:event", EventData{});
    EXPECT_EQ(call_count, 1);

    sub.cancel();
    EXPECT_FALSE(sub.is_active());

    bus.emit("test:event", EventData{});
    EXPECT_EQ(call_count, 1);
    EXPECT_EQ(bus.handler_count("test:event"), 0u);
}

TEST_F(EventBusTest, OnlyMatchingEventIsDelivered) {
    std::vector<std::string> seen;

    auto a = bus.on(events::VALIDATION_ERROR, [&](const EventData& data) {
        seen.push_back("validation:" + data.message);
    });
    auto b = bus.on(events::ACTIVATION_ERROR, [&](const EventData& data) {
        seen.push_back("activation:" + data.message);
    });

    EventData data;
    data.message = "boom";
    data.error = ErrorCode::OperationFailed;
    bus.emit(events::VALIDATION_ERROR, data);

    EXPECT_EQ(seen, (std::vector<std::string>{"validation:boom"}));
    EXPECT_EQ(bus.handler_count(events::VALIDATION_ERROR), 1u);
    EXPECT_EQ(bus.handler_count(events::ACTIVATION_ERROR), 1u);
}

TEST_F(EventBusTest, ThrowingHandlerDoesNotStopOthers) {
    int later = 0;

    auto first = bus.on("test:event", [](const EventData& /*data*/) {
        throw std::runtime_error("handler failed");
    });
    auto second = bus.on("test:event", [&](const EventData& /*data*/) { later++; });

    EXPECT_NO_THROW(bus.emit("test:event", EventData{}));
    EXPECT_EQ(later, 1);
}

TEST_F(EventBusTest, NonStandardThrowDoesNotStopOthers) {
    int later = 0;

    auto first = bus.on("test:event", [](const EventData& /*data*/) { throw 42; });
    auto second = bus.on("test:event", [&](const EventData& /*data*/) { later++; });

    EXPECT_NO_THROW(bus.emit("test:event", EventData{}));
    EXPECT_EQ(later, 1);
}

TEST_F(EventBusTest, EmitWithoutHandlersIsNoop) {
    EXPECT_NO_THROW(bus.emit("nobody:listens", EventData{}));
    EXPECT_EQ(bus.handler_count("nobody:listens"), 0u);
}

TEST_F(EventBusTest, HandlerMaySubscribeDuringEmit) {
    std::vector<Subscription> extra;

    auto sub = bus.on("test:event", [&](const EventData& /*data*/) {
        extra.push_back(bus.on("test:event", [](const EventData& /*data*/) {}));
    });

    bus.emit("test:event", EventData{});

    EXPECT_EQ(bus.handler_count("test:event"), 2u);
}

}  // namespace
}  // namespace licenseguard
