// tests/test_DeviceTracker.cpp
#include <gtest/gtest.h>
#include "FakeBusReader.hpp"
#include "core/DeviceTracker.hpp"
#include "core/StatisticsTracker.hpp"
#include "security/SecurityManager.hpp"

namespace ironwatch {
namespace testing {

class DeviceTrackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        bus = std::make_shared<FakeBus>();
    }

    std::unique_ptr<DeviceTracker> makeTracker(SecurityPolicy policy = SecurityPolicy{}) {
        return std::make_unique<DeviceTracker>(std::make_unique<FakeBusReader>(bus), std::move(policy));
    }

    std::shared_ptr<FakeBus> bus;
};

TEST_F(DeviceTrackerTest, FilterMatchesProductName) {
    bus->setDevices({
        makeDevice(0x046d, 0xc077, 1, 2, std::string("Logitech Mouse")),
        makeDevice(0x04d9, 0x1702, 1, 3, std::string("Generic Keyboard")),
    });

    auto tracker = makeTracker();
    tracker->setFilter(std::string("Logitech"));

    auto devices = tracker->getConnectedDevices();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].product.value_or(""), "Logitech Mouse");
}

TEST_F(DeviceTrackerTest, FilterFallsBackToManufacturerAndIgnoresCase) {
    bus->setDevices({
        makeDevice(0x046d, 0xc52b, 1, 2, std::nullopt, std::string("Logitech")),
        makeDevice(0x1111, 0x0001, 1, 3),
    });

    auto tracker = makeTracker();
    tracker->setFilter(std::string("LOGI"));

    auto devices = tracker->getConnectedDevices();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].vendorId, 0x046d);
}

TEST_F(DeviceTrackerTest, FilterIgnoresManufacturerWhenProductIsPresent) {
    bus->setDevices({
        makeDevice(0x046d, 0xc077, 1, 2, std::string("Logitech Mouse"), std::string("Logitech")),
        makeDevice(0x046d, 0xc31c, 1, 3, std::string("Generic Keyboard"), std::string("Logitech Inc.")),
    });

    auto tracker = makeTracker();
    tracker->setFilter(std::string("Logitech"));

    auto devices = tracker->getConnectedDevices();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].product.value_or(""), "Logitech Mouse");
}

TEST_F(DeviceTrackerTest, EmptyFilterClears) {
    bus->setDevices({makeDevice(0x1111, 0x0001), makeDevice(0x2222, 0x0002, 1, 2)});

    auto tracker = makeTracker();
    tracker->setFilter(std::string("nothing matches"));
    EXPECT_TRUE(tracker->getConnectedDevices().empty());

    tracker->setFilter(std::string());
    EXPECT_FALSE(tracker->filter().has_value());
    EXPECT_EQ(tracker->getConnectedDevices().size(), 2u);
}

TEST_F(DeviceTrackerTest, BlacklistedDeviceIsBlockedAndCounted) {
    SecurityPolicy policy;
    DeviceRule rule;
    rule.vendorId = 0x1234;
    rule.reason = "test";
    policy.blacklist.push_back(rule);

    auto tracker = makeTracker(policy);
    tracker->primeInitialState();

    auto device = makeDevice(0x1234, 0x0001);
    bus->setDevices({device});
    auto changes = tracker->monitorChanges();

    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].type, ChangeType::Blocked);

    auto stats = tracker->statistics().statistics(device.key());
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->totalBlocked, 1u);

    auto events = tracker->security().securityEvents();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].eventType, SecurityEventType::DeviceBlocked);
    EXPECT_EQ(events[0].reason, "test");
}

TEST_F(DeviceTrackerTest, PrimingSeedsStateWithoutLaterChanges) {
    bus->setDevices({makeDevice(0x1111, 0x0001), makeDevice(0x2222, 0x0002, 1, 2)});

    auto tracker = makeTracker();
    EXPECT_FALSE(tracker->isPrimed());

    auto devices = tracker->primeInitialState();
    EXPECT_TRUE(tracker->isPrimed());
    EXPECT_EQ(devices.size(), 2u);
    EXPECT_TRUE(tracker->monitorChanges().empty());
}

TEST_F(DeviceTrackerTest, FilterAppliesToChangesButNotToTracking) {
    auto tracker = makeTracker();
    tracker->setFilter(std::string("Logitech"));
    tracker->primeInitialState();

    auto keyboard = makeDevice(0x04d9, 0x1702, 1, 3, std::string("Generic Keyboard"));
    bus->setDevices({
        makeDevice(0x046d, 0xc077, 1, 2, std::string("Logitech Mouse")),
        keyboard,
    });

    auto changes = tracker->monitorChanges();
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].device.product.value_or(""), "Logitech Mouse");

    // The keyboard is still tracked, only hidden.
    EXPECT_TRUE(tracker->statistics().statistics(keyboard.key()).has_value());
    EXPECT_EQ(tracker->knownDevices().size(), 1u);
}

TEST_F(DeviceTrackerTest, KnownDevicesOmitDisconnected) {
    bus->setDevices({makeDevice(0x1111, 0x0001), makeDevice(0x2222, 0x0002, 1, 2)});
    auto tracker = makeTracker();
    tracker->primeInitialState();

    bus->setDevices({makeDevice(0x1111, 0x0001)});
    auto changes = tracker->monitorChanges();

    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].type, ChangeType::Disconnected);
    EXPECT_EQ(tracker->knownDevices().size(), 1u);
}

TEST_F(DeviceTrackerTest, BusErrorsPropagateAndLeaveStateIntact) {
    bus->setDevices({makeDevice(0x1111, 0x0001)});
    auto tracker = makeTracker();
    tracker->primeInitialState();

    bus->fail(ErrorKind::BusAccessDenied, "access denied");
    try {
        tracker->monitorChanges();
        FAIL() << "expected UsbError";
    } catch (const UsbError& e) {
        EXPECT_TRUE(e.isPermissionError());
    }

    bus->recover();
    EXPECT_TRUE(tracker->monitorChanges().empty());
    EXPECT_EQ(tracker->knownDevices().size(), 1u);
}

} // namespace testing
} // namespace ironwatch
