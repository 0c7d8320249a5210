// tests/test_DeviceDiff.cpp
#include <gtest/gtest.h>
#include "FakeBusReader.hpp"
#include "core/DeviceDiff.hpp"
#include "security/SecurityManager.hpp"
#include <algorithm>

namespace ironwatch {
namespace testing {

class DeviceDiffTest : public ::testing::Test {
protected:
    size_t countOf(const std::vector<DeviceChange>& changes, ChangeType type) const {
        return static_cast<size_t>(std::count_if(changes.begin(), changes.end(),
            [type](const DeviceChange& c) { return c.type == type; }));
    }

    SecurityManager security;
};

TEST_F(DeviceDiffTest, KeyFormatIsUpperCaseHex) {
    auto device = makeDevice(0x046d, 0xc52b, 3, 12);
    EXPECT_EQ(device.key(), "046D:C52B:03:0C");
}

TEST_F(DeviceDiffTest, FirstPollReportsEveryDeviceAsConnected) {
    std::vector<DeviceSnapshot> current = {
        makeDevice(0x1111, 0x0001, 1, 1),
        makeDevice(0x2222, 0x0002, 1, 2),
    };

    auto result = DeviceDiff::diff({}, current, security);

    ASSERT_EQ(result.changes.size(), 2u);
    EXPECT_EQ(countOf(result.changes, ChangeType::Connected), 2u);
    EXPECT_EQ(result.state.size(), 2u);
    for (const auto& [key, device] : result.state) {
        EXPECT_EQ(device.connectionStatus, ConnectionStatus::Connected) << key;
    }
}

TEST_F(DeviceDiffTest, DisjointSnapshotsDisconnectAllThenConnectAll) {
    auto first = DeviceDiff::diff({}, {
        makeDevice(0x1111, 0x0001, 1, 1),
        makeDevice(0x2222, 0x0002, 1, 2),
    }, security);

    auto second = DeviceDiff::diff(first.state, {
        makeDevice(0x3333, 0x0003, 2, 1),
        makeDevice(0x4444, 0x0004, 2, 2),
        makeDevice(0x5555, 0x0005, 2, 3),
    }, security);

    ASSERT_EQ(second.changes.size(), 5u);
    EXPECT_EQ(countOf(second.changes, ChangeType::Disconnected), 2u);
    EXPECT_EQ(countOf(second.changes, ChangeType::Connected), 3u);
    EXPECT_EQ(countOf(second.changes, ChangeType::Reconnected), 0u);

    // Disconnects come first.
    EXPECT_EQ(second.changes[0].type, ChangeType::Disconnected);
    EXPECT_EQ(second.changes[1].type, ChangeType::Disconnected);
    EXPECT_EQ(second.changes[2].type, ChangeType::Connected);
}

TEST_F(DeviceDiffTest, SteadyStateProducesNoChanges) {
    std::vector<DeviceSnapshot> current = {
        makeDevice(0x1111, 0x0001, 1, 1),
        makeDevice(0x2222, 0x0002, 1, 2),
    };

    auto first = DeviceDiff::diff({}, current, security);
    auto second = DeviceDiff::diff(first.state, current, security);

    EXPECT_TRUE(second.changes.empty());
    EXPECT_EQ(second.state.size(), 2u);
}

TEST_F(DeviceDiffTest, ReappearingKeysAreReconnected) {
    std::vector<DeviceSnapshot> devices = {
        makeDevice(0x1111, 0x0001, 1, 1),
        makeDevice(0x2222, 0x0002, 1, 2),
    };

    auto connected = DeviceDiff::diff({}, devices, security);
    auto gone = DeviceDiff::diff(connected.state, {}, security);
    auto back = DeviceDiff::diff(gone.state, devices, security);

    ASSERT_EQ(gone.changes.size(), 2u);
    EXPECT_EQ(countOf(gone.changes, ChangeType::Disconnected), 2u);

    ASSERT_EQ(back.changes.size(), 2u);
    EXPECT_EQ(countOf(back.changes, ChangeType::Reconnected), 2u);
    EXPECT_EQ(countOf(back.changes, ChangeType::Connected), 0u);
}

TEST_F(DeviceDiffTest, DisconnectIsReportedOnlyOnce) {
    auto connected = DeviceDiff::diff({}, {makeDevice(0x1111, 0x0001)}, security);
    auto gone = DeviceDiff::diff(connected.state, {}, security);
    auto stillGone = DeviceDiff::diff(gone.state, {}, security);

    EXPECT_EQ(gone.changes.size(), 1u);
    EXPECT_TRUE(stillGone.changes.empty());
    ASSERT_EQ(stillGone.state.size(), 1u);
    EXPECT_EQ(stillGone.state.begin()->second.connectionStatus, ConnectionStatus::Disconnected);
}

TEST_F(DeviceDiffTest, SecurityIsEvaluatedOnlyForNewKeys) {
    std::vector<DeviceSnapshot> devices = {
        makeDevice(0x1111, 0x0001, 1, 1),
        makeDevice(0x2222, 0x0002, 1, 2),
    };

    auto state = DeviceDiff::diff({}, devices, security).state;
    state = DeviceDiff::diff(state, devices, security).state;
    state = DeviceDiff::diff(state, {}, security).state;
    state = DeviceDiff::diff(state, devices, security).state;

    EXPECT_EQ(security.securityEventCount(), 2u);
}

TEST_F(DeviceDiffTest, BlockedDeviceStaysBlockedInSteadyState) {
    SecurityPolicy policy;
    DeviceRule rule;
    rule.vendorId = 0x1234;
    rule.reason = "test";
    policy.blacklist.push_back(rule);
    security.setPolicy(policy);

    std::vector<DeviceSnapshot> devices = {makeDevice(0x1234, 0x0001)};
    auto first = DeviceDiff::diff({}, devices, security);
    auto second = DeviceDiff::diff(first.state, devices, security);

    ASSERT_EQ(first.changes.size(), 1u);
    EXPECT_EQ(first.changes[0].type, ChangeType::Blocked);
    EXPECT_EQ(first.changes[0].device.connectionStatus, ConnectionStatus::Blocked);
    EXPECT_TRUE(second.changes.empty());
    EXPECT_EQ(second.state.begin()->second.connectionStatus, ConnectionStatus::Blocked);
}

TEST_F(DeviceDiffTest, MovingPortsIsANewIdentity) {
    auto first = DeviceDiff::diff({}, {makeDevice(0x1111, 0x0001, 1, 4)}, security);
    auto second = DeviceDiff::diff(first.state, {makeDevice(0x1111, 0x0001, 1, 5)}, security);

    ASSERT_EQ(second.changes.size(), 2u);
    EXPECT_EQ(second.changes[0].type, ChangeType::Disconnected);
    EXPECT_EQ(second.changes[1].type, ChangeType::Connected);
}

TEST_F(DeviceDiffTest, DisconnectCarriesPollTimestamp) {
    auto connected = DeviceDiff::diff({}, {makeDevice(0x1111, 0x0001)}, security);
    TimePoint now = Clock::now() + std::chrono::seconds(10);
    auto gone = DeviceDiff::diff(connected.state, {}, security, now);

    ASSERT_EQ(gone.changes.size(), 1u);
    EXPECT_EQ(gone.changes[0].device.timestamp, now);
}

} // namespace testing
} // namespace ironwatch
