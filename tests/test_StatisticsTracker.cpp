// tests/test_StatisticsTracker.cpp
#include <gtest/gtest.h>
#include "FakeBusReader.hpp"
#include "core/StatisticsTracker.hpp"
#include <ironwatch/Constants.hpp>

namespace ironwatch {
namespace testing {

class StatisticsTrackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        device = makeDevice(0x046d, 0xc52b, 1, 3, std::string("USB Receiver"));
        key = device.key();
        start = Clock::now() - std::chrono::hours(2);
    }

    void expectConsistent(const std::string& k) const {
        auto stats = tracker.statistics(k);
        ASSERT_TRUE(stats.has_value());
        EXPECT_EQ(stats->totalConnections - stats->totalDisconnections, stats->connectionCount);
    }

    StatisticsTracker tracker;
    DeviceSnapshot device;
    std::string key;
    TimePoint start;
};

TEST_F(StatisticsTrackerTest, UnknownKeyHasNoStatistics) {
    EXPECT_FALSE(tracker.statistics("0000:0000:00:00").has_value());
}

TEST_F(StatisticsTrackerTest, CountersFollowTransitions) {
    tracker.record(key, device, ConnectionStatus::Connected, start);
    tracker.record(key, device, ConnectionStatus::Disconnected, start + std::chrono::seconds(5));
    tracker.record(key, device, ConnectionStatus::Reconnected, start + std::chrono::seconds(9));

    auto stats = tracker.statistics(key);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->totalConnections, 2u);
    EXPECT_EQ(stats->totalDisconnections, 1u);
    EXPECT_EQ(stats->connectionCount, 1u);
    EXPECT_EQ(stats->firstSeen, start);
    EXPECT_EQ(stats->lastSeen, start + std::chrono::seconds(9));
    expectConsistent(key);
}

TEST_F(StatisticsTrackerTest, DurationRunsFromFirstConnection) {
    tracker.record(key, device, ConnectionStatus::Connected, start);
    tracker.record(key, device, ConnectionStatus::Disconnected, start + std::chrono::seconds(5));

    auto stats = tracker.statistics(key);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->connectionDuration, std::chrono::milliseconds(5000));
}

TEST_F(StatisticsTrackerTest, BlockedDeviceLeavingDoesNotUnderflow) {
    tracker.record(key, device, ConnectionStatus::Blocked, start);
    tracker.record(key, device, ConnectionStatus::Disconnected, start + std::chrono::seconds(1));

    auto stats = tracker.statistics(key);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->totalBlocked, 1u);
    EXPECT_EQ(stats->totalDisconnections, 0u);
    EXPECT_EQ(stats->connectionCount, 0u);
    expectConsistent(key);
}

TEST_F(StatisticsTrackerTest, CountersStayConsistentOverLongSequences) {
    const ConnectionStatus pattern[] = {
        ConnectionStatus::Connected, ConnectionStatus::Disconnected,
        ConnectionStatus::Disconnected, ConnectionStatus::Reconnected,
        ConnectionStatus::Blocked, ConnectionStatus::Disconnected,
        ConnectionStatus::Reconnected, ConnectionStatus::Reconnected,
    };

    TimePoint t = start;
    for (int round = 0; round < 10; ++round) {
        for (auto status : pattern) {
            tracker.record(key, device, status, t);
            t += std::chrono::seconds(1);
            expectConsistent(key);
        }
    }
}

TEST_F(StatisticsTrackerTest, HistoryKeepsNewestEntries) {
    const size_t extra = 7;
    for (size_t i = 0; i < CONNECTION_HISTORY_CAPACITY + extra; ++i) {
        auto d = makeDevice(0x1111, static_cast<uint16_t>(i));
        tracker.record(d.key(), d, ConnectionStatus::Connected, start);
    }

    auto history = tracker.connectionHistory();
    ASSERT_EQ(history.size(), CONNECTION_HISTORY_CAPACITY);
    EXPECT_EQ(tracker.historySize(), CONNECTION_HISTORY_CAPACITY);
    EXPECT_EQ(history.front().deviceKey, makeDevice(0x1111, static_cast<uint16_t>(extra)).key());
    EXPECT_EQ(history.back().deviceKey,
              makeDevice(0x1111, static_cast<uint16_t>(CONNECTION_HISTORY_CAPACITY + extra - 1)).key());

    // Statistics entries are never evicted.
    EXPECT_EQ(tracker.allStatistics().size(), CONNECTION_HISTORY_CAPACITY + extra);
}

TEST_F(StatisticsTrackerTest, PerKeyHistory) {
    auto other = makeDevice(0x2222, 0x0001, 2, 1);
    tracker.record(key, device, ConnectionStatus::Connected, start);
    tracker.record(other.key(), other, ConnectionStatus::Connected, start);
    tracker.record(key, device, ConnectionStatus::Disconnected, start + std::chrono::seconds(1));

    auto history = tracker.connectionHistory(key);
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].second, ConnectionStatus::Connected);
    EXPECT_EQ(history[1].second, ConnectionStatus::Disconnected);
}

TEST_F(StatisticsTrackerTest, HourlyHistogramCountsRecentConnections) {
    TimePoint now = Clock::now();
    tracker.record(key, device, ConnectionStatus::Connected, now - std::chrono::minutes(30));
    tracker.record(key, device, ConnectionStatus::Disconnected, now - std::chrono::minutes(20));
    tracker.record(key, device, ConnectionStatus::Connected, now - std::chrono::minutes(90));
    tracker.record(key, device, ConnectionStatus::Connected, now - std::chrono::hours(30));

    auto analytics = tracker.analytics(0, now);

    ASSERT_EQ(analytics.connectionFrequency.size(), static_cast<size_t>(ANALYTICS_WINDOW_HOURS));
    EXPECT_EQ(analytics.connectionFrequency.back().second, 1u);
    EXPECT_EQ(analytics.connectionFrequency[ANALYTICS_WINDOW_HOURS - 2].second, 1u);

    uint32_t total = 0;
    for (const auto& bucket : analytics.connectionFrequency) {
        total += bucket.second;
    }
    EXPECT_EQ(total, 2u);
    EXPECT_EQ(analytics.connectionFrequency.front().first, now - std::chrono::hours(ANALYTICS_WINDOW_HOURS));
}

TEST_F(StatisticsTrackerTest, AnalyticsSummarizesDevices) {
    auto hub = makeDevice(0x1d6b, 0x0002, 1, 1);
    hub.deviceClass = 0x09;
    device.deviceClass = 0x03;

    tracker.record(key, device, ConnectionStatus::Connected, start);
    tracker.record(hub.key(), hub, ConnectionStatus::Blocked, start);

    auto analytics = tracker.analytics(7);

    EXPECT_EQ(analytics.uniqueDevices, 2u);
    EXPECT_EQ(analytics.totalDevicesSeen, 2u);
    EXPECT_EQ(analytics.blockedDevices, 1u);
    EXPECT_EQ(analytics.securityViolations, 7u);
    EXPECT_EQ(analytics.deviceClassDistribution[0x03], 1u);
    EXPECT_EQ(analytics.deviceClassDistribution[0x09], 1u);
    EXPECT_EQ(analytics.vendorDistribution[0x046d], 1u);
    EXPECT_EQ(analytics.vendorDistribution[0x1d6b], 1u);
}

} // namespace testing
} // namespace ironwatch
