#include "StatisticsTracker.hpp"
#include <ironwatch/BoundedBuffer.hpp>
#include <ironwatch/Constants.hpp>

namespace ironwatch {

class StatisticsTracker::Private {
public:
    std::map<std::string, DeviceStatistics> statistics;
    // Latest descriptor data per key, for the class/vendor breakdowns.
    std::map<std::string, DeviceSnapshot> lastKnown;
    BoundedBuffer<ConnectionHistoryEntry> history{CONNECTION_HISTORY_CAPACITY};

    std::optional<TimePoint> firstConnection(const std::string& key) const {
        for (const auto& entry : history) {
            if (entry.deviceKey == key && entry.status == ConnectionStatus::Connected) {
                return entry.timestamp;
            }
        }
        return std::nullopt;
    }
};

StatisticsTracker::StatisticsTracker()
    : d(std::make_unique<Private>()) {
}

StatisticsTracker::~StatisticsTracker() = default;

void StatisticsTracker::record(const std::string& key,
                               const DeviceSnapshot& device,
                               ConnectionStatus status) {
    record(key, device, status, Clock::now());
}

void StatisticsTracker::record(const std::string& key,
                               const DeviceSnapshot& device,
                               ConnectionStatus status,
                               TimePoint now) {
    d->history.push(ConnectionHistoryEntry{now, key, status});
    d->lastKnown[key] = device;

    auto inserted = d->statistics.emplace(key, DeviceStatistics{});
    DeviceStatistics& stats = inserted.first->second;
    if (inserted.second) {
        stats.firstSeen = now;
    }
    stats.lastSeen = now;

    switch (status) {
        case ConnectionStatus::Connected:
        case ConnectionStatus::Reconnected:
            stats.totalConnections++;
            stats.connectionCount++;
            break;

        case ConnectionStatus::Disconnected:
            // Only a live connection can end; a blocked device leaving the bus
            // never counted as connected.
            if (stats.connectionCount > 0) {
                stats.totalDisconnections++;
                stats.connectionCount--;
            }
            break;

        case ConnectionStatus::Blocked:
            stats.totalBlocked++;
            break;
    }

    if (auto first = d->firstConnection(key)) {
        auto elapsed = now - *first;
        stats.connectionDuration = elapsed.count() > 0
            ? std::chrono::duration_cast<std::chrono::milliseconds>(elapsed)
            : std::chrono::milliseconds(0);
    }
}

std::optional<DeviceStatistics> StatisticsTracker::statistics(const std::string& key) const {
    auto it = d->statistics.find(key);
    if (it == d->statistics.end()) {
        return std::nullopt;
    }
    return it->second;
}

const std::map<std::string, DeviceStatistics>& StatisticsTracker::allStatistics() const {
    return d->statistics;
}

std::vector<ConnectionHistoryEntry> StatisticsTracker::connectionHistory() const {
    return std::vector<ConnectionHistoryEntry>(d->history.begin(), d->history.end());
}

std::vector<std::pair<TimePoint, ConnectionStatus>>
StatisticsTracker::connectionHistory(const std::string& key) const {
    std::vector<std::pair<TimePoint, ConnectionStatus>> result;
    for (const auto& entry : d->history) {
        if (entry.deviceKey == key) {
            result.emplace_back(entry.timestamp, entry.status);
        }
    }
    return result;
}

size_t StatisticsTracker::historySize() const {
    return d->history.size();
}

DeviceAnalytics StatisticsTracker::analytics(size_t securityEventCount) const {
    return analytics(securityEventCount, Clock::now());
}

DeviceAnalytics StatisticsTracker::analytics(size_t securityEventCount, TimePoint now) const {
    DeviceAnalytics result;

    for (const auto& [key, stats] : d->statistics) {
        result.blockedDevices += stats.totalBlocked;

        auto it = d->lastKnown.find(key);
        if (it != d->lastKnown.end()) {
            result.deviceClassDistribution[it->second.deviceClass]++;
            result.vendorDistribution[it->second.vendorId]++;
        }
    }

    result.uniqueDevices = static_cast<uint32_t>(d->statistics.size());
    result.totalDevicesSeen = static_cast<uint32_t>(d->history.size());
    result.securityViolations = static_cast<uint32_t>(securityEventCount);

    // Hourly buckets over the trailing window, oldest first.
    const auto windowStart = now - std::chrono::hours(ANALYTICS_WINDOW_HOURS);
    result.connectionFrequency.reserve(ANALYTICS_WINDOW_HOURS);
    for (int hour = 0; hour < ANALYTICS_WINDOW_HOURS; ++hour) {
        auto bucketStart = windowStart + std::chrono::hours(hour);
        auto bucketEnd = bucketStart + std::chrono::hours(1);

        uint32_t count = 0;
        for (const auto& entry : d->history) {
            if (entry.status == ConnectionStatus::Connected &&
                entry.timestamp >= bucketStart && entry.timestamp < bucketEnd) {
                count++;
            }
        }
        result.connectionFrequency.emplace_back(bucketStart, count);
    }

    return result;
}

}
