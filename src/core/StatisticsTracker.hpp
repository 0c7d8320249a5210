#pragma once
#include <ironwatch/Types.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ironwatch {

/**
 * Per-device counters plus the capped connection history.
 *
 * record() is called once for every emitted change. Statistics entries are
 * never removed; the history keeps the most recent CONNECTION_HISTORY_CAPACITY
 * transitions. Owned by the monitoring thread; not thread-safe.
 */
class StatisticsTracker {
public:
    StatisticsTracker();
    ~StatisticsTracker();

    StatisticsTracker(const StatisticsTracker&) = delete;
    StatisticsTracker& operator=(const StatisticsTracker&) = delete;

    void record(const std::string& key, const DeviceSnapshot& device, ConnectionStatus status);
    void record(const std::string& key, const DeviceSnapshot& device, ConnectionStatus status,
                TimePoint now);

    std::optional<DeviceStatistics> statistics(const std::string& key) const;
    const std::map<std::string, DeviceStatistics>& allStatistics() const;

    std::vector<ConnectionHistoryEntry> connectionHistory() const;
    std::vector<std::pair<TimePoint, ConnectionStatus>> connectionHistory(const std::string& key) const;
    size_t historySize() const;

    // Full scan of the history; securityEventCount comes from the security log.
    DeviceAnalytics analytics(size_t securityEventCount) const;
    DeviceAnalytics analytics(size_t securityEventCount, TimePoint now) const;

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
