#pragma once
#include "BusReader.hpp"
#include <ironwatch/Types.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ironwatch {

class SecurityManager;
class StatisticsTracker;

/**
 * The device-change engine: reads the bus, diffs it against the previous
 * poll, applies the security policy to new devices and records statistics.
 *
 * Owns the previous-snapshot map; only the monitoring thread may use it.
 */
class DeviceTracker {
public:
    explicit DeviceTracker(std::unique_ptr<IBusReader> reader,
                           SecurityPolicy policy = SecurityPolicy{});
    ~DeviceTracker();

    DeviceTracker(const DeviceTracker&) = delete;
    DeviceTracker& operator=(const DeviceTracker&) = delete;

    // Empty or nullopt clears the filter.
    void setFilter(const std::optional<std::string>& filter);
    std::optional<std::string> filter() const;
    bool passesFilter(const DeviceSnapshot& device) const;

    // Current bus contents (filtered), with tracked status where known.
    // Throws UsbError when the bus cannot be read.
    std::vector<DeviceSnapshot> getConnectedDevices();

    // One poll: snapshot, diff, statistics. Returns the filtered change batch.
    // Throws UsbError when the bus cannot be read; state is left untouched.
    std::vector<DeviceChange> monitorChanges();

    // First poll after start. Seeds the previous state (evaluating security
    // for each device) and returns the filtered device list.
    std::vector<DeviceSnapshot> primeInitialState();
    bool isPrimed() const;

    // Devices present at the last poll (filtered, Disconnected entries omitted).
    std::vector<DeviceSnapshot> knownDevices() const;

    SecurityManager& security();
    const SecurityManager& security() const;
    const StatisticsTracker& statistics() const;

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
