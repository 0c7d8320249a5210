#include "DeviceTracker.hpp"
#include "DeviceDiff.hpp"
#include "Logger.hpp"
#include "StatisticsTracker.hpp"
#include "../security/SecurityManager.hpp"
#include "../utils/StringUtils.hpp"

namespace ironwatch {

namespace {

ConnectionStatus statusFor(ChangeType type) {
    switch (type) {
        case ChangeType::Connected:    return ConnectionStatus::Connected;
        case ChangeType::Disconnected: return ConnectionStatus::Disconnected;
        case ChangeType::Reconnected:  return ConnectionStatus::Reconnected;
        case ChangeType::Blocked:      return ConnectionStatus::Blocked;
    }
    return ConnectionStatus::Connected;
}

} // namespace

class DeviceTracker::Private {
public:
    std::unique_ptr<IBusReader> reader;
    SecurityManager security;
    StatisticsTracker statistics;
    DeviceMap previousDevices;
    std::optional<std::string> filter;
    bool primed{false};

    explicit Private(std::unique_ptr<IBusReader> r, SecurityPolicy policy)
        : reader(std::move(r))
        , security(std::move(policy)) {}

    std::vector<DeviceChange> applyDiff(const std::vector<DeviceSnapshot>& current) {
        DiffResult result = DeviceDiff::diff(previousDevices, current, security);

        for (const auto& change : result.changes) {
            statistics.record(change.device.key(), change.device, statusFor(change.type));
        }

        previousDevices = std::move(result.state);
        return std::move(result.changes);
    }
};

DeviceTracker::DeviceTracker(std::unique_ptr<IBusReader> reader, SecurityPolicy policy)
    : d(std::make_unique<Private>(std::move(reader), std::move(policy))) {
}

DeviceTracker::~DeviceTracker() = default;

void DeviceTracker::setFilter(const std::optional<std::string>& filter) {
    if (filter && !filter->empty()) {
        d->filter = filter;
    } else {
        d->filter.reset();
    }
}

std::optional<std::string> DeviceTracker::filter() const {
    return d->filter;
}

bool DeviceTracker::passesFilter(const DeviceSnapshot& device) const {
    if (!d->filter) {
        return true;
    }
    // Manufacturer is only consulted when the product string is missing.
    if (device.product) {
        return containsIgnoreCase(*device.product, *d->filter);
    }
    if (device.manufacturer) {
        return containsIgnoreCase(*device.manufacturer, *d->filter);
    }
    return false;
}

std::vector<DeviceSnapshot> DeviceTracker::getConnectedDevices() {
    std::vector<DeviceSnapshot> result;

    for (auto& device : d->reader->readSnapshot()) {
        if (!passesFilter(device)) {
            continue;
        }

        auto it = d->previousDevices.find(device.key());
        if (it != d->previousDevices.end() &&
            it->second.connectionStatus != ConnectionStatus::Disconnected) {
            device.connectionStatus = it->second.connectionStatus;
        }
        result.push_back(std::move(device));
    }

    return result;
}

std::vector<DeviceChange> DeviceTracker::monitorChanges() {
    std::vector<DeviceSnapshot> current = d->reader->readSnapshot();
    std::vector<DeviceChange> changes = d->applyDiff(current);
    d->primed = true;

    std::vector<DeviceChange> visible;
    for (auto& change : changes) {
        if (passesFilter(change.device)) {
            visible.push_back(std::move(change));
        }
    }

    if (!visible.empty()) {
        LOG_DEBUG("Detected " + std::to_string(visible.size()) + " USB device changes");
    }
    return visible;
}

std::vector<DeviceSnapshot> DeviceTracker::primeInitialState() {
    std::vector<DeviceSnapshot> current = d->reader->readSnapshot();
    d->applyDiff(current);
    d->primed = true;

    LOG_INFO("Found " + std::to_string(current.size()) + " initial USB devices");
    return knownDevices();
}

bool DeviceTracker::isPrimed() const {
    return d->primed;
}

std::vector<DeviceSnapshot> DeviceTracker::knownDevices() const {
    std::vector<DeviceSnapshot> result;
    for (const auto& [key, device] : d->previousDevices) {
        if (device.connectionStatus != ConnectionStatus::Disconnected && passesFilter(device)) {
            result.push_back(device);
        }
    }
    return result;
}

SecurityManager& DeviceTracker::security() {
    return d->security;
}

const SecurityManager& DeviceTracker::security() const {
    return d->security;
}

const StatisticsTracker& DeviceTracker::statistics() const {
    return d->statistics;
}

}
