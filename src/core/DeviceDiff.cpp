#include "DeviceDiff.hpp"
#include "../security/SecurityManager.hpp"

namespace ironwatch {

DiffResult DeviceDiff::diff(const DeviceMap& previous,
                            const std::vector<DeviceSnapshot>& current,
                            SecurityManager& security) {
    return diff(previous, current, security, Clock::now());
}

DiffResult DeviceDiff::diff(const DeviceMap& previous,
                            const std::vector<DeviceSnapshot>& current,
                            SecurityManager& security,
                            TimePoint now) {
    DeviceMap currentMap;
    for (const auto& device : current) {
        currentMap[device.key()] = device;
    }

    DiffResult result;
    std::vector<DeviceChange> connects;

    for (const auto& [key, prev] : previous) {
        if (currentMap.count(key)) {
            continue;
        }

        if (prev.connectionStatus == ConnectionStatus::Disconnected) {
            // Already reported; keep remembering it for reconnection.
            result.state.emplace(key, prev);
            continue;
        }

        DeviceSnapshot gone = prev;
        gone.connectionStatus = ConnectionStatus::Disconnected;
        gone.timestamp = now;
        result.changes.push_back(DeviceChange{ChangeType::Disconnected, gone});
        result.state.emplace(key, std::move(gone));
    }

    for (auto& [key, device] : currentMap) {
        auto it = previous.find(key);

        if (it == previous.end()) {
            SecurityDecision decision = security.evaluate(device);
            if (decision.blocked) {
                device.connectionStatus = ConnectionStatus::Blocked;
                connects.push_back(DeviceChange{ChangeType::Blocked, device});
            } else {
                device.connectionStatus = ConnectionStatus::Connected;
                connects.push_back(DeviceChange{ChangeType::Connected, device});
            }
        } else if (it->second.connectionStatus == ConnectionStatus::Disconnected) {
            device.connectionStatus = ConnectionStatus::Reconnected;
            connects.push_back(DeviceChange{ChangeType::Reconnected, device});
        } else {
            device.connectionStatus = it->second.connectionStatus;
        }

        result.state[key] = device;
    }

    result.changes.insert(result.changes.end(),
                          std::make_move_iterator(connects.begin()),
                          std::make_move_iterator(connects.end()));
    return result;
}

}
