#pragma once
#include <ironwatch/Types.hpp>
#include <vector>

namespace ironwatch {

class SecurityManager;

struct DiffResult {
    std::vector<DeviceChange> changes;  // disconnects first, then connects
    DeviceMap state;                    // next "previous" map
};

/**
 * Classifies one poll against the previous state.
 *
 * Keys missing from the current poll become Disconnected and stay in the
 * state with that status, so a later reappearance on the same key is
 * reported as Reconnected. Keys never seen before are evaluated by the
 * security manager and become Connected or Blocked. Everything else is
 * steady state and produces no change.
 */
class DeviceDiff {
public:
    static DiffResult diff(const DeviceMap& previous,
                           const std::vector<DeviceSnapshot>& current,
                           SecurityManager& security);
    static DiffResult diff(const DeviceMap& previous,
                           const std::vector<DeviceSnapshot>& current,
                           SecurityManager& security,
                           TimePoint now);
};

}
