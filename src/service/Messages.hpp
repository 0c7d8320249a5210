#pragma once
#include "../utils/Overloaded.hpp"
#include <ironwatch/Types.hpp>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ironwatch {

// Commands: consumer -> monitoring service

struct StartMonitoring {};
struct StopMonitoring {};
struct RefreshDevices {};
struct SetFilter {
    std::optional<std::string> pattern;
};
struct SetPollingInterval {
    std::chrono::milliseconds interval;
};
struct UpdateSecurityPolicy {
    SecurityPolicy policy;
};
struct RequestReport {};
struct Shutdown {};

using MonitorCommand = std::variant<
    StartMonitoring,
    StopMonitoring,
    RefreshDevices,
    SetFilter,
    SetPollingInterval,
    UpdateSecurityPolicy,
    RequestReport,
    Shutdown>;

const char* commandName(const MonitorCommand& command);

// Events: monitoring service -> consumer

/**
 * Read-only copy of the service's bookkeeping, for export and reporting.
 */
struct ServiceReport {
    std::vector<DeviceSnapshot> devices;
    std::map<std::string, DeviceStatistics> statistics;
    DeviceAnalytics analytics;
    std::vector<SecurityEvent> securityEvents;
    std::vector<ConnectionHistoryEntry> connectionHistory;
};

struct DevicesLoaded {
    std::vector<DeviceSnapshot> devices;
};
struct DevicesUpdated {
    std::vector<DeviceSnapshot> devices;
};
struct DeviceChanged {
    DeviceChange change;
};
struct DevicesChanged {
    std::vector<DeviceChange> changes;
};
struct MonitoringStarting {};
struct MonitoringStarted {};
struct MonitoringStopping {};
struct MonitoringStopped {};
struct MonitoringError {
    std::string message;
};
struct PermissionError {
    std::string message;
};
struct UsbUnavailable {
    std::string message;
};
struct ReportReady {
    ServiceReport report;
};

using MonitorEvent = std::variant<
    DevicesLoaded,
    DevicesUpdated,
    DeviceChanged,
    DevicesChanged,
    MonitoringStarting,
    MonitoringStarted,
    MonitoringStopping,
    MonitoringStopped,
    MonitoringError,
    PermissionError,
    UsbUnavailable,
    ReportReady>;

const char* eventName(const MonitorEvent& event);

}
