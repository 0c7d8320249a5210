#include "Messages.hpp"

namespace ironwatch {

const char* commandName(const MonitorCommand& command) {
    return std::visit(overloaded{
        [](const StartMonitoring&) { return "StartMonitoring"; },
        [](const StopMonitoring&) { return "StopMonitoring"; },
        [](const RefreshDevices&) { return "RefreshDevices"; },
        [](const SetFilter&) { return "SetFilter"; },
        [](const SetPollingInterval&) { return "SetPollingInterval"; },
        [](const UpdateSecurityPolicy&) { return "UpdateSecurityPolicy"; },
        [](const RequestReport&) { return "RequestReport"; },
        [](const Shutdown&) { return "Shutdown"; }
    }, command);
}

const char* eventName(const MonitorEvent& event) {
    return std::visit(overloaded{
        [](const DevicesLoaded&) { return "DevicesLoaded"; },
        [](const DevicesUpdated&) { return "DevicesUpdated"; },
        [](const DeviceChanged&) { return "DeviceChanged"; },
        [](const DevicesChanged&) { return "DevicesChanged"; },
        [](const MonitoringStarting&) { return "MonitoringStarting"; },
        [](const MonitoringStarted&) { return "MonitoringStarted"; },
        [](const MonitoringStopping&) { return "MonitoringStopping"; },
        [](const MonitoringStopped&) { return "MonitoringStopped"; },
        [](const MonitoringError&) { return "MonitoringError"; },
        [](const PermissionError&) { return "PermissionError"; },
        [](const UsbUnavailable&) { return "UsbUnavailable"; },
        [](const ReportReady&) { return "ReportReady"; }
    }, event);
}

}
