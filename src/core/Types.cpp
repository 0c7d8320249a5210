#include <ironwatch/Types.hpp>
#include <iomanip>
#include <sstream>

namespace ironwatch {

std::string DeviceIdentifier::key() const {
    std::stringstream ss;
    ss << std::hex << std::uppercase << std::setfill('0')
       << std::setw(4) << vendorId << ":"
       << std::setw(4) << productId << ":"
       << std::setw(2) << static_cast<int>(busNumber) << ":"
       << std::setw(2) << static_cast<int>(deviceAddress);
    return ss.str();
}

std::string DeviceSnapshot::displayName() const {
    if (product && !product->empty()) {
        return *product;
    }
    if (manufacturer && !manufacturer->empty()) {
        return *manufacturer;
    }

    std::stringstream ss;
    ss << "Unknown Device "
       << std::hex << std::uppercase << std::setfill('0')
       << std::setw(4) << vendorId << ":"
       << std::setw(4) << productId;
    return ss.str();
}

const char* connectionStatusName(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Connected:    return "Connected";
        case ConnectionStatus::Disconnected: return "Disconnected";
        case ConnectionStatus::Reconnected:  return "Reconnected";
        case ConnectionStatus::Blocked:      return "Blocked";
    }
    return "Unknown";
}

const char* changeTypeName(ChangeType type) {
    switch (type) {
        case ChangeType::Connected:    return "CONNECTED";
        case ChangeType::Disconnected: return "DISCONNECTED";
        case ChangeType::Reconnected:  return "RECONNECTED";
        case ChangeType::Blocked:      return "BLOCKED";
    }
    return "UNKNOWN";
}

const char* securityEventTypeName(SecurityEventType type) {
    switch (type) {
        case SecurityEventType::DeviceBlocked:      return "DeviceBlocked";
        case SecurityEventType::DeviceAllowed:      return "DeviceAllowed";
        case SecurityEventType::RuleViolation:      return "RuleViolation";
        case SecurityEventType::SuspiciousActivity: return "SuspiciousActivity";
    }
    return "Unknown";
}

const char* securityActionName(SecurityAction action) {
    switch (action) {
        case SecurityAction::Blocked: return "Blocked";
        case SecurityAction::Allowed: return "Allowed";
        case SecurityAction::Warned:  return "Warned";
        case SecurityAction::Logged:  return "Logged";
    }
    return "Unknown";
}

const char* deviceClassName(uint8_t classCode) {
    switch (static_cast<DeviceClass>(classCode)) {
        case DeviceClass::Unspecified:         return "Per Interface";
        case DeviceClass::Audio:               return "Audio";
        case DeviceClass::CDC:                 return "Communications";
        case DeviceClass::HID:                 return "HID";
        case DeviceClass::Physical:            return "Physical";
        case DeviceClass::Image:               return "Image";
        case DeviceClass::Printer:             return "Printer";
        case DeviceClass::MassStorage:         return "Mass Storage";
        case DeviceClass::Hub:                 return "Hub";
        case DeviceClass::CDC_Data:            return "CDC Data";
        case DeviceClass::SmartCard:           return "Smart Card";
        case DeviceClass::ContentSecurity:     return "Content Security";
        case DeviceClass::Video:               return "Video";
        case DeviceClass::PersonalHealthcare:  return "Personal Healthcare";
        case DeviceClass::AudioVideo:          return "Audio/Video";
        case DeviceClass::Billboard:           return "Billboard";
        case DeviceClass::TypeCBridge:         return "USB Type-C Bridge";
        case DeviceClass::Diagnostic:          return "Diagnostic";
        case DeviceClass::Wireless:            return "Wireless Controller";
        case DeviceClass::Miscellaneous:       return "Miscellaneous";
        case DeviceClass::ApplicationSpecific: return "Application Specific";
        case DeviceClass::VendorSpecific:      return "Vendor Specific";
    }
    return "Unknown";
}

std::string monitoringStatusText(const MonitoringStatus& status) {
    switch (status.state) {
        case MonitoringStatus::State::Stopped:  return "Stopped";
        case MonitoringStatus::State::Starting: return "Starting";
        case MonitoringStatus::State::Running:  return "Running";
        case MonitoringStatus::State::Stopping: return "Stopping";
        case MonitoringStatus::State::Error:    return "Error: " + status.message;
    }
    return "Unknown";
}

} // namespace ironwatch
