#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ironwatch {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

struct DeviceIdentifier {
    uint16_t vendorId{0};
    uint16_t productId{0};
    uint8_t busNumber{0};
    uint8_t deviceAddress{0};

    // VVVV:PPPP:BB:AA, upper-case hex
    std::string key() const;

    bool operator==(const DeviceIdentifier& other) const {
        return vendorId == other.vendorId &&
               productId == other.productId &&
               busNumber == other.busNumber &&
               deviceAddress == other.deviceAddress;
    }
    bool operator!=(const DeviceIdentifier& other) const {
        return !(*this == other);
    }
};

enum class ConnectionStatus {
    Connected,
    Disconnected,
    Reconnected,
    Blocked
};

enum class DeviceClass {
    Unspecified = 0x00,
    Audio = 0x01,
    CDC = 0x02,
    HID = 0x03,
    Physical = 0x05,
    Image = 0x06,
    Printer = 0x07,
    MassStorage = 0x08,
    Hub = 0x09,
    CDC_Data = 0x0A,
    SmartCard = 0x0B,
    ContentSecurity = 0x0D,
    Video = 0x0E,
    PersonalHealthcare = 0x0F,
    AudioVideo = 0x10,
    Billboard = 0x11,
    TypeCBridge = 0x12,
    Diagnostic = 0xDC,
    Wireless = 0xE0,
    Miscellaneous = 0xEF,
    ApplicationSpecific = 0xFE,
    VendorSpecific = 0xFF
};

/**
 * One device as seen by a single bus enumeration.
 */
struct DeviceSnapshot {
    uint8_t busNumber{0};
    uint8_t deviceAddress{0};
    uint16_t vendorId{0};
    uint16_t productId{0};
    uint16_t deviceVersion{0};      // BCD, major << 8 | minor
    std::optional<std::string> manufacturer;
    std::optional<std::string> product;
    std::optional<std::string> serialNumber;
    uint8_t deviceClass{0};
    uint8_t deviceSubclass{0};
    uint8_t deviceProtocol{0};
    uint8_t maxPacketSize{0};
    uint8_t numConfigurations{0};
    TimePoint timestamp{};
    ConnectionStatus connectionStatus{ConnectionStatus::Connected};

    DeviceIdentifier identifier() const {
        return DeviceIdentifier{vendorId, productId, busNumber, deviceAddress};
    }
    std::string key() const { return identifier().key(); }

    // "Product" / "Manufacturer" / "Unknown Device VVVV:PPPP"
    std::string displayName() const;
};

using DeviceMap = std::map<std::string, DeviceSnapshot>;

enum class ChangeType {
    Connected,
    Disconnected,
    Reconnected,
    Blocked
};

struct DeviceChange {
    ChangeType type;
    DeviceSnapshot device;
};

struct DeviceStatistics {
    uint32_t totalConnections{0};
    uint32_t totalDisconnections{0};
    uint32_t totalBlocked{0};
    TimePoint firstSeen{};
    TimePoint lastSeen{};
    std::chrono::milliseconds connectionDuration{0};
    uint32_t connectionCount{0};
};

struct ConnectionHistoryEntry {
    TimePoint timestamp;
    std::string deviceKey;
    ConnectionStatus status;
};

enum class SecurityEventType {
    DeviceBlocked,
    DeviceAllowed,
    RuleViolation,
    SuspiciousActivity
};

enum class SecurityAction {
    Blocked,
    Allowed,
    Warned,
    Logged
};

struct SecurityEvent {
    TimePoint timestamp;
    SecurityEventType eventType;
    DeviceSnapshot device;
    std::string reason;
    SecurityAction actionTaken;
};

struct DeviceAnalytics {
    std::map<uint8_t, uint32_t> deviceClassDistribution;
    std::map<uint16_t, uint32_t> vendorDistribution;
    std::vector<std::pair<TimePoint, uint32_t>> connectionFrequency;
    uint32_t totalDevicesSeen{0};
    uint32_t uniqueDevices{0};
    uint32_t blockedDevices{0};
    uint32_t securityViolations{0};
};

/**
 * Blacklist/whitelist entry. Every matcher that is set must match; unset
 * matchers are wildcards. String matchers are case-insensitive substring
 * tests and never match a device that lacks the string.
 */
struct DeviceRule {
    std::optional<uint16_t> vendorId;
    std::optional<uint16_t> productId;
    std::optional<uint8_t> deviceClass;
    std::optional<std::string> manufacturer;
    std::optional<std::string> productName;
    std::optional<std::string> serialNumber;
    std::string reason;
    TimePoint createdAt{Clock::now()};
    bool enabled{true};

    bool matches(const DeviceSnapshot& device) const;

    // Compares matchers, reason and enabled flag; createdAt is ignored.
    bool sameRule(const DeviceRule& other) const;
};

struct SecurityPolicy {
    bool blacklistEnabled{true};
    bool whitelistEnabled{false};
    std::vector<DeviceRule> blacklist;
    std::vector<DeviceRule> whitelist;
};

struct MonitoringStatus {
    enum class State {
        Stopped,
        Starting,
        Running,
        Stopping,
        Error
    };

    State state{State::Stopped};
    std::string message;    // only meaningful for Error

    static MonitoringStatus error(std::string msg) {
        return MonitoringStatus{State::Error, std::move(msg)};
    }

    bool operator==(const MonitoringStatus& other) const {
        return state == other.state && message == other.message;
    }
    bool operator!=(const MonitoringStatus& other) const {
        return !(*this == other);
    }
};

const char* connectionStatusName(ConnectionStatus status);
const char* changeTypeName(ChangeType type);
const char* securityEventTypeName(SecurityEventType type);
const char* securityActionName(SecurityAction action);
const char* deviceClassName(uint8_t classCode);
std::string monitoringStatusText(const MonitoringStatus& status);

}
