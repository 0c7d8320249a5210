#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace ironwatch {

enum class ErrorKind {
    BusAccessDenied,        // not allowed to enumerate or open devices
    BusUnavailable,         // USB context could not be created
    EnumerationFailed,      // bus query failed for another reason
    DeviceReadFailure,      // one device's descriptor read failed
    ConfigurationError,     // invalid rule, filter or setting
    CommunicationFailure    // channel endpoint closed
};

class UsbError : public std::runtime_error {
public:
    UsbError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {}

    ErrorKind kind() const { return kind_; }
    bool isPermissionError() const { return kind_ == ErrorKind::BusAccessDenied; }

private:
    ErrorKind kind_;
};

const char* errorKindName(ErrorKind kind);

// Maps a libusb return code onto the error taxonomy.
ErrorKind classifyLibusbError(int code);

// Message for the user plus an optional remediation hint.
std::pair<std::string, std::optional<std::string>> userFriendlyMessage(const UsbError& error);

}
