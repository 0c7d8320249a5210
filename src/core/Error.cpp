#include <ironwatch/Error.hpp>
#include <libusb-1.0/libusb.h>

namespace ironwatch {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BusAccessDenied:      return "BusAccessDenied";
        case ErrorKind::BusUnavailable:       return "BusUnavailable";
        case ErrorKind::EnumerationFailed:    return "EnumerationFailed";
        case ErrorKind::DeviceReadFailure:    return "DeviceReadFailure";
        case ErrorKind::ConfigurationError:   return "ConfigurationError";
        case ErrorKind::CommunicationFailure: return "CommunicationFailure";
    }
    return "Unknown";
}

ErrorKind classifyLibusbError(int code) {
    switch (code) {
        case LIBUSB_ERROR_ACCESS:
            return ErrorKind::BusAccessDenied;
        case LIBUSB_ERROR_NOT_FOUND:
        case LIBUSB_ERROR_NO_DEVICE:
        case LIBUSB_ERROR_NOT_SUPPORTED:
            return ErrorKind::BusUnavailable;
        default:
            return ErrorKind::EnumerationFailed;
    }
}

std::pair<std::string, std::optional<std::string>> userFriendlyMessage(const UsbError& error) {
    switch (error.kind()) {
        case ErrorKind::BusAccessDenied:
            return {"Insufficient permissions for USB access",
                    std::string("Run as administrator or add your user to the 'plugdev' group "
                                "(or install a udev rule granting access to /dev/bus/usb).")};
        case ErrorKind::BusUnavailable:
            return {"Failed to initialize USB monitoring",
                    std::string("Make sure libusb is installed and the USB subsystem is available.")};
        case ErrorKind::ConfigurationError:
            return {std::string("Invalid configuration: ") + error.what(),
                    std::string("Fix the value or run 'ironwatch config show' to inspect the current settings.")};
        default:
            return {error.what(), std::nullopt};
    }
}

} // namespace ironwatch
