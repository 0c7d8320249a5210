#include "UsbContext.hpp"
#include "Logger.hpp"
#include <ironwatch/Error.hpp>
#include <string>

namespace ironwatch {

UsbContext::UsbContext() {
    int ret = libusb_init(&context_);
    if (ret != LIBUSB_SUCCESS) {
        context_ = nullptr;
        ErrorKind kind = ret == LIBUSB_ERROR_ACCESS ? ErrorKind::BusAccessDenied
                                                    : ErrorKind::BusUnavailable;
        throw UsbError(kind, std::string("Failed to create USB context: ") +
                                 libusb_error_name(ret));
    }

    try {
        UsbDeviceList probe(context_);
        LOG_DEBUG("USB context ready, " + std::to_string(probe.size()) + " devices visible");
    } catch (...) {
        libusb_exit(context_);
        context_ = nullptr;
        throw;
    }
}

UsbContext::~UsbContext() {
    if (context_) {
        libusb_exit(context_);
        context_ = nullptr;
    }
}

UsbDeviceList::UsbDeviceList(libusb_context* context) {
    count_ = libusb_get_device_list(context, &list_);
    if (count_ < 0) {
        int code = static_cast<int>(count_);
        list_ = nullptr;
        count_ = 0;

        ErrorKind kind = classifyLibusbError(code);
        std::string message = kind == ErrorKind::BusAccessDenied
            ? "Insufficient permissions to access USB devices"
            : "Failed to get device list";
        throw UsbError(kind, message + ": " + libusb_error_name(code));
    }
}

UsbDeviceList::~UsbDeviceList() {
    if (list_) {
        libusb_free_device_list(list_, 1);
    }
}

}
