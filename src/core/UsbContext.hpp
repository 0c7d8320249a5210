#pragma once
#include <libusb-1.0/libusb.h>

namespace ironwatch {

/**
 * Owns a libusb context for its lifetime.
 *
 * Construction performs the permission check: the context is created and the
 * device list fetched once. Throws UsbError (BusUnavailable, BusAccessDenied
 * or EnumerationFailed) when either step fails.
 */
class UsbContext {
public:
    UsbContext();
    ~UsbContext();

    UsbContext(const UsbContext&) = delete;
    UsbContext& operator=(const UsbContext&) = delete;

    libusb_context* get() const { return context_; }

private:
    libusb_context* context_{nullptr};
};

/**
 * RAII holder for a libusb device list; unrefs every device on destruction.
 */
class UsbDeviceList {
public:
    explicit UsbDeviceList(libusb_context* context);
    ~UsbDeviceList();

    UsbDeviceList(const UsbDeviceList&) = delete;
    UsbDeviceList& operator=(const UsbDeviceList&) = delete;

    ssize_t size() const { return count_; }
    libusb_device* operator[](ssize_t index) const { return list_[index]; }

private:
    libusb_device** list_{nullptr};
    ssize_t count_{0};
};

}
