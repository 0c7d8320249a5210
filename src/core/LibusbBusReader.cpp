#include "LibusbBusReader.hpp"
#include "UsbContext.hpp"
#include "Logger.hpp"
#include <ironwatch/Constants.hpp>
#include <ironwatch/Error.hpp>
#include <optional>
#include <string>

namespace ironwatch {

namespace {

// Closes the handle when the read for one device is done.
class ScopedHandle {
public:
    explicit ScopedHandle(libusb_device* device) {
        openResult_ = libusb_open(device, &handle_);
        if (openResult_ != LIBUSB_SUCCESS) {
            handle_ = nullptr;
        }
    }
    ~ScopedHandle() {
        if (handle_) {
            libusb_close(handle_);
        }
    }
    ScopedHandle(const ScopedHandle&) = delete;
    ScopedHandle& operator=(const ScopedHandle&) = delete;

    libusb_device_handle* get() const { return handle_; }
    int openResult() const { return openResult_; }

private:
    libusb_device_handle* handle_{nullptr};
    int openResult_{LIBUSB_SUCCESS};
};

std::optional<std::string> readString(libusb_device_handle* handle, uint8_t index) {
    if (!handle || index == 0) {
        return std::nullopt;
    }

    unsigned char buffer[MAX_STRING_LENGTH];
    int ret = libusb_get_string_descriptor_ascii(handle, index, buffer, sizeof(buffer));
    if (ret < 0) {
        return std::nullopt;
    }
    return std::string(reinterpret_cast<char*>(buffer), ret);
}

} // namespace

class LibusbBusReader::Private {
public:
    UsbContext context;

    std::optional<DeviceSnapshot> readDevice(libusb_device* device, TimePoint now) {
        uint8_t busNum = libusb_get_bus_number(device);
        uint8_t devAddr = libusb_get_device_address(device);

        libusb_device_descriptor desc{};
        int ret = libusb_get_device_descriptor(device, &desc);
        if (ret != LIBUSB_SUCCESS) {
            LOG_DEBUG("Failed to read device descriptor for " +
                      std::to_string(busNum) + ":" + std::to_string(devAddr) +
                      ": " + libusb_error_name(ret));
            return std::nullopt;
        }

        DeviceSnapshot snapshot;
        snapshot.busNumber = busNum;
        snapshot.deviceAddress = devAddr;
        snapshot.vendorId = desc.idVendor;
        snapshot.productId = desc.idProduct;
        snapshot.deviceVersion = desc.bcdDevice;
        snapshot.deviceClass = desc.bDeviceClass;
        snapshot.deviceSubclass = desc.bDeviceSubClass;
        snapshot.deviceProtocol = desc.bDeviceProtocol;
        snapshot.maxPacketSize = desc.bMaxPacketSize0;
        snapshot.numConfigurations = desc.bNumConfigurations;
        snapshot.timestamp = now;
        snapshot.connectionStatus = ConnectionStatus::Connected;

        // String descriptors need an open handle; without permission they stay empty.
        ScopedHandle handle(device);
        if (handle.get()) {
            snapshot.manufacturer = readString(handle.get(), desc.iManufacturer);
            snapshot.product = readString(handle.get(), desc.iProduct);
            snapshot.serialNumber = readString(handle.get(), desc.iSerialNumber);
        } else {
            LOG_DEBUG("Could not open device " + std::to_string(busNum) + ":" +
                      std::to_string(devAddr) + " for string descriptors: " +
                      libusb_error_name(handle.openResult()));
        }

        return snapshot;
    }
};

LibusbBusReader::LibusbBusReader()
    : d(std::make_unique<Private>()) {
}

LibusbBusReader::~LibusbBusReader() = default;

std::vector<DeviceSnapshot> LibusbBusReader::readSnapshot() {
    UsbDeviceList list(d->context.get());
    auto now = Clock::now();

    std::vector<DeviceSnapshot> result;
    result.reserve(static_cast<size_t>(list.size()));

    for (ssize_t i = 0; i < list.size(); i++) {
        if (auto snapshot = d->readDevice(list[i], now)) {
            result.push_back(std::move(*snapshot));
        }
    }

    return result;
}

BusReaderFactory LibusbBusReader::factory() {
    return []() -> std::unique_ptr<IBusReader> {
        return std::make_unique<LibusbBusReader>();
    };
}

}
