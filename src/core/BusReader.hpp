#pragma once
#include <ironwatch/Types.hpp>
#include <functional>
#include <memory>
#include <vector>

namespace ironwatch {

/**
 * Source of bus snapshots. readSnapshot() enumerates every device visible
 * right now; it throws UsbError when the bus itself cannot be queried.
 * Devices that fail individually are left out rather than failing the call.
 */
class IBusReader {
public:
    virtual ~IBusReader() = default;
    virtual std::vector<DeviceSnapshot> readSnapshot() = 0;
};

// Creates a reader, throwing UsbError if the bus is unusable.
using BusReaderFactory = std::function<std::unique_ptr<IBusReader>()>;

}
