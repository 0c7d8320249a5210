#pragma once
#include "BusReader.hpp"
#include <memory>

namespace ironwatch {

class LibusbBusReader : public IBusReader {
public:
    // Throws UsbError if the USB context cannot be created or queried.
    LibusbBusReader();
    ~LibusbBusReader() override;

    std::vector<DeviceSnapshot> readSnapshot() override;

    static BusReaderFactory factory();

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
