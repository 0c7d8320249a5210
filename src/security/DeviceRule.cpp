#include <ironwatch/Types.hpp>
#include "../utils/StringUtils.hpp"

namespace ironwatch {

namespace {

bool matchesString(const std::optional<std::string>& pattern,
                   const std::optional<std::string>& value) {
    if (!pattern) {
        return true;
    }
    if (!value) {
        return false;
    }
    return containsIgnoreCase(*value, *pattern);
}

} // namespace

bool DeviceRule::matches(const DeviceSnapshot& device) const {
    if (vendorId && device.vendorId != *vendorId) {
        return false;
    }
    if (productId && device.productId != *productId) {
        return false;
    }
    if (deviceClass && device.deviceClass != *deviceClass) {
        return false;
    }

    return matchesString(manufacturer, device.manufacturer) &&
           matchesString(productName, device.product) &&
           matchesString(serialNumber, device.serialNumber);
}

bool DeviceRule::sameRule(const DeviceRule& other) const {
    return vendorId == other.vendorId &&
           productId == other.productId &&
           deviceClass == other.deviceClass &&
           manufacturer == other.manufacturer &&
           productName == other.productName &&
           serialNumber == other.serialNumber &&
           reason == other.reason &&
           enabled == other.enabled;
}

}
