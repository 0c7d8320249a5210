#include "NotificationSink.hpp"
#include "../core/Logger.hpp"
#include "../utils/StringUtils.hpp"
#include <algorithm>
#include <cctype>

namespace ironwatch {

Notification changeNotification(const DeviceChange& change) {
    std::string action = changeTypeName(change.type);
    std::transform(action.begin(), action.end(), action.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const DeviceSnapshot& device = change.device;
    std::string name = "Unknown Device";
    if (device.product && !device.product->empty()) {
        name = *device.product;
    } else if (device.manufacturer && !device.manufacturer->empty()) {
        name = *device.manufacturer;
    }

    return Notification{
        "IronWatch - Device " + action,
        name + " (" + toHex(device.vendorId) + ":" + toHex(device.productId) + ")"
    };
}

void LogNotificationSink::notify(const std::string& title, const std::string& body) {
    LOG_INFO(title + ": " + body);
}

}
