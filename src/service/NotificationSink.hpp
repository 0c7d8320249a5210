#pragma once
#include <ironwatch/Types.hpp>
#include <string>

namespace ironwatch {

struct Notification {
    std::string title;
    std::string body;
};

// "IronWatch - Device connected" / "Logitech USB Receiver (046D:C52B)"
Notification changeNotification(const DeviceChange& change);

/**
 * Receiver for user-facing device notifications. Called on the monitoring
 * thread, so implementations must not block for long.
 */
class INotificationSink {
public:
    virtual ~INotificationSink() = default;
    virtual void notify(const std::string& title, const std::string& body) = 0;
};

class LogNotificationSink : public INotificationSink {
public:
    void notify(const std::string& title, const std::string& body) override;
};

}
