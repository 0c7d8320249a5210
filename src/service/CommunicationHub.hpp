#pragma once
#include "Messages.hpp"
#include <ironwatch/Types.hpp>
#include <QObject>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ironwatch {

struct HubChannel;

/**
 * Push-style status stream. Holds at most STATUS_SUBSCRIPTION_CAPACITY
 * pending updates; a subscriber that falls behind loses the oldest ones.
 */
class StatusSubscription {
public:
    StatusSubscription();
    ~StatusSubscription();

    StatusSubscription(const StatusSubscription&) = delete;
    StatusSubscription& operator=(const StatusSubscription&) = delete;

    std::optional<MonitoringStatus> tryNext();
    std::optional<MonitoringStatus> waitNext(std::chrono::milliseconds timeout);

    // Updates lost because the queue was full.
    size_t missed() const;

private:
    friend struct HubChannel;
    void push(const MonitoringStatus& status);

    class Private;
    std::unique_ptr<Private> d;
};

/**
 * Service-side half of the hub. Owned by the monitoring thread.
 */
class ServiceEndpoint {
public:
    enum class WaitResult {
        Command,
        Timeout,
        Shutdown,
        Closed      // the hub is gone; no command can arrive any more
    };

    ~ServiceEndpoint();

    ServiceEndpoint(const ServiceEndpoint&) = delete;
    ServiceEndpoint& operator=(const ServiceEndpoint&) = delete;

    // Blocks until a command arrives, shutdown is signalled or the deadline
    // passes. Without a deadline only the first two can end the wait.
    WaitResult waitForCommand(std::optional<std::chrono::steady_clock::time_point> deadline,
                              MonitorCommand& command);
    std::optional<MonitorCommand> tryRecvCommand();

    // Mirrors status/device-list events into the hub cache, then queues the
    // event. Returns false when the consumer side has been destroyed.
    bool sendEvent(MonitorEvent event);

    void signalShutdown();
    bool isShutdownSignaled() const;

    // Marks the service as terminated; later sendCommand() calls fail.
    void close();

private:
    friend class CommunicationHub;
    explicit ServiceEndpoint(std::shared_ptr<HubChannel> channel);

    std::shared_ptr<HubChannel> channel_;
};

/**
 * Consumer-side half: fire-and-forget commands, non-blocking event pull and
 * cached status/device list readable from any thread.
 */
class CommunicationHub : public QObject {
    Q_OBJECT

public:
    explicit CommunicationHub(QObject* parent = nullptr);
    ~CommunicationHub() override;

    // The service side. Available once; later calls return nullptr.
    std::unique_ptr<ServiceEndpoint> takeEndpoint();

    // Never blocks. False only once the service side has terminated.
    bool sendCommand(MonitorCommand command);

    bool startMonitoring();
    bool stopMonitoring();
    bool refreshDevices();
    bool setFilter(std::optional<std::string> pattern);
    bool setPollingInterval(std::chrono::milliseconds interval);
    bool updateSecurityPolicy(SecurityPolicy policy);
    bool requestReport();
    bool shutdown();

    std::optional<MonitorEvent> tryRecvEvent();

    MonitoringStatus status() const;
    std::vector<DeviceSnapshot> devices() const;

    std::shared_ptr<StatusSubscription> subscribeStatus();

signals:
    // Emitted on the thread that delivered the status-changing event.
    void statusChanged(const ironwatch::MonitoringStatus& status);

private:
    std::shared_ptr<HubChannel> channel_;
    std::unique_ptr<ServiceEndpoint> endpoint_;
};

}

Q_DECLARE_METATYPE(ironwatch::MonitoringStatus)
