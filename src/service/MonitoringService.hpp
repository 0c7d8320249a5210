#pragma once
#include "CommunicationHub.hpp"
#include "NotificationSink.hpp"
#include "../core/BusReader.hpp"
#include <ironwatch/Constants.hpp>
#include <ironwatch/Types.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace ironwatch {

struct MonitorSettings {
    std::chrono::milliseconds pollInterval{DEFAULT_POLL_INTERVAL};
    std::optional<std::string> deviceFilter;
    SecurityPolicy securityPolicy;
};

/**
 * Background service that owns the device tracker and serves the hub.
 *
 * The loop waits for one of: shutdown, the next command, or the polling
 * deadline (only while Running). Bus failures are reported as events and
 * never end the loop; without a bus reader the service keeps answering
 * commands with empty device lists.
 */
class MonitoringService {
public:
    enum class State {
        Idle,
        Initializing,
        Running,
        Stopped,
        Error,
        ShuttingDown
    };

    MonitoringService(std::unique_ptr<ServiceEndpoint> endpoint,
                      BusReaderFactory readerFactory,
                      MonitorSettings settings = MonitorSettings{},
                      std::shared_ptr<INotificationSink> notifications = nullptr);
    ~MonitoringService();

    MonitoringService(const MonitoringService&) = delete;
    MonitoringService& operator=(const MonitoringService&) = delete;

    // Spawns the service thread. Returns false if it is already running.
    bool start();
    // Runs the loop on the calling thread until shutdown.
    void run();
    // Joins the service thread.
    void wait();

    // Safe to call from any thread.
    void requestShutdown();
    State state() const;

    // Retries the factory until it yields a reader, sleeping between
    // attempts. Returns true if the bus became accessible.
    static bool waitForUsbAccess(const BusReaderFactory& readerFactory,
                                 int retries,
                                 std::chrono::milliseconds delay =
                                     std::chrono::milliseconds(USB_ACCESS_RETRY_DELAY));

private:
    class Private;
    std::unique_ptr<Private> d;
};

const char* serviceStateName(MonitoringService::State state);

}
