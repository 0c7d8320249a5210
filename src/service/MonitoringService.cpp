#include "MonitoringService.hpp"
#include "../core/DeviceTracker.hpp"
#include "../core/Logger.hpp"
#include "../core/StatisticsTracker.hpp"
#include "../security/SecurityManager.hpp"
#include <ironwatch/Error.hpp>
#include <atomic>
#include <vector>
#include <thread>

namespace ironwatch {

class MonitoringService::Private {
public:
    std::unique_ptr<ServiceEndpoint> endpoint;
    BusReaderFactory readerFactory;
    MonitorSettings settings;
    std::shared_ptr<INotificationSink> notifications;

    std::unique_ptr<DeviceTracker> tracker;
    std::atomic<State> state{State::Idle};
    std::thread serviceThread;
    std::chrono::steady_clock::time_point nextTick;

    void setState(State next) {
        State previous = state.exchange(next);
        if (previous != next) {
            LOG_DEBUG(std::string("Service state ") + serviceStateName(previous) +
                      " -> " + serviceStateName(next));
        }
    }

    void emitEvent(MonitorEvent event) {
        const char* name = eventName(event);
        if (!endpoint->sendEvent(std::move(event))) {
            LOG_DEBUG(std::string("No consumer attached, dropped event ") + name);
        }
    }

    void notify(const DeviceChange& change) {
        if (!notifications) {
            return;
        }
        Notification n = changeNotification(change);
        notifications->notify(n.title, n.body);
    }

    void reportBusError(const UsbError& error, const std::string& context) {
        std::string message = context + ": " + error.what();
        LOG_ERROR(message);
        if (error.isPermissionError()) {
            emitEvent(PermissionError{message});
        } else {
            emitEvent(MonitoringError{message});
        }
    }

    void publishChanges(std::vector<DeviceChange> changes) {
        for (const auto& change : changes) {
            notify(change);
        }
        if (!changes.empty()) {
            emitEvent(DevicesChanged{std::move(changes)});
        }
    }

    // Puts the hub's cached status back in line with the service state.
    void republishState() {
        switch (state.load()) {
            case State::Running:
                emitEvent(MonitoringStarted{});
                break;
            case State::Idle:
            case State::Stopped:
                emitEvent(MonitoringStopped{});
                break;
            default:
                break;
        }
    }

    bool initializeTracker() {
        if (tracker) {
            return true;
        }

        setState(State::Initializing);
        try {
            std::unique_ptr<IBusReader> reader;
            if (readerFactory) {
                reader = readerFactory();
            }
            if (!reader) {
                throw UsbError(ErrorKind::BusUnavailable, "No USB bus reader available");
            }
            tracker = std::make_unique<DeviceTracker>(std::move(reader), settings.securityPolicy);
            tracker->setFilter(settings.deviceFilter);
            LOG_INFO("USB monitor initialized successfully");
            return true;
        } catch (const UsbError& e) {
            auto [message, suggestion] = userFriendlyMessage(e);
            LOG_ERROR("Failed to initialize USB monitor: " + std::string(e.what()));
            if (suggestion) {
                LOG_INFO(*suggestion);
            }
            if (e.isPermissionError()) {
                emitEvent(PermissionError{message});
            } else {
                emitEvent(UsbUnavailable{message});
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to initialize USB monitor: " + std::string(e.what()));
            emitEvent(UsbUnavailable{e.what()});
        }

        setState(State::Error);
        return false;
    }

    void startMonitoring() {
        if (state == State::Running) {
            LOG_DEBUG("Monitoring already active");
            return;
        }

        emitEvent(MonitoringStarting{});
        if (!initializeTracker()) {
            LOG_WARNING("USB monitor unavailable, running in degraded mode");
            return;
        }

        setState(State::Running);
        nextTick = std::chrono::steady_clock::now() + settings.pollInterval;
        emitEvent(MonitoringStarted{});
        LOG_INFO("USB monitoring started");

        try {
            if (!tracker->isPrimed()) {
                emitEvent(DevicesLoaded{tracker->primeInitialState()});
                return;
            }
            // Restart: arrivals and removals during the pause are real changes.
            publishChanges(tracker->monitorChanges());
            emitEvent(DevicesLoaded{tracker->knownDevices()});
        } catch (const UsbError& e) {
            reportBusError(e, "Initial device scan failed");
        }
    }

    void stopMonitoring() {
        if (state != State::Running) {
            LOG_DEBUG("Monitoring not active");
            return;
        }

        emitEvent(MonitoringStopping{});
        setState(State::Stopped);
        emitEvent(MonitoringStopped{});
        LOG_INFO("USB monitoring stopped");
    }

    void refreshDevices() {
        if (!tracker) {
            LOG_WARNING("USB monitor not available, sending empty device list");
            emitEvent(DevicesUpdated{});
            return;
        }

        try {
            publishChanges(tracker->monitorChanges());
            emitEvent(DevicesUpdated{tracker->knownDevices()});
        } catch (const UsbError& e) {
            reportBusError(e, "Failed to get device list");
        }
    }

    void performMonitoringCycle() {
        if (!tracker) {
            return;
        }

        try {
            std::vector<DeviceChange> changes = tracker->monitorChanges();
            if (changes.empty()) {
                return;
            }
            for (auto& change : changes) {
                notify(change);
                emitEvent(DeviceChanged{std::move(change)});
            }
            emitEvent(DevicesUpdated{tracker->knownDevices()});
        } catch (const UsbError& e) {
            reportBusError(e, "Device monitoring error");
        }
    }

    void setFilter(const std::optional<std::string>& filter) {
        settings.deviceFilter = filter;
        if (tracker) {
            tracker->setFilter(filter);
        }
        LOG_INFO("Device filter " + (filter && !filter->empty() ? "set to '" + *filter + "'"
                                                                 : std::string("cleared")));
        refreshDevices();
    }

    void setPollingInterval(std::chrono::milliseconds interval) {
        if (interval.count() < MIN_POLL_INTERVAL) {
            std::string message = "Polling interval must be at least " +
                                  std::to_string(MIN_POLL_INTERVAL) + " ms, got " +
                                  std::to_string(interval.count()) + " ms";
            LOG_WARNING(message);
            emitEvent(MonitoringError{message});
            republishState();
            return;
        }
        settings.pollInterval = interval;
        LOG_INFO("Polling interval updated to " + std::to_string(interval.count()) + " ms");
    }

    void updateSecurityPolicy(SecurityPolicy policy) {
        settings.securityPolicy = policy;
        if (tracker) {
            tracker->security().setPolicy(std::move(policy));
        }
    }

    ServiceReport buildReport() const {
        ServiceReport report;
        if (!tracker) {
            return report;
        }

        const SecurityManager& security = tracker->security();
        const StatisticsTracker& statistics = tracker->statistics();

        report.devices = tracker->knownDevices();
        report.statistics = statistics.allStatistics();
        report.analytics = statistics.analytics(security.securityEventCount());
        report.securityEvents = security.securityEvents();
        report.connectionHistory = statistics.connectionHistory();
        return report;
    }

    // Returns false once the loop should exit.
    bool handleCommand(MonitorCommand& command) {
        LOG_DEBUG(std::string("Handling command: ") + commandName(command));

        bool keepRunning = true;
        std::visit(overloaded{
            [this](StartMonitoring&) { startMonitoring(); },
            [this](StopMonitoring&) { stopMonitoring(); },
            [this](RefreshDevices&) { refreshDevices(); },
            [this](SetFilter& c) { setFilter(c.pattern); },
            [this](SetPollingInterval& c) { setPollingInterval(c.interval); },
            [this](UpdateSecurityPolicy& c) { updateSecurityPolicy(std::move(c.policy)); },
            [this](RequestReport&) { emitEvent(ReportReady{buildReport()}); },
            [this, &keepRunning](Shutdown&) {
                LOG_INFO("Received shutdown command");
                endpoint->signalShutdown();
                keepRunning = false;
            }
        }, command);
        return keepRunning;
    }
};

MonitoringService::MonitoringService(std::unique_ptr<ServiceEndpoint> endpoint,
                                     BusReaderFactory readerFactory,
                                     MonitorSettings settings,
                                     std::shared_ptr<INotificationSink> notifications)
    : d(std::make_unique<Private>()) {
    if (!endpoint) {
        throw UsbError(ErrorKind::CommunicationFailure, "Monitoring service needs a hub endpoint");
    }
    d->endpoint = std::move(endpoint);
    d->readerFactory = std::move(readerFactory);
    d->settings = std::move(settings);
    d->notifications = std::move(notifications);
}

MonitoringService::~MonitoringService() {
    requestShutdown();
    wait();
}

bool MonitoringService::start() {
    if (d->serviceThread.joinable()) {
        return false;
    }
    d->serviceThread = std::thread([this]() { run(); });
    return true;
}

void MonitoringService::run() {
    LOG_INFO("Starting monitoring service");

    for (;;) {
        std::optional<std::chrono::steady_clock::time_point> deadline;
        if (d->state == State::Running) {
            deadline = d->nextTick;
        }

        MonitorCommand command;
        auto result = d->endpoint->waitForCommand(deadline, command);

        if (result == ServiceEndpoint::WaitResult::Shutdown) {
            LOG_INFO("Shutdown signal received, stopping monitoring service");
            break;
        }
        if (result == ServiceEndpoint::WaitResult::Closed) {
            LOG_DEBUG("Command channel closed, shutting down");
            break;
        }
        if (result == ServiceEndpoint::WaitResult::Timeout) {
            d->performMonitoringCycle();
            d->nextTick = std::chrono::steady_clock::now() + d->settings.pollInterval;
            continue;
        }

        bool keepRunning = true;
        try {
            keepRunning = d->handleCommand(command);
        } catch (const std::exception& e) {
            std::string message = std::string("Error handling command ") +
                                  commandName(command) + ": " + e.what();
            LOG_ERROR(message);
            d->emitEvent(MonitoringError{message});
        }
        if (!keepRunning) {
            break;
        }
    }

    d->stopMonitoring();
    d->setState(State::ShuttingDown);
    d->endpoint->close();
    LOG_INFO("Monitoring service stopped");
}

void MonitoringService::wait() {
    if (d->serviceThread.joinable()) {
        d->serviceThread.join();
    }
}

void MonitoringService::requestShutdown() {
    d->endpoint->signalShutdown();
}

MonitoringService::State MonitoringService::state() const {
    return d->state;
}

bool MonitoringService::waitForUsbAccess(const BusReaderFactory& readerFactory,
                                         int retries,
                                         std::chrono::milliseconds delay) {
    for (int attempt = 0;; ++attempt) {
        try {
            if (readerFactory && readerFactory()) {
                LOG_INFO("USB access verified");
                return true;
            }
            LOG_ERROR("USB access check failed: no bus reader");
        } catch (const UsbError& e) {
            LOG_ERROR("USB access check failed: " + std::string(e.what()));
        }

        if (attempt >= retries) {
            LOG_ERROR("Max retries reached, continuing without USB access");
            return false;
        }
        LOG_WARNING("Retrying USB access check in " + std::to_string(delay.count()) + " ms... (" +
                    std::to_string(attempt + 1) + "/" + std::to_string(retries) + ")");
        std::this_thread::sleep_for(delay);
    }
}

const char* serviceStateName(MonitoringService::State state) {
    switch (state) {
        case MonitoringService::State::Idle:         return "Idle";
        case MonitoringService::State::Initializing: return "Initializing";
        case MonitoringService::State::Running:      return "Running";
        case MonitoringService::State::Stopped:      return "Stopped";
        case MonitoringService::State::Error:        return "Error";
        case MonitoringService::State::ShuttingDown: return "ShuttingDown";
    }
    return "Unknown";
}

}
