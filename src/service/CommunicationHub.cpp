#include "CommunicationHub.hpp"
#include "../core/Logger.hpp"
#include <ironwatch/BoundedBuffer.hpp>
#include <ironwatch/Constants.hpp>
#include <algorithm>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>

namespace ironwatch {

namespace {

std::optional<MonitoringStatus> statusForEvent(const MonitorEvent& event) {
    using State = MonitoringStatus::State;
    return std::visit(overloaded{
        [](const MonitoringStarting&) -> std::optional<MonitoringStatus> {
            return MonitoringStatus{State::Starting, {}};
        },
        [](const MonitoringStarted&) -> std::optional<MonitoringStatus> {
            return MonitoringStatus{State::Running, {}};
        },
        [](const MonitoringStopping&) -> std::optional<MonitoringStatus> {
            return MonitoringStatus{State::Stopping, {}};
        },
        [](const MonitoringStopped&) -> std::optional<MonitoringStatus> {
            return MonitoringStatus{State::Stopped, {}};
        },
        [](const MonitoringError& e) -> std::optional<MonitoringStatus> {
            return MonitoringStatus::error(e.message);
        },
        [](const PermissionError& e) -> std::optional<MonitoringStatus> {
            return MonitoringStatus::error("Permission: " + e.message);
        },
        [](const UsbUnavailable& e) -> std::optional<MonitoringStatus> {
            return MonitoringStatus::error("USB Unavailable: " + e.message);
        },
        [](const auto&) -> std::optional<MonitoringStatus> {
            return std::nullopt;
        }
    }, event);
}

std::optional<std::vector<DeviceSnapshot>> devicesForEvent(const MonitorEvent& event) {
    if (const auto* loaded = std::get_if<DevicesLoaded>(&event)) {
        return loaded->devices;
    }
    if (const auto* updated = std::get_if<DevicesUpdated>(&event)) {
        return updated->devices;
    }
    return std::nullopt;
}

}

// StatusSubscription

class StatusSubscription::Private {
public:
    mutable std::mutex mutex;
    std::condition_variable cv;
    BoundedBuffer<MonitoringStatus> queue{STATUS_SUBSCRIPTION_CAPACITY};
    size_t missed = 0;
};

StatusSubscription::StatusSubscription()
    : d(std::make_unique<Private>()) {}

StatusSubscription::~StatusSubscription() = default;

std::optional<MonitoringStatus> StatusSubscription::tryNext() {
    std::lock_guard<std::mutex> lock(d->mutex);
    if (d->queue.empty()) {
        return std::nullopt;
    }
    return d->queue.pop();
}

std::optional<MonitoringStatus> StatusSubscription::waitNext(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(d->mutex);
    if (!d->cv.wait_for(lock, timeout, [this] { return !d->queue.empty(); })) {
        return std::nullopt;
    }
    return d->queue.pop();
}

size_t StatusSubscription::missed() const {
    std::lock_guard<std::mutex> lock(d->mutex);
    return d->missed;
}

void StatusSubscription::push(const MonitoringStatus& status) {
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        if (d->queue.full()) {
            ++d->missed;
        }
        d->queue.push(status);
    }
    d->cv.notify_all();
}

// Shared state between the two halves of the hub

struct HubChannel {
    std::mutex commandMutex;
    std::condition_variable commandReady;
    std::deque<MonitorCommand> commands;
    bool serviceClosed = false;
    bool consumerClosed = false;
    bool shutdownSignaled = false;

    std::mutex eventMutex;
    std::deque<MonitorEvent> events;

    mutable std::mutex statusMutex;
    MonitoringStatus status;

    mutable std::mutex devicesMutex;
    std::vector<DeviceSnapshot> devices;

    std::mutex subscriberMutex;
    std::vector<std::weak_ptr<StatusSubscription>> subscribers;

    std::mutex observerMutex;
    std::function<void(const MonitoringStatus&)> observer;

    void broadcast(const MonitoringStatus& newStatus) {
        std::vector<std::shared_ptr<StatusSubscription>> live;
        {
            std::lock_guard<std::mutex> lock(subscriberMutex);
            subscribers.erase(
                std::remove_if(subscribers.begin(), subscribers.end(),
                               [](const std::weak_ptr<StatusSubscription>& s) { return s.expired(); }),
                subscribers.end());
            for (const auto& weak : subscribers) {
                if (auto sub = weak.lock()) {
                    live.push_back(std::move(sub));
                }
            }
        }
        for (const auto& sub : live) {
            sub->push(newStatus);
        }

        std::lock_guard<std::mutex> lock(observerMutex);
        if (observer) {
            observer(newStatus);
        }
    }
};

// ServiceEndpoint

ServiceEndpoint::ServiceEndpoint(std::shared_ptr<HubChannel> channel)
    : channel_(std::move(channel)) {}

ServiceEndpoint::~ServiceEndpoint() {
    close();
}

ServiceEndpoint::WaitResult ServiceEndpoint::waitForCommand(
    std::optional<std::chrono::steady_clock::time_point> deadline,
    MonitorCommand& command) {
    auto& ch = *channel_;
    std::unique_lock<std::mutex> lock(ch.commandMutex);
    auto ready = [&ch] {
        return ch.shutdownSignaled || ch.consumerClosed || !ch.commands.empty();
    };

    if (deadline) {
        if (!ch.commandReady.wait_until(lock, *deadline, ready)) {
            return WaitResult::Timeout;
        }
    } else {
        ch.commandReady.wait(lock, ready);
    }

    if (ch.shutdownSignaled) {
        return WaitResult::Shutdown;
    }
    if (!ch.commands.empty()) {
        command = std::move(ch.commands.front());
        ch.commands.pop_front();
        return WaitResult::Command;
    }
    return WaitResult::Closed;
}

std::optional<MonitorCommand> ServiceEndpoint::tryRecvCommand() {
    std::lock_guard<std::mutex> lock(channel_->commandMutex);
    if (channel_->commands.empty()) {
        return std::nullopt;
    }
    MonitorCommand command = std::move(channel_->commands.front());
    channel_->commands.pop_front();
    return command;
}

bool ServiceEndpoint::sendEvent(MonitorEvent event) {
    auto& ch = *channel_;

    if (auto devices = devicesForEvent(event)) {
        std::lock_guard<std::mutex> lock(ch.devicesMutex);
        ch.devices = std::move(*devices);
    }

    auto newStatus = statusForEvent(event);
    if (newStatus) {
        std::lock_guard<std::mutex> lock(ch.statusMutex);
        ch.status = *newStatus;
    }

    bool delivered = false;
    {
        std::lock_guard<std::mutex> lock(ch.commandMutex);
        delivered = !ch.consumerClosed;
    }
    if (delivered) {
        std::lock_guard<std::mutex> lock(ch.eventMutex);
        ch.events.push_back(std::move(event));
    }

    if (newStatus) {
        ch.broadcast(*newStatus);
    }
    return delivered;
}

void ServiceEndpoint::signalShutdown() {
    {
        std::lock_guard<std::mutex> lock(channel_->commandMutex);
        channel_->shutdownSignaled = true;
    }
    channel_->commandReady.notify_all();
}

bool ServiceEndpoint::isShutdownSignaled() const {
    std::lock_guard<std::mutex> lock(channel_->commandMutex);
    return channel_->shutdownSignaled;
}

void ServiceEndpoint::close() {
    std::lock_guard<std::mutex> lock(channel_->commandMutex);
    channel_->serviceClosed = true;
}

// CommunicationHub

CommunicationHub::CommunicationHub(QObject* parent)
    : QObject(parent)
    , channel_(std::make_shared<HubChannel>()) {
    qRegisterMetaType<ironwatch::MonitoringStatus>("ironwatch::MonitoringStatus");

    endpoint_.reset(new ServiceEndpoint(channel_));

    std::lock_guard<std::mutex> lock(channel_->observerMutex);
    channel_->observer = [this](const MonitoringStatus& status) {
        emit statusChanged(status);
    };
}

CommunicationHub::~CommunicationHub() {
    {
        std::lock_guard<std::mutex> lock(channel_->observerMutex);
        channel_->observer = nullptr;
    }
    {
        std::lock_guard<std::mutex> lock(channel_->commandMutex);
        channel_->consumerClosed = true;
    }
    channel_->commandReady.notify_all();
}

std::unique_ptr<ServiceEndpoint> CommunicationHub::takeEndpoint() {
    return std::move(endpoint_);
}

bool CommunicationHub::sendCommand(MonitorCommand command) {
    const char* name = commandName(command);
    {
        std::lock_guard<std::mutex> lock(channel_->commandMutex);
        if (channel_->serviceClosed) {
            LOG_WARNING(std::string("Monitoring service is gone, dropping command ") + name);
            return false;
        }
        channel_->commands.push_back(std::move(command));
    }
    channel_->commandReady.notify_one();
    LOG_DEBUG(std::string("Queued command ") + name);
    return true;
}

bool CommunicationHub::startMonitoring() {
    return sendCommand(StartMonitoring{});
}

bool CommunicationHub::stopMonitoring() {
    return sendCommand(StopMonitoring{});
}

bool CommunicationHub::refreshDevices() {
    return sendCommand(RefreshDevices{});
}

bool CommunicationHub::setFilter(std::optional<std::string> pattern) {
    return sendCommand(SetFilter{std::move(pattern)});
}

bool CommunicationHub::setPollingInterval(std::chrono::milliseconds interval) {
    return sendCommand(SetPollingInterval{interval});
}

bool CommunicationHub::updateSecurityPolicy(SecurityPolicy policy) {
    return sendCommand(UpdateSecurityPolicy{std::move(policy)});
}

bool CommunicationHub::requestReport() {
    return sendCommand(RequestReport{});
}

bool CommunicationHub::shutdown() {
    return sendCommand(Shutdown{});
}

std::optional<MonitorEvent> CommunicationHub::tryRecvEvent() {
    std::lock_guard<std::mutex> lock(channel_->eventMutex);
    if (channel_->events.empty()) {
        return std::nullopt;
    }
    MonitorEvent event = std::move(channel_->events.front());
    channel_->events.pop_front();
    return event;
}

MonitoringStatus CommunicationHub::status() const {
    std::lock_guard<std::mutex> lock(channel_->statusMutex);
    return channel_->status;
}

std::vector<DeviceSnapshot> CommunicationHub::devices() const {
    std::lock_guard<std::mutex> lock(channel_->devicesMutex);
    return channel_->devices;
}

std::shared_ptr<StatusSubscription> CommunicationHub::subscribeStatus() {
    auto subscription = std::make_shared<StatusSubscription>();
    std::lock_guard<std::mutex> lock(channel_->subscriberMutex);
    channel_->subscribers.push_back(subscription);
    return subscription;
}

}
