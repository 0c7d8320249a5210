#include "SecurityManager.hpp"
#include "../core/Logger.hpp"
#include "../utils/StringUtils.hpp"
#include <ironwatch/BoundedBuffer.hpp>
#include <ironwatch/Constants.hpp>

namespace ironwatch {

namespace {

const char* const kNotWhitelisted = "Device not in whitelist";
const char* const kPassedChecks = "Device passed security checks";

std::string describe(const DeviceSnapshot& device) {
    return device.displayName() + " (VID:" + toHex(device.vendorId) +
           ", PID:" + toHex(device.productId) + ")";
}

} // namespace

class SecurityManager::Private {
public:
    SecurityPolicy policy;
    BoundedBuffer<SecurityEvent> events{SECURITY_EVENT_CAPACITY};

    // First enabled rule in the list that matches, if any.
    const DeviceRule* findMatchingRule(const std::vector<DeviceRule>& rules,
                                       const DeviceSnapshot& device) const {
        for (const auto& rule : rules) {
            if (rule.enabled && rule.matches(device)) {
                return &rule;
            }
        }
        return nullptr;
    }

    void logSecurityEvent(SecurityEventType type,
                          const DeviceSnapshot& device,
                          const std::string& reason,
                          SecurityAction action) {
        events.push(SecurityEvent{Clock::now(), type, device, reason, action});
    }
};

SecurityManager::SecurityManager(SecurityPolicy policy)
    : d(std::make_unique<Private>()) {
    d->policy = std::move(policy);
}

SecurityManager::~SecurityManager() = default;

SecurityDecision SecurityManager::evaluate(const DeviceSnapshot& device) {
    std::optional<std::string> blockReason;

    if (d->policy.whitelistEnabled &&
        !d->findMatchingRule(d->policy.whitelist, device)) {
        blockReason = kNotWhitelisted;
    }

    if (!blockReason && d->policy.blacklistEnabled) {
        if (const DeviceRule* rule = d->findMatchingRule(d->policy.blacklist, device)) {
            blockReason = rule->reason;
        }
    }

    if (blockReason) {
        d->logSecurityEvent(SecurityEventType::DeviceBlocked, device,
                            *blockReason, SecurityAction::Blocked);
        LOG_WARNING("New device blocked: " + describe(device) + " - " + *blockReason);
        return SecurityDecision{true, blockReason, SecurityAction::Blocked};
    }

    d->logSecurityEvent(SecurityEventType::DeviceAllowed, device,
                        kPassedChecks, SecurityAction::Allowed);
    return SecurityDecision{false, std::nullopt, SecurityAction::Allowed};
}

void SecurityManager::setPolicy(SecurityPolicy policy) {
    d->policy = std::move(policy);
    LOG_INFO("Security policy updated: blacklist " +
             std::string(d->policy.blacklistEnabled ? "enabled" : "disabled") +
             " (" + std::to_string(d->policy.blacklist.size()) + " rules), whitelist " +
             std::string(d->policy.whitelistEnabled ? "enabled" : "disabled") +
             " (" + std::to_string(d->policy.whitelist.size()) + " rules)");
}

const SecurityPolicy& SecurityManager::policy() const {
    return d->policy;
}

std::vector<SecurityEvent> SecurityManager::securityEvents() const {
    return std::vector<SecurityEvent>(d->events.begin(), d->events.end());
}

std::vector<SecurityEvent> SecurityManager::securityEvents(TimePoint start, TimePoint end) const {
    std::vector<SecurityEvent> result;
    for (const auto& event : d->events) {
        if (event.timestamp >= start && event.timestamp <= end) {
            result.push_back(event);
        }
    }
    return result;
}

size_t SecurityManager::securityEventCount() const {
    return d->events.size();
}

void SecurityManager::clearSecurityEvents() {
    d->events.clear();
}

}
