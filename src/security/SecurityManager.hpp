#pragma once
#include <ironwatch/Types.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ironwatch {

struct SecurityDecision {
    bool blocked{false};
    std::optional<std::string> reason;
    SecurityAction action{SecurityAction::Allowed};
};

/**
 * Applies the whitelist/blacklist policy to newly seen devices and keeps the
 * capped security event log. Owned by the monitoring thread; not thread-safe.
 */
class SecurityManager {
public:
    explicit SecurityManager(SecurityPolicy policy = SecurityPolicy{});
    ~SecurityManager();

    SecurityManager(const SecurityManager&) = delete;
    SecurityManager& operator=(const SecurityManager&) = delete;

    // Decides allow/block and appends exactly one SecurityEvent.
    SecurityDecision evaluate(const DeviceSnapshot& device);

    void setPolicy(SecurityPolicy policy);
    const SecurityPolicy& policy() const;

    std::vector<SecurityEvent> securityEvents() const;
    std::vector<SecurityEvent> securityEvents(TimePoint start, TimePoint end) const;
    size_t securityEventCount() const;
    void clearSecurityEvents();

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
