#pragma once
#include <ironwatch/Constants.hpp>
#include <ironwatch/Types.hpp>
#include <QObject>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ironwatch {

using ConfigValue = std::variant<bool, int, std::string>;

std::string configValueToString(const ConfigValue& value);

struct MonitoringConfig {
    int pollIntervalMs{DEFAULT_POLL_INTERVAL};
    bool autoStart{false};
};

struct LoggingConfig {
    std::string level{"info"};
    bool fileLogging{false};
    std::string logFilePath;
    int maxLogFileSizeMb{10};
    bool rotateLogs{true};
};

struct Config {
    MonitoringConfig monitoring;
    LoggingConfig logging;
    std::string deviceFilter;
    SecurityPolicy deviceRules;
};

enum class RuleList {
    Blacklist,
    Whitelist
};

/**
 * JSON backed application configuration.
 *
 * Scalar settings are addressed by dotted key paths such as
 * "monitoring.poll_interval_ms". Mutators throw UsbError with
 * ErrorKind::ConfigurationError when a value or operation is rejected.
 */
class ConfigManager : public QObject {
    Q_OBJECT

public:
    explicit ConfigManager(QObject* parent = nullptr);
    ~ConfigManager();

    const Config& config() const;

    // Key path access
    static std::vector<std::string> keys();
    ConfigValue getValue(const std::string& key) const;
    void setValue(const std::string& key, const std::string& value);

    void validate() const;

    // Device rules
    void addRule(RuleList list, DeviceRule rule);
    void removeRule(RuleList list, size_t index);
    const std::vector<DeviceRule>& rules(RuleList list) const;
    void setListEnabled(RuleList list, bool enabled);

    // Derived settings
    std::chrono::milliseconds pollInterval() const;
    std::optional<std::string> deviceFilter() const;
    SecurityPolicy securityPolicy() const;
    void applyLoggingSettings() const;

    // File operations
    bool loadFromFile(const std::string& filename);
    bool saveToFile(const std::string& filename) const;
    std::string configPath() const;

    // First existing file among the explicit path, ./ironwatch.json,
    // ~/.config/ironwatch/config.json and /etc/ironwatch/config.json.
    static std::optional<std::string> findConfigFile(const std::optional<std::string>& explicitPath);

    void resetToDefaults();

signals:
    void configChanged(const std::string& key);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
