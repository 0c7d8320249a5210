#include "ConfigManager.hpp"
#include "Overloaded.hpp"
#include "StringUtils.hpp"
#include "../core/Logger.hpp"
#include <ironwatch/Error.hpp>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <algorithm>

namespace ironwatch {

namespace {

const char* const KEY_POLL_INTERVAL = "monitoring.poll_interval_ms";
const char* const KEY_AUTO_START = "monitoring.auto_start";
const char* const KEY_LOG_LEVEL = "logging.level";
const char* const KEY_FILE_LOGGING = "logging.file_logging";
const char* const KEY_LOG_FILE_PATH = "logging.log_file_path";
const char* const KEY_MAX_LOG_SIZE = "logging.max_log_file_size_mb";
const char* const KEY_ROTATE_LOGS = "logging.rotate_logs";
const char* const KEY_DEVICE_FILTER = "filters.device_filter";
const char* const KEY_BLACKLIST_ENABLED = "device_rules.blacklist_enabled";
const char* const KEY_WHITELIST_ENABLED = "device_rules.whitelist_enabled";

[[noreturn]] void configError(const std::string& message) {
    throw UsbError(ErrorKind::ConfigurationError, message);
}

bool parseBool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        return false;
    }
    configError("Invalid " + key + " value: '" + value + "' (expected true or false)");
}

int parseInt(const std::string& key, const std::string& value) {
    bool ok = false;
    int result = QString::fromStdString(value).trimmed().toInt(&ok);
    if (!ok) {
        configError("Invalid " + key + " value: '" + value + "' (expected an integer)");
    }
    return result;
}

QString toIsoString(TimePoint time) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
    return QDateTime::fromMSecsSinceEpoch(ms, Qt::UTC).toString(Qt::ISODate);
}

std::optional<TimePoint> fromIsoString(const QString& text) {
    QDateTime parsed = QDateTime::fromString(text, Qt::ISODate);
    if (!parsed.isValid()) {
        return std::nullopt;
    }
    return TimePoint(std::chrono::milliseconds(parsed.toMSecsSinceEpoch()));
}

std::optional<uint16_t> idFromJson(const QJsonValue& value, const char* field) {
    if (value.isUndefined() || value.isNull()) {
        return std::nullopt;
    }
    if (value.isDouble()) {
        int number = value.toInt(-1);
        if (number < 0 || number > 0xFFFF) {
            configError(std::string("Rule ") + field + " out of range");
        }
        return static_cast<uint16_t>(number);
    }
    if (value.isString()) {
        auto id = parseHexId(value.toString().toStdString());
        if (!id) {
            configError(std::string("Rule ") + field + " is not a hex id: " +
                        value.toString().toStdString());
        }
        return id;
    }
    configError(std::string("Rule ") + field + " must be a string or number");
}

std::optional<std::string> stringFromJson(const QJsonValue& value) {
    if (!value.isString()) {
        return std::nullopt;
    }
    return value.toString().toStdString();
}

DeviceRule ruleFromJson(const QJsonObject& json) {
    DeviceRule rule;
    rule.vendorId = idFromJson(json["vendor_id"], "vendor_id");
    rule.productId = idFromJson(json["product_id"], "product_id");

    QJsonValue deviceClass = json["device_class"];
    if (deviceClass.isDouble()) {
        int value = deviceClass.toInt(-1);
        if (value < 0 || value > 0xFF) {
            configError("Rule device_class out of range");
        }
        rule.deviceClass = static_cast<uint8_t>(value);
    }

    rule.manufacturer = stringFromJson(json["manufacturer"]);
    rule.productName = stringFromJson(json["product_name"]);
    rule.serialNumber = stringFromJson(json["serial_number"]);
    rule.reason = json["reason"].toString().toStdString();
    rule.enabled = json["enabled"].toBool(true);

    if (auto created = fromIsoString(json["created_at"].toString())) {
        rule.createdAt = *created;
    }
    return rule;
}

QJsonObject ruleToJson(const DeviceRule& rule) {
    QJsonObject json;
    if (rule.vendorId) {
        json["vendor_id"] = QString::fromStdString(toHex(*rule.vendorId));
    }
    if (rule.productId) {
        json["product_id"] = QString::fromStdString(toHex(*rule.productId));
    }
    if (rule.deviceClass) {
        json["device_class"] = static_cast<int>(*rule.deviceClass);
    }
    if (rule.manufacturer) {
        json["manufacturer"] = QString::fromStdString(*rule.manufacturer);
    }
    if (rule.productName) {
        json["product_name"] = QString::fromStdString(*rule.productName);
    }
    if (rule.serialNumber) {
        json["serial_number"] = QString::fromStdString(*rule.serialNumber);
    }
    json["reason"] = QString::fromStdString(rule.reason);
    json["created_at"] = toIsoString(rule.createdAt);
    json["enabled"] = rule.enabled;
    return json;
}

std::vector<DeviceRule> rulesFromJson(const QJsonValue& value) {
    std::vector<DeviceRule> rules;
    for (const QJsonValue& entry : value.toArray()) {
        rules.push_back(ruleFromJson(entry.toObject()));
    }
    return rules;
}

QJsonArray rulesToJson(const std::vector<DeviceRule>& rules) {
    QJsonArray array;
    for (const auto& rule : rules) {
        array.append(ruleToJson(rule));
    }
    return array;
}

const char* listName(RuleList list) {
    return list == RuleList::Blacklist ? "blacklist" : "whitelist";
}

} // namespace

std::string configValueToString(const ConfigValue& value) {
    return std::visit(overloaded{
        [](bool b) -> std::string { return b ? "true" : "false"; },
        [](int i) -> std::string { return std::to_string(i); },
        [](const std::string& s) -> std::string { return s; }
    }, value);
}

class ConfigManager::Private {
public:
    Config config;
    std::string path;

    std::vector<DeviceRule>& rules(RuleList list) {
        return list == RuleList::Blacklist ? config.deviceRules.blacklist
                                           : config.deviceRules.whitelist;
    }

    bool listEnabled(RuleList list) const {
        return list == RuleList::Blacklist ? config.deviceRules.blacklistEnabled
                                           : config.deviceRules.whitelistEnabled;
    }

    void fromJson(const QJsonObject& root) {
        Config loaded;

        const QJsonObject monitoring = root["monitoring"].toObject();
        loaded.monitoring.pollIntervalMs =
            monitoring["poll_interval_ms"].toInt(loaded.monitoring.pollIntervalMs);
        loaded.monitoring.autoStart = monitoring["auto_start"].toBool(loaded.monitoring.autoStart);

        const QJsonObject logging = root["logging"].toObject();
        loaded.logging.level =
            logging["level"].toString(QString::fromStdString(loaded.logging.level)).toStdString();
        loaded.logging.fileLogging = logging["file_logging"].toBool(loaded.logging.fileLogging);
        loaded.logging.logFilePath = logging["log_file_path"].toString().toStdString();
        loaded.logging.maxLogFileSizeMb =
            logging["max_log_file_size_mb"].toInt(loaded.logging.maxLogFileSizeMb);
        loaded.logging.rotateLogs = logging["rotate_logs"].toBool(loaded.logging.rotateLogs);

        const QJsonObject filters = root["filters"].toObject();
        loaded.deviceFilter = filters["device_filter"].toString().toStdString();

        const QJsonObject deviceRules = root["device_rules"].toObject();
        loaded.deviceRules.blacklistEnabled =
            deviceRules["blacklist_enabled"].toBool(loaded.deviceRules.blacklistEnabled);
        loaded.deviceRules.whitelistEnabled =
            deviceRules["whitelist_enabled"].toBool(loaded.deviceRules.whitelistEnabled);
        loaded.deviceRules.blacklist = rulesFromJson(deviceRules["blacklisted_devices"]);
        loaded.deviceRules.whitelist = rulesFromJson(deviceRules["whitelisted_devices"]);

        config = std::move(loaded);
    }

    QJsonObject toJson() const {
        QJsonObject monitoring;
        monitoring["poll_interval_ms"] = config.monitoring.pollIntervalMs;
        monitoring["auto_start"] = config.monitoring.autoStart;

        QJsonObject logging;
        logging["level"] = QString::fromStdString(config.logging.level);
        logging["file_logging"] = config.logging.fileLogging;
        logging["log_file_path"] = QString::fromStdString(config.logging.logFilePath);
        logging["max_log_file_size_mb"] = config.logging.maxLogFileSizeMb;
        logging["rotate_logs"] = config.logging.rotateLogs;

        QJsonObject filters;
        filters["device_filter"] = QString::fromStdString(config.deviceFilter);

        QJsonObject deviceRules;
        deviceRules["blacklist_enabled"] = config.deviceRules.blacklistEnabled;
        deviceRules["whitelist_enabled"] = config.deviceRules.whitelistEnabled;
        deviceRules["blacklisted_devices"] = rulesToJson(config.deviceRules.blacklist);
        deviceRules["whitelisted_devices"] = rulesToJson(config.deviceRules.whitelist);

        QJsonObject root;
        root["monitoring"] = monitoring;
        root["logging"] = logging;
        root["filters"] = filters;
        root["device_rules"] = deviceRules;
        return root;
    }
};

ConfigManager::ConfigManager(QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
}

ConfigManager::~ConfigManager() = default;

const Config& ConfigManager::config() const {
    return d->config;
}

std::vector<std::string> ConfigManager::keys() {
    return {
        KEY_POLL_INTERVAL, KEY_AUTO_START,
        KEY_LOG_LEVEL, KEY_FILE_LOGGING, KEY_LOG_FILE_PATH, KEY_MAX_LOG_SIZE, KEY_ROTATE_LOGS,
        KEY_DEVICE_FILTER,
        KEY_BLACKLIST_ENABLED, KEY_WHITELIST_ENABLED
    };
}

ConfigValue ConfigManager::getValue(const std::string& key) const {
    const Config& c = d->config;
    if (key == KEY_POLL_INTERVAL) return c.monitoring.pollIntervalMs;
    if (key == KEY_AUTO_START) return c.monitoring.autoStart;
    if (key == KEY_LOG_LEVEL) return c.logging.level;
    if (key == KEY_FILE_LOGGING) return c.logging.fileLogging;
    if (key == KEY_LOG_FILE_PATH) return c.logging.logFilePath;
    if (key == KEY_MAX_LOG_SIZE) return c.logging.maxLogFileSizeMb;
    if (key == KEY_ROTATE_LOGS) return c.logging.rotateLogs;
    if (key == KEY_DEVICE_FILTER) return c.deviceFilter;
    if (key == KEY_BLACKLIST_ENABLED) return c.deviceRules.blacklistEnabled;
    if (key == KEY_WHITELIST_ENABLED) return c.deviceRules.whitelistEnabled;
    configError("Unknown configuration key: " + key);
}

void ConfigManager::setValue(const std::string& key, const std::string& value) {
    LOG_DEBUG("Setting config value: " + key + " = " + value);

    Config& c = d->config;
    if (key == KEY_POLL_INTERVAL) {
        int interval = parseInt(key, value);
        if (interval < MIN_POLL_INTERVAL) {
            configError("Poll interval must be at least " + std::to_string(MIN_POLL_INTERVAL) + "ms");
        }
        c.monitoring.pollIntervalMs = interval;
    } else if (key == KEY_AUTO_START) {
        c.monitoring.autoStart = parseBool(key, value);
    } else if (key == KEY_LOG_LEVEL) {
        if (!parseLogLevel(value)) {
            configError("Invalid log level. Must be: error, warn, info, debug, or trace");
        }
        c.logging.level = value;
    } else if (key == KEY_FILE_LOGGING) {
        c.logging.fileLogging = parseBool(key, value);
    } else if (key == KEY_LOG_FILE_PATH) {
        c.logging.logFilePath = value;
    } else if (key == KEY_MAX_LOG_SIZE) {
        int size = parseInt(key, value);
        if (size <= 0) {
            configError("max_log_file_size_mb must be positive");
        }
        c.logging.maxLogFileSizeMb = size;
    } else if (key == KEY_ROTATE_LOGS) {
        c.logging.rotateLogs = parseBool(key, value);
    } else if (key == KEY_DEVICE_FILTER) {
        c.deviceFilter = value;
    } else if (key == KEY_BLACKLIST_ENABLED) {
        c.deviceRules.blacklistEnabled = parseBool(key, value);
    } else if (key == KEY_WHITELIST_ENABLED) {
        c.deviceRules.whitelistEnabled = parseBool(key, value);
    } else {
        configError("Unknown configuration key: " + key);
    }

    LOG_INFO("Configuration updated: " + key + " = " + value);
    emit configChanged(key);
}

void ConfigManager::validate() const {
    const Config& c = d->config;
    if (c.monitoring.pollIntervalMs < MIN_POLL_INTERVAL) {
        configError("Poll interval must be at least " + std::to_string(MIN_POLL_INTERVAL) + "ms");
    }
    if (!parseLogLevel(c.logging.level)) {
        configError("Invalid log level: " + c.logging.level);
    }
    if (c.logging.maxLogFileSizeMb <= 0) {
        configError("max_log_file_size_mb must be positive");
    }
    if (c.logging.maxLogFileSizeMb > 100) {
        LOG_WARNING("Large log file size configured: " +
                    std::to_string(c.logging.maxLogFileSizeMb) + "MB");
    }
    LOG_DEBUG("Configuration validation passed");
}

void ConfigManager::addRule(RuleList list, DeviceRule rule) {
    if (!d->listEnabled(list)) {
        configError(std::string("The ") + listName(list) + " is not enabled");
    }

    auto& rules = d->rules(list);
    bool duplicate = std::any_of(rules.begin(), rules.end(),
                                 [&rule](const DeviceRule& r) { return r.sameRule(rule); });
    if (duplicate) {
        configError(std::string("Device rule is already in the ") + listName(list));
    }

    rules.push_back(std::move(rule));
    LOG_INFO(std::string("Device rule added to ") + listName(list));
    emit configChanged(list == RuleList::Blacklist ? "device_rules.blacklisted_devices"
                                                   : "device_rules.whitelisted_devices");
}

void ConfigManager::removeRule(RuleList list, size_t index) {
    auto& rules = d->rules(list);
    if (index >= rules.size()) {
        configError(std::string("Invalid ") + listName(list) + " index: " + std::to_string(index));
    }

    rules.erase(rules.begin() + static_cast<std::ptrdiff_t>(index));
    LOG_INFO(std::string("Device rule removed from ") + listName(list));
    emit configChanged(list == RuleList::Blacklist ? "device_rules.blacklisted_devices"
                                                   : "device_rules.whitelisted_devices");
}

const std::vector<DeviceRule>& ConfigManager::rules(RuleList list) const {
    return list == RuleList::Blacklist ? d->config.deviceRules.blacklist
                                       : d->config.deviceRules.whitelist;
}

void ConfigManager::setListEnabled(RuleList list, bool enabled) {
    if (list == RuleList::Blacklist) {
        d->config.deviceRules.blacklistEnabled = enabled;
    } else {
        d->config.deviceRules.whitelistEnabled = enabled;
    }
    LOG_INFO(std::string(list == RuleList::Blacklist ? "Blacklist " : "Whitelist ") +
             (enabled ? "enabled" : "disabled"));
    emit configChanged(list == RuleList::Blacklist ? KEY_BLACKLIST_ENABLED : KEY_WHITELIST_ENABLED);
}

std::chrono::milliseconds ConfigManager::pollInterval() const {
    return std::chrono::milliseconds(d->config.monitoring.pollIntervalMs);
}

std::optional<std::string> ConfigManager::deviceFilter() const {
    if (d->config.deviceFilter.empty()) {
        return std::nullopt;
    }
    return d->config.deviceFilter;
}

SecurityPolicy ConfigManager::securityPolicy() const {
    return d->config.deviceRules;
}

void ConfigManager::applyLoggingSettings() const {
    const LoggingConfig& logging = d->config.logging;
    Logger& logger = Logger::instance();

    if (auto level = parseLogLevel(logging.level)) {
        logger.setLogLevel(*level);
    }
    logger.setMaxFileSize(static_cast<size_t>(logging.maxLogFileSizeMb) * 1024 * 1024);
    logger.setRotationEnabled(logging.rotateLogs);

    if (logging.fileLogging) {
        logger.setLogFile(logging.logFilePath.empty() ? std::string("ironwatch.log")
                                                      : logging.logFilePath);
        logger.setLogDestination(LogDestination::All);
    }
}

bool ConfigManager::loadFromFile(const std::string& filename) {
    QFile file(QString::fromStdString(filename));
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_ERROR("Failed to read config file: " + filename);
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (doc.isNull() || !doc.isObject()) {
        LOG_ERROR("Failed to parse config file " + filename + ": " +
                  parseError.errorString().toStdString());
        return false;
    }

    Config previous = d->config;
    try {
        d->fromJson(doc.object());
        validate();
    } catch (const UsbError& e) {
        d->config = std::move(previous);
        LOG_ERROR("Invalid config file " + filename + ": " + e.what());
        return false;
    }

    d->path = filename;
    LOG_INFO("Configuration loaded from " + filename);
    emit configChanged("");
    return true;
}

bool ConfigManager::saveToFile(const std::string& filename) const {
    QFileInfo info(QString::fromStdString(filename));
    QDir dir = info.absoluteDir();
    if (!dir.exists() && !dir.mkpath(".")) {
        LOG_ERROR("Failed to create config directory: " + dir.absolutePath().toStdString());
        return false;
    }

    QFile file(QString::fromStdString(filename));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR("Failed to write config file: " + filename);
        return false;
    }

    QJsonDocument doc(d->toJson());
    if (file.write(doc.toJson()) < 0) {
        LOG_ERROR("Failed to write config file: " + filename);
        return false;
    }

    LOG_INFO("Configuration saved to " + filename);
    return true;
}

std::string ConfigManager::configPath() const {
    return d->path;
}

std::optional<std::string> ConfigManager::findConfigFile(const std::optional<std::string>& explicitPath) {
    if (explicitPath && !explicitPath->empty()) {
        return explicitPath;
    }

    const QStringList candidates = {
        QStringLiteral("ironwatch.json"),
        QDir::homePath() + QStringLiteral("/.config/ironwatch/config.json"),
        QStringLiteral("/etc/ironwatch/config.json")
    };
    for (const QString& candidate : candidates) {
        if (QFileInfo::exists(candidate)) {
            return candidate.toStdString();
        }
    }
    return std::nullopt;
}

void ConfigManager::resetToDefaults() {
    LOG_WARNING("Resetting configuration to defaults");
    d->config = Config{};
    emit configChanged("");
}

}
