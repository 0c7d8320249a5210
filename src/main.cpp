#include "core/DeviceTracker.hpp"
#include "core/LibusbBusReader.hpp"
#include "core/Logger.hpp"
#include "service/CommunicationHub.hpp"
#include "service/MonitoringService.hpp"
#include "service/NotificationSink.hpp"
#include "utils/ConfigManager.hpp"
#include "utils/Overloaded.hpp"
#include "utils/StringUtils.hpp"
#include <ironwatch/Error.hpp>
#include <QCoreApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QDir>
#include <QTimer>
#include <atomic>
#include <csignal>
#include <iomanip>
#include <iostream>

using namespace ironwatch;

namespace {

std::atomic<bool> interrupted{false};

void handleSignal(int) {
    interrupted = true;
}

void setupCommandLineParser(QCommandLineParser& parser) {
    parser.setApplicationDescription("IronWatch USB device monitor");
    parser.addHelpOption();
    parser.addVersionOption();

    parser.addPositionalArgument("command",
        "list | monitor | config show | config get <key> | config set <key> <value> | config reset");

    parser.addOption(QCommandLineOption(
        QStringList() << "c" << "config",
        "Specify configuration file path.",
        "config"));
    parser.addOption(QCommandLineOption(
        QStringList() << "l" << "log-file",
        "Specify log file path.",
        "log-file"));
    parser.addOption(QCommandLineOption(
        QStringList() << "v" << "verbosity",
        "Set log level (0-4: debug, info, warning, error, critical).",
        "level"));
    parser.addOption(QCommandLineOption(
        QStringList() << "f" << "filter",
        "Only show devices whose product or manufacturer contains this text.",
        "pattern"));
    parser.addOption(QCommandLineOption(
        QStringList() << "i" << "interval",
        "Polling interval in milliseconds.",
        "ms"));
    parser.addOption(QCommandLineOption(
        QStringList() << "r" << "retries",
        "USB access retries before monitoring in degraded mode.",
        "count",
        "3"));
}

void initializeLogger(const QCommandLineParser& parser) {
    auto& logger = Logger::instance();

    if (parser.isSet("log-file")) {
        logger.setLogFile(parser.value("log-file").toStdString());
        logger.setLogDestination(LogDestination::All);
    }

    if (parser.isSet("verbosity")) {
        int level = parser.value("verbosity").toInt();
        switch (level) {
            case 0: logger.setLogLevel(LogLevel::Debug); break;
            case 1: logger.setLogLevel(LogLevel::Info); break;
            case 2: logger.setLogLevel(LogLevel::Warning); break;
            case 3: logger.setLogLevel(LogLevel::Error); break;
            case 4: logger.setLogLevel(LogLevel::Critical); break;
            default: logger.setLogLevel(LogLevel::Info); break;
        }
    }
}

bool loadConfiguration(ConfigManager& config, const QCommandLineParser& parser) {
    std::optional<std::string> explicitPath;
    if (parser.isSet("config")) {
        explicitPath = parser.value("config").toStdString();
    }

    auto path = ConfigManager::findConfigFile(explicitPath);
    if (!path) {
        LOG_INFO("No configuration file found, using defaults");
        return true;
    }
    if (!config.loadFromFile(*path)) {
        LOG_WARNING("Failed to load configuration from " + *path);
        return false;
    }
    return true;
}

std::string writableConfigPath(const ConfigManager& config, const QCommandLineParser& parser) {
    if (parser.isSet("config")) {
        return parser.value("config").toStdString();
    }
    if (!config.configPath().empty()) {
        return config.configPath();
    }
    return (QDir::homePath() + "/.config/ironwatch/config.json").toStdString();
}

MonitorSettings settingsFrom(const ConfigManager& config, const QCommandLineParser& parser) {
    MonitorSettings settings;
    settings.pollInterval = config.pollInterval();
    settings.deviceFilter = config.deviceFilter();
    settings.securityPolicy = config.securityPolicy();

    if (parser.isSet("filter")) {
        settings.deviceFilter = parser.value("filter").toStdString();
    }
    if (parser.isSet("interval")) {
        bool ok = false;
        int ms = parser.value("interval").toInt(&ok);
        if (!ok || ms < MIN_POLL_INTERVAL) {
            throw UsbError(ErrorKind::ConfigurationError,
                           "Polling interval must be at least " +
                           std::to_string(MIN_POLL_INTERVAL) + " ms");
        }
        settings.pollInterval = std::chrono::milliseconds(ms);
    }
    return settings;
}

void printDevice(const DeviceSnapshot& device) {
    std::cout << "Bus " << std::setw(3) << std::setfill('0') << int(device.busNumber)
              << " Device " << std::setw(3) << int(device.deviceAddress) << std::setfill(' ')
              << ": ID " << toHex(device.vendorId) << ":" << toHex(device.productId)
              << " [" << deviceClassName(device.deviceClass) << "] "
              << device.displayName();
    if (device.connectionStatus != ConnectionStatus::Connected) {
        std::cout << " (" << connectionStatusName(device.connectionStatus) << ")";
    }
    std::cout << std::endl;
}

void printError(const UsbError& error) {
    auto [message, suggestion] = userFriendlyMessage(error);
    std::cerr << "Error: " << message << std::endl;
    if (suggestion) {
        std::cerr << "Hint: " << *suggestion << std::endl;
    }
}

int runList(const ConfigManager& config, const QCommandLineParser& parser) {
    MonitorSettings settings = settingsFrom(config, parser);
    try {
        DeviceTracker tracker(LibusbBusReader::factory()(), settings.securityPolicy);
        tracker.setFilter(settings.deviceFilter);

        auto devices = tracker.getConnectedDevices();
        for (const auto& device : devices) {
            printDevice(device);
        }
        std::cout << devices.size() << " device(s)" << std::endl;
        return 0;
    } catch (const UsbError& e) {
        LOG_ERROR(std::string("Device listing failed: ") + e.what());
        printError(e);
        return 1;
    }
}

void printEvent(const MonitorEvent& event) {
    std::visit(overloaded{
        [](const DevicesLoaded& e) {
            std::cout << "Monitoring " << e.devices.size() << " device(s)" << std::endl;
            for (const auto& device : e.devices) {
                printDevice(device);
            }
        },
        [](const DevicesUpdated&) {},
        [](const DeviceChanged& e) {
            std::cout << "[" << changeTypeName(e.change.type) << "] ";
            printDevice(e.change.device);
        },
        [](const DevicesChanged& e) {
            for (const auto& change : e.changes) {
                std::cout << "[" << changeTypeName(change.type) << "] ";
                printDevice(change.device);
            }
        },
        [](const MonitoringStarting&) {},
        [](const MonitoringStarted&) { std::cout << "Monitoring started" << std::endl; },
        [](const MonitoringStopping&) {},
        [](const MonitoringStopped&) { std::cout << "Monitoring stopped" << std::endl; },
        [](const MonitoringError& e) { std::cerr << "Error: " << e.message << std::endl; },
        [](const PermissionError& e) { std::cerr << "Permission error: " << e.message << std::endl; },
        [](const UsbUnavailable& e) { std::cerr << "USB unavailable: " << e.message << std::endl; },
        [](const ReportReady& e) {
            const DeviceAnalytics& a = e.report.analytics;
            std::cout << "Devices seen: " << a.totalDevicesSeen
                      << ", unique: " << a.uniqueDevices
                      << ", blocked: " << a.blockedDevices
                      << ", security events: " << a.securityViolations << std::endl;
        }
    }, event);
}

int runMonitor(QCoreApplication& app, const ConfigManager& config, const QCommandLineParser& parser) {
    MonitorSettings settings = settingsFrom(config, parser);
    BusReaderFactory factory = LibusbBusReader::factory();

    int retries = parser.value("retries").toInt();
    MonitoringService::waitForUsbAccess(factory, retries);

    CommunicationHub hub;
    MonitoringService service(hub.takeEndpoint(), factory, settings,
                              std::make_shared<LogNotificationSink>());
    service.start();
    hub.startMonitoring();

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    QTimer pollTimer;
    QObject::connect(&pollTimer, &QTimer::timeout, [&]() {
        while (auto event = hub.tryRecvEvent()) {
            printEvent(*event);
        }

        if (interrupted.exchange(false)) {
            LOG_INFO("Interrupt received, shutting down");
            hub.requestReport();
            hub.shutdown();
        }

        if (service.state() == MonitoringService::State::ShuttingDown) {
            pollTimer.stop();
            app.quit();
        }
    });
    pollTimer.start(100);

    int rc = app.exec();
    service.wait();

    while (auto event = hub.tryRecvEvent()) {
        printEvent(*event);
    }
    return rc;
}

int runConfig(ConfigManager& config, const QCommandLineParser& parser, const QStringList& args) {
    const QString action = args.value(1, "show");

    try {
        if (action == "show") {
            std::cout << "Configuration file: "
                      << (config.configPath().empty() ? std::string("(defaults)") : config.configPath())
                      << std::endl;
            for (const auto& key : ConfigManager::keys()) {
                std::cout << key << " = " << configValueToString(config.getValue(key)) << std::endl;
            }
            std::cout << "blacklist rules: " << config.rules(RuleList::Blacklist).size() << std::endl;
            std::cout << "whitelist rules: " << config.rules(RuleList::Whitelist).size() << std::endl;
            return 0;
        }
        if (action == "get" && args.size() == 3) {
            std::cout << configValueToString(config.getValue(args[2].toStdString())) << std::endl;
            return 0;
        }
        if (action == "set" && args.size() == 4) {
            config.setValue(args[2].toStdString(), args[3].toStdString());
            return config.saveToFile(writableConfigPath(config, parser)) ? 0 : 1;
        }
        if (action == "reset") {
            config.resetToDefaults();
            return config.saveToFile(writableConfigPath(config, parser)) ? 0 : 1;
        }
    } catch (const UsbError& e) {
        printError(e);
        return 1;
    }

    std::cerr << "Usage: ironwatch config [show | get <key> | set <key> <value> | reset]" << std::endl;
    return 2;
}

} // namespace

int main(int argc, char *argv[]) {
    try {
        QCoreApplication app(argc, argv);
        app.setApplicationName("ironwatch");
        app.setApplicationVersion("0.1.0");

        QCommandLineParser parser;
        setupCommandLineParser(parser);
        parser.process(app);

        initializeLogger(parser);

        ConfigManager configManager;
        if (!loadConfiguration(configManager, parser)) {
            return 1;
        }
        if (!parser.isSet("verbosity") && !parser.isSet("log-file")) {
            configManager.applyLoggingSettings();
        }

        const QStringList args = parser.positionalArguments();
        const QString command = args.value(0, "list");

        LOG_DEBUG("Running command " + command.toStdString());

        if (command == "list") {
            return runList(configManager, parser);
        }
        if (command == "monitor") {
            return runMonitor(app, configManager, parser);
        }
        if (command == "config") {
            return runConfig(configManager, parser, args);
        }

        std::cerr << "Unknown command: " << command.toStdString() << std::endl;
        parser.showHelp(2);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        LOG_CRITICAL("Fatal error: " + std::string(e.what()));
        return 1;
    }
}
