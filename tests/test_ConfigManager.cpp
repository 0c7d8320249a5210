// tests/test_ConfigManager.cpp
#include <gtest/gtest.h>
#include "utils/ConfigManager.hpp"
#include <ironwatch/Error.hpp>
#include <QFile>
#include <QTemporaryDir>
#include <functional>

namespace ironwatch {
namespace testing {

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
    }

    std::string path(const char* name) const {
        return dir.filePath(name).toStdString();
    }

    std::string writeFile(const char* name, const QByteArray& contents) const {
        QFile file(dir.filePath(name));
        EXPECT_TRUE(file.open(QIODevice::WriteOnly));
        file.write(contents);
        return path(name);
    }

    static void expectConfigError(const std::function<void()>& action) {
        try {
            action();
            FAIL() << "expected a configuration error";
        } catch (const UsbError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::ConfigurationError);
        }
    }

    QTemporaryDir dir;
    ConfigManager config;
};

TEST_F(ConfigManagerTest, DefaultsMatchDocumentedValues) {
    EXPECT_EQ(config.pollInterval(), std::chrono::milliseconds(500));
    EXPECT_FALSE(config.deviceFilter().has_value());
    EXPECT_EQ(configValueToString(config.getValue("logging.level")), "info");
    EXPECT_EQ(configValueToString(config.getValue("logging.max_log_file_size_mb")), "10");

    SecurityPolicy policy = config.securityPolicy();
    EXPECT_TRUE(policy.blacklistEnabled);
    EXPECT_FALSE(policy.whitelistEnabled);
    EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigManagerTest, SetValueParsesByKeyType) {
    config.setValue("monitoring.poll_interval_ms", "250");
    config.setValue("monitoring.auto_start", "true");
    config.setValue("filters.device_filter", "Logitech");

    EXPECT_EQ(config.pollInterval(), std::chrono::milliseconds(250));
    EXPECT_EQ(std::get<bool>(config.getValue("monitoring.auto_start")), true);
    EXPECT_EQ(config.deviceFilter().value_or(""), "Logitech");
}

TEST_F(ConfigManagerTest, InvalidValuesAreRejected) {
    expectConfigError([this] { config.setValue("monitoring.poll_interval_ms", "50"); });
    expectConfigError([this] { config.setValue("monitoring.poll_interval_ms", "fast"); });
    expectConfigError([this] { config.setValue("monitoring.auto_start", "maybe"); });
    expectConfigError([this] { config.setValue("logging.level", "verbose"); });
    expectConfigError([this] { config.setValue("no.such.key", "1"); });
    expectConfigError([this] { config.getValue("no.such.key"); });

    EXPECT_EQ(config.pollInterval(), std::chrono::milliseconds(500));
}

TEST_F(ConfigManagerTest, ChangesAreSignalled) {
    std::vector<std::string> keys;
    QObject::connect(&config, &ConfigManager::configChanged,
        [&keys](const std::string& key) { keys.push_back(key); });

    config.setValue("logging.level", "debug");
    ASSERT_EQ(keys.size(), 1u);
    EXPECT_EQ(keys[0], "logging.level");
}

TEST_F(ConfigManagerTest, RulesRequireEnabledListAndRejectDuplicates) {
    DeviceRule rule;
    rule.vendorId = 0x1234;
    rule.reason = "test";

    config.addRule(RuleList::Blacklist, rule);
    EXPECT_EQ(config.rules(RuleList::Blacklist).size(), 1u);
    expectConfigError([&] { config.addRule(RuleList::Blacklist, rule); });

    // Whitelist is disabled by default.
    expectConfigError([&] { config.addRule(RuleList::Whitelist, rule); });
    config.setListEnabled(RuleList::Whitelist, true);
    EXPECT_NO_THROW(config.addRule(RuleList::Whitelist, rule));

    expectConfigError([this] { config.removeRule(RuleList::Blacklist, 3); });
    config.removeRule(RuleList::Blacklist, 0);
    EXPECT_TRUE(config.rules(RuleList::Blacklist).empty());
}

TEST_F(ConfigManagerTest, SaveAndLoadPreserveSettingsAndRules) {
    DeviceRule rule;
    rule.vendorId = 0x046d;
    rule.productName = "Receiver";
    rule.reason = "no wireless dongles";
    config.addRule(RuleList::Blacklist, rule);
    config.setValue("monitoring.poll_interval_ms", "750");

    std::string file = path("config.json");
    ASSERT_TRUE(config.saveToFile(file));

    ConfigManager loaded;
    ASSERT_TRUE(loaded.loadFromFile(file));
    EXPECT_EQ(loaded.configPath(), file);
    EXPECT_EQ(loaded.pollInterval(), std::chrono::milliseconds(750));

    const auto& rules = loaded.rules(RuleList::Blacklist);
    ASSERT_EQ(rules.size(), 1u);
    EXPECT_TRUE(rules[0].sameRule(rule));
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(rules[0].createdAt.time_since_epoch()),
              std::chrono::duration_cast<std::chrono::seconds>(rule.createdAt.time_since_epoch()));
}

TEST_F(ConfigManagerTest, RuleIdsAcceptHexStringsAndNumbers) {
    std::string file = writeFile("rules.json", R"({
        "device_rules": {
            "blacklist_enabled": true,
            "blacklisted_devices": [
                {"vendor_id": "0x1234", "product_id": 1, "reason": "test"},
                {"vendor_id": "046D", "manufacturer": "Logitech", "reason": "vendor", "enabled": false}
            ]
        }
    })");

    ASSERT_TRUE(config.loadFromFile(file));
    const auto& rules = config.rules(RuleList::Blacklist);
    ASSERT_EQ(rules.size(), 2u);
    EXPECT_EQ(rules[0].vendorId.value_or(0), 0x1234);
    EXPECT_EQ(rules[0].productId.value_or(0), 0x0001);
    EXPECT_TRUE(rules[0].enabled);
    EXPECT_EQ(rules[1].vendorId.value_or(0), 0x046d);
    EXPECT_FALSE(rules[1].enabled);

    // Unspecified sections keep their defaults.
    EXPECT_EQ(config.pollInterval(), std::chrono::milliseconds(500));
}

TEST_F(ConfigManagerTest, InvalidFilesLeaveConfigurationUntouched) {
    config.setValue("monitoring.poll_interval_ms", "300");

    EXPECT_FALSE(config.loadFromFile(path("missing.json")));
    EXPECT_FALSE(config.loadFromFile(writeFile("broken.json", "{ not json")));
    EXPECT_FALSE(config.loadFromFile(writeFile("slow.json", R"({"monitoring": {"poll_interval_ms": 20}})")));
    EXPECT_FALSE(config.loadFromFile(writeFile("level.json", R"({"logging": {"level": "loud"}})")));
    EXPECT_FALSE(config.loadFromFile(writeFile("badid.json",
        R"({"device_rules": {"blacklisted_devices": [{"vendor_id": "zz"}]}})")));

    EXPECT_EQ(config.pollInterval(), std::chrono::milliseconds(300));
}

TEST_F(ConfigManagerTest, ResetRestoresDefaults) {
    config.setValue("monitoring.poll_interval_ms", "900");
    config.setListEnabled(RuleList::Blacklist, false);

    config.resetToDefaults();

    EXPECT_EQ(config.pollInterval(), std::chrono::milliseconds(500));
    EXPECT_TRUE(config.securityPolicy().blacklistEnabled);
}

TEST_F(ConfigManagerTest, ExplicitConfigPathWins) {
    std::string file = path("explicit.json");
    EXPECT_EQ(ConfigManager::findConfigFile(file).value_or(""), file);
}

} // namespace testing
} // namespace ironwatch
