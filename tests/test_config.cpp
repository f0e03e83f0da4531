#include <gtest/gtest.h>
#include "../platform/desktop/TomlConfig.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <vector>

using namespace fleetalert;

TEST(TomlConfigTest, DefaultsWithoutInput) {
    EngineConfig config = TomlConfig::loadFromString("");

    EXPECT_FALSE(config.verbose);
    EXPECT_EQ(config.overspeed.minimalDurationMillis, 0);
    EXPECT_EQ(config.overspeed.radarCooldownMillis, 60000);
    EXPECT_EQ(config.notification.timeThresholdMillis, 15 * 60 * 1000);
    EXPECT_EQ(config.defaultChannels, std::vector<std::string>{"push"});
    EXPECT_TRUE(config.dailySummary.enabled);
    EXPECT_EQ(config.dedupIntervalMinutes, 60);
    EXPECT_FALSE(config.forwarder.enabled);
    EXPECT_EQ(config.forwarder.port, 8883);
}

TEST(TomlConfigTest, ParsesEverySection) {
    const std::string text = R"(
# fleetalert service
[general]
verbose = true
server_timezone = "America/Sao_Paulo"

[overspeed]
minimal_duration_seconds = 30
threshold_multiplier = 1.1
prefer_lowest = true
radar_cooldown_seconds = 0

[radar]
enabled = true
file = "/var/lib/fleetalert/radars.geojson"   # catalog
overrides_file = "/var/lib/fleetalert/overrides.json"
default_radius_meters = 45.5
min_speed_kph = 20
max_speed_kph = 150
reload_interval_seconds = 120
grid_cell_degrees = 0.05

[notification]
time_threshold_seconds = 600
blocked_users = 3, 7 ,11
default_channels = "push,mail"

[daily_summary]
enabled = false
fallback_timezone = "Europe/Lisbon"
push_channels = "firebase"
webhook_url = "https://hooks.example.com/daily#summary"
webhook_token = "abc"
webhook_timeout_seconds = 5

[dedup]
interval_minutes = 15

[forwarder]
enabled = true
host = "broker.example.com"
port = 1883
client_id = "fleetalert-prod"
username = "svc"
password = "pw"
use_tls = false
root_ca_path = "/etc/ssl/ca.pem"
verify_server_cert = false
topic_prefix = "fleet/events"

[push]
topic_prefix = "fleet/users"
)";

    EngineConfig config = TomlConfig::loadFromString(text);

    EXPECT_TRUE(config.verbose);
    EXPECT_EQ(config.serverTimezone, "America/Sao_Paulo");
    EXPECT_EQ(config.dailySummary.serverTimezone, "America/Sao_Paulo");

    EXPECT_EQ(config.overspeed.minimalDurationMillis, 30000);
    EXPECT_DOUBLE_EQ(config.overspeed.thresholdMultiplier, 1.1);
    EXPECT_TRUE(config.overspeed.preferLowest);
    EXPECT_EQ(config.overspeed.radarCooldownMillis, 0);

    EXPECT_TRUE(config.radar.enabled);
    EXPECT_EQ(config.radar.file, "/var/lib/fleetalert/radars.geojson");
    EXPECT_EQ(config.radar.overridesFile, "/var/lib/fleetalert/overrides.json");
    EXPECT_DOUBLE_EQ(config.radar.defaultRadiusMeters, 45.5);
    EXPECT_DOUBLE_EQ(config.radar.minSpeedKph, 20.0);
    EXPECT_DOUBLE_EQ(config.radar.maxSpeedKph, 150.0);
    EXPECT_EQ(config.radar.reloadIntervalMillis, 120000);
    EXPECT_DOUBLE_EQ(config.radar.cellDegrees, 0.05);

    EXPECT_EQ(config.notification.timeThresholdMillis, 600000);
    EXPECT_EQ(config.notification.blockedUsers, (std::set<int64_t>{3, 7, 11}));
    EXPECT_EQ(config.defaultChannels, (std::vector<std::string>{"push", "mail"}));

    EXPECT_FALSE(config.dailySummary.enabled);
    EXPECT_EQ(config.dailySummary.fallbackTimezone, "Europe/Lisbon");
    EXPECT_EQ(config.dailySummary.pushChannels, std::vector<std::string>{"firebase"});
    EXPECT_EQ(config.dailySummary.webhookUrl, "https://hooks.example.com/daily#summary");
    EXPECT_EQ(config.dailySummary.webhookToken, "abc");
    EXPECT_EQ(config.webhookTimeoutSeconds, 5);

    EXPECT_EQ(config.dedupIntervalMinutes, 15);

    EXPECT_TRUE(config.forwarder.enabled);
    EXPECT_EQ(config.forwarder.host, "broker.example.com");
    EXPECT_EQ(config.forwarder.port, 1883);
    EXPECT_EQ(config.forwarder.clientId, "fleetalert-prod");
    EXPECT_EQ(config.forwarder.username, "svc");
    EXPECT_EQ(config.forwarder.password, "pw");
    EXPECT_FALSE(config.forwarder.useTls);
    EXPECT_EQ(config.forwarder.caPath, "/etc/ssl/ca.pem");
    EXPECT_FALSE(config.forwarder.verifyServerCert);
    EXPECT_EQ(config.forwarder.topicPrefix, "fleet/events");
    EXPECT_EQ(config.pushTopicPrefix, "fleet/users");
}

TEST(TomlConfigTest, BadValuesKeepDefaults) {
    const std::string text = R"(
[overspeed]
minimal_duration_seconds = soon
threshold_multiplier = -2
radar_cooldown_seconds = -5

[radar]
enabled = maybe
default_radius_meters = -1
grid_cell_degrees = 0

[forwarder]
port = 70000

[dedup]
interval_minutes = 0
)";

    EngineConfig config = TomlConfig::loadFromString(text);
    EXPECT_EQ(config.overspeed.minimalDurationMillis, 0);
    EXPECT_DOUBLE_EQ(config.overspeed.thresholdMultiplier, 1.0);
    EXPECT_EQ(config.overspeed.radarCooldownMillis, 60000);
    EXPECT_FALSE(config.radar.enabled);
    EXPECT_DOUBLE_EQ(config.radar.defaultRadiusMeters, 30.0);
    EXPECT_DOUBLE_EQ(config.radar.cellDegrees, 0.02);
    EXPECT_EQ(config.forwarder.port, 8883);
    EXPECT_EQ(config.dedupIntervalMinutes, 60);
}

TEST(TomlConfigTest, UnknownKeysAndMalformedLinesAreSkipped) {
    const std::string text = R"(
[general]
colour = "blue"
this line has no equals sign
[broken
[mystery]
verbose = true
[overspeed]
prefer_lowest = 1
)";

    EngineConfig config = TomlConfig::loadFromString(text);
    EXPECT_FALSE(config.verbose);
    EXPECT_TRUE(config.overspeed.preferLowest);
}

TEST(TomlConfigTest, EnvironmentOverridesSecrets) {
    EngineConfig config = TomlConfig::loadFromString(R"(
[forwarder]
password = "from-file"
[daily_summary]
webhook_token = "from-file"
)");

    setenv("FLEETALERT_MQTT_PASSWORD", "from-env", 1);
    setenv("FLEETALERT_WEBHOOK_URL", "https://env.example.com/hook", 1);
    unsetenv("FLEETALERT_WEBHOOK_TOKEN");

    TomlConfig::applyEnvironment(config);
    EXPECT_EQ(config.forwarder.password, "from-env");
    EXPECT_EQ(config.dailySummary.webhookUrl, "https://env.example.com/hook");
    EXPECT_EQ(config.dailySummary.webhookToken, "from-file");

    unsetenv("FLEETALERT_MQTT_PASSWORD");
    unsetenv("FLEETALERT_WEBHOOK_URL");
}

TEST(TomlConfigTest, BrokerCredentialsPassThroughUnchanged) {
    EngineConfig config = TomlConfig::loadFromString(R"(
[forwarder]
host = "broker.example.com"
port = 8884
client_id = "fleetalert-edge"
username = "svc"
password = "s3cret"
root_ca_path = "/etc/ssl/ca.pem"
)");

    MqttConnectOptions options = config.forwarder.connectOptions();
    EXPECT_EQ(options.host, "broker.example.com");
    EXPECT_EQ(options.port, 8884);
    EXPECT_EQ(options.clientId, "fleetalert-edge");
    EXPECT_EQ(options.username, "svc");
    EXPECT_EQ(options.password, "s3cret");
    EXPECT_TRUE(options.tls.enabled);
    EXPECT_TRUE(options.tls.verifyServer);
    EXPECT_EQ(options.tls.caPath, "/etc/ssl/ca.pem");
}

TEST(TomlConfigTest, MissingFileFallsBackToDefaults) {
    EngineConfig config = TomlConfig::loadFromFile("/nonexistent/fleetalert.toml");
    EXPECT_EQ(config.dedupIntervalMinutes, 60);
}

TEST(TomlConfigTest, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() / "fleetalert_config_test.toml";
    {
        std::ofstream out(path);
        out << "[notification]\ntime_threshold_seconds = 0\n";
    }
    EngineConfig config = TomlConfig::loadFromFile(path.string());
    EXPECT_EQ(config.notification.timeThresholdMillis, 0);
    std::filesystem::remove(path);
}
