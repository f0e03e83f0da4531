/**
 * @file TomlConfig.hpp
 * @brief TOML configuration file parser for the fleetalert service
 *
 * Simple line-based reader for the flat subset of TOML the service uses:
 * [section] headers and key = value pairs with optional quotes and # comments.
 *
 * Supported Sections:
 * - [general]: verbosity and server time zone
 * - [overspeed]: overspeed debounce and radar cooldown
 * - [radar]: static radar catalog
 * - [notification]: staleness threshold, blocked users, default channels
 * - [daily_summary]: daily summary scheduler and webhook
 * - [dedup]: subscription deduplication interval
 * - [forwarder]: MQTT event forwarder broker settings
 * - [push]: MQTT push channel topics
 *
 * Secrets can be supplied through the environment instead of the file:
 * FLEETALERT_MQTT_PASSWORD, FLEETALERT_WEBHOOK_TOKEN, FLEETALERT_WEBHOOK_URL.
 */

#pragma once

#include "../../core/IMqttClient.hpp"
#include "../../core/Model.hpp"
#include "../../core/domain/DailySummaryTask.hpp"
#include "../../core/domain/NotificationManager.hpp"
#include "../../core/domain/OverspeedEvaluator.hpp"
#include "../../core/domain/StaticRadarIndex.hpp"
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <istream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace fleetalert {

/**
 * @brief Broker settings for the MQTT event forwarder and push channel
 */
struct ForwarderConfig {
    bool enabled = false;
    std::string host;
    int port = 8883;
    std::string clientId = "fleetalert";
    std::string username;
    std::string password;
    bool useTls = true;
    std::string caPath;
    bool verifyServerCert = true;
    std::string topicPrefix = "fleetalert/events";

    MqttConnectOptions connectOptions() const {
        MqttConnectOptions options;
        options.host = host;
        options.port = static_cast<std::uint16_t>(port);
        options.clientId = clientId;
        options.username = username;
        options.password = password;
        options.tls.enabled = useTls;
        options.tls.caPath = caPath;
        options.tls.verifyServer = verifyServerCert;
        return options;
    }
};

/**
 * @brief Complete service configuration
 */
struct EngineConfig {
    bool verbose = false;
    std::string serverTimezone;

    domain::OverspeedConfig overspeed;
    domain::StaticRadarConfig radar;
    domain::NotificationConfig notification;
    std::vector<std::string> defaultChannels = {"push"};

    domain::DailySummaryConfig dailySummary;
    int webhookTimeoutSeconds = 10;

    int dedupIntervalMinutes = 60;

    ForwarderConfig forwarder;
    std::string pushTopicPrefix = "fleetalert/users";
};

/**
 * @brief TOML configuration file parser
 *
 * Malformed values are reported with a [Config] warning and leave the default
 * in place; a bad value never aborts loading.
 */
class TomlConfig {
public:
    /**
     * @brief Load and parse a TOML configuration file, then apply env overrides
     * @param filename Path to TOML configuration file
     * @return Parsed configuration; defaults when the file cannot be opened
     */
    static EngineConfig loadFromFile(const std::string& filename) {
        EngineConfig config;
        std::ifstream file(filename);

        if (!file.is_open()) {
            std::cerr << "[Config] Could not open config file: " << filename << ", using defaults" << std::endl;
        } else {
            parse(file, config);
        }

        applyEnvironment(config);
        validatePaths(config);
        return config;
    }

    /// Parses TOML text without touching the environment
    static EngineConfig loadFromString(const std::string& text) {
        EngineConfig config;
        std::istringstream stream(text);
        parse(stream, config);
        return config;
    }

    /// Secrets from the environment take precedence over the file
    static void applyEnvironment(EngineConfig& config) {
        std::string password = safeGetEnv("FLEETALERT_MQTT_PASSWORD");
        std::string webhookToken = safeGetEnv("FLEETALERT_WEBHOOK_TOKEN");
        std::string webhookUrl = safeGetEnv("FLEETALERT_WEBHOOK_URL");

        if (!password.empty()) config.forwarder.password = password;
        if (!webhookToken.empty()) config.dailySummary.webhookToken = webhookToken;
        if (!webhookUrl.empty()) config.dailySummary.webhookUrl = webhookUrl;
    }

    static std::string safeGetEnv(const char* name) {
#ifdef _WIN32
        char* buffer = nullptr;
        size_t size = 0;
        if (_dupenv_s(&buffer, &size, name) == 0 && buffer != nullptr) {
            std::string result(buffer);
            free(buffer);
            return result;
        }
        return "";
#else
        const char* value = std::getenv(name);
        return value ? std::string(value) : "";
#endif
    }

private:
    static void parse(std::istream& input, EngineConfig& config) {
        std::string currentSection;
        std::string line;
        int lineNumber = 0;
        while (std::getline(input, line)) {
            ++lineNumber;
            stripComment(line);
            trim(line);

            if (line.empty()) {
                continue;
            }

            if (line[0] == '[') {
                if (line.back() == ']') {
                    currentSection = line.substr(1, line.length() - 2);
                    trim(currentSection);
                } else {
                    std::cerr << "[Config] Warning: malformed section header at line " << lineNumber << std::endl;
                }
                continue;
            }

            size_t equalPos = line.find('=');
            if (equalPos == std::string::npos) {
                std::cerr << "[Config] Warning: ignoring line " << lineNumber << ": " << line << std::endl;
                continue;
            }

            std::string key = line.substr(0, equalPos);
            std::string value = line.substr(equalPos + 1);
            trim(key);
            trim(value);
            unquote(value);

            if (!apply(config, currentSection, key, value)) {
                std::cerr << "[Config] Warning: unknown key " << currentSection << "." << key << std::endl;
            }
        }
    }

    /// @return false when the section/key pair is not recognized
    static bool apply(EngineConfig& config, const std::string& section,
                      const std::string& key, const std::string& value) {
        if (section == "general") {
            if (key == "verbose") {
                setBool(config.verbose, section, key, value);
            } else if (key == "server_timezone") {
                config.serverTimezone = value;
                config.dailySummary.serverTimezone = value;
            } else {
                return false;
            }
        } else if (section == "overspeed") {
            if (key == "minimal_duration_seconds") {
                setMillis(config.overspeed.minimalDurationMillis, 1000, section, key, value);
            } else if (key == "threshold_multiplier") {
                auto parsed = parseDouble(section, key, value);
                if (parsed && *parsed > 0.0) {
                    config.overspeed.thresholdMultiplier = *parsed;
                } else if (parsed) {
                    warnRange(section, key, value);
                }
            } else if (key == "prefer_lowest") {
                setBool(config.overspeed.preferLowest, section, key, value);
            } else if (key == "radar_cooldown_seconds") {
                setMillis(config.overspeed.radarCooldownMillis, 1000, section, key, value);
            } else {
                return false;
            }
        } else if (section == "radar") {
            if (key == "enabled") {
                setBool(config.radar.enabled, section, key, value);
            } else if (key == "file") {
                config.radar.file = value;
            } else if (key == "overrides_file") {
                config.radar.overridesFile = value;
            } else if (key == "default_radius_meters") {
                setNonNegative(config.radar.defaultRadiusMeters, section, key, value);
            } else if (key == "min_speed_kph") {
                setNonNegative(config.radar.minSpeedKph, section, key, value);
            } else if (key == "max_speed_kph") {
                setNonNegative(config.radar.maxSpeedKph, section, key, value);
            } else if (key == "reload_interval_seconds") {
                setMillis(config.radar.reloadIntervalMillis, 1000, section, key, value);
            } else if (key == "grid_cell_degrees") {
                auto parsed = parseDouble(section, key, value);
                if (parsed && *parsed > 0.0) {
                    config.radar.cellDegrees = *parsed;
                } else if (parsed) {
                    warnRange(section, key, value);
                }
            } else {
                return false;
            }
        } else if (section == "notification") {
            if (key == "time_threshold_seconds") {
                setMillis(config.notification.timeThresholdMillis, 1000, section, key, value);
            } else if (key == "blocked_users") {
                config.notification.blockedUsers.clear();
                for (const auto& part : splitCsv(value)) {
                    auto id = parseLong(section, key, part);
                    if (id) {
                        config.notification.blockedUsers.insert(*id);
                    }
                }
            } else if (key == "default_channels") {
                config.defaultChannels = splitCsv(value);
            } else {
                return false;
            }
        } else if (section == "daily_summary") {
            if (key == "enabled") {
                setBool(config.dailySummary.enabled, section, key, value);
            } else if (key == "fallback_timezone") {
                config.dailySummary.fallbackTimezone = value;
            } else if (key == "push_channels") {
                config.dailySummary.pushChannels = splitCsv(value);
            } else if (key == "webhook_url") {
                config.dailySummary.webhookUrl = value;
            } else if (key == "webhook_token") {
                config.dailySummary.webhookToken = value;
            } else if (key == "webhook_timeout_seconds") {
                auto parsed = parseLong(section, key, value);
                if (parsed && *parsed > 0) {
                    config.webhookTimeoutSeconds = static_cast<int>(*parsed);
                } else if (parsed) {
                    warnRange(section, key, value);
                }
            } else {
                return false;
            }
        } else if (section == "dedup") {
            if (key == "interval_minutes") {
                auto parsed = parseLong(section, key, value);
                if (parsed && *parsed > 0) {
                    config.dedupIntervalMinutes = static_cast<int>(*parsed);
                } else if (parsed) {
                    warnRange(section, key, value);
                }
            } else {
                return false;
            }
        } else if (section == "forwarder") {
            if (key == "enabled") {
                setBool(config.forwarder.enabled, section, key, value);
            } else if (key == "host") {
                config.forwarder.host = value;
            } else if (key == "port") {
                auto parsed = parseLong(section, key, value);
                if (parsed && *parsed > 0 && *parsed <= 65535) {
                    config.forwarder.port = static_cast<int>(*parsed);
                } else if (parsed) {
                    warnRange(section, key, value);
                }
            } else if (key == "client_id") {
                config.forwarder.clientId = value;
            } else if (key == "username") {
                config.forwarder.username = value;
            } else if (key == "password") {
                config.forwarder.password = value;
            } else if (key == "use_tls") {
                setBool(config.forwarder.useTls, section, key, value);
            } else if (key == "root_ca_path") {
                config.forwarder.caPath = value;
            } else if (key == "verify_server_cert") {
                setBool(config.forwarder.verifyServerCert, section, key, value);
            } else if (key == "topic_prefix") {
                config.forwarder.topicPrefix = value;
            } else {
                return false;
            }
        } else if (section == "push") {
            if (key == "topic_prefix") {
                config.pushTopicPrefix = value;
            } else {
                return false;
            }
        } else {
            return false;
        }
        return true;
    }

    static std::optional<double> parseDouble(const std::string& section, const std::string& key,
                                             const std::string& value) {
        try {
            size_t consumed = 0;
            double parsed = std::stod(value, &consumed);
            if (consumed == value.size() && std::isfinite(parsed)) {
                return parsed;
            }
        } catch (const std::exception&) {
        }
        std::cerr << "[Config] Warning: " << section << "." << key << " is not a number: " << value << std::endl;
        return std::nullopt;
    }

    static std::optional<int64_t> parseLong(const std::string& section, const std::string& key,
                                            const std::string& value) {
        try {
            size_t consumed = 0;
            long long parsed = std::stoll(value, &consumed);
            if (consumed == value.size()) {
                return static_cast<int64_t>(parsed);
            }
        } catch (const std::exception&) {
        }
        std::cerr << "[Config] Warning: " << section << "." << key << " is not an integer: " << value << std::endl;
        return std::nullopt;
    }

    static void setBool(bool& target, const std::string& section, const std::string& key,
                        const std::string& value) {
        if (value == "true" || value == "1") {
            target = true;
        } else if (value == "false" || value == "0") {
            target = false;
        } else {
            std::cerr << "[Config] Warning: " << section << "." << key << " is not a boolean: " << value << std::endl;
        }
    }

    static void setMillis(int64_t& target, int64_t scale, const std::string& section,
                          const std::string& key, const std::string& value) {
        auto parsed = parseLong(section, key, value);
        if (parsed && *parsed >= 0) {
            target = *parsed * scale;
        } else if (parsed) {
            warnRange(section, key, value);
        }
    }

    static void setNonNegative(double& target, const std::string& section, const std::string& key,
                               const std::string& value) {
        auto parsed = parseDouble(section, key, value);
        if (parsed && *parsed >= 0.0) {
            target = *parsed;
        } else if (parsed) {
            warnRange(section, key, value);
        }
    }

    static void warnRange(const std::string& section, const std::string& key, const std::string& value) {
        std::cerr << "[Config] Warning: " << section << "." << key << " out of range: " << value << std::endl;
    }

    /**
     * @brief Warn about configured files that do not exist yet
     */
    static void validatePaths(const EngineConfig& config) {
        namespace fs = std::filesystem;

        if (config.radar.enabled && !config.radar.file.empty() && !fs::exists(config.radar.file)) {
            std::cerr << "[Config] Warning: Radar catalog not found: " << config.radar.file << std::endl;
        }

        if (config.forwarder.enabled && !config.forwarder.caPath.empty() && !fs::exists(config.forwarder.caPath)) {
            std::cerr << "[Config] Warning: Root CA certificate not found: " << config.forwarder.caPath << std::endl;
        }
    }

    /// Drops a # comment unless it sits inside a quoted value
    static void stripComment(std::string& line) {
        bool quoted = false;
        for (size_t i = 0; i < line.size(); ++i) {
            if (line[i] == '"') {
                quoted = !quoted;
            } else if (line[i] == '#' && !quoted) {
                line.erase(i);
                return;
            }
        }
    }

    static void trim(std::string& str) {
        str.erase(0, str.find_first_not_of(" \t\r"));
        str.erase(str.find_last_not_of(" \t\r") + 1);
    }

    static void unquote(std::string& value) {
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
    }
};

} // namespace fleetalert
