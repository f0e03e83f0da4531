/**
 * @file main_cli.cpp
 * @brief Command-line runner for the fleetalert rule and notification engine
 *
 * Seeds the in-memory store from a JSON fixture, replays NDJSON positions
 * through the position pipeline and runs the scheduled jobs on demand or on
 * their normal cadence until interrupted.
 *
 * @note Handles SIGINT/SIGTERM for graceful shutdown in --serve mode
 */

#include "TomlConfig.hpp"
#include "../../core/IClock.hpp"
#include "../../core/JsonCodec.hpp"
#include "../../core/adapters/DefaultPolicies.hpp"
#include "../../core/adapters/LogNotificator.hpp"
#include "../../core/adapters/MqttEventForwarder.hpp"
#include "../../core/adapters/MqttPushNotificator.hpp"
#include "../../core/domain/DailySummaryTask.hpp"
#include "../../core/domain/DefaultNotifications.hpp"
#include "../../core/domain/NotificationDeduplicateTask.hpp"
#include "../../core/domain/NotificationManager.hpp"
#include "../../core/domain/OilChangeEvaluator.hpp"
#include "../../core/domain/OverspeedEvaluator.hpp"
#include "../../core/domain/PositionPipeline.hpp"
#include "../../core/domain/StaticRadarIndex.hpp"
#include "../../core/domain/TireRotationEvaluator.hpp"
#include "../../core/sim/InMemoryStore.hpp"
#include "../../core/sim/SimulatedClock.hpp"
#include "../../net/http/HttpWebhookClient.hpp"
#include "../../net/mqtt/PahoMqttClient.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <utility>
#include <signal.h>
#include <string>
#include <thread>

using namespace fleetalert;

/// Global flag for graceful shutdown coordination
static volatile bool g_running = true;

void signalHandler(int signal) {
    std::cout << "\nReceived signal " << signal << ", shutting down..." << std::endl;
    g_running = false;
}

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n"
              << "Options:\n"
              << "  --config <file>                 Configuration file (default: fleetalert.toml)\n"
              << "  --fixture <file>                JSON fixture seeding users, devices, subscriptions\n"
              << "  --replay <file>                 NDJSON positions fed through the pipeline\n"
              << "  --now <iso8601>                 Run on a simulated clock starting at this instant\n"
              << "  --provision <userId>            Create the default subscriptions for a user\n"
              << "  --run-daily-summary             Run one daily summary tick\n"
              << "  --run-dedup                     Run one subscription deduplication pass\n"
              << "  --set-radar-radius <id> <m>     Store a static radar radius override\n"
              << "  --serve                         Keep running the scheduled jobs until Ctrl+C\n"
              << "  --help                          Show this help message\n"
              << "\nConfiguration file format (TOML):\n"
              << "  [general]\n"
              << "  server_timezone = \"America/Sao_Paulo\"\n"
              << "  [forwarder]\n"
              << "  enabled = true\n"
              << "  host = \"broker.example.com\"\n"
              << std::endl;
}

static std::optional<nlohmann::json> readJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Error: could not open " << path << std::endl;
        return std::nullopt;
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Error: invalid JSON in " << path << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

static std::shared_ptr<PahoMqttClient> connectBroker(const ForwarderConfig& config) {
    MqttConnectOptions options = config.connectOptions();

    auto client = std::make_shared<PahoMqttClient>();
    client->setConnectionCallback([](bool connected, const std::string& reason) {
        std::cout << "[MQTT] " << (connected ? "Connected" : "Disconnected");
        if (!reason.empty()) {
            std::cout << ": " << reason;
        }
        std::cout << std::endl;
    });
    if (!client->connect(options)) {
        std::cerr << "[MQTT] Connect request failed; messages are queued until the broker is reachable"
                  << std::endl;
    }
    return client;
}

static int replayPositions(const std::string& path, sim::InMemoryStore& store,
                           domain::PositionPipeline& pipeline, sim::SimulatedClock* simulatedClock) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Error: could not open " << path << std::endl;
        return -1;
    }

    int processed = 0;
    size_t eventCount = 0;
    std::string line;
    int lineNumber = 0;
    while (g_running && std::getline(file, line)) {
        ++lineNumber;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        Position position;
        try {
            position = JsonCodec::jsonToPosition(nlohmann::json::parse(line));
        } catch (const std::exception& e) {
            std::cerr << "[Replay] Skipping line " << lineNumber << ": " << e.what() << std::endl;
            continue;
        }

        if (simulatedClock && position.fixTime > simulatedClock->epochMillis()) {
            simulatedClock->setCurrentTime(position.fixTime);
        }

        position.id = store.addPosition(position);
        auto events = pipeline.process(position);
        eventCount += events.size();
        ++processed;
    }

    std::cout << "[Replay] Processed " << processed << " positions, raised " << eventCount << " events"
              << std::endl;
    return processed;
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    std::string configFile = "fleetalert.toml";
    std::string fixtureFile;
    std::string replayFile;
    std::string startTime;
    std::optional<int64_t> provisionUser;
    std::optional<std::pair<std::string, double>> radarOverride;
    bool runDailySummary = false;
    bool runDedup = false;
    bool serve = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "--config" && i + 1 < argc) {
                configFile = argv[++i];
            } else if (arg == "--fixture" && i + 1 < argc) {
                fixtureFile = argv[++i];
            } else if (arg == "--replay" && i + 1 < argc) {
                replayFile = argv[++i];
            } else if (arg == "--now" && i + 1 < argc) {
                startTime = argv[++i];
            } else if (arg == "--provision" && i + 1 < argc) {
                provisionUser = std::stoll(argv[++i]);
            } else if (arg == "--set-radar-radius" && i + 2 < argc) {
                std::string id = argv[++i];
                radarOverride = std::make_pair(id, std::stod(argv[++i]));
            } else if (arg == "--run-daily-summary") {
                runDailySummary = true;
            } else if (arg == "--run-dedup") {
                runDedup = true;
            } else if (arg == "--serve") {
                serve = true;
            } else {
                std::cerr << "Unknown option or missing value: " << arg << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        } catch (const std::exception&) {
            std::cerr << "Invalid value for " << arg << std::endl;
            return 1;
        }
    }

    auto config = TomlConfig::loadFromFile(configFile);

    std::shared_ptr<IClock> clock;
    std::shared_ptr<sim::SimulatedClock> simulatedClock;
    if (!startTime.empty()) {
        try {
            simulatedClock = std::make_shared<sim::SimulatedClock>();
            simulatedClock->setCurrentTime(startTime);
        } catch (const std::invalid_argument& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
        clock = simulatedClock;
    } else {
        clock = std::make_shared<SystemClock>();
    }

    auto radarIndex = std::make_shared<domain::StaticRadarIndex>(config.radar, clock);
    if (radarOverride) {
        try {
            double stored = radarIndex->setRadiusOverride(radarOverride->first, radarOverride->second);
            std::cout << "Radar " << radarOverride->first << " radius set to " << stored << " m" << std::endl;
        } catch (const std::invalid_argument& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        } catch (const std::runtime_error& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
        if (fixtureFile.empty() && replayFile.empty() && !serve && !runDailySummary && !runDedup) {
            return 0;
        }
    }

    auto store = std::make_shared<sim::InMemoryStore>();
    if (!fixtureFile.empty()) {
        auto fixture = readJsonFile(fixtureFile);
        if (!fixture) {
            return 1;
        }
        try {
            store->loadFixture(*fixture);
        } catch (const std::exception& e) {
            std::cerr << "Error: invalid fixture " << fixtureFile << ": " << e.what() << std::endl;
            return 1;
        }
        std::cout << "Loaded fixture " << fixtureFile << std::endl;
    }

    std::cout << "Starting fleetalert engine" << std::endl;
    std::cout << "Server time zone: "
              << (config.serverTimezone.empty() ? std::string("(fallback)") : config.serverTimezone) << std::endl;

    // Outbound adapters
    std::shared_ptr<PahoMqttClient> mqttClient;
    if (config.forwarder.enabled && !config.forwarder.host.empty()) {
        mqttClient = connectBroker(config.forwarder);
    }

    auto notificators = std::make_shared<ports::NotificatorRegistry>();
    std::shared_ptr<ports::IEventForwarder> forwarder;
    if (mqttClient) {
        notificators->add("push", std::make_shared<adapters::MqttPushNotificator>(
            mqttClient, store, config.pushTopicPrefix));
        forwarder = std::make_shared<adapters::MqttEventForwarder>(mqttClient, config.forwarder.topicPrefix);
    } else {
        std::cout << "No broker configured, push notifications are written to the log" << std::endl;
        notificators->add("push", std::make_shared<adapters::LogNotificator>(store));
    }

    std::shared_ptr<HttpWebhookClient> webhookClient;
    if (!config.dailySummary.webhookUrl.empty()) {
        webhookClient = std::make_shared<HttpWebhookClient>(std::chrono::seconds(config.webhookTimeoutSeconds));
    }

    // Core services
    auto notificationManager = std::make_shared<domain::NotificationManager>(
        store, store, notificators, clock, config.notification, forwarder);

    domain::PositionPipeline pipeline(store, notificationManager);
    pipeline.addHandler(std::make_shared<domain::OverspeedEvaluator>(
        store, store, clock, config.overspeed, config.radar.enabled ? radarIndex : nullptr));
    pipeline.addHandler(std::make_shared<domain::OilChangeEvaluator>(store, config.verbose));
    pipeline.addHandler(std::make_shared<domain::TireRotationEvaluator>(store));

    domain::DailySummaryTask dailySummary(store, store, notificators, clock,
                                          std::make_shared<adapters::FixedScheduleRetryPolicy>(),
                                          config.dailySummary, webhookClient);
    domain::NotificationDeduplicateTask dedup(store, store);

    if (provisionUser) {
        domain::DefaultNotifications defaults(store, store, config.defaultChannels);
        int created = defaults.provision(*provisionUser);
        std::cout << "Provisioned " << created << " default notifications for user " << *provisionUser
                  << std::endl;
    }

    if (!replayFile.empty()) {
        if (replayPositions(replayFile, *store, pipeline, simulatedClock.get()) < 0) {
            return 1;
        }
    }

    if (runDedup) {
        dedup.run();
    }

    if (runDailySummary) {
        int processed = dailySummary.tick();
        std::cout << "Daily summary tick processed " << processed << " users" << std::endl;
    }

    if (serve) {
        std::cout << "Serving. Press Ctrl+C to stop." << std::endl;

        const auto summaryInterval = std::chrono::minutes(1);
        const auto dedupInterval = std::chrono::minutes(config.dedupIntervalMinutes);
        auto nextSummary = std::chrono::steady_clock::now();
        auto nextDedup = std::chrono::steady_clock::now() + dedupInterval;

        while (g_running) {
            auto now = std::chrono::steady_clock::now();
            if (now >= nextSummary) {
                dailySummary.tick();
                nextSummary = now + summaryInterval;
            }
            if (now >= nextDedup) {
                dedup.run();
                nextDedup = now + dedupInterval;
            }
            if (simulatedClock) {
                simulatedClock->advance(std::chrono::seconds(1));
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1000));
        }
    }

    std::cout << "Stopping engine..." << std::endl;

    if (mqttClient) {
        // Allow time for queued messages to drain
        std::this_thread::sleep_for(std::chrono::seconds(1));
        mqttClient->disconnect();
    }

    std::cout << "Engine stopped." << std::endl;
    return 0;
}
