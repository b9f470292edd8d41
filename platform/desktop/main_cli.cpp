/**
 * @file main_cli.cpp
 * @brief Command-line host for the telemetry uplink service
 *
 * Wires the desktop adapters (SQLite event store, JSON state document,
 * threaded wakeup timer, Paho MQTT collector transport) into an EventService
 * and drives it from command-line flags, a JSON-lines import file or an
 * interactive prompt.
 *
 * @note Includes signal handling for graceful shutdown
 * @note Supports configuration via TOML files and environment variables
 */

#include "domain/EventService.hpp"
#include "domain/TuningState.hpp"
#include "adapters/SqliteEventStore.hpp"
#include "adapters/ThreadWakeupTimer.hpp"
#include "adapters/MqttEventTransport.hpp"
#include "PahoMqttClient.hpp"
#include "CollectorToken.hpp"
#include "IClock.hpp"
#include "JsonCodec.hpp"
#include "TomlConfig.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <thread>
#include <signal.h>

using namespace uplink;

/// Global flag for graceful shutdown coordination
static std::atomic<bool> g_running{true};

/**
 * @brief Signal handler for graceful shutdown
 *
 * Handles SIGINT (Ctrl+C) and SIGTERM so queued commands are drained and the
 * state document is flushed before exit.
 *
 * @param signal Signal number received
 */
void signalHandler(int signal) {
    (void)signal;
    g_running = false;
}

/**
 * @brief Display program usage information
 * @param programName Name of the executable (from argv[0])
 */
void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n"
              << "Options:\n"
              << "  --config <file>    Configuration file (default: uplink.toml)\n"
              << "  --import <file>    Queue JSON-lines events from file\n"
              << "  --upload           Request an immediate upload\n"
              << "  --delete-all       Purge all stored events\n"
              << "  --background       Treat the host application as backgrounded\n"
              << "  --headless         Run without user interaction until SIGINT/SIGTERM\n"
              << "  --help             Show this help message\n"
              << "\nConfiguration file format (TOML):\n"
              << "  [storage]\n"
              << "  database_path = \"uplink_events.db\"\n"
              << "  state_path = \"uplink_state.json\"\n"
              << "  [collector]\n"
              << "  host = \"collector.example.net\"\n"
              << "  client_id = \"your-client-id\"\n"
              << "  key_base64 = \"your-base64-key\"\n"
              << std::endl;
}

/**
 * @brief Safe environment variable getter
 * @param name Environment variable name
 * @return Environment variable value or empty string if not found
 */
std::string safeGetEnv(const char* name) {
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

/**
 * @brief Apply environment overrides on top of the file configuration
 * @param config Configuration to update in place
 */
void applyEnvOverrides(ServiceConfig& config) {
    std::string databasePath = safeGetEnv("UPLINK_DB");
    std::string statePath = safeGetEnv("UPLINK_STATE");
    std::string host = safeGetEnv("COLLECTOR_HOST");
    std::string clientId = safeGetEnv("COLLECTOR_CLIENT_ID");
    std::string key = safeGetEnv("COLLECTOR_KEY");

    if (!databasePath.empty()) config.databasePath = databasePath;
    if (!statePath.empty()) config.statePath = statePath;
    if (!host.empty()) config.collectorHost = host;
    if (!clientId.empty()) config.clientId = clientId;
    if (!key.empty()) config.keyBase64 = key;
}

// Epoch seconds with millisecond fraction, fixed width so text order is time order
std::string epochTimestamp(const IClock& clock) {
    int64_t millis = clock.epochMillis();
    std::ostringstream ss;
    ss << (millis / 1000) << '.' << std::setfill('0') << std::setw(3) << (millis % 1000);
    return ss.str();
}

/**
 * @brief Queue every valid line of a JSON-lines file as an AddEvent
 * @return Number of events queued
 */
int importEvents(const std::string& filename, domain::EventService& service) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "[CLI] Could not open import file: " << filename << std::endl;
        return 0;
    }

    int queued = 0;
    int lineNumber = 0;
    std::string line;
    while (std::getline(file, line)) {
        ++lineNumber;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        auto event = JsonCodec::parseEventLine(line);
        if (!event) {
            std::cerr << "[CLI] Skipping unparsable line " << lineNumber << std::endl;
            continue;
        }
        service.addEvent(std::move(*event));
        ++queued;
    }

    std::cout << "[CLI] Queued " << queued << " events from " << filename << std::endl;
    return queued;
}

Event makeTestEvent(const IClock& clock, const std::string& sessionId, int sequence) {
    nlohmann::json data = {
        {"source", "uplink_cli"},
        {"sequence", sequence}
    };

    Event event;
    event.id = "cli-" + std::to_string(clock.epochMillis()) + "-" + std::to_string(sequence);
    event.type = "custom_event";
    event.data = data.dump();
    event.timestamp = epochTimestamp(clock);
    event.sessionId = sessionId;
    return event;
}

/**
 * @brief Main application entry point
 *
 * @param argc Command line argument count
 * @param argv Command line argument values
 * @return Exit code (0 for success, 1 for error)
 */
int main(int argc, char* argv[]) {
    // Install signal handlers for graceful shutdown
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    bool headless = false;
    bool uploadNow = false;
    bool deleteAll = false;
    bool background = false;
    std::string importFile;

    // Parse command line arguments
    std::string configFile = "uplink.toml";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            if (i + 1 < argc) {
                configFile = argv[++i];
            }
        } else if (arg == "--import") {
            if (i + 1 < argc) {
                importFile = argv[++i];
            } else {
                std::cerr << "--import requires a file" << std::endl;
                return 1;
            }
        } else if (arg == "--upload") {
            uploadNow = true;
        } else if (arg == "--delete-all") {
            deleteAll = true;
        } else if (arg == "--background") {
            background = true;
        } else if (arg == "--headless") {
            headless = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    auto config = TomlConfig::loadFromFile(configFile);
    applyEnvOverrides(config);

    if (!config.hasCollectorConfig()) {
        std::cerr << "Error: Missing required configuration in " << configFile << std::endl;
        std::cerr << "Required: [collector] host, client_id (or COLLECTOR_HOST, COLLECTOR_CLIENT_ID)" << std::endl;
        return 1;
    }

    std::cout << "Starting telemetry uplink" << std::endl;
    std::cout << "Collector: " << config.collectorHost << ":" << config.collectorPort << std::endl;
    std::cout << "Client ID: " << config.clientId << std::endl;
    std::cout << "Event database: " << config.databasePath << std::endl;
    std::cout << "State document: " << config.statePath << std::endl;

    std::shared_ptr<adapters::SqliteEventStore> store;
    try {
        store = std::make_shared<adapters::SqliteEventStore>(config.databasePath);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    auto tuning = std::make_shared<domain::TuningStateRepository>(config.statePath, config.tuningDefaults);
    tuning->load();

    auto clock = std::make_shared<SystemClock>();
    auto timer = std::make_shared<adapters::ThreadWakeupTimer>();
    auto mqttClient = std::make_shared<PahoMqttClient>();

    adapters::MqttEventTransport::Options transportOptions;
    transportOptions.clientId = config.clientId;
    transportOptions.responseTimeout = config.responseTimeout;
    auto transport = std::make_shared<adapters::MqttEventTransport>(mqttClient, transportOptions);

    MqttConnectOptions connectOptions;
    connectOptions.host = config.collectorHost;
    connectOptions.port = static_cast<std::uint16_t>(config.collectorPort);
    connectOptions.clientId = config.clientId;
    connectOptions.username = config.collectorHost + "/" + config.clientId;
    connectOptions.useTls = config.useTls;
    connectOptions.caPath = config.caPath;

    if (!config.keyBase64.empty()) {
        CollectorToken::Config tokenConfig;
        tokenConfig.host = config.collectorHost;
        tokenConfig.clientId = config.clientId;
        tokenConfig.keyBase64 = config.keyBase64;
        tokenConfig.expirySeconds = config.tokenExpirySeconds;

        uint64_t nowSeconds = static_cast<uint64_t>(clock->epochMillis() / 1000);
        connectOptions.password = CollectorToken::generate(tokenConfig, nowSeconds);
    }

    // Uploads before the connection completes fail and back off like any other failure
    if (!mqttClient->connect(connectOptions)) {
        std::cerr << "[CLI] Could not start MQTT connection, uploads will back off" << std::endl;
    }

    domain::ServiceOptions serviceOptions;
    serviceOptions.backgroundReportingInterval = config.backgroundReportingInterval;
    serviceOptions.verbose = config.verbose;

    domain::EventService service(store, transport, tuning, timer, clock, serviceOptions);
    service.setAppInForeground(!background);
    service.start();

    if (deleteAll) {
        service.deleteAll();
    }
    if (!importFile.empty()) {
        importEvents(importFile, service);
    }
    if (uploadNow) {
        service.requestUpload();
    }
    service.flush();

    const std::string sessionId = "cli-" + std::to_string(clock->epochMillis());

    if (headless) {
        std::cout << "Running in headless mode. Press Ctrl+C to stop." << std::endl;

        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }

    } else if (!importFile.empty() || uploadNow || deleteAll) {
        // One-shot invocation: queued work has run, report and leave
        service.reportStatus();
        service.flush();

    } else {
        std::cout << "\nInteractive mode. Commands:" << std::endl;
        std::cout << "  a - Add a test event" << std::endl;
        std::cout << "  u - Upload now" << std::endl;
        std::cout << "  d - Delete all events" << std::endl;
        std::cout << "  s - Show status" << std::endl;
        std::cout << "  q - Quit" << std::endl;

        int sequence = 0;
        char cmd;
        while (g_running && std::cin >> cmd) {
            switch (cmd) {
                case 'a':
                    service.addEvent(makeTestEvent(*clock, sessionId, ++sequence));
                    service.flush();
                    std::cout << "Added test event " << sequence << std::endl;
                    break;

                case 'u':
                    service.requestUpload();
                    service.flush();
                    break;

                case 'd':
                    service.deleteAll();
                    service.flush();
                    std::cout << "All events deleted" << std::endl;
                    break;

                case 's':
                    service.reportStatus();
                    service.flush();
                    break;

                case 'q':
                    g_running = false;
                    break;

                default:
                    std::cout << "Unknown command" << std::endl;
                    break;
            }
        }
    }

    std::cout << "Stopping uplink..." << std::endl;
    service.stop();
    mqttClient->disconnect();

    std::cout << "Uplink stopped." << std::endl;
    return 0;
}
