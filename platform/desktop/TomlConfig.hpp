/**
 * @file TomlConfig.hpp
 * @brief TOML configuration parser for the desktop uplink host
 *
 * Simple line-based parser for the subset of TOML the service needs:
 * section headers, `key = value` pairs, `#` comments and quoted strings.
 *
 * Supported Sections:
 * - [storage]: event database and state document locations
 * - [upload]: background reporting interval and verbosity
 * - [tuning]: local defaults for the collector-adjustable bounds
 * - [collector]: MQTT endpoint, client identity and token settings
 *
 * @note Unknown sections and keys are ignored; malformed numbers are
 *       reported and leave the default in place
 */

#pragma once

#include "domain/TuningState.hpp"
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace uplink {

/**
 * @brief Complete configuration of the desktop host
 */
struct ServiceConfig {
    std::string databasePath = "uplink_events.db";     ///< SQLite event database
    std::string statePath = "uplink_state.json";        ///< Persisted tuning and pacing state
    
    std::chrono::milliseconds backgroundReportingInterval = std::chrono::minutes(15);
    bool verbose = false;
    
    domain::TuningState tuningDefaults;                 ///< Used until the collector says otherwise
    
    std::string collectorHost;                          ///< MQTT broker of the collector
    int collectorPort = 8883;
    std::string clientId;                               ///< Identity in topics and token
    std::string keyBase64;                              ///< Shared access key for the token
    bool useTls = true;
    std::string caPath;                                 ///< Optional trust store
    std::chrono::milliseconds responseTimeout = std::chrono::seconds(30);
    uint64_t tokenExpirySeconds = 3600;
    
    bool hasCollectorConfig() const {
        return !collectorHost.empty() && !clientId.empty();
    }
};

/**
 * @brief TOML configuration file parser
 */
class TomlConfig {
public:
    /**
     * @brief Load configuration from a file
     * @param filename Path to the TOML file
     * @return Parsed configuration, or defaults if the file cannot be opened
     */
    static ServiceConfig loadFromFile(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            std::cerr << "[Config] Could not open config file: " << filename << ", using defaults" << std::endl;
            return ServiceConfig{};
        }
        return parse(file);
    }
    
    /**
     * @brief Parse configuration text
     * @param text TOML document
     * @return Parsed configuration on top of defaults
     */
    static ServiceConfig loadFromString(const std::string& text) {
        std::istringstream stream(text);
        return parse(stream);
    }

private:
    static ServiceConfig parse(std::istream& input) {
        ServiceConfig config;
        std::string currentSection;
        std::string line;
        
        while (std::getline(input, line)) {
            stripComment(line);
            trim(line);
            
            if (line.empty()) {
                continue;
            }
            
            if (line[0] == '[') {
                if (line.back() == ']') {
                    currentSection = line.substr(1, line.length() - 2);
                    trim(currentSection);
                }
                continue;
            }
            
            size_t equalPos = line.find('=');
            if (equalPos == std::string::npos) {
                continue;
            }
            
            std::string key = line.substr(0, equalPos);
            std::string value = line.substr(equalPos + 1);
            trim(key);
            trim(value);
            unquote(value);
            
            try {
                apply(config, currentSection, key, value);
            } catch (const std::exception&) {
                std::cerr << "[Config] Invalid value for " << currentSection << "." << key
                          << ": " << value << std::endl;
            }
        }
        
        return config;
    }
    
    static void apply(ServiceConfig& config, const std::string& section,
                      const std::string& key, const std::string& value) {
        if (section == "storage") {
            if (key == "database_path") {
                config.databasePath = value;
            } else if (key == "state_path") {
                config.statePath = value;
            }
        } else if (section == "upload") {
            if (key == "background_reporting_interval_ms") {
                config.backgroundReportingInterval = std::chrono::milliseconds(std::stoll(value));
            } else if (key == "verbose") {
                config.verbose = parseBool(value);
            }
        } else if (section == "tuning") {
            if (key == "max_total_db_size") {
                config.tuningDefaults.maxTotalDbSize = std::stoll(value);
            } else if (key == "max_batch_size") {
                config.tuningDefaults.maxBatchSize = std::stoll(value);
            } else if (key == "min_batch_interval_ms") {
                config.tuningDefaults.minBatchInterval = std::stoll(value);
            } else if (key == "max_wait_ms") {
                config.tuningDefaults.maxWait = std::stoll(value);
            }
        } else if (section == "collector") {
            if (key == "host") {
                config.collectorHost = value;
            } else if (key == "port") {
                config.collectorPort = std::stoi(value);
            } else if (key == "client_id") {
                config.clientId = value;
            } else if (key == "key_base64") {
                config.keyBase64 = value;
            } else if (key == "use_tls") {
                config.useTls = parseBool(value);
            } else if (key == "ca_path") {
                config.caPath = value;
            } else if (key == "response_timeout_ms") {
                config.responseTimeout = std::chrono::milliseconds(std::stoll(value));
            } else if (key == "token_expiry_seconds") {
                config.tokenExpirySeconds = std::stoull(value);
            }
        }
    }
    
    static bool parseBool(const std::string& value) {
        return value == "true" || value == "1";
    }
    
    /**
     * @brief Drop a trailing comment, leaving '#' inside quotes alone
     * @param line Line to clean (modified in place)
     */
    static void stripComment(std::string& line) {
        bool inQuotes = false;
        for (size_t i = 0; i < line.size(); ++i) {
            if (line[i] == '"') {
                inQuotes = !inQuotes;
            } else if (line[i] == '#' && !inQuotes) {
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

} // namespace uplink
