#pragma once

#include <cstdint>
#include <string>

namespace uplink {

// Shared access signature presented as the MQTT password to the collector
class CollectorToken {
public:
    struct Config {
        std::string host;
        std::string clientId;
        std::string keyBase64;
        uint64_t expirySeconds = 3600;
    };
    
    static std::string generate(const Config& config, uint64_t nowEpochSeconds);
    static std::string generate(const std::string& host,
                                const std::string& clientId,
                                const std::string& keyBase64,
                                uint64_t expiryEpochSeconds);
    
    // Lowercased host + "/clients/" + client id
    static std::string resourceUri(const std::string& host, const std::string& clientId);
    
    static std::string urlEncode(const std::string& value);
    static std::string base64Encode(const std::string& data);
    static std::string base64Decode(const std::string& encoded);
    
    // Raw 32-byte digest
    static std::string hmacSha256(const std::string& key, const std::string& message);
};

} // namespace uplink
