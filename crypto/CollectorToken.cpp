/**
 * @file CollectorToken.cpp
 * @brief Collector shared access signature generation
 *
 * The collector authenticates MQTT clients with a signature over the
 * URL-encoded resource URI and an expiry timestamp:
 *
 *   SharedAccessSignature sr={resource}&sig={base64 hmac}&se={expiry}
 *
 * where the signed string is `urlEncode(resource) + "\n" + expiry` and the key
 * is the base64-decoded client key. HMAC-SHA256 and base64 come from OpenSSL.
 */

#include "CollectorToken.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <vector>

namespace uplink {

std::string CollectorToken::generate(const Config& config, uint64_t nowEpochSeconds) {
    return generate(config.host, config.clientId, config.keyBase64,
                    nowEpochSeconds + config.expirySeconds);
}

std::string CollectorToken::generate(const std::string& host,
                                     const std::string& clientId,
                                     const std::string& keyBase64,
                                     uint64_t expiryEpochSeconds) {
    const std::string resource = resourceUri(host, clientId);
    const std::string encodedResource = urlEncode(resource);
    const std::string stringToSign = encodedResource + "\n" + std::to_string(expiryEpochSeconds);
    
    const std::string signature = base64Encode(hmacSha256(base64Decode(keyBase64), stringToSign));
    
    std::ostringstream token;
    token << "SharedAccessSignature sr=" << encodedResource
          << "&sig=" << urlEncode(signature)
          << "&se=" << expiryEpochSeconds;
    return token.str();
}

std::string CollectorToken::resourceUri(const std::string& host, const std::string& clientId) {
    std::string lowerHost = host;
    std::transform(lowerHost.begin(), lowerHost.end(), lowerHost.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowerHost + "/clients/" + clientId;
}

std::string CollectorToken::hmacSha256(const std::string& key, const std::string& message) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;
    
    const unsigned char* result = HMAC(EVP_sha256(),
                                       key.data(), static_cast<int>(key.size()),
                                       reinterpret_cast<const unsigned char*>(message.data()),
                                       message.size(),
                                       digest, &digestLength);
    if (!result) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(digest), digestLength);
}

std::string CollectorToken::base64Encode(const std::string& data) {
    if (data.empty()) {
        return {};
    }
    
    // 4 output bytes per 3 input bytes, plus the terminating NUL
    std::vector<unsigned char> buffer(4 * ((data.size() + 2) / 3) + 1);
    int length = EVP_EncodeBlock(buffer.data(),
                                 reinterpret_cast<const unsigned char*>(data.data()),
                                 static_cast<int>(data.size()));
    if (length < 0) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(buffer.data()), static_cast<std::size_t>(length));
}

std::string CollectorToken::base64Decode(const std::string& encoded) {
    if (encoded.empty() || encoded.size() % 4 != 0) {
        return {};
    }
    
    std::vector<unsigned char> buffer(3 * (encoded.size() / 4) + 1);
    int length = EVP_DecodeBlock(buffer.data(),
                                 reinterpret_cast<const unsigned char*>(encoded.data()),
                                 static_cast<int>(encoded.size()));
    if (length < 0) {
        return {};
    }
    
    // EVP_DecodeBlock counts padding as zero bytes
    std::size_t padding = 0;
    if (encoded[encoded.size() - 1] == '=') ++padding;
    if (encoded[encoded.size() - 2] == '=') ++padding;
    
    return std::string(reinterpret_cast<const char*>(buffer.data()),
                       static_cast<std::size_t>(length) - padding);
}

std::string CollectorToken::urlEncode(const std::string& value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;
    
    for (char c : value) {
        // RFC 3986 unreserved characters pass through
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << static_cast<int>(static_cast<unsigned char>(c));
        }
    }
    
    return escaped.str();
}

} // namespace uplink
