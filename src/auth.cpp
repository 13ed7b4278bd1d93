#include "auth.h"

#include <openssl/crypto.h>
#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace agentrun {

ApiKeyResolver::ApiKeyResolver(std::vector<std::string> keys) : keys_(std::move(keys)) {}

std::string ApiKeyResolver::principal_for(const std::string& key) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(key.data()), key.size(), hash);

    std::ostringstream id;
    id << "key_";
    for (int i = 0; i < 8; i++) {
        id << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return id.str();
}

std::optional<std::string> ApiKeyResolver::resolve(const HttpRequest& req) const {
    if (keys_.empty()) {
        return std::string("anonymous");
    }

    std::string presented = req.header("X-API-Key");
    if (presented.empty()) {
        auto it = req.query.find("api_key");
        if (it != req.query.end()) {
            presented = it->second;
        }
    }
    if (presented.empty()) {
        return std::nullopt;
    }

    for (const auto& key : keys_) {
        if (key.size() == presented.size() &&
            CRYPTO_memcmp(key.data(), presented.data(), key.size()) == 0) {
            return principal_for(key);
        }
    }
    return std::nullopt;
}

} // namespace agentrun
