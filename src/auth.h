#pragma once

#include "http_server.h"

#include <optional>
#include <string>
#include <vector>

namespace agentrun {

// Maps a request to a principal id, or rejects it
class IdentityResolver {
public:
    virtual ~IdentityResolver() = default;
    virtual std::optional<std::string> resolve(const HttpRequest& req) const = 0;
};

// API keys from X-API-Key (or ?api_key= for browser EventSource/WebSocket
// clients that cannot set headers). With no keys configured every caller is
// "anonymous".
class ApiKeyResolver : public IdentityResolver {
public:
    explicit ApiKeyResolver(std::vector<std::string> keys);

    std::optional<std::string> resolve(const HttpRequest& req) const override;

    bool development_mode() const { return keys_.empty(); }

    // Stable principal id derived from a key; the key itself is never stored
    static std::string principal_for(const std::string& key);

private:
    std::vector<std::string> keys_;
};

} // namespace agentrun
