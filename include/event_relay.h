#pragma once

#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace agentrun {

// One entry of a durable channel
struct RelayEntry {
    uint64_t id = 0;                        // Strictly increasing per channel
    Json::Value fields;
};

// channel -> last id seen (0 = from the beginning)
using RelayCursor = std::map<std::string, uint64_t>;

// channel -> entries newer than the cursor, in id order
using RelayBatch = std::map<std::string, std::vector<RelayEntry>>;

// Live subscription to a fan-out channel
class RelaySubscription {
public:
    virtual ~RelaySubscription() = default;

    // Next published message; false when nothing arrived within wait.
    // Throws RelayUnavailable once the transport is gone.
    virtual bool next(std::string& message, std::chrono::milliseconds wait) = 0;

    virtual void close() = 0;
};

// Transport between event producers and consumers, possibly in other
// processes. Every call fails fast with RelayUnavailable instead of hanging.
class EventRelay {
public:
    virtual ~EventRelay() = default;

    // Best-effort fan-out. Returns the number of subscribers reached; with
    // none the message is dropped.
    virtual size_t publish(const std::string& channel, const std::string& message) = 0;

    virtual std::unique_ptr<RelaySubscription> subscribe(const std::string& channel) = 0;

    // Durable append; the channel keeps at most max_len newest entries
    virtual uint64_t append(const std::string& channel, const Json::Value& fields,
                            size_t max_len) = 0;

    // Entries newer than the cursor, at most max_count per channel. Waits up
    // to block for the first new entry when there is nothing yet.
    virtual RelayBatch read(const RelayCursor& after, std::chrono::milliseconds block,
                            size_t max_count) = 0;

    virtual void trim(const std::string& channel, size_t max_len) = 0;

    virtual void remove(const std::vector<std::string>& channels) = 0;

    // True when the transport answers
    virtual bool ping() = 0;

    virtual std::string describe() const = 0;
};

} // namespace agentrun
