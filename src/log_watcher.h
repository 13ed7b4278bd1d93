#pragma once

#include "sandbox_backend.h"
#include "event_publisher.h"

#include <json/json.h>
#include <atomic>
#include <string>
#include <vector>

namespace agentrun {

enum class LineKind {
    OUTPUT,     // Agent output, forwarded verbatim
    INTERNAL    // Structured record from the sandbox tooling
};

// A line is internal when it is a JSON object carrying both "timestamp" and
// "level", or a "step" marker. Anything else, malformed JSON included, is
// output. On INTERNAL the parsed object is stored in record.
LineKind classify_line(const std::string& line, Json::Value* record = nullptr);

// Forwards one sandbox's output into the relay until the stream ends or the
// cancel flag is raised.
class LogWatcher {
public:
    struct Result {
        size_t output_lines = 0;
        size_t log_lines = 0;
        std::vector<std::string> errors;    // Backend error markers, in order
        bool cancelled = false;
    };

    LogWatcher(EventPublisher& publisher, std::string run_id, int variation_id);

    Result watch(OutputStream& stream, const std::atomic<bool>& cancelled);

private:
    void forward(const OutputLine& line, Result& result);

    EventPublisher& publisher_;
    std::string run_id_;
    int variation_id_;
};

} // namespace agentrun
