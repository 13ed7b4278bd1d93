#include "log_watcher.h"
#include "constants.h"
#include "util.h"

#include <iostream>

namespace agentrun {

LineKind classify_line(const std::string& line, Json::Value* record) {
    std::string text = trim(line);
    if (text.empty() || text.front() != '{' || text.back() != '}') {
        return LineKind::OUTPUT;
    }

    Json::Value parsed;
    if (!parse_json(text, parsed) || !parsed.isObject()) {
        return LineKind::OUTPUT;
    }

    bool structured = (parsed.isMember("timestamp") && parsed.isMember("level")) ||
                      parsed.isMember("step");
    if (!structured) {
        return LineKind::OUTPUT;
    }

    if (record) {
        *record = std::move(parsed);
    }
    return LineKind::INTERNAL;
}

LogWatcher::LogWatcher(EventPublisher& publisher, std::string run_id, int variation_id)
    : publisher_(publisher), run_id_(std::move(run_id)), variation_id_(variation_id) {}

LogWatcher::Result LogWatcher::watch(OutputStream& stream, const std::atomic<bool>& cancelled) {
    Result result;
    OutputLine line;

    while (true) {
        if (cancelled) {
            result.cancelled = true;
            stream.close();
            break;
        }

        auto status = stream.next(line, std::chrono::milliseconds(DELIVERY_POLL_MS));
        if (status == OutputStream::Status::END) break;
        if (status == OutputStream::Status::IDLE) continue;

        forward(line, result);
    }

    std::cout << "[LogWatcher] Run " << run_id_ << " variation " << variation_id_
              << " stream finished: " << result.output_lines << " output, "
              << result.log_lines << " log, " << result.errors.size() << " error lines"
              << (result.cancelled ? " (cancelled)" : "") << std::endl;
    return result;
}

void LogWatcher::forward(const OutputLine& line, Result& result) {
    if (line.kind == OutputLine::Kind::ERROR) {
        result.errors.push_back(line.text);

        // Error markers also land on the log channel so subscribers see them in context
        Json::Value record;
        record["timestamp"] = now_timestamp();
        record["level"] = "ERROR";
        record["message"] = line.text;
        record["source"] = "backend";
        publisher_.agent_log(run_id_, variation_id_, record);
        result.log_lines++;
        return;
    }

    Json::Value record;
    if (classify_line(line.text, &record) == LineKind::INTERNAL) {
        publisher_.agent_log(run_id_, variation_id_, record);
        result.log_lines++;
    } else {
        publisher_.agent_output(run_id_, variation_id_, line.text);
        result.output_lines++;
    }
}

} // namespace agentrun
