#include "process_output_stream.h"

#include <algorithm>

namespace agentrun {

ProcessOutputStream::ProcessOutputStream(std::shared_ptr<Process> process, Options options)
    : process_(std::move(process)), options_(std::move(options)) {}

OutputStream::Status ProcessOutputStream::fail(OutputLine& line, const std::string& message) {
    process_->terminate(options_.terminate_grace);
    finished_ = true;
    line.kind = OutputLine::Kind::ERROR;
    line.text = message;
    return Status::LINE;
}

OutputStream::Status ProcessOutputStream::next(OutputLine& line, std::chrono::milliseconds wait) {
    if (finished_) return Status::END;

    auto now = std::chrono::steady_clock::now();
    if (now >= options_.deadline) {
        return fail(line, options_.label + " exceeded its execution timeout");
    }
    if (!seen_output_ && options_.first_output_deadline && now >= *options_.first_output_deadline) {
        return fail(line, options_.label + " produced no output within the setup timeout");
    }

    auto until = options_.deadline;
    if (!seen_output_ && options_.first_output_deadline) {
        until = std::min(until, *options_.first_output_deadline);
    }
    auto slice = std::min(wait, std::chrono::duration_cast<std::chrono::milliseconds>(until - now));

    std::string text;
    switch (process_->read_line(text, slice)) {
        case Process::ReadStatus::LINE: {
            seen_output_ = true;
            const std::string& prefix = options_.error_prefix;
            if (!prefix.empty() && text.compare(0, prefix.size(), prefix) == 0) {
                line.kind = OutputLine::Kind::ERROR;
                size_t start = text.find_first_not_of(' ', prefix.size());
                line.text = start == std::string::npos ? "" : text.substr(start);
            } else {
                line.kind = OutputLine::Kind::OUTPUT;
                line.text = std::move(text);
            }
            return Status::LINE;
        }

        case Process::ReadStatus::IDLE:
            return Status::IDLE;

        case Process::ReadStatus::END:
            break;
    }

    // Output closed; the process may still be exiting
    auto code = process_->wait_for(slice);
    if (!code) return Status::IDLE;

    finished_ = true;
    exit_code_ = code;
    if (*code != 0) {
        line.kind = OutputLine::Kind::ERROR;
        line.text = options_.label + " exited with code " + std::to_string(*code);
        return Status::LINE;
    }
    return Status::END;
}

void ProcessOutputStream::close() {
    finished_ = true;
}

} // namespace agentrun
