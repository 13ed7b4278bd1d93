#pragma once

#include "sandbox_backend.h"
#include "process.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace agentrun {

// OutputStream over a child process's combined output.
//
// Lines starting with the error prefix become ERROR lines. A non-zero exit
// and a missed deadline each produce one ERROR line before END. The process
// is shared with the backend so terminate() can reach it while streaming.
class ProcessOutputStream : public OutputStream {
public:
    struct Options {
        std::string label;                                   // Used in error markers
        std::string error_prefix = "ERROR:";
        std::chrono::steady_clock::time_point deadline;      // Overall wall time
        std::optional<std::chrono::steady_clock::time_point> first_output_deadline;
        std::chrono::milliseconds terminate_grace{2000};
    };

    ProcessOutputStream(std::shared_ptr<Process> process, Options options);

    Status next(OutputLine& line, std::chrono::milliseconds wait) override;
    void close() override;

    std::optional<int> exit_code() const { return exit_code_; }

private:
    Status fail(OutputLine& line, const std::string& message);

    std::shared_ptr<Process> process_;
    Options options_;
    bool seen_output_ = false;
    bool finished_ = false;
    std::optional<int> exit_code_;
};

} // namespace agentrun
