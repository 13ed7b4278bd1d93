#pragma once

#include <sys/types.h>

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentrun {

struct ProcessOptions {
    std::vector<std::string> argv;              // argv[0] resolved through PATH
    std::map<std::string, std::string> env;     // Added to (or replacing) the environment
    bool inherit_env = true;
    std::string working_dir;
    bool merge_stderr = true;                   // stderr into the stdout pipe

    // Runs in the child between fork and exec (rlimits, namespaces, seccomp).
    // Must only make syscalls; return false to abort the exec.
    std::function<bool()> child_setup;
};

struct CommandResult {
    int exit_code = -1;
    std::string output;
    std::string error_output;
};

// Child process in its own process group with piped output.
// read_line() belongs to one reader thread; try_wait(), wait_for() and
// terminate() may be called from any thread.
class Process {
public:
    enum class ReadStatus {
        LINE,   // A complete line was returned
        IDLE,   // Nothing arrived within the wait
        END     // Output closed and buffer drained
    };

    // Spawns immediately; throws std::runtime_error if fork/exec fails
    explicit Process(const ProcessOptions& options);
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    pid_t pid() const { return pid_; }

    // Next line of combined output without the trailing newline
    ReadStatus read_line(std::string& line, std::chrono::milliseconds wait);

    // Exit code once exited (128+signal for signals); never blocks
    std::optional<int> try_wait();

    // Blocks up to timeout; nullopt if still running
    std::optional<int> wait_for(std::chrono::milliseconds timeout);

    // SIGTERM to the group, SIGKILL after grace, then reap. Safe to repeat.
    void terminate(std::chrono::milliseconds grace);

    // Run to completion collecting output; throws TimeoutError past the deadline
    static CommandResult run(const ProcessOptions& options, std::chrono::milliseconds timeout);

private:
    void spawn(const ProcessOptions& options);
    bool fill_buffer(std::chrono::milliseconds wait);
    void close_fds();

    pid_t pid_ = -1;
    int out_fd_ = -1;
    int err_fd_ = -1;
    bool out_eof_ = false;
    std::string buffer_;

    std::mutex wait_mutex_;                     // Guards reaping and exit_code_
    std::optional<int> exit_code_;
};

} // namespace agentrun
