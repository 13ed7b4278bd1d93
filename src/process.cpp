#include "process.h"
#include "constants.h"
#include "errors.h"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <thread>

extern char** environ;

namespace agentrun {

namespace {

int exit_code_from_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

std::vector<std::string> build_environment(const ProcessOptions& options) {
    std::map<std::string, std::string> merged;
    if (options.inherit_env) {
        for (char** e = environ; e && *e; ++e) {
            std::string entry(*e);
            size_t eq = entry.find('=');
            if (eq != std::string::npos) {
                merged[entry.substr(0, eq)] = entry.substr(eq + 1);
            }
        }
    }
    for (const auto& [key, value] : options.env) {
        merged[key] = value;
    }

    std::vector<std::string> env;
    env.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        env.push_back(key + "=" + value);
    }
    return env;
}

} // namespace

Process::Process(const ProcessOptions& options) {
    spawn(options);
}

Process::~Process() {
    terminate(std::chrono::milliseconds(0));
    close_fds();
}

void Process::spawn(const ProcessOptions& options) {
    if (options.argv.empty()) {
        throw std::invalid_argument("Process requires a command");
    }

    // Everything the child needs is prepared before fork
    std::vector<std::string> env_strings = build_environment(options);
    std::vector<char*> argv;
    for (const auto& arg : options.argv) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);
    std::vector<char*> envp;
    for (const auto& entry : env_strings) envp.push_back(const_cast<char*>(entry.c_str()));
    envp.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};    // Reports exec failure to the parent

    if (pipe2(out_pipe, O_CLOEXEC) == -1 ||
        (!options.merge_stderr && pipe2(err_pipe, O_CLOEXEC) == -1) ||
        pipe2(exec_pipe, O_CLOEXEC) == -1) {
        int err = errno;
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1], exec_pipe[0], exec_pipe[1]}) {
            if (fd >= 0) close(fd);
        }
        throw std::runtime_error(std::string("pipe: ") + strerror(err));
    }

    pid_t pid = fork();
    if (pid == -1) {
        int err = errno;
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1], exec_pipe[0], exec_pipe[1]}) {
            if (fd >= 0) close(fd);
        }
        throw std::runtime_error(std::string("fork: ") + strerror(err));
    }

    if (pid == 0) {
        // Child
        setpgid(0, 0);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(options.merge_stderr ? out_pipe[1] : err_pipe[1], STDERR_FILENO);

        auto die = [&](int err) {
            ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        };

        if (!options.working_dir.empty() && chdir(options.working_dir.c_str()) != 0) {
            die(errno);
        }
        if (options.child_setup && !options.child_setup()) {
            die(errno ? errno : EPERM);
        }
        execvpe(argv[0], argv.data(), envp.data());
        die(errno);
    }

    // Parent
    pid_ = pid;
    setpgid(pid, pid);   // Also done in the child; whichever runs first wins
    close(out_pipe[1]);
    out_fd_ = out_pipe[0];
    if (!options.merge_stderr) {
        close(err_pipe[1]);
        err_fd_ = err_pipe[0];
    }
    close(exec_pipe[1]);

    int child_errno = 0;
    ssize_t n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    close(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        waitpid(pid_, &status, 0);
        exit_code_ = exit_code_from_status(status);
        close_fds();
        throw std::runtime_error("exec " + options.argv[0] + ": " + strerror(child_errno));
    }
}

bool Process::fill_buffer(std::chrono::milliseconds wait) {
    if (out_fd_ < 0 || out_eof_) return false;

    struct pollfd pfd;
    pfd.fd = out_fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int ready = poll(&pfd, 1, static_cast<int>(wait.count()));
    if (ready < 0) {
        if (errno == EINTR) return false;
        out_eof_ = true;
        return false;
    }
    if (ready == 0) return false;

    char buf[PIPE_BUFFER_SIZE];
    ssize_t n = read(out_fd_, buf, sizeof(buf));
    if (n <= 0) {
        if (n < 0 && (errno == EINTR || errno == EAGAIN)) return false;
        out_eof_ = true;
        return false;
    }
    buffer_.append(buf, n);
    return true;
}

Process::ReadStatus Process::read_line(std::string& line, std::chrono::milliseconds wait) {
    auto deadline = std::chrono::steady_clock::now() + wait;

    while (true) {
        size_t nl = buffer_.find('\n');
        if (nl != std::string::npos) {
            line = buffer_.substr(0, nl);
            buffer_.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return ReadStatus::LINE;
        }
        if (buffer_.size() >= MAX_LINE_LENGTH) {
            line = buffer_.substr(0, MAX_LINE_LENGTH);
            buffer_.erase(0, MAX_LINE_LENGTH);
            return ReadStatus::LINE;
        }
        if (out_eof_) {
            if (!buffer_.empty()) {
                line.swap(buffer_);
                buffer_.clear();
                return ReadStatus::LINE;
            }
            return ReadStatus::END;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return ReadStatus::IDLE;
        fill_buffer(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
    }
}

std::optional<int> Process::try_wait() {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    if (exit_code_) return exit_code_;
    if (pid_ <= 0) return std::nullopt;

    int status = 0;
    pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
        exit_code_ = exit_code_from_status(status);
    } else if (r < 0 && errno == ECHILD) {
        exit_code_ = -1;
    }
    return exit_code_;
}

std::optional<int> Process::wait_for(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (auto code = try_wait()) return code;
        if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

void Process::terminate(std::chrono::milliseconds grace) {
    if (pid_ <= 0 || try_wait()) return;

    // Negative pid signals the whole group so agent subprocesses die too
    if (kill(-pid_, SIGTERM) != 0 && errno == ESRCH) {
        kill(pid_, SIGTERM);
    }
    if (grace.count() > 0 && wait_for(grace)) return;

    kill(-pid_, SIGKILL);
    kill(pid_, SIGKILL);
    if (!wait_for(std::chrono::seconds(5))) {
        std::cerr << "[Process] pid " << pid_ << " did not exit after SIGKILL" << std::endl;
    }
}

void Process::close_fds() {
    if (out_fd_ >= 0) {
        close(out_fd_);
        out_fd_ = -1;
    }
    if (err_fd_ >= 0) {
        close(err_fd_);
        err_fd_ = -1;
    }
}

CommandResult Process::run(const ProcessOptions& options, std::chrono::milliseconds timeout) {
    Process process(options);
    auto deadline = std::chrono::steady_clock::now() + timeout;

    CommandResult result;
    bool out_open = process.out_fd_ >= 0;
    bool err_open = process.err_fd_ >= 0;
    char buf[PIPE_BUFFER_SIZE];

    while (out_open || err_open) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            process.terminate(std::chrono::milliseconds(0));
            throw TimeoutError(options.argv[0] + " after " +
                               std::to_string(timeout.count()) + "ms");
        }

        struct pollfd pfds[2];
        int count = 0;
        if (out_open) pfds[count++] = {process.out_fd_, POLLIN, 0};
        if (err_open) pfds[count++] = {process.err_fd_, POLLIN, 0};

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int ready = poll(pfds, count, static_cast<int>(std::min<long long>(remaining.count(), DELIVERY_POLL_MS)));
        if (ready < 0 && errno != EINTR) break;
        if (ready <= 0) continue;

        for (int i = 0; i < count; i++) {
            if (!(pfds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = read(pfds[i].fd, buf, sizeof(buf));
            bool is_out = pfds[i].fd == process.out_fd_;
            if (n <= 0) {
                if (n < 0 && errno == EINTR) continue;
                if (is_out) out_open = false; else err_open = false;
                continue;
            }
            (is_out ? result.output : result.error_output).append(buf, n);
        }
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    auto code = process.wait_for(std::max(remaining, std::chrono::milliseconds(0)));
    if (!code) {
        process.terminate(std::chrono::milliseconds(0));
        throw TimeoutError(options.argv[0] + " after " + std::to_string(timeout.count()) + "ms");
    }
    result.exit_code = *code;
    return result;
}

} // namespace agentrun
