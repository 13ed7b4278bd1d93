#include "sandbox_isolation.h"
#include "errors.h"

#include <errno.h>
#include <linux/seccomp.h>
#include <sched.h>
#include <seccomp.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cstdio>
#include <iostream>

namespace agentrun {

namespace {

bool set_limit(int resource, rlim_t value) {
    struct rlimit limit;
    limit.rlim_cur = limit.rlim_max = value;
    return setrlimit(resource, &limit) == 0;
}

std::vector<struct sock_filter> compile_filter() {
    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
    if (!ctx) {
        throw ProvisionError("seccomp_init failed");
    }

    for (const auto& name : SandboxIsolation::denied_syscalls()) {
        int nr = seccomp_syscall_resolve_name(name.c_str());
        if (nr == __NR_SCMP_ERROR) {
            continue;   // Not present on this architecture
        }
        int rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), nr, 0);
        if (rc < 0) {
            seccomp_release(ctx);
            throw ProvisionError("seccomp rule for " + name + " failed: " + std::to_string(rc));
        }
    }

    FILE* out = tmpfile();
    if (!out) {
        seccomp_release(ctx);
        throw ProvisionError("cannot export seccomp program");
    }
    int rc = seccomp_export_bpf(ctx, fileno(out));
    seccomp_release(ctx);
    if (rc < 0) {
        fclose(out);
        throw ProvisionError("seccomp_export_bpf failed: " + std::to_string(rc));
    }

    std::vector<struct sock_filter> program;
    rewind(out);
    struct sock_filter instruction;
    while (fread(&instruction, sizeof(instruction), 1, out) == 1) {
        program.push_back(instruction);
    }
    fclose(out);

    if (program.empty()) {
        throw ProvisionError("seccomp program is empty");
    }
    return program;
}

} // namespace

SandboxIsolation::SandboxIsolation(const IsolationPolicy& policy) : policy_(policy) {
    if (policy_.syscall_filter) {
        program_ = compile_filter();
    }
}

const std::vector<std::string>& SandboxIsolation::denied_syscalls() {
    static const std::vector<std::string> denied = {
        "ptrace", "process_vm_readv", "process_vm_writev",
        "mount", "umount2", "pivot_root", "chroot", "setns",
        "reboot", "kexec_load", "kexec_file_load",
        "init_module", "finit_module", "delete_module",
        "swapon", "swapoff", "acct",
        "settimeofday", "clock_settime", "adjtimex",
        "bpf", "perf_event_open", "keyctl", "add_key", "request_key"
    };
    return denied;
}

bool SandboxIsolation::apply_in_child() const {
    const ResourceLimits& limits = policy_.limits;

    if (!set_limit(RLIMIT_AS, static_cast<rlim_t>(limits.memory_mb) * 1024 * 1024) ||
        !set_limit(RLIMIT_CPU, limits.cpu_time_sec) ||
        !set_limit(RLIMIT_FSIZE, static_cast<rlim_t>(limits.max_file_size_mb) * 1024 * 1024) ||
        !set_limit(RLIMIT_NPROC, limits.max_processes) ||
        !set_limit(RLIMIT_NOFILE, limits.max_open_files)) {
        return false;
    }

    if (policy_.namespaces) {
        int flags = CLONE_NEWNS | CLONE_NEWUTS | CLONE_NEWIPC;
        if (!policy_.allow_network) {
            flags |= CLONE_NEWNET;
        }
        if (unshare(flags) != 0) {
            return false;
        }
    }

    if (!program_.empty()) {
        if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
            return false;
        }
        struct sock_fprog prog;
        prog.len = static_cast<unsigned short>(program_.size());
        prog.filter = const_cast<struct sock_filter*>(program_.data());
        if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog) != 0) {
            return false;
        }
    }
    return true;
}

bool SandboxIsolation::namespaces_supported() {
    pid_t pid = fork();
    if (pid == 0) {
        _exit(unshare(CLONE_NEWNS | CLONE_NEWUTS | CLONE_NEWIPC) == 0 ? 0 : 1);
    } else if (pid > 0) {
        int status = 0;
        waitpid(pid, &status, 0);
        return WIFEXITED(status) && WEXITSTATUS(status) == 0;
    }
    std::cerr << "[LocalContainer] Namespace probe failed to fork" << std::endl;
    return false;
}

} // namespace agentrun
