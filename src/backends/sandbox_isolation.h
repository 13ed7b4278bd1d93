#pragma once

#include "sandbox_backend.h"

#include <linux/filter.h>

#include <string>
#include <vector>

namespace agentrun {

struct IsolationPolicy {
    ResourceLimits limits;
    bool namespaces = true;         // Mount/UTS/IPC (and net when !allow_network)
    bool allow_network = true;
    bool syscall_filter = true;
};

// Process isolation for the local-container backend.
//
// Everything that allocates (the seccomp program) is prepared in the parent;
// apply_in_child() only makes syscalls so it is safe between fork and exec.
class SandboxIsolation {
public:
    // Throws ProvisionError if the syscall filter cannot be compiled
    explicit SandboxIsolation(const IsolationPolicy& policy);

    // Rlimits, namespaces, no_new_privs and the syscall filter.
    // Returns false (errno set) on the first failure.
    bool apply_in_child() const;

    const IsolationPolicy& policy() const { return policy_; }

    // Syscalls an agent never needs
    static const std::vector<std::string>& denied_syscalls();

    // Probe in a throwaway child whether unshare() is permitted here
    static bool namespaces_supported();

private:
    IsolationPolicy policy_;
    std::vector<struct sock_filter> program_;
};

} // namespace agentrun
