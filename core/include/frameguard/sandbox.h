#pragma once

// FrameGuard Sandbox: seccomp-BPF syscall allowlists.
//
// Allowlist-only. Any syscall not on the list kills the process with SIGSYS.
// Two profiles:
//   PROCESS  installed by proc.cpp in the forked child before exec. Covers
//            what the dynamic loader and a C++ runtime need to start; no
//            sockets, no ptrace, no mount/namespace/module syscalls.
//   COMPUTE  installed by the workhost after it has read its job and before
//            it interprets any script. Memory, signals, clocks and
//            read/write on already-open fds only; no open/openat, no
//            exec, no clone/fork, no sockets.
//
// Both reject mprotect(PROT_EXEC) and architectures other than the one the
// binary was built for.

#include <string>

namespace frameguard {

enum class SeccompProfile { PROCESS, COMPUTE };

const char* seccomp_profile_name(SeccompProfile p);

// Must be called AFTER prctl(PR_SET_NO_NEW_PRIVS, 1).
// Returns empty string on success, error message on failure.
// On non-Linux platforms, returns success (no-op).
std::string install_seccomp_filter(SeccompProfile profile);

// Check if seccomp is available on this system.
bool seccomp_available();

} // namespace frameguard
