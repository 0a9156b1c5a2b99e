#pragma once

#include <functional>
#include <string>
#include <vector>

namespace frameguard {

struct ProcLimits {
    int timeout_ms{2000};
    size_t stdout_max_bytes{64 * 1024};

    int rlimit_cpu_sec{2};          // CPU time seconds
    size_t rlimit_as_mb{512};       // virtual memory MB
    size_t rlimit_fsize_mb{1};      // max file size MB
    int rlimit_nofile{16};          // max open fds
    int rlimit_nproc{0};            // max processes (0 = leave as is)

    bool no_new_privs{true};

    // PROCESS seccomp profile installed before exec. Skipped when an
    // operator wrapper is in use (the wrapper needs clone/mount).
    bool enable_seccomp{false};

    // Best-effort unshare(CLONE_NEWUSER | CLONE_NEWNET) in the child.
    bool unshare_network{false};

    // Child stderr joins stdout when true, goes to /dev/null otherwise.
    bool merge_stderr{true};

    // Complete child environment ("KEY=value"). Empty: PATH and LC_ALL only.
    std::vector<std::string> env;
};

struct ProcResult {
    int exit_code{127};
    int term_signal{0};         // signal that killed the child, 0 if it exited
    bool timed_out{false};
    bool cancelled{false};
    bool output_truncated{false};
    long duration_ms{0};
    long cpu_ms{0};             // user + system CPU time of the child
    std::string output;         // stdout (plus stderr when merged)
    std::string error;          // internal runner error, not child stderr
};

// Polled while the child runs; returning true kills the child.
using CancelFn = std::function<bool()>;

// Run a process (argv[0] is executable), capture output, enforce timeout and
// rlimits. The child gets its own process group; timeout and cancellation
// SIGKILL the whole group. Returns true if the process started.
bool proc_run_capture_sandboxed(const std::vector<std::string>& argv,
                                const std::string& cwd,
                                const ProcLimits& lim,
                                ProcResult* res);

// Same, writing stdin_data to the child's stdin while reading its output.
bool proc_run_capture_sandboxed_stdin(const std::vector<std::string>& argv,
                                      const std::string& cwd,
                                      const std::string& stdin_data,
                                      const ProcLimits& lim,
                                      ProcResult* res,
                                      const CancelFn& cancel = CancelFn());

// Small helper: split a command string into argv tokens.
// Supports basic quotes (single/double) and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

} // namespace frameguard
