#pragma once

// Capability-restricted execution environment.
//
// evaluate() interprets a script in the calling process against a fresh
// namespace holding only the dataset, the read-only `params` dict, the
// Workshop libraries and the builtins. execute() does the same inside a
// frameguard_workhost child with rlimits, a scratch cwd, a scrubbed
// environment and seccomp, and kills it on timeout or cancellation.

#include "proc.h"
#include "types.h"
#include "workshop.h"

#include <map>
#include <string>

namespace frameguard {

struct WorkbenchOptions {
    std::string workhost_path{"frameguard_workhost"};
    std::string scratch_root{"/tmp"};
    std::string frame_name{"dataframe"};
};

class Workbench {
public:
    Workbench(const Workshop& workshop, WorkbenchOptions opt);

    // Child-process execution. Only reached after an allowed policy decision.
    ExecutionResult execute(const std::string& source_code,
                            const Dataset& dataset,
                            const std::map<std::string, ParamValue>& parameters,
                            const ExecLimits& limits,
                            const CancelFn& cancel = CancelFn()) const;

    // In-process interpretation; never throws script errors.
    ExecutionResult evaluate(const std::string& source_code,
                             const Dataset& dataset,
                             const std::map<std::string, ParamValue>& parameters,
                             const ExecLimits& limits,
                             bool* console_truncated = nullptr) const;

    const WorkbenchOptions& options() const { return opt_; }

private:
    const Workshop& workshop_;
    WorkbenchOptions opt_;
};

// Classifies a workhost killed by `sig` after `cpu_ms` of CPU time. SIGKILL
// counts as the CPU hard limit only once the child used its cpu_sec
// allowance; any other SIGKILL came from the kernel's memory accounting.
ExecStatus status_for_signal(int sig, long cpu_ms, int cpu_sec, std::string* diagnostics);

// Absolute paths become "<path>", control characters are dropped and the
// result is capped at max_len bytes.
std::string sanitize_diagnostic(const std::string& msg, size_t max_len = 2000);

} // namespace frameguard
