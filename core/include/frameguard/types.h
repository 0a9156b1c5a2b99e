#pragma once
#include "dataset.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace frameguard {

// Scalar request parameter (bound read-only as `params`).
using ParamValue = Cell;

struct ExecutionRequest {
    std::string request_id;       // caller-supplied tracing ID (optional)
    std::string source_code;
    Dataset dataset;
    std::map<std::string, ParamValue> parameters;
    std::vector<std::string> required_libraries;
};

struct PolicyViolation {
    std::string rule_id;
    std::string matched_text;
    int line{0};
    int column{0};
};

struct PolicyDecision {
    bool allowed{true};
    std::vector<PolicyViolation> violations;

    // One line per violation: "line 2:1 import_statement 'import'"
    std::string summary() const;
};

enum class ExecStatus {
    SUCCESS,
    POLICY_REJECTED,
    RUNTIME_ERROR,
    TIMEOUT,
    RESOURCE_EXCEEDED,
    MALFORMED_REQUEST,
    OVERLOADED,
};

const char* exec_status_to_str(ExecStatus st);
ExecStatus exec_status_from_str(const std::string& s);

struct ExecutionResult {
    ExecStatus status{ExecStatus::RUNTIME_ERROR};
    std::optional<Dataset> output_dataset;   // present iff SUCCESS
    std::string diagnostics;
    std::vector<PolicyViolation> violations; // POLICY_REJECTED only
    std::string console;                     // captured print() output
    int64_t duration_ms{0};

    bool ok() const { return status == ExecStatus::SUCCESS; }
};

// Per-execution resource budget.
struct ExecLimits {
    int timeout_ms{5000};
    int cpu_sec{10};
    size_t memory_mb{512};
    size_t output_max_bytes{8 * 1024 * 1024}; // child stdout (result JSON) cap
    size_t console_max_bytes{64 * 1024};      // print() cap inside the script
    size_t max_cells{5'000'000};              // elements per list/table/range
    uint64_t max_steps{0};                    // in-process backstop; 0 = unlimited
    bool enable_seccomp{true};
    bool unshare_network{true};               // best-effort; needs user namespaces
};

// What the parent sends to frameguard_workhost on stdin.
struct HostJob {
    std::string source_code;
    Dataset dataset;
    std::map<std::string, ParamValue> parameters;
    std::string frame_name{"dataframe"};
    size_t max_cells{5'000'000};
    size_t console_max_bytes{64 * 1024};
    uint64_t max_steps{0};
    bool enable_seccomp{true};
};

} // namespace frameguard
