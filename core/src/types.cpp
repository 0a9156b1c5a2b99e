#include "frameguard/types.h"

#include <sstream>

namespace frameguard {

std::string PolicyDecision::summary() const {
    std::ostringstream oss;
    for (size_t i = 0; i < violations.size(); i++) {
        const auto& v = violations[i];
        if (i) oss << "\n";
        oss << "line " << v.line << ":" << v.column << " " << v.rule_id << " '" << v.matched_text << "'";
    }
    return oss.str();
}

const char* exec_status_to_str(ExecStatus st) {
    switch (st) {
        case ExecStatus::SUCCESS:           return "Success";
        case ExecStatus::POLICY_REJECTED:   return "PolicyRejected";
        case ExecStatus::RUNTIME_ERROR:     return "RuntimeError";
        case ExecStatus::TIMEOUT:           return "Timeout";
        case ExecStatus::RESOURCE_EXCEEDED: return "ResourceExceeded";
        case ExecStatus::MALFORMED_REQUEST: return "MalformedRequest";
        case ExecStatus::OVERLOADED:        return "Overloaded";
    }
    return "RuntimeError";
}

ExecStatus exec_status_from_str(const std::string& s) {
    if (s == "Success") return ExecStatus::SUCCESS;
    if (s == "PolicyRejected") return ExecStatus::POLICY_REJECTED;
    if (s == "Timeout") return ExecStatus::TIMEOUT;
    if (s == "ResourceExceeded") return ExecStatus::RESOURCE_EXCEEDED;
    if (s == "MalformedRequest") return ExecStatus::MALFORMED_REQUEST;
    if (s == "Overloaded") return ExecStatus::OVERLOADED;
    return ExecStatus::RUNTIME_ERROR;
}

} // namespace frameguard
