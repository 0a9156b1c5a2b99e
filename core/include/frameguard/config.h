#pragma once
#include "types.h"

#include <string>
#include <vector>

namespace frameguard {

enum class Profile { DEV, PROD };

// Detect profile from FRAMEGUARD_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: lenient (no seccomp, isolation not required, generous timeouts)
// PROD: strict (seccomp on, network unshare, isolation required, tight timeouts)
void apply_profile_defaults(Profile p);

struct ServiceConfig {
    Profile profile{Profile::DEV};

    // HTTP surface
    std::string host{"127.0.0.1"};
    int port{8000};
    std::string api_token;                 // empty: no token required (loopback only)
    std::vector<std::string> allow_clients; // peer IPs; empty: any
    size_t max_body_bytes{16 * 1024 * 1024};
    int max_conns{32};
    int socket_timeout_ms{30000};

    // Gateway
    size_t workers{4};
    size_t queue_capacity{16};
    size_t max_source_bytes{64 * 1024};

    // Workbench
    std::string workhost_path;             // empty: next to the running binary
    std::string scratch_root{"/tmp"};
    std::string frame_name{"dataframe"};
    ExecLimits limits;

    bool require_isolation{false};
    std::string audit_log_path;            // empty: audit trail disabled
};

// Reads FRAMEGUARD_* variables (after apply_profile_defaults).
ServiceConfig load_service_config();

// Empty string when usable; otherwise the first problem found.
std::string validate_service_config(const ServiceConfig& cfg);

} // namespace frameguard
