#include "runner_utils.h"

#include "frameguard/isolation.h"
#include "frameguard/json_mini.h"

#include <json-c/json.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace frameguard {

std::filesystem::path resolve_self_dir(const char* argv0) {
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec && !exe.empty()) return exe.parent_path();
    std::filesystem::path p = argv0 ? argv0 : "";
    auto abs = std::filesystem::absolute(p, ec);
    if (ec) return std::filesystem::current_path();
    return abs.parent_path();
}

std::string resolve_workhost_path(const char* argv0, const std::string& configured) {
    if (!configured.empty()) return configured;
    return (resolve_self_dir(argv0) / "frameguard_workhost").string();
}

bool slurp(const std::string& path, std::string* out, size_t max_bytes) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        *out = "cannot open " + path;
        return false;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    std::string s = ss.str();
    if (s.size() > max_bytes) {
        *out = path + " exceeds " + std::to_string(max_bytes) + " bytes";
        return false;
    }
    *out = std::move(s);
    return true;
}

WorkbenchOptions workbench_options_from(const ServiceConfig& cfg, const char* argv0) {
    WorkbenchOptions o;
    o.workhost_path = resolve_workhost_path(argv0, cfg.workhost_path);
    o.scratch_root = cfg.scratch_root;
    o.frame_name = cfg.frame_name;
    return o;
}

GatewayOptions gateway_options_from(const ServiceConfig& cfg) {
    GatewayOptions o;
    o.workers = cfg.workers;
    o.queue_capacity = cfg.queue_capacity;
    o.max_source_bytes = cfg.max_source_bytes;
    o.limits = cfg.limits;
    return o;
}

bool prepare_service(const char* component, ServiceConfig* cfg) {
    const Profile profile = detect_profile();
    apply_profile_defaults(profile);
    *cfg = load_service_config();

    std::string err = validate_service_config(*cfg);
    if (!err.empty()) {
        std::cerr << "[" << component << "] invalid configuration: " << err << "\n";
        return false;
    }

    IsolationReport rep = check_isolation(cfg->scratch_root);
    std::cerr << "[" << component << "] profile=" << profile_name(profile) << " isolation: " << rep.summary() << "\n";
    if (!rep.ok()) {
        if (cfg->require_isolation) {
            std::cerr << "[" << component << "] isolation required but not met: " << rep.failures() << "\n";
            return false;
        }
        std::cerr << "[WARN] isolation not met (" << rep.failures() << "); continuing because "
                  << "FRAMEGUARD_REQUIRE_ISOLATION=0\n";
    }
    if (cfg->limits.enable_seccomp && !rep.seccomp_available) {
        std::cerr << "[" << component << "] FRAMEGUARD_SECCOMP_ENABLE=1 but seccomp is unavailable\n";
        return false;
    }
    return true;
}

std::string stats_to_json(const GatewayStats& s, const GatewayOptions& opt) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "received", json_object_new_int64((int64_t)s.received));
    json_object_object_add(o, "succeeded", json_object_new_int64((int64_t)s.succeeded));
    json_object_object_add(o, "policy_rejected", json_object_new_int64((int64_t)s.policy_rejected));
    json_object_object_add(o, "runtime_errors", json_object_new_int64((int64_t)s.runtime_errors));
    json_object_object_add(o, "timeouts", json_object_new_int64((int64_t)s.timeouts));
    json_object_object_add(o, "resource_exceeded", json_object_new_int64((int64_t)s.resource_exceeded));
    json_object_object_add(o, "malformed", json_object_new_int64((int64_t)s.malformed));
    json_object_object_add(o, "overloaded", json_object_new_int64((int64_t)s.overloaded));
    json_object_object_add(o, "in_flight", json_object_new_int64((int64_t)s.in_flight));
    json_object_object_add(o, "queued", json_object_new_int64((int64_t)s.queued));
    json_object_object_add(o, "workers", json_object_new_int64((int64_t)opt.workers));
    json_object_object_add(o, "queue_capacity", json_object_new_int64((int64_t)opt.queue_capacity));
    std::string out = json_mini::canonical(o);
    json_object_put(o);
    return out;
}

std::string stats_to_prometheus(const GatewayStats& s, const GatewayOptions& opt) {
    std::ostringstream m;
    m << "# HELP frameguard_requests_total Requests received\n";
    m << "# TYPE frameguard_requests_total counter\n";
    m << "frameguard_requests_total " << s.received << "\n";
    m << "# HELP frameguard_results_total Requests finished, by status\n";
    m << "# TYPE frameguard_results_total counter\n";
    m << "frameguard_results_total{status=\"Success\"} " << s.succeeded << "\n";
    m << "frameguard_results_total{status=\"PolicyRejected\"} " << s.policy_rejected << "\n";
    m << "frameguard_results_total{status=\"RuntimeError\"} " << s.runtime_errors << "\n";
    m << "frameguard_results_total{status=\"Timeout\"} " << s.timeouts << "\n";
    m << "frameguard_results_total{status=\"ResourceExceeded\"} " << s.resource_exceeded << "\n";
    m << "frameguard_results_total{status=\"MalformedRequest\"} " << s.malformed << "\n";
    m << "frameguard_results_total{status=\"Overloaded\"} " << s.overloaded << "\n";
    m << "# HELP frameguard_in_flight Requests currently being handled\n";
    m << "# TYPE frameguard_in_flight gauge\n";
    m << "frameguard_in_flight " << s.in_flight << "\n";
    m << "# HELP frameguard_queue_size Requests waiting for a worker\n";
    m << "# TYPE frameguard_queue_size gauge\n";
    m << "frameguard_queue_size " << s.queued << "\n";
    m << "# HELP frameguard_queue_capacity Maximum waiting requests\n";
    m << "# TYPE frameguard_queue_capacity gauge\n";
    m << "frameguard_queue_capacity " << opt.queue_capacity << "\n";
    m << "# HELP frameguard_workers_configured Number of worker threads\n";
    m << "# TYPE frameguard_workers_configured gauge\n";
    m << "frameguard_workers_configured " << opt.workers << "\n";
    return m.str();
}

int64_t now_ms_i64() {
    return (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

} // namespace frameguard
