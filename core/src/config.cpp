#include "frameguard/config.h"
#include "frameguard/lexer.h"
#include "frameguard/scanner.h"
#include "frameguard/workshop.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace frameguard {

Profile detect_profile() {
    const char* env = std::getenv("FRAMEGUARD_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any worker threads are created.
    // setenv() is not thread-safe with getenv() on some platforms.
    // overwrite=0: won't override existing env vars
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("FRAMEGUARD_SECCOMP_ENABLE",     "0",     NO_OVERWRITE);
            setenv("FRAMEGUARD_UNSHARE_NET",        "0",     NO_OVERWRITE);
            setenv("FRAMEGUARD_REQUIRE_ISOLATION",  "0",     NO_OVERWRITE);
            setenv("FRAMEGUARD_TIMEOUT_MS",         "10000", NO_OVERWRITE);
            setenv("FRAMEGUARD_CPU_SEC",            "20",    NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("FRAMEGUARD_SECCOMP_ENABLE",     "1",     NO_OVERWRITE);
            setenv("FRAMEGUARD_UNSHARE_NET",        "1",     NO_OVERWRITE);
            setenv("FRAMEGUARD_REQUIRE_ISOLATION",  "1",     NO_OVERWRITE);
            setenv("FRAMEGUARD_TIMEOUT_MS",         "5000",  NO_OVERWRITE);
            setenv("FRAMEGUARD_CPU_SEC",            "10",    NO_OVERWRITE);
            // a shared secret is expected in front of anything non-loopback
            setenv("FRAMEGUARD_HOST",               "127.0.0.1", NO_OVERWRITE);
            break;
    }
}

namespace {

std::string env_str(const char* k, const std::string& defv) {
    const char* e = std::getenv(k);
    return e ? std::string(e) : defv;
}

int64_t env_i64(const char* k, int64_t defv) {
    const char* e = std::getenv(k);
    if (!e || !*e) return defv;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(e, &end, 10);
    if (errno != 0 || end == e || *end != '\0') return defv;
    return (int64_t)v;
}

bool env_bool(const char* k, bool defv) {
    const char* e = std::getenv(k);
    if (!e) return defv;
    std::string s = e;
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return defv;
}

std::vector<std::string> env_list(const char* k) {
    std::vector<std::string> out;
    const char* e = std::getenv(k);
    if (!e) return out;
    std::stringstream ss(e);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

bool is_identifier(const std::string& s) {
    if (s.empty() || !(std::isalpha((unsigned char)s[0]) || s[0] == '_')) return false;
    for (char c : s) {
        if (!(std::isalnum((unsigned char)c) || c == '_')) return false;
    }
    return s.compare(0, 2, "__") != 0;
}

} // namespace

ServiceConfig load_service_config() {
    ServiceConfig c;
    c.profile = detect_profile();

    c.host = env_str("FRAMEGUARD_HOST", c.host);
    c.port = (int)env_i64("FRAMEGUARD_PORT", c.port);
    c.api_token = env_str("FRAMEGUARD_API_TOKEN", "");
    c.allow_clients = env_list("FRAMEGUARD_ALLOW_CLIENTS");
    c.max_body_bytes = (size_t)std::max<int64_t>(1024, env_i64("FRAMEGUARD_MAX_BODY_BYTES", (int64_t)c.max_body_bytes));
    c.max_conns = (int)std::max<int64_t>(1, env_i64("FRAMEGUARD_MAX_CONNS", c.max_conns));
    c.socket_timeout_ms = (int)std::max<int64_t>(100, env_i64("FRAMEGUARD_SOCKET_TIMEOUT_MS", c.socket_timeout_ms));

    c.workers = (size_t)std::max<int64_t>(1, env_i64("FRAMEGUARD_WORKERS", (int64_t)c.workers));
    c.queue_capacity = (size_t)std::max<int64_t>(0, env_i64("FRAMEGUARD_QUEUE", (int64_t)c.queue_capacity));
    c.max_source_bytes = (size_t)std::max<int64_t>(1, env_i64("FRAMEGUARD_MAX_SOURCE_BYTES", (int64_t)c.max_source_bytes));

    c.workhost_path = env_str("FRAMEGUARD_WORKHOST", "");
    c.scratch_root = env_str("FRAMEGUARD_SCRATCH_DIR", c.scratch_root);
    c.frame_name = env_str("FRAMEGUARD_FRAME_NAME", c.frame_name);

    ExecLimits& l = c.limits;
    l.timeout_ms = (int)std::max<int64_t>(1, env_i64("FRAMEGUARD_TIMEOUT_MS", l.timeout_ms));
    l.cpu_sec = (int)std::max<int64_t>(1, env_i64("FRAMEGUARD_CPU_SEC", l.cpu_sec));
    l.memory_mb = (size_t)std::max<int64_t>(16, env_i64("FRAMEGUARD_MEMORY_MB", (int64_t)l.memory_mb));
    l.output_max_bytes = (size_t)std::max<int64_t>(1024, env_i64("FRAMEGUARD_OUTPUT_MAX_BYTES", (int64_t)l.output_max_bytes));
    l.console_max_bytes = (size_t)std::max<int64_t>(0, env_i64("FRAMEGUARD_CONSOLE_MAX_BYTES", (int64_t)l.console_max_bytes));
    l.max_cells = (size_t)std::max<int64_t>(1, env_i64("FRAMEGUARD_MAX_CELLS", (int64_t)l.max_cells));
    l.max_steps = (uint64_t)std::max<int64_t>(0, env_i64("FRAMEGUARD_MAX_STEPS", (int64_t)l.max_steps));
    l.enable_seccomp = env_bool("FRAMEGUARD_SECCOMP_ENABLE", l.enable_seccomp);
    l.unshare_network = env_bool("FRAMEGUARD_UNSHARE_NET", l.unshare_network);

    c.require_isolation = env_bool("FRAMEGUARD_REQUIRE_ISOLATION", c.require_isolation);
    c.audit_log_path = env_str("FRAMEGUARD_AUDIT_LOG", "");
    return c;
}

std::string validate_service_config(const ServiceConfig& cfg) {
    if (cfg.port <= 0 || cfg.port > 65535) return "port out of range: " + std::to_string(cfg.port);
    if (!is_identifier(cfg.frame_name)) return "frame name is not a plain identifier: " + cfg.frame_name;
    if (cfg.frame_name == "params" || is_keyword(cfg.frame_name) || is_denied_identifier(cfg.frame_name)) return "frame name is reserved: " + cfg.frame_name;
    const Workshop& ws = Workshop::initialize();
    if (ws.get(cfg.frame_name) || ws.builtin(cfg.frame_name)) {
        return "frame name shadows a preloaded name: " + cfg.frame_name;
    }
    if (cfg.scratch_root.empty() || cfg.scratch_root[0] != '/') return "scratch directory must be absolute";
    return "";
}

} // namespace frameguard
