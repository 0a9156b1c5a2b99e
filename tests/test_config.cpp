#include "test_common.h"
#include "frameguard/config.h"
#include <cstdlib>

static void clear_env() {
    for (const char* k : {"FRAMEGUARD_PROFILE", "FRAMEGUARD_SECCOMP_ENABLE", "FRAMEGUARD_UNSHARE_NET",
                          "FRAMEGUARD_REQUIRE_ISOLATION", "FRAMEGUARD_TIMEOUT_MS", "FRAMEGUARD_CPU_SEC",
                          "FRAMEGUARD_HOST", "FRAMEGUARD_PORT", "FRAMEGUARD_WORKERS", "FRAMEGUARD_QUEUE",
                          "FRAMEGUARD_ALLOW_CLIENTS", "FRAMEGUARD_FRAME_NAME", "FRAMEGUARD_SCRATCH_DIR",
                          "FRAMEGUARD_MEMORY_MB", "FRAMEGUARD_AUDIT_LOG"}) {
        unsetenv(k);
    }
}

int main() {
    clear_env();

    // Test 1: Default profile is DEV
    auto p = frameguard::detect_profile();
    expect_true(p == frameguard::Profile::DEV, "default should be DEV");

    // Test 2: PROD detection, case insensitive
    setenv("FRAMEGUARD_PROFILE", "PROD", 1);
    p = frameguard::detect_profile();
    expect_true(p == frameguard::Profile::PROD, "should detect PROD case-insensitive");
    setenv("FRAMEGUARD_PROFILE", "production", 1);
    expect_true(frameguard::detect_profile() == frameguard::Profile::PROD, "production alias");
    setenv("FRAMEGUARD_PROFILE", "staging", 1);
    expect_true(frameguard::detect_profile() == frameguard::Profile::DEV, "unknown falls back to DEV");

    // Test 3: Apply defaults (won't override existing)
    setenv("FRAMEGUARD_TIMEOUT_MS", "1234", 1);
    frameguard::apply_profile_defaults(frameguard::Profile::PROD);
    std::string val = std::getenv("FRAMEGUARD_TIMEOUT_MS") ? std::getenv("FRAMEGUARD_TIMEOUT_MS") : "";
    expect_true(val == "1234", "should NOT override pre-existing env var");

    // Test 4: PROD is strict
    auto cfg = frameguard::load_service_config();
    expect_true(cfg.limits.enable_seccomp, "PROD enables seccomp");
    expect_true(cfg.limits.unshare_network, "PROD unshares the network");
    expect_true(cfg.require_isolation, "PROD requires isolation");
    expect_eq_ll(cfg.limits.timeout_ms, 1234, "explicit timeout kept");
    expect_eq_ll(cfg.limits.cpu_sec, 10, "PROD CPU budget");
    expect_true(cfg.host == "127.0.0.1", "loopback by default");

    // Test 5: DEV is lenient
    clear_env();
    frameguard::apply_profile_defaults(frameguard::Profile::DEV);
    cfg = frameguard::load_service_config();
    expect_true(!cfg.limits.enable_seccomp, "DEV leaves seccomp off");
    expect_true(!cfg.require_isolation, "DEV does not require isolation");
    expect_eq_ll(cfg.limits.timeout_ms, 10000, "DEV timeout");

    // Test 6: typed parsing, bad numbers fall back to defaults
    setenv("FRAMEGUARD_PORT", "9100", 1);
    setenv("FRAMEGUARD_WORKERS", "abc", 1);
    setenv("FRAMEGUARD_QUEUE", "0", 1);
    setenv("FRAMEGUARD_MEMORY_MB", "1", 1);
    setenv("FRAMEGUARD_ALLOW_CLIENTS", " 127.0.0.1 , 10.0.0.2,,", 1);
    cfg = frameguard::load_service_config();
    expect_eq_ll(cfg.port, 9100, "port parsed");
    expect_eq_ll((long long)cfg.workers, 4, "bad number keeps default");
    expect_eq_ll((long long)cfg.queue_capacity, 0, "zero queue allowed");
    expect_eq_ll((long long)cfg.limits.memory_mb, 16, "memory floor");
    expect_eq_ll((long long)cfg.allow_clients.size(), 2, "allowlist split and trimmed");
    expect_true(cfg.allow_clients[1] == "10.0.0.2", "allowlist entry");
    expect_true(frameguard::validate_service_config(cfg).empty(), "valid config");

    // Test 7: validation
    frameguard::ServiceConfig bad = cfg;
    bad.port = 70000;
    expect_true(!frameguard::validate_service_config(bad).empty(), "port out of range");
    bad = cfg;
    for (const char* name : {"params", "np", "print", "for", "open", "1df", "a-b", "__x"}) {
        bad.frame_name = name;
        expect_true(!frameguard::validate_service_config(bad).empty(), std::string("frame name rejected: ") + name);
    }
    bad.frame_name = "df";
    expect_true(frameguard::validate_service_config(bad).empty(), "plain frame name accepted");
    bad.scratch_root = "relative/dir";
    expect_true(!frameguard::validate_service_config(bad).empty(), "relative scratch rejected");

    // Test 8: Profile name
    expect_true(std::string(frameguard::profile_name(frameguard::Profile::DEV)) == "dev", "dev name");
    expect_true(std::string(frameguard::profile_name(frameguard::Profile::PROD)) == "prod", "prod name");

    clear_env();
    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}
