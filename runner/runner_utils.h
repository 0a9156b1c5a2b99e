#pragma once

#include "frameguard/config.h"
#include "frameguard/gateway.h"
#include "frameguard/workbench.h"

#include <filesystem>
#include <string>

namespace frameguard {

// ---- Utility functions shared by the CLI commands ----

// Directory of the running binary (/proc/self/exe, argv[0] as fallback).
std::filesystem::path resolve_self_dir(const char* argv0);

// Configured workhost path, or frameguard_workhost next to the running binary.
std::string resolve_workhost_path(const char* argv0, const std::string& configured);

// false when the file cannot be read; *out holds the error message then.
bool slurp(const std::string& path, std::string* out, size_t max_bytes = 64ULL * 1024 * 1024);

WorkbenchOptions workbench_options_from(const ServiceConfig& cfg, const char* argv0);
GatewayOptions gateway_options_from(const ServiceConfig& cfg);

// Common startup: profile defaults, config load and validation, isolation
// check. Returns false (after printing why) when the process must not start.
bool prepare_service(const char* component, ServiceConfig* cfg);

std::string stats_to_json(const GatewayStats& s, const GatewayOptions& opt);
std::string stats_to_prometheus(const GatewayStats& s, const GatewayOptions& opt);

int64_t now_ms_i64();

} // namespace frameguard
