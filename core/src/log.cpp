#include "frameguard/log.h"
#include "frameguard/json_mini.h"

#include <json-c/json.h>

#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace frameguard {

std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string source_digest(const std::string& source) {
    uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : source) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "fnv1a64:%016llx", (unsigned long long)h);
    return buf;
}

AuditLog::AuditLog(const std::string& path) : path_(path) {
    if (path_.empty()) return;
    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_.is_open()) error_ = std::string("cannot open audit log: ") + std::strerror(errno);
}

void AuditLog::record(const ExecutionRequest& req, const ExecutionResult& res) {
    if (!enabled()) return;

    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "ts", json_object_new_string(iso_now().c_str()));
    json_object_object_add(rec, "request_id", json_object_new_string(req.request_id.c_str()));
    json_object_object_add(rec, "status", json_object_new_string(exec_status_to_str(res.status)));
    json_object_object_add(rec, "source_digest", json_object_new_string(source_digest(req.source_code).c_str()));
    json_object_object_add(rec, "source_bytes", json_object_new_int64((int64_t)req.source_code.size()));
    json_object_object_add(rec, "rows_in", json_object_new_int64((int64_t)req.dataset.rows()));
    json_object_object_add(rec, "rows_out",
                           json_object_new_int64(res.output_dataset ? (int64_t)res.output_dataset->rows() : 0));
    json_object_object_add(rec, "duration_ms", json_object_new_int64(res.duration_ms));

    json_object* rules = json_object_new_array();
    for (const auto& v : res.violations) json_object_array_add(rules, json_object_new_string(v.rule_id.c_str()));
    json_object_object_add(rec, "rule_ids", rules);

    if (!res.ok() && !res.diagnostics.empty()) {
        std::string d = res.diagnostics.substr(0, 256);
        json_object_object_add(rec, "diagnostics", json_object_new_string_len(d.c_str(), (int)d.size()));
    }

    std::lock_guard<std::mutex> lk(mu_);
    json_object_object_add(rec, "seq", json_object_new_int64((int64_t)++seq_));
    out_ << json_mini::canonical(rec) << "\n";
    out_.flush();
    json_object_put(rec);
}

uint64_t AuditLog::records() const {
    std::lock_guard<std::mutex> lk(mu_);
    return seq_;
}

} // namespace frameguard
