#pragma once
#include "types.h"

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace frameguard {

// "fnv1a64:<16 hex>" digest of submitted source; the audit trail never
// stores the source itself.
std::string source_digest(const std::string& source);

std::string iso_now();

// Append-only JSONL audit trail, one canonical (sorted-key) record per
// request. Thread-safe. Disabled when constructed with an empty path.
class AuditLog {
public:
    explicit AuditLog(const std::string& path);

    bool enabled() const { return out_.is_open(); }
    const std::string& path() const { return path_; }
    // Why the file could not be opened; empty otherwise.
    const std::string& error() const { return error_; }

    void record(const ExecutionRequest& req, const ExecutionResult& res);
    uint64_t records() const;

private:
    std::string path_;
    std::string error_;
    mutable std::mutex mu_;
    std::ofstream out_;
    uint64_t seq_{0};
};

} // namespace frameguard
