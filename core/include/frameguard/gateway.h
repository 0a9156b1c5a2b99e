#pragma once

// Execution gateway: shape check -> library check -> policy scan -> executor.
// Denied requests never reach the executor. submit() runs requests on a fixed
// worker pool behind a bounded queue and answers Overloaded immediately when
// the queue is full.

#include "log.h"
#include "proc.h"
#include "types.h"
#include "workbench.h"
#include "worker_pool.h"

#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <string>

namespace frameguard {

class IExecutor {
public:
    virtual ~IExecutor() = default;
    virtual ExecutionResult run(const ExecutionRequest& req,
                                const ExecLimits& limits,
                                const CancelFn& cancel) = 0;
};

class WorkbenchExecutor final : public IExecutor {
public:
    explicit WorkbenchExecutor(const Workbench& wb) : wb_(wb) {}
    ExecutionResult run(const ExecutionRequest& req,
                        const ExecLimits& limits,
                        const CancelFn& cancel) override;

private:
    const Workbench& wb_;
};

struct GatewayOptions {
    size_t workers{4};
    size_t queue_capacity{16};
    size_t max_source_bytes{64 * 1024};
    ExecLimits limits;
};

struct GatewayStats {
    uint64_t received{0};
    uint64_t succeeded{0};
    uint64_t policy_rejected{0};
    uint64_t runtime_errors{0};
    uint64_t timeouts{0};
    uint64_t resource_exceeded{0};
    uint64_t malformed{0};
    uint64_t overloaded{0};
    uint64_t in_flight{0};
    uint64_t queued{0};
};

// Accepts both the preloaded binding names (pd, np, scipy) and the library
// names they stand for (pandas, numpy, scipy.stats).
bool is_known_library(const std::string& name);

class Gateway {
public:
    // `audit` may be null; it must outlive the gateway otherwise.
    Gateway(IExecutor& executor, GatewayOptions opt, AuditLog* audit = nullptr);
    ~Gateway();

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    // Runs on the calling thread.
    ExecutionResult handle(const ExecutionRequest& req, const CancelFn& cancel = CancelFn());

    // Runs on the worker pool. The future is already satisfied with
    // Overloaded when the queue is full or the gateway is shutting down.
    std::future<ExecutionResult> submit(ExecutionRequest req, CancelFn cancel = CancelFn());

    // Shape and policy checks only; nothing is executed.
    PolicyDecision screen(const std::string& source_code) const;

    GatewayStats stats() const;
    const GatewayOptions& options() const { return opt_; }

    // Refuses new work and waits for queued requests to finish.
    void shutdown();

private:
    // Empty when the request is well-formed.
    std::string validate(const ExecutionRequest& req) const;
    void account(const ExecutionRequest& req, const ExecutionResult& res);

    IExecutor& executor_;
    GatewayOptions opt_;
    AuditLog* audit_;
    WorkerPool pool_;

    std::atomic<uint64_t> received_{0};
    std::atomic<uint64_t> succeeded_{0};
    std::atomic<uint64_t> policy_rejected_{0};
    std::atomic<uint64_t> runtime_errors_{0};
    std::atomic<uint64_t> timeouts_{0};
    std::atomic<uint64_t> resource_exceeded_{0};
    std::atomic<uint64_t> malformed_{0};
    std::atomic<uint64_t> overloaded_{0};
    std::atomic<uint64_t> in_flight_{0};
};

} // namespace frameguard
