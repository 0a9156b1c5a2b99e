#include "frameguard/gateway.h"

#include "frameguard/scanner.h"
#include "frameguard/workshop.h"

#include <chrono>
#include <exception>

namespace frameguard {

namespace {

int64_t ms_since(std::chrono::steady_clock::time_point t0) {
    return (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();
}

ExecutionResult rejected(ExecStatus st, const std::string& diag) {
    ExecutionResult r;
    r.status = st;
    r.diagnostics = diag;
    return r;
}

} // namespace

ExecutionResult WorkbenchExecutor::run(const ExecutionRequest& req,
                                       const ExecLimits& limits,
                                       const CancelFn& cancel) {
    return wb_.execute(req.source_code, req.dataset, req.parameters, limits, cancel);
}

bool is_known_library(const std::string& name) {
    if (name == "pandas" || name == "numpy" || name == "scipy.stats") return true;
    return Workshop::initialize().get(name) != nullptr;
}

Gateway::Gateway(IExecutor& executor, GatewayOptions opt, AuditLog* audit)
    : executor_(executor), opt_(std::move(opt)), audit_(audit),
      pool_(opt_.workers, opt_.queue_capacity) {}

Gateway::~Gateway() { shutdown(); }

void Gateway::shutdown() { pool_.shutdown(); }

std::string Gateway::validate(const ExecutionRequest& req) const {
    bool blank = true;
    for (char c : req.source_code) {
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') { blank = false; break; }
    }
    if (blank) return "code_snippet is empty";

    std::string shape = req.dataset.check_shape();
    if (!shape.empty()) return "dataset is malformed: " + shape;
    if (req.dataset.cell_count() > opt_.limits.max_cells) {
        return "dataset has " + std::to_string(req.dataset.cell_count()) + " cells, limit is " +
               std::to_string(opt_.limits.max_cells);
    }
    for (const auto& kv : req.parameters) {
        if (kv.first.empty()) return "parameter name is empty";
    }
    return "";
}

PolicyDecision Gateway::screen(const std::string& source_code) const {
    ScanOptions so;
    so.max_source_bytes = opt_.max_source_bytes;
    return scan(source_code, so);
}

ExecutionResult Gateway::handle(const ExecutionRequest& req, const CancelFn& cancel) {
    const auto t0 = std::chrono::steady_clock::now();
    received_.fetch_add(1);
    in_flight_.fetch_add(1);

    ExecutionResult res;
    std::string bad = validate(req);
    if (!bad.empty()) {
        res = rejected(ExecStatus::MALFORMED_REQUEST, bad);
    } else {
        PolicyDecision decision;
        for (const auto& lib : req.required_libraries) {
            if (!is_known_library(lib)) {
                decision.allowed = false;
                decision.violations.push_back(PolicyViolation{"unknown_library", lib, 0, 0});
            }
        }
        if (decision.allowed) decision = screen(req.source_code);

        if (!decision.allowed) {
            res = rejected(ExecStatus::POLICY_REJECTED, decision.summary());
            res.violations = decision.violations;
        } else {
            try {
                res = executor_.run(req, opt_.limits, cancel);
            } catch (const std::exception& e) {
                res = rejected(ExecStatus::RUNTIME_ERROR, std::string("executor failed: ") + e.what());
            }
        }
    }
    if (res.duration_ms == 0) res.duration_ms = ms_since(t0);

    in_flight_.fetch_sub(1);
    account(req, res);
    return res;
}

std::future<ExecutionResult> Gateway::submit(ExecutionRequest req, CancelFn cancel) {
    auto promise = std::make_shared<std::promise<ExecutionResult>>();
    std::future<ExecutionResult> fut = promise->get_future();
    auto shared_req = std::make_shared<ExecutionRequest>(std::move(req));

    bool queued = pool_.try_submit([this, promise, shared_req, cancel] {
        try {
            promise->set_value(handle(*shared_req, cancel));
        } catch (const std::exception& e) {
            promise->set_value(rejected(ExecStatus::RUNTIME_ERROR, std::string("internal error: ") + e.what()));
        }
    });
    if (!queued) {
        received_.fetch_add(1);
        ExecutionResult r = rejected(ExecStatus::OVERLOADED,
                                     "server busy: " + std::to_string(opt_.workers) + " workers and " +
                                     std::to_string(opt_.queue_capacity) + " queue slots in use");
        account(*shared_req, r);
        promise->set_value(std::move(r));
    }
    return fut;
}

void Gateway::account(const ExecutionRequest& req, const ExecutionResult& res) {
    switch (res.status) {
        case ExecStatus::SUCCESS: succeeded_.fetch_add(1); break;
        case ExecStatus::POLICY_REJECTED: policy_rejected_.fetch_add(1); break;
        case ExecStatus::RUNTIME_ERROR: runtime_errors_.fetch_add(1); break;
        case ExecStatus::TIMEOUT: timeouts_.fetch_add(1); break;
        case ExecStatus::RESOURCE_EXCEEDED: resource_exceeded_.fetch_add(1); break;
        case ExecStatus::MALFORMED_REQUEST: malformed_.fetch_add(1); break;
        case ExecStatus::OVERLOADED: overloaded_.fetch_add(1); break;
    }
    if (audit_) audit_->record(req, res);
}

GatewayStats Gateway::stats() const {
    GatewayStats s;
    s.received = received_.load();
    s.succeeded = succeeded_.load();
    s.policy_rejected = policy_rejected_.load();
    s.runtime_errors = runtime_errors_.load();
    s.timeouts = timeouts_.load();
    s.resource_exceeded = resource_exceeded_.load();
    s.malformed = malformed_.load();
    s.overloaded = overloaded_.load();
    s.in_flight = in_flight_.load();
    s.queued = pool_.queued();
    return s;
}

} // namespace frameguard
