#include "test_common.h"

#include "frameguard/gateway.h"
#include "frameguard/log.h"
#include "frameguard/serialization.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <fstream>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <stdlib.h>
#include <unistd.h>

using namespace frameguard;

// Records what reaches it; optionally blocks until released.
class FakeExecutor final : public IExecutor {
public:
    ExecutionResult run(const ExecutionRequest& req, const ExecLimits&, const CancelFn& cancel) override {
        calls.fetch_add(1);
        {
            std::unique_lock<std::mutex> lk(mu);
            running++;
            cv.notify_all();
            cv.wait(lk, [&] { return !hold || (cancel && cancel()); });
            running--;
        }
        ExecutionResult r;
        r.status = ExecStatus::SUCCESS;
        r.output_dataset = req.dataset;
        r.duration_ms = 1;
        return r;
    }

    void wait_running(int n) {
        std::unique_lock<std::mutex> lk(mu);
        cv.wait(lk, [&] { return running >= n; });
    }

    void release() {
        std::lock_guard<std::mutex> lk(mu);
        hold = false;
        cv.notify_all();
    }

    std::atomic<int> calls{0};
    std::mutex mu;
    std::condition_variable cv;
    int running{0};
    bool hold{false};
};

static ExecutionRequest request(const std::string& code) {
    ExecutionRequest req;
    req.request_id = "t-1";
    req.source_code = code;
    std::string err;
    if (!dataset_from_records_json(R"([{"a":1},{"a":2}])", &req.dataset, &err)) die(err);
    return req;
}

static bool has_rule(const ExecutionResult& r, const std::string& rule) {
    for (const auto& v : r.violations)
        if (v.rule_id == rule) return true;
    return false;
}

int main() {
    // Denied requests never reach the executor
    {
        FakeExecutor ex;
        Gateway gw(ex, GatewayOptions{});
        for (const char* code : {"import os\n", "x = __import__('os')\n", "f = open('x')\n",
                                 "e = eval('1')\n", "name = 'sock' 'et'\n", "f = lambda: 1\n", "x = (\n"}) {
            ExecutionResult r = gw.handle(request(code));
            expect_true(r.status == ExecStatus::POLICY_REJECTED, std::string("denied: ") + code);
            expect_true(!r.violations.empty(), "violations attached");
            expect_true(!r.diagnostics.empty(), "diagnostics name the rule");
        }
        expect_eq_ll(ex.calls.load(), 0, "executor never invoked on denial");

        ExecutionResult ok = gw.handle(request("dataframe = dataframe.head(1)\n"));
        expect_true(ok.ok(), "allowed request executes");
        expect_eq_ll(ex.calls.load(), 1, "executor invoked once");

        GatewayStats s = gw.stats();
        expect_eq_ll((long long)s.received, 8, "received counter");
        expect_eq_ll((long long)s.policy_rejected, 7, "rejected counter");
        expect_eq_ll((long long)s.succeeded, 1, "succeeded counter");
    }

    // Malformed requests are rejected before the scanner
    {
        FakeExecutor ex;
        GatewayOptions opt;
        opt.limits.max_cells = 3;
        Gateway gw(ex, opt);

        ExecutionResult r = gw.handle(request("   \n"));
        expect_true(r.status == ExecStatus::MALFORMED_REQUEST, "blank code is malformed");

        ExecutionRequest ragged = request("x = 1\n");
        ragged.dataset.columns.push_back(Column{"b", {Cell{int64_t(1)}}});
        r = gw.handle(ragged);
        expect_true(r.status == ExecStatus::MALFORMED_REQUEST, "ragged dataset is malformed");

        ExecutionRequest big = request("x = 1\n");
        big.dataset.columns.push_back(Column{"b", {Cell{int64_t(1)}, Cell{int64_t(2)}}});
        r = gw.handle(big);
        expect_true(r.status == ExecStatus::MALFORMED_REQUEST, "dataset over the cell ceiling");
        expect_true(r.diagnostics.find("cells") != std::string::npos, "diagnostic names the ceiling");

        // malformed wins over a policy violation
        ExecutionRequest both = request("import os\n");
        both.dataset = ragged.dataset;
        r = gw.handle(both);
        expect_true(r.status == ExecStatus::MALFORMED_REQUEST, "shape checked before scan");
        expect_eq_ll(ex.calls.load(), 0, "executor untouched");
    }

    // Unknown libraries are a policy rejection
    {
        FakeExecutor ex;
        Gateway gw(ex, GatewayOptions{});
        ExecutionRequest req = request("x = 1\n");
        req.required_libraries = {"pandas", "np", "requests"};
        ExecutionResult r = gw.handle(req);
        expect_true(r.status == ExecStatus::POLICY_REJECTED, "unknown library rejected");
        expect_true(has_rule(r, "unknown_library"), "unknown_library rule");
        expect_true(r.violations[0].matched_text == "requests", "names the library");

        req.required_libraries = {"pandas", "numpy", "scipy.stats", "pd", "np", "scipy"};
        r = gw.handle(req);
        expect_true(r.ok(), "known libraries accepted");
        expect_true(is_known_library("pd") && !is_known_library("torch"), "library lookup");
    }

    // Source size ceiling
    {
        FakeExecutor ex;
        GatewayOptions opt;
        opt.max_source_bytes = 64;
        Gateway gw(ex, opt);
        ExecutionResult r = gw.handle(request("x = 1\n" + std::string(100, '#') + "\n"));
        expect_true(r.status == ExecStatus::POLICY_REJECTED && has_rule(r, "source_too_large"), "too large");
    }

    // Full queue answers Overloaded immediately
    {
        FakeExecutor ex;
        ex.hold = true;
        GatewayOptions opt;
        opt.workers = 1;
        opt.queue_capacity = 1;
        Gateway gw(ex, opt);

        auto f1 = gw.submit(request("x = 1\n"));
        ex.wait_running(1);                                // worker busy
        auto f2 = gw.submit(request("x = 2\n"));           // queued
        auto f3 = gw.submit(request("x = 3\n"));           // refused

        expect_true(f3.wait_for(std::chrono::seconds(0)) == std::future_status::ready, "overload is immediate");
        ExecutionResult r3 = f3.get();
        expect_true(r3.status == ExecStatus::OVERLOADED, "third request overloaded");
        expect_true(!r3.diagnostics.empty(), "overload names the limit");

        ex.release();
        expect_true(f1.get().ok(), "first finishes");
        expect_true(f2.get().ok(), "queued one finishes");
        GatewayStats s = gw.stats();
        expect_eq_ll((long long)s.overloaded, 1, "overload counted");
        expect_eq_ll((long long)s.in_flight, 0, "nothing in flight");
    }

    // Zero queue slots: an idle worker still serves, a busy one refuses
    {
        FakeExecutor ex;
        ex.hold = true;
        GatewayOptions opt;
        opt.workers = 1;
        opt.queue_capacity = 0;
        Gateway gw(ex, opt);

        auto f1 = gw.submit(request("x = 1\n"));
        ex.wait_running(1);
        auto f2 = gw.submit(request("x = 2\n"));
        expect_true(f2.get().status == ExecStatus::OVERLOADED, "busy worker, no backlog: overloaded");
        ex.release();
        expect_true(f1.get().ok(), "idle worker took the first request");
    }

    // Cancellation predicate reaches the executor
    {
        FakeExecutor ex;
        ex.hold = true;
        Gateway gw(ex, GatewayOptions{});
        std::atomic<bool> gone{false};
        auto f = gw.submit(request("x = 1\n"), [&gone] { return gone.load(); });
        ex.wait_running(1);
        gone.store(true);
        {
            std::lock_guard<std::mutex> lk(ex.mu);
            ex.cv.notify_all();
        }
        expect_true(f.wait_for(std::chrono::seconds(5)) == std::future_status::ready, "cancel unblocks run");
    }

    // Concurrent submissions are independent
    {
        FakeExecutor ex;
        GatewayOptions opt;
        opt.workers = 4;
        opt.queue_capacity = 64;
        Gateway gw(ex, opt);
        std::vector<std::future<ExecutionResult>> fs;
        for (int i = 0; i < 32; i++) fs.push_back(gw.submit(request("x = " + std::to_string(i) + "\n")));
        for (auto& f : fs) expect_true(f.get().ok(), "concurrent request succeeds");
        expect_eq_ll(ex.calls.load(), 32, "all executed");
    }

    // Every request lands in the audit log
    {
        char tmpl[] = "/tmp/frameguard-audit-XXXXXX";
        int fd = mkstemp(tmpl);
        if (fd < 0) die("mkstemp failed");
        ::close(fd);
        {
            AuditLog audit(tmpl);
            expect_true(audit.enabled(), "audit log opened");
            FakeExecutor ex;
            Gateway gw(ex, GatewayOptions{}, &audit);
            (void)gw.handle(request("import os\n"));
            (void)gw.handle(request("dataframe = dataframe.head(1)\n"));
            (void)gw.handle(request(""));
            expect_eq_ll((long long)audit.records(), 3, "three records");
        }
        std::ifstream in(tmpl);
        std::string line;
        int n = 0;
        bool saw_rule = false, saw_digest = false, leaked_source = false;
        while (std::getline(in, line)) {
            n++;
            saw_rule = saw_rule || line.find("\"import_statement\"") != std::string::npos;
            saw_digest = saw_digest || line.find("fnv1a64:") != std::string::npos;
            leaked_source = leaked_source || line.find("import os") != std::string::npos;
        }
        expect_eq_ll(n, 3, "three lines on disk");
        expect_true(saw_rule, "rule ids recorded");
        expect_true(saw_digest, "source digest recorded");
        expect_true(!leaked_source, "source text not recorded");
        ::unlink(tmpl);
    }

    std::cerr << "test_gateway: ALL PASSED" << std::endl;
    return 0;
}
