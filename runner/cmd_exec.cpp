#include "commands.h"
#include "runner_utils.h"

#include "frameguard/gateway.h"
#include "frameguard/isolation.h"
#include "frameguard/json_mini.h"
#include "frameguard/log.h"
#include "frameguard/scanner.h"
#include "frameguard/serialization.h"
#include "frameguard/workbench.h"
#include "frameguard/workshop.h"

#include <cstdlib>
#include <iostream>
#include <string>

using namespace frameguard;

// Run one request file through the full pipeline and print the result JSON.
// Exit code: 0 success, 1 any other status, 2 usage, 3 startup refused.
int cmd_exec(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: frameguard_cli exec <request.json>\n";
        return 2;
    }
    ServiceConfig cfg;
    if (!prepare_service("exec", &cfg)) return 3;

    std::string body;
    if (!slurp(argv[2], &body, cfg.max_body_bytes)) {
        std::cerr << "[exec] " << body << "\n";
        return 2;
    }

    AuditLog audit(cfg.audit_log_path);
    if (!audit.error().empty()) std::cerr << "[exec] " << audit.error() << "\n";

    ExecutionRequest req;
    std::string err;
    ExecutionResult res;
    if (!request_from_json_string(body, &req, &err)) {
        res.status = ExecStatus::MALFORMED_REQUEST;
        res.diagnostics = err;
        audit.record(req, res);
    } else {
        const Workshop& workshop = Workshop::initialize();
        Workbench workbench(workshop, workbench_options_from(cfg, argv[0]));
        WorkbenchExecutor executor(workbench);
        GatewayOptions gopt = gateway_options_from(cfg);
        gopt.workers = 1;
        gopt.queue_capacity = 0;
        Gateway gateway(executor, gopt, &audit);
        res = gateway.handle(req);
    }

    std::cout << result_to_json_string(res) << "\n";
    if (!res.ok()) std::cerr << "[exec] " << exec_status_to_str(res.status) << ": " << res.diagnostics << "\n";
    return res.ok() ? 0 : 1;
}

// Static policy check of a code file. Exit code 0 when allowed, 1 when denied.
int cmd_scan(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: frameguard_cli scan <code-file>\n";
        return 2;
    }
    std::string src;
    if (!slurp(argv[2], &src)) {
        std::cerr << "[scan] " << src << "\n";
        return 2;
    }
    ScanOptions so;
    so.max_source_bytes = ServiceConfig{}.max_source_bytes;
    if (const char* e = std::getenv("FRAMEGUARD_MAX_SOURCE_BYTES")) {
        char* end = nullptr;
        long long v = std::strtoll(e, &end, 10);
        if (end != e && *end == '\0' && v > 0) so.max_source_bytes = (size_t)v;
    }
    PolicyDecision d = scan(src, so);

    json_mini::Doc out(decision_to_json(d));
    std::cout << json_mini::dump(out.root) << "\n";
    if (!d.allowed) std::cerr << d.summary();
    return d.allowed ? 0 : 1;
}

// Report the isolation boundary as seen from this process.
int cmd_check(int argc, char** argv) {
    (void)argc;
    (void)argv;
    apply_profile_defaults(detect_profile());
    ServiceConfig cfg = load_service_config();
    IsolationReport rep = check_isolation(cfg.scratch_root);
    std::cout << rep.summary() << "\n";
    if (!rep.ok()) {
        std::cout << "not isolated: " << rep.failures() << "\n";
        return 1;
    }
    return 0;
}
