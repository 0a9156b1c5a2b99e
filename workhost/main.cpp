// frameguard_workhost: interprets one FrameScript job in an isolated child.
//
// Protocol: one JSON job on stdin (see HostJob), one JSON reply on stdout.
// The parent has already applied rlimits, a scratch cwd, no_new_privs and
// the PROCESS seccomp profile; this binary narrows to the COMPUTE profile
// once the job is in memory, so the script runs without open/exec/socket.

#include "frameguard/json_mini.h"
#include "frameguard/sandbox.h"
#include "frameguard/serialization.h"
#include "frameguard/workbench.h"
#include "frameguard/workshop.h"

#include <iostream>
#include <string>

using namespace frameguard;

static constexpr size_t MAX_STDIN_BYTES = 256ULL * 1024 * 1024;

static bool slurp_stdin(std::string* out) {
    out->reserve(64 * 1024);
    char buf[8192];
    while (std::cin.read(buf, sizeof(buf)) || std::cin.gcount()) {
        out->append(buf, (size_t)std::cin.gcount());
        if (out->size() > MAX_STDIN_BYTES) return false;
    }
    return true;
}

static int reply(const ExecutionResult& r, bool console_truncated, int exit_code) {
    json_mini::Doc d(host_reply_to_json(r, console_truncated));
    std::cout << json_mini::dump(d.root);
    std::cout.flush();
    return exit_code;
}

static int reply_error(ExecStatus st, const std::string& msg, int exit_code) {
    ExecutionResult r;
    r.status = st;
    r.diagnostics = msg;
    return reply(r, false, exit_code);
}

int main(int argc, char** argv) {
    if (argc > 1) {
        std::cerr << "usage: frameguard_workhost  (reads one JSON job from stdin)\n";
        return 2;
    }
    (void)argv;
    std::ios::sync_with_stdio(false);

    std::string input;
    if (!slurp_stdin(&input)) return reply_error(ExecStatus::RESOURCE_EXCEEDED, "job exceeds input limit", 3);

    HostJob job;
    {
        json_mini::Doc d = json_mini::parse(input, 64);
        std::string err;
        if (!d || !host_job_from_json(d.root, &job, &err)) {
            return reply_error(ExecStatus::MALFORMED_REQUEST, err.empty() ? "job is not valid JSON" : err, 3);
        }
    }
    input.clear();
    input.shrink_to_fit();

    const Workshop& workshop = Workshop::initialize();

    if (job.enable_seccomp) {
        std::string err = install_seccomp_filter(SeccompProfile::COMPUTE);
        if (!err.empty()) return reply_error(ExecStatus::RUNTIME_ERROR, "sandbox unavailable: " + err, 4);
    }

    WorkbenchOptions opt;
    opt.frame_name = job.frame_name;
    Workbench bench(workshop, opt);

    ExecLimits lim;
    lim.max_cells = job.max_cells;
    lim.console_max_bytes = job.console_max_bytes;
    lim.max_steps = job.max_steps;

    bool console_truncated = false;
    ExecutionResult r = bench.evaluate(job.source_code, job.dataset, job.parameters, lim, &console_truncated);
    return reply(r, console_truncated, 0);
}
