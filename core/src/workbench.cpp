#include "frameguard/workbench.h"

#include "frameguard/interpreter.h"
#include "frameguard/json_mini.h"
#include "frameguard/parser.h"
#include "frameguard/serialization.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <new>
#include <stdexcept>
#include <vector>

namespace frameguard {

namespace {

int64_t ms_since(std::chrono::steady_clock::time_point t0) {
    return (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();
}

ExecutionResult failure(ExecStatus st, const std::string& diag) {
    ExecutionResult r;
    r.status = st;
    r.diagnostics = sanitize_diagnostic(diag);
    return r;
}

ExecStatus status_for(ErrorKind k) {
    switch (k) {
        case ErrorKind::RESOURCE: return ExecStatus::RESOURCE_EXCEEDED;
        case ErrorKind::STEP_BUDGET: return ExecStatus::TIMEOUT;
        default: return ExecStatus::RUNTIME_ERROR;
    }
}

bool is_path_char(char c) {
    return std::isalnum((unsigned char)c) || c == '/' || c == '.' || c == '_' || c == '-';
}

// RAII scratch directory; removed with its contents on scope exit.
class ScratchDir {
public:
    explicit ScratchDir(const std::string& root) {
        std::string tmpl = root + "/frameguard-XXXXXX";
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (mkdtemp(buf.data())) path_ = buf.data();
        else error_ = std::strerror(errno);
    }
    ~ScratchDir() {
        if (path_.empty()) return;
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::string& path() const { return path_; }
    const std::string& error() const { return error_; }

private:
    std::string path_;
    std::string error_;
};

} // namespace

std::string sanitize_diagnostic(const std::string& msg, size_t max_len) {
    std::string out;
    out.reserve(std::min(msg.size(), max_len));
    for (size_t i = 0; i < msg.size(); i++) {
        char c = msg[i];
        const bool boundary = (i == 0) || msg[i - 1] == ' ' || msg[i - 1] == '\'' || msg[i - 1] == '"' ||
                              msg[i - 1] == '(' || msg[i - 1] == '=';
        if (c == '/' && boundary && i + 1 < msg.size() && is_path_char(msg[i + 1]) && msg[i + 1] != '/') {
            while (i + 1 < msg.size() && is_path_char(msg[i + 1])) i++;
            out += "<path>";
            continue;
        }
        if (c == '\n' || c == '\t') { out.push_back(' '); continue; }
        if ((unsigned char)c < 0x20 || c == 0x7f) continue;
        out.push_back(c);
    }
    if (out.size() > max_len) {
        out.resize(max_len);
        out += "...";
    }
    return out;
}

Workbench::Workbench(const Workshop& workshop, WorkbenchOptions opt)
    : workshop_(workshop), opt_(std::move(opt)) {}

ExecutionResult Workbench::evaluate(const std::string& source_code,
                                    const Dataset& dataset,
                                    const std::map<std::string, ParamValue>& parameters,
                                    const ExecLimits& limits,
                                    bool* console_truncated) const {
    const auto t0 = std::chrono::steady_clock::now();
    ExecContext ctx(limits.max_cells, limits.console_max_bytes, limits.max_steps);
    ExecutionResult r;

    try {
        Program program = parse_program(source_code);

        Interpreter interp(workshop_, ctx);
        interp.bind_libraries();
        interp.bind(opt_.frame_name, Value::frame(std::make_shared<Dataset>(dataset)));
        auto params = std::make_shared<DictData>();
        for (const auto& kv : parameters) params->set(Cell{kv.first}, Value::from_cell(kv.second));
        params->frozen = true;
        interp.bind("params", Value::dict(params));

        Value tail = interp.run(program);
        if (tail.type() == Value::Type::FRAME) interp.bind(opt_.frame_name, tail);

        const Value* out = interp.lookup(opt_.frame_name);
        if (!out || out->type() != Value::Type::FRAME) {
            r = failure(ExecStatus::RUNTIME_ERROR,
                        "'" + opt_.frame_name + "' no longer holds a table (got " +
                        (out ? type_name(*out) : std::string("nothing")) + ")");
        } else {
            r.status = ExecStatus::SUCCESS;
            r.output_dataset = *out->frame_ptr();
        }
    } catch (const ScriptError& e) {
        r = failure(status_for(e.kind()), e.describe());
    } catch (const std::bad_alloc&) {
        r = failure(ExecStatus::RESOURCE_EXCEEDED, "memory limit exceeded");
    } catch (const std::length_error&) {
        r = failure(ExecStatus::RESOURCE_EXCEEDED, "memory limit exceeded");
    } catch (const std::exception& e) {
        r = failure(ExecStatus::RUNTIME_ERROR, std::string("internal error: ") + e.what());
    }

    r.console = ctx.console();
    if (console_truncated) *console_truncated = ctx.console_truncated();
    r.duration_ms = ms_since(t0);
    return r;
}

ExecStatus status_for_signal(int sig, long cpu_ms, int cpu_sec, std::string* diagnostics) {
    const bool cpu_spent = cpu_sec > 0 && cpu_ms >= (long)cpu_sec * 1000L;
    if (sig == SIGXCPU || (sig == SIGKILL && cpu_spent)) {
        *diagnostics = "CPU time limit exceeded";
        return ExecStatus::TIMEOUT;
    }
    if (sig == SIGKILL) {
        *diagnostics = "workhost killed (memory limit exceeded)";
        return ExecStatus::RESOURCE_EXCEEDED;
    }
    if (sig == SIGSYS) {
        *diagnostics = "blocked system call";
        return ExecStatus::RUNTIME_ERROR;
    }
    *diagnostics = "workhost terminated by signal " + std::to_string(sig);
    return ExecStatus::RUNTIME_ERROR;
}

ExecutionResult Workbench::execute(const std::string& source_code,
                                   const Dataset& dataset,
                                   const std::map<std::string, ParamValue>& parameters,
                                   const ExecLimits& limits,
                                   const CancelFn& cancel) const {
    const auto t0 = std::chrono::steady_clock::now();
    auto finish = [&](ExecutionResult r) {
        r.duration_ms = ms_since(t0);
        return r;
    };

    HostJob job;
    job.source_code = source_code;
    job.dataset = dataset;
    job.parameters = parameters;
    job.frame_name = opt_.frame_name;
    job.max_cells = limits.max_cells;
    job.console_max_bytes = limits.console_max_bytes;
    job.max_steps = limits.max_steps;
    job.enable_seccomp = limits.enable_seccomp;
    std::string stdin_data;
    {
        json_mini::Doc d(host_job_to_json(job));
        stdin_data = json_mini::dump(d.root);
    }

    ScratchDir scratch(opt_.scratch_root);
    if (scratch.path().empty()) {
        return finish(failure(ExecStatus::RUNTIME_ERROR, "scratch directory unavailable: " + scratch.error()));
    }

    ProcLimits pl;
    pl.timeout_ms = limits.timeout_ms;
    pl.stdout_max_bytes = limits.output_max_bytes;
    pl.rlimit_cpu_sec = limits.cpu_sec;
    pl.rlimit_as_mb = limits.memory_mb;
    pl.rlimit_fsize_mb = 1;
    pl.rlimit_nofile = 16;
    pl.enable_seccomp = limits.enable_seccomp;
    pl.unshare_network = limits.unshare_network;
    pl.merge_stderr = false;

    ProcResult pr;
    if (!proc_run_capture_sandboxed_stdin({opt_.workhost_path}, scratch.path(), stdin_data, pl, &pr, cancel)) {
        return finish(failure(ExecStatus::RUNTIME_ERROR, "failed to start workhost: " + pr.error));
    }

    if (pr.cancelled) return finish(failure(ExecStatus::RUNTIME_ERROR, "execution cancelled"));
    if (pr.timed_out) {
        return finish(failure(ExecStatus::TIMEOUT,
                              "execution exceeded " + std::to_string(limits.timeout_ms) + " ms"));
    }
    if (pr.term_signal != 0) {
        std::string diag;
        ExecStatus st = status_for_signal(pr.term_signal, pr.cpu_ms, limits.cpu_sec, &diag);
        return finish(failure(st, diag));
    }
    if (pr.output_truncated) {
        return finish(failure(ExecStatus::RESOURCE_EXCEEDED,
                              "output exceeded " + std::to_string(limits.output_max_bytes) + " bytes"));
    }

    json_mini::Doc reply = json_mini::parse(pr.output);
    ExecutionResult r;
    std::string err;
    if (!reply || !host_reply_from_json(reply.root, &r, &err)) {
        if (pr.exit_code != 0) {
            return finish(failure(ExecStatus::RUNTIME_ERROR,
                                  "workhost exited with code " + std::to_string(pr.exit_code)));
        }
        return finish(failure(ExecStatus::RUNTIME_ERROR, "malformed workhost reply: " + err));
    }
    r.diagnostics = sanitize_diagnostic(r.diagnostics);
    if (r.console.size() > limits.console_max_bytes) r.console.resize(limits.console_max_bytes);
    return finish(std::move(r));
}

} // namespace frameguard
