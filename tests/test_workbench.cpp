#include "test_common.h"

#include "frameguard/sandbox.h"
#include "frameguard/serialization.h"
#include "frameguard/workbench.h"
#include "frameguard/workshop.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include <signal.h>
#include <stdlib.h>

using namespace frameguard;

// Usage: test_workbench <path-to-frameguard_workhost>

static Dataset records(const std::string& json) {
    Dataset ds;
    std::string err;
    if (!dataset_from_records_json(json, &ds, &err)) die("bad fixture: " + err);
    return ds;
}

static ExecLimits test_limits() {
    ExecLimits l;
    l.timeout_ms = 5000;
    l.cpu_sec = 5;
    l.memory_mb = 512;
    l.enable_seccomp = seccomp_available();
    l.unshare_network = false;
    return l;
}

static void expect_status(const ExecutionResult& r, ExecStatus want, const std::string& what) {
    if (r.status != want) {
        die(what + ": got " + exec_status_to_str(r.status) + " (" + r.diagnostics + "), want " +
            exec_status_to_str(want));
    }
}

static size_t entries_in(const std::string& dir) {
    size_t n = 0;
    std::error_code ec;
    for (auto it = std::filesystem::directory_iterator(dir, ec); !ec && it != std::filesystem::directory_iterator(); ++it) n++;
    return n;
}

int main(int argc, char** argv) {
    if (argc < 2) die("usage: test_workbench <workhost>");

    char tmpl[] = "/tmp/frameguard-test-XXXXXX";
    if (!mkdtemp(tmpl)) die("mkdtemp failed");
    const std::string scratch = tmpl;

    WorkbenchOptions opt;
    opt.workhost_path = argv[1];
    opt.scratch_root = scratch;
    Workbench wb(Workshop::initialize(), opt);

    const Dataset ds = records(R"([{"id":1,"score":10.5,"tag":"a"},
                                   {"id":2,"score":null,"tag":"b"},
                                   {"id":3,"score":7.25,"tag":null}])");

    // Plain transformation through the child
    {
        ExecutionResult r = wb.execute("dataframe = dataframe.dropna()\n"
                                       "dataframe['score'] = dataframe['score'] * params['factor']\n"
                                       "print('kept', len(dataframe))\n",
                                       ds, {{"factor", Cell{int64_t(2)}}}, test_limits());
        expect_status(r, ExecStatus::SUCCESS, "child transform");
        expect_eq_ll((long long)r.output_dataset->rows(), 1, "dropna kept one row");
        expect_true(cell_as_double(r.output_dataset->find("score")->cells[0]) == 21.0, "score doubled");
        expect_true(r.console == "kept 1\n", "console relayed: " + r.console);
        expect_true(r.duration_ms >= 0, "duration recorded");
    }

    // Zero-row tables keep their columns
    {
        ExecutionResult r = wb.execute("dataframe = dataframe[dataframe['id'] > 100]\n", ds, {}, test_limits());
        expect_status(r, ExecStatus::SUCCESS, "empty result");
        expect_eq_ll((long long)r.output_dataset->rows(), 0, "no rows");
        expect_eq_ll((long long)r.output_dataset->columns.size(), 3, "columns kept");
    }

    // Infinite loop is killed at the wall-clock limit
    {
        ExecLimits l = test_limits();
        l.timeout_ms = 1000;
        auto t0 = std::chrono::steady_clock::now();
        ExecutionResult r = wb.execute("while True:\n    pass\n", ds, {}, l);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
        expect_status(r, ExecStatus::TIMEOUT, "infinite loop");
        expect_true(ms < 4000, "killed promptly");
        expect_true(r.diagnostics.find("1000 ms") != std::string::npos, "diagnostic names the limit");
    }

    // CPU ceiling: the kernel stops the child before the wall clock does
    {
        ExecLimits l = test_limits();
        l.cpu_sec = 1;
        l.timeout_ms = 20000;
        ExecutionResult r = wb.execute("while True:\n    pass\n", ds, {}, l);
        expect_status(r, ExecStatus::TIMEOUT, "cpu ceiling");
        expect_true(r.diagnostics.find("CPU time") != std::string::npos, "diagnostic: " + r.diagnostics);
    }

    // Kill signals: a SIGKILL before the CPU allowance is spent is a memory kill
    {
        std::string diag;
        expect_true(status_for_signal(SIGXCPU, 1000, 1, &diag) == ExecStatus::TIMEOUT, "SIGXCPU");
        expect_true(status_for_signal(SIGKILL, 2050, 2, &diag) == ExecStatus::TIMEOUT, "SIGKILL at hard cpu limit");
        expect_true(status_for_signal(SIGKILL, 10, 2, &diag) == ExecStatus::RESOURCE_EXCEEDED, "early SIGKILL");
        expect_true(diag.find("memory") != std::string::npos, "memory kill diagnostic: " + diag);
        expect_true(status_for_signal(SIGKILL, 9000, 0, &diag) == ExecStatus::RESOURCE_EXCEEDED,
                    "no cpu limit configured");
        expect_true(status_for_signal(SIGSYS, 0, 2, &diag) == ExecStatus::RUNTIME_ERROR, "SIGSYS");
        expect_true(diag == "blocked system call", "SIGSYS diagnostic");
        expect_true(status_for_signal(SIGSEGV, 0, 2, &diag) == ExecStatus::RUNTIME_ERROR, "SIGSEGV");
        expect_true(diag.find("signal") != std::string::npos, "other signal diagnostic");
    }

    // A trailing bare table expression is the result
    {
        ExecutionResult r = wb.execute("dataframe.fillna(0)\n", ds, {}, test_limits());
        expect_status(r, ExecStatus::SUCCESS, "bare fillna");
        expect_true(cell_as_double(r.output_dataset->find("score")->cells[1]) == 0.0, "null score filled");
    }

    // Memory blow-up hits the address-space ceiling
    {
        ExecLimits l = test_limits();
        l.memory_mb = 256;
        l.max_cells = 1000000000;
        ExecutionResult r = wb.execute("x = list(range(200000000))\n", ds, {}, l);
        expect_status(r, ExecStatus::RESOURCE_EXCEEDED, "memory blow-up");
    }

    // Element ceiling inside the child
    {
        ExecLimits l = test_limits();
        l.max_cells = 10000;
        ExecutionResult r = wb.execute("x = [0] * 1000000\n", ds, {}, l);
        expect_status(r, ExecStatus::RESOURCE_EXCEEDED, "element ceiling");
    }

    // Payloads that bypass the scanner still cannot reach the filesystem
    {
        ExecutionResult r = wb.execute("data = open('/etc/passwd').read()\n", ds, {}, test_limits());
        expect_status(r, ExecStatus::RUNTIME_ERROR, "open()");
        r = wb.execute("f = pd.read_csv('/etc/passwd')\n", ds, {}, test_limits());
        expect_status(r, ExecStatus::RUNTIME_ERROR, "pd.read_csv");
        r = wb.execute("x = np.__dict__\n", ds, {}, test_limits());
        expect_status(r, ExecStatus::RUNTIME_ERROR, "dunder attribute");
        expect_true(r.diagnostics.find('\n') == std::string::npos, "diagnostic is one line");
    }

    // Output ceiling on the child's reply
    {
        ExecLimits l = test_limits();
        l.output_max_bytes = 4096;
        ExecutionResult r = wb.execute("dataframe['pad'] = 'x' * 10000\n", ds, {}, l);
        expect_status(r, ExecStatus::RESOURCE_EXCEEDED, "output ceiling");
    }

    // Cancellation kills the child
    {
        auto t0 = std::chrono::steady_clock::now();
        CancelFn cancel = [t0] {
            return std::chrono::steady_clock::now() - t0 > std::chrono::milliseconds(300);
        };
        ExecutionResult r = wb.execute("while True:\n    pass\n", ds, {}, test_limits(), cancel);
        expect_status(r, ExecStatus::RUNTIME_ERROR, "cancelled run");
        expect_true(r.diagnostics.find("cancelled") != std::string::npos, "diagnostic says cancelled");
    }

    // Independent concurrent runs
    {
        const int N = 6;
        std::vector<ExecutionResult> results(N);
        std::vector<std::thread> ts;
        for (int i = 0; i < N; i++) {
            ts.emplace_back([&, i] {
                Dataset mine = records("[{\"v\":" + std::to_string(i) + "}]");
                results[i] = wb.execute("dataframe['w'] = dataframe['v'] + 100\n"
                                        "shared = 1\n",
                                        mine, {}, test_limits());
            });
        }
        for (auto& t : ts) t.join();
        for (int i = 0; i < N; i++) {
            expect_status(results[i], ExecStatus::SUCCESS, "concurrent run " + std::to_string(i));
            expect_eq_ll((long long)std::get<int64_t>(results[i].output_dataset->find("w")->cells[0]), 100 + i,
                         "each run sees its own data");
        }
    }

    // Missing workhost binary is a runtime error, not a crash
    {
        WorkbenchOptions bad = opt;
        bad.workhost_path = scratch + "/no-such-workhost";
        Workbench broken(Workshop::initialize(), bad);
        ExecutionResult r = broken.execute("x = 1\n", ds, {}, test_limits());
        expect_status(r, ExecStatus::RUNTIME_ERROR, "missing workhost");
    }

    // Per-run scratch directories are removed
    expect_eq_ll((long long)entries_in(scratch), 0, "scratch root left empty");
    std::error_code ec;
    std::filesystem::remove_all(scratch, ec);

    std::cerr << "test_workbench: ALL PASSED" << std::endl;
    return 0;
}
