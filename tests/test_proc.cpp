#include "test_common.h"

#include "frameguard/proc.h"

#include <chrono>
#include <string>
#include <vector>

#include <stdlib.h>

using namespace frameguard;

static ProcLimits quick_limits() {
    ProcLimits lim;
    lim.timeout_ms = 5000;
    lim.rlimit_cpu_sec = 5;
    return lim;
}

int main() {
    unsetenv("FRAMEGUARD_PROC_WRAPPER");

    // Test 1: capture stdout and exit code
    {
        ProcResult r;
        bool started = proc_run_capture_sandboxed({"/bin/sh", "-c", "echo hello; exit 3"}, "", quick_limits(), &r);
        expect_true(started, "process should start: " + r.error);
        expect_eq_ll(r.exit_code, 3, "exit code");
        expect_true(r.output == "hello\n", "stdout captured: " + r.output);
        expect_true(!r.timed_out && !r.cancelled, "no timeout");
    }

    // Test 2: stdin is passed through
    {
        std::string payload(200000, 'z');   // larger than a pipe buffer
        ProcLimits lim = quick_limits();
        lim.stdout_max_bytes = 1 << 20;
        ProcResult r;
        bool started = proc_run_capture_sandboxed_stdin({"/bin/cat"}, "", payload, lim, &r);
        expect_true(started, "cat should start");
        expect_eq_ll(r.exit_code, 0, "cat exit code");
        expect_eq_ll((long long)r.output.size(), (long long)payload.size(), "stdin echoed back in full");
    }

    // Test 3: output ceiling truncates
    {
        ProcLimits lim = quick_limits();
        lim.stdout_max_bytes = 100;
        ProcResult r;
        (void)proc_run_capture_sandboxed({"/bin/sh", "-c", "yes x | head -c 10000"}, "", lim, &r);
        expect_true(r.output_truncated, "output should be truncated");
        expect_eq_ll((long long)r.output.size(), 100, "truncated at the ceiling");
    }

    // Test 4: timeout kills the process group
    {
        ProcLimits lim = quick_limits();
        lim.timeout_ms = 300;
        ProcResult r;
        auto t0 = std::chrono::steady_clock::now();
        (void)proc_run_capture_sandboxed({"/bin/sh", "-c", "sleep 5 & sleep 5"}, "", lim, &r);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
        expect_true(r.timed_out, "should time out");
        expect_true(ms < 3000, "killed promptly");
    }

    // Test 4b: CPU time is reported for a killed child too
    {
        ProcLimits lim = quick_limits();
        lim.timeout_ms = 600;
        ProcResult r;
        (void)proc_run_capture_sandboxed({"/bin/sh", "-c", "while :; do :; done"}, "", lim, &r);
        expect_true(r.timed_out, "spinner times out");
        expect_true(r.cpu_ms > 100, "spinner used CPU: " + std::to_string(r.cpu_ms));
        expect_true(r.cpu_ms <= r.duration_ms + 50, "cpu time bounded by wall time");
    }

    // Test 5: cancellation
    {
        auto t0 = std::chrono::steady_clock::now();
        CancelFn cancel = [t0] { return std::chrono::steady_clock::now() - t0 > std::chrono::milliseconds(200); };
        ProcResult r;
        (void)proc_run_capture_sandboxed_stdin({"/bin/sh", "-c", "sleep 5"}, "", std::string(), quick_limits(), &r,
                                               cancel);
        expect_true(r.cancelled && !r.timed_out, "should be cancelled");
    }

    // Test 6: environment is replaced, not inherited
    {
        setenv("FRAMEGUARD_TEST_SECRET", "leak", 1);
        ProcResult r;
        (void)proc_run_capture_sandboxed({"/bin/sh", "-c", "echo \"[$FRAMEGUARD_TEST_SECRET]\""}, "", quick_limits(), &r);
        expect_true(r.output == "[]\n", "parent environment not inherited: " + r.output);
        unsetenv("FRAMEGUARD_TEST_SECRET");
    }

    // Test 7: missing cwd fails in the child, missing binary exits 127
    {
        ProcResult r;
        (void)proc_run_capture_sandboxed({"/bin/true"}, "/nonexistent/frameguard", quick_limits(), &r);
        expect_eq_ll(r.exit_code, 126, "chdir failure");
        (void)proc_run_capture_sandboxed({"/nonexistent/binary"}, "", quick_limits(), &r);
        expect_eq_ll(r.exit_code, 127, "exec failure");
        expect_true(!proc_run_capture_sandboxed({}, "", quick_limits(), &r), "empty argv refused");
    }

    // Test 8: argv splitting
    {
        auto v = split_argv_quoted("bwrap --ro-bind / / \"a b\" 'c d'");
        expect_eq_ll((long long)v.size(), 6, "token count");
        expect_true(v[4] == "a b" && v[5] == "c d", "quoted tokens");
        expect_true(split_argv_quoted("broken \"quote").empty(), "unterminated quote rejected");
    }

    std::cerr << "test_proc: ALL PASSED" << std::endl;
    return 0;
}
