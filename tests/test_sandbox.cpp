#include "test_common.h"
#include "frameguard/sandbox.h"

#include <csignal>
#include <functional>
#include <string>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

using frameguard::SeccompProfile;

// Runs `body` in a forked child under `profile`; returns the raw wait status.
static int run_filtered(SeccompProfile profile, const std::function<int()>& body) {
    pid_t pid = fork();
    if (pid < 0) die("fork failed");
    if (pid == 0) {
        prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
        std::string err = frameguard::install_seccomp_filter(profile);
        if (!err.empty()) _exit(100);
        _exit(body());
    }
    int status = 0;
    waitpid(pid, &status, 0);
    return status;
}

static bool exited_ok(int status) { return WIFEXITED(status) && WEXITSTATUS(status) == 0; }
static bool killed_by_sigsys(int status) { return WIFSIGNALED(status) && WTERMSIG(status) == SIGSYS; }

int main() {
    expect_true(std::string(frameguard::seccomp_profile_name(SeccompProfile::COMPUTE)) == "compute", "compute name");
    expect_true(std::string(frameguard::seccomp_profile_name(SeccompProfile::PROCESS)) == "process", "process name");

    if (!frameguard::seccomp_available()) {
        std::cerr << "test_sandbox: seccomp unavailable, filter checks skipped" << std::endl;
        std::cerr << "test_sandbox: ALL PASSED" << std::endl;
        return 0;
    }

    // Test 1: COMPUTE keeps write() and anonymous memory
    int st = run_filtered(SeccompProfile::COMPUTE, [] {
        const char* msg = "seccomp_ok\n";
        if (write(STDERR_FILENO, msg, 11) <= 0) return 2;
        void* p = mmap(nullptr, 1 << 20, PROT_READ | PROT_WRITE, MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
        if (p == MAP_FAILED) return 3;
        munmap(p, 1 << 20);
        return 0;
    });
    expect_true(exited_ok(st), "COMPUTE child should exit cleanly after write() and mmap()");

    // Test 2: COMPUTE blocks opening files
    st = run_filtered(SeccompProfile::COMPUTE, [] {
        int fd = ::open("/etc/hostname", O_RDONLY);
        return fd >= 0 ? 0 : 1;
    });
    expect_true(killed_by_sigsys(st), "open() under COMPUTE should be killed with SIGSYS");

    // Test 3: COMPUTE blocks process creation
    st = run_filtered(SeccompProfile::COMPUTE, [] {
        pid_t p = fork();
        if (p == 0) _exit(0);
        return 0;
    });
    expect_true(killed_by_sigsys(st), "fork() under COMPUTE should be killed");

    // Test 4: PROCESS blocks sockets
    st = run_filtered(SeccompProfile::PROCESS, [] {
        int s = ::socket(AF_INET, SOCK_STREAM, 0);
        return s >= 0 ? 0 : 1;
    });
    expect_true(killed_by_sigsys(st), "socket() under PROCESS should be killed");

    // Test 5: making memory executable is refused
    st = run_filtered(SeccompProfile::COMPUTE, [] {
        void* p = mmap(nullptr, 4096, PROT_READ | PROT_WRITE, MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
        if (p == MAP_FAILED) return 3;
        if (mprotect(p, 4096, PROT_READ) != 0) return 4;
        return mprotect(p, 4096, PROT_READ | PROT_EXEC) == 0 ? 0 : 1;
    });
    expect_true(killed_by_sigsys(st), "mprotect(PROT_EXEC) should be killed");

    std::cerr << "test_sandbox: ALL PASSED" << std::endl;
    return 0;
}
