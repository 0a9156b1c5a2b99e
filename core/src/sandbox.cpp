#include "frameguard/sandbox.h"

#if defined(__linux__)

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <vector>

#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sys/mman.h>
#include <sys/prctl.h>
#include <sys/syscall.h>

#if defined(__x86_64__)
  #define FRAMEGUARD_AUDIT_ARCH AUDIT_ARCH_X86_64
#elif defined(__aarch64__)
  #define FRAMEGUARD_AUDIT_ARCH AUDIT_ARCH_AARCH64
#else
  #define FRAMEGUARD_AUDIT_ARCH 0
#endif

namespace frameguard {

namespace {

sock_filter stmt(unsigned short code, unsigned int k) {
    return sock_filter{code, 0, 0, k};
}

sock_filter jump(unsigned short code, unsigned int k, unsigned char jt, unsigned char jf) {
    return sock_filter{code, jt, jf, k};
}

// Shared by both profiles: memory, signals, clocks, fd I/O, exit.
void add_compute_syscalls(std::vector<unsigned int>& v) {
    const unsigned int base[] = {
        __NR_read, __NR_write, __NR_readv, __NR_writev, __NR_close, __NR_fstat, __NR_lseek,
        __NR_mmap, __NR_mprotect, __NR_munmap, __NR_mremap, __NR_brk, __NR_madvise,
        __NR_rt_sigaction, __NR_rt_sigprocmask, __NR_rt_sigreturn, __NR_sigaltstack,
        __NR_futex, __NR_getpid, __NR_gettid, __NR_tgkill,
        __NR_clock_gettime, __NR_clock_getres, __NR_gettimeofday, __NR_clock_nanosleep,
        __NR_nanosleep, __NR_sched_yield, __NR_getrandom, __NR_prlimit64,
        __NR_exit, __NR_exit_group, __NR_newfstatat,
#ifdef __NR_rseq
        __NR_rseq,
#endif
#ifdef __NR_time
        __NR_time,
#endif
    };
    v.insert(v.end(), std::begin(base), std::end(base));
}

void add_process_syscalls(std::vector<unsigned int>& v) {
    const unsigned int extra[] = {
        __NR_openat, __NR_execve, __NR_pread64, __NR_pwrite64, __NR_fcntl, __NR_ioctl,
        __NR_dup, __NR_dup3, __NR_pipe2, __NR_ppoll, __NR_pselect6,
        __NR_getcwd, __NR_chdir, __NR_fchdir, __NR_getdents64, __NR_readlinkat,
        __NR_faccessat, __NR_statfs, __NR_fstatfs, __NR_umask, __NR_uname,
        __NR_getrlimit, __NR_sysinfo, __NR_times,
        __NR_getuid, __NR_getgid, __NR_geteuid, __NR_getegid, __NR_getppid,
        __NR_set_tid_address, __NR_set_robust_list, __NR_prctl, __NR_kill,
        __NR_wait4, __NR_sched_getaffinity,
#ifdef __NR_faccessat2
        __NR_faccessat2,
#endif
#ifdef __NR_statx
        __NR_statx,
#endif
#ifdef __NR_open
        __NR_open, __NR_stat, __NR_lstat, __NR_access, __NR_readlink, __NR_poll,
        __NR_dup2, __NR_pipe, __NR_getdents, __NR_getpgrp,
#endif
#ifdef __NR_arch_prctl
        __NR_arch_prctl,
#endif
    };
    v.insert(v.end(), std::begin(extra), std::end(extra));
}

} // namespace

const char* seccomp_profile_name(SeccompProfile p) {
    switch (p) {
        case SeccompProfile::PROCESS: return "process";
        case SeccompProfile::COMPUTE: return "compute";
    }
    return "process";
}

std::string install_seccomp_filter(SeccompProfile profile) {
#if FRAMEGUARD_AUDIT_ARCH == 0
    (void)profile;
    return "seccomp: unsupported architecture";
#else
    std::vector<unsigned int> allow;
    add_compute_syscalls(allow);
    if (profile == SeccompProfile::PROCESS) add_process_syscalls(allow);

    const size_t n = allow.size();
    if (n + 6 > 255) return "seccomp: allowlist too long for single-hop jumps";

    // Layout:
    //   [0] load arch   [1] arch ok? skip   [2] KILL   [3] load nr
    //   [4 .. 4+n-1]    JEQ allow[s] -> ALLOW (or MPROTECT_CHECK)
    //   [4+n]           KILL (default deny)
    //   [4+n+1]         MPROTECT_CHECK: load args[2]
    //   [4+n+2]         JSET PROT_EXEC -> KILL
    //   [4+n+3]         ALLOW (mprotect without PROT_EXEC)
    //   [4+n+4]         KILL
    //   [4+n+5]         ALLOW
    std::vector<sock_filter> prog;
    prog.reserve(n + 10);
    prog.push_back(stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)));
    prog.push_back(jump(BPF_JMP | BPF_JEQ | BPF_K, FRAMEGUARD_AUDIT_ARCH, 1, 0));
    prog.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    prog.push_back(stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr)));

    for (size_t s = 0; s < n; s++) {
        unsigned char jt = (allow[s] == (unsigned int)__NR_mprotect)
            ? (unsigned char)(n - s)
            : (unsigned char)(n + 4 - s);
        prog.push_back(jump(BPF_JMP | BPF_JEQ | BPF_K, allow[s], jt, 0));
    }

    prog.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    prog.push_back(stmt(BPF_LD | BPF_W | BPF_ABS,
                        offsetof(struct seccomp_data, args) + 2 * sizeof(uint64_t)));
    prog.push_back(jump(BPF_JMP | BPF_JSET | BPF_K, PROT_EXEC, 1, 0));
    prog.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));
    prog.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    prog.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));

    struct sock_fprog fprog = {};
    fprog.len = (unsigned short)prog.size();
    fprog.filter = prog.data();

    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &fprog, 0, 0) != 0) {
        return std::string("seccomp install failed: ") + std::strerror(errno);
    }
    return "";
#endif
}

bool seccomp_available() {
    // 0: available and not active, 2: filter mode active, -1/EINVAL: unsupported
    int ret = prctl(PR_GET_SECCOMP, 0, 0, 0, 0);
    return (ret >= 0);
}

} // namespace frameguard

#else // !__linux__

namespace frameguard {

const char* seccomp_profile_name(SeccompProfile p) {
    return p == SeccompProfile::COMPUTE ? "compute" : "process";
}

std::string install_seccomp_filter(SeccompProfile) {
    return "";
}

bool seccomp_available() {
    return false;
}

} // namespace frameguard

#endif
