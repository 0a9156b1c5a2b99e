#include "frameguard/proc.h"
#include "frameguard/sandbox.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
  #include <sched.h>
  #include <sys/prctl.h>
#endif

namespace frameguard {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;

    auto flush = [&]() {
        if (!cur.empty()) {
            out.push_back(cur);
            cur.clear();
        }
    };

    for (char c : cmd) {
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                flush();
                continue;
            }
            if (c == '\'') { st = SQ; continue; }
            if (c == '"') { st = DQ; esc = false; continue; }
            cur.push_back(c);
        } else if (st == SQ) {
            if (c == '\'') { st = NORM; continue; }
            cur.push_back(c);
        } else {
            if (esc) {
                cur.push_back(c);
                esc = false;
                continue;
            }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { st = NORM; continue; }
            cur.push_back(c);
        }
    }
    if (st != NORM) return {};
    flush();
    return out;
}

namespace {

void set_rlimit(int resource, rlim_t soft, rlim_t hard) {
    struct rlimit rl;
    rl.rlim_cur = soft;
    rl.rlim_max = hard;
    (void)setrlimit(resource, &rl);
}

bool env_true(const char* key) {
    const char* v = std::getenv(key);
    if (!v) return false;
    std::string s = v;
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return (s == "1" || s == "true" || s == "yes" || s == "on");
}

// Operator-provided wrapper (bwrap, nsjail, firejail) prepended to argv.
// Disabled unless FRAMEGUARD_PROC_WRAPPER_ENABLE is set.
bool apply_wrapper(std::vector<std::string>* argv) {
    if (!env_true("FRAMEGUARD_PROC_WRAPPER_ENABLE")) return false;
    const char* w = std::getenv("FRAMEGUARD_PROC_WRAPPER");
    if (!w) return false;
    auto toks = split_argv_quoted(w);
    if (toks.empty()) return false;
    toks.insert(toks.end(), argv->begin(), argv->end());
    argv->swap(toks);
    return true;
}

long elapsed_ms_since(std::chrono::steady_clock::time_point start) {
    return (long)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

long cpu_ms_of(const struct rusage& ru) {
    return (long)(ru.ru_utime.tv_sec + ru.ru_stime.tv_sec) * 1000L +
           (long)(ru.ru_utime.tv_usec + ru.ru_stime.tv_usec) / 1000L;
}

void kill_group(pid_t pid, int* status, struct rusage* ru) {
    (void)kill(-pid, SIGKILL);
    (void)kill(pid, SIGKILL);
    while (wait4(pid, status, 0, ru) < 0 && errno == EINTR) {}
}

// Runs in the forked child; only returns on failure.
[[noreturn]] void child_exec(int in_fd, int out_fd, const std::string& cwd, const ProcLimits& lim,
                             bool wrapped, char* const* cargv, char* const* cenv) {
    (void)dup2(in_fd, STDIN_FILENO);
    (void)dup2(out_fd, STDOUT_FILENO);
    if (lim.merge_stderr) {
        (void)dup2(out_fd, STDERR_FILENO);
    } else {
        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) (void)dup2(devnull, STDERR_FILENO);
    }

    // isolate process group so timeout can kill the whole subtree
    (void)setpgid(0, 0);
    (void)umask(077);

    long maxfd = sysconf(_SC_OPEN_MAX);
    if (maxfd < 256) maxfd = 256;
    for (int fd = 3; fd < maxfd; fd++) {
        (void)close(fd);
    }

    // the scratch directory is the only writable place; no fallback to ours
    if (!cwd.empty() && chdir(cwd.c_str()) != 0) _exit(126);

#ifdef __linux__
    if (lim.unshare_network) {
        // fails without user namespaces; the isolation check reports that case
        (void)unshare(CLONE_NEWUSER | CLONE_NEWNET);
    }
    if (lim.no_new_privs) {
        (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
    }
    (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

    set_rlimit(RLIMIT_CORE, 0, 0);
    if (lim.rlimit_cpu_sec > 0) {
        // soft limit raises SIGXCPU, hard limit one second later is SIGKILL
        set_rlimit(RLIMIT_CPU, (rlim_t)lim.rlimit_cpu_sec, (rlim_t)lim.rlimit_cpu_sec + 1);
    }
    if (lim.rlimit_as_mb > 0) {
        rlim_t bytes = (rlim_t)lim.rlimit_as_mb * 1024ULL * 1024ULL;
        set_rlimit(RLIMIT_AS, bytes, bytes);
    }
    {
        rlim_t bytes = (rlim_t)lim.rlimit_fsize_mb * 1024ULL * 1024ULL;
        set_rlimit(RLIMIT_FSIZE, bytes, bytes);
    }
    if (lim.rlimit_nofile > 0) {
        set_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile, (rlim_t)lim.rlimit_nofile);
    }
#ifdef RLIMIT_NPROC
    if (lim.rlimit_nproc > 0) {
        set_rlimit(RLIMIT_NPROC, (rlim_t)lim.rlimit_nproc, (rlim_t)lim.rlimit_nproc);
    }
#endif

    if (lim.enable_seccomp && !wrapped) {
        (void)install_seccomp_filter(SeccompProfile::PROCESS);
    }

    if (std::strchr(cargv[0], '/')) execve(cargv[0], cargv, cenv);
    else execvpe(cargv[0], cargv, cenv);
    _exit(127);
}

} // namespace

bool proc_run_capture_sandboxed(const std::vector<std::string>& argv,
                                const std::string& cwd,
                                const ProcLimits& lim,
                                ProcResult* res) {
    return proc_run_capture_sandboxed_stdin(argv, cwd, std::string(), lim, res);
}

bool proc_run_capture_sandboxed_stdin(const std::vector<std::string>& argv,
                                      const std::string& cwd,
                                      const std::string& stdin_data,
                                      const ProcLimits& lim,
                                      ProcResult* res,
                                      const CancelFn& cancel) {
    if (!res) return false;
    *res = ProcResult{};

    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    std::vector<std::string> eff_argv = argv;
    const bool wrapped = apply_wrapper(&eff_argv);

    std::vector<std::string> env = lim.env;
    if (env.empty()) {
        env.push_back("PATH=/usr/local/bin:/usr/bin:/bin");
        env.push_back("LC_ALL=C");
    }

    // argv/envp are built before fork: the child only calls exec-safe functions
    std::vector<char*> cargv;
    cargv.reserve(eff_argv.size() + 1);
    for (auto& s : eff_argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);
    std::vector<char*> cenv;
    cenv.reserve(env.size() + 1);
    for (auto& s : env) cenv.push_back(const_cast<char*>(s.c_str()));
    cenv.push_back(nullptr);

    int out_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        res->error = std::string("pipe(out) failed: ") + std::strerror(errno);
        return false;
    }
    int in_pipe[2];
    if (pipe2(in_pipe, O_CLOEXEC) != 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        res->error = std::string("pipe(in) failed: ") + std::strerror(errno);
        return false;
    }

    int flags = fcntl(out_pipe[0], F_GETFL, 0);
    if (flags >= 0) (void)fcntl(out_pipe[0], F_SETFL, flags | O_NONBLOCK);

    const auto start = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        close(in_pipe[0]); close(in_pipe[1]);
        res->error = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }

    if (pid == 0) {
        child_exec(in_pipe[0], out_pipe[1], cwd, lim, wrapped, cargv.data(), cenv.data());
    }

    // parent
    (void)setpgid(pid, pid);
    close(out_pipe[1]);
    close(in_pipe[0]);

    // Interleave stdin writes with stdout reads: a large job would otherwise
    // deadlock with both sides blocked on a full pipe.
    int in_fd = in_pipe[1];
    if (!stdin_data.empty()) {
        int fl = fcntl(in_fd, F_GETFL, 0);
        if (fl >= 0) (void)fcntl(in_fd, F_SETFL, fl | O_NONBLOCK);
    } else {
        close(in_fd);
        in_fd = -1;
    }
    size_t write_off = 0;

    std::string out;
    out.reserve(std::min<size_t>(lim.stdout_max_bytes, 64 * 1024));

    auto append_stdout = [&](const char* buf, ssize_t n) {
        size_t can = lim.stdout_max_bytes > out.size() ? (lim.stdout_max_bytes - out.size()) : 0;
        if (can > 0) {
            size_t take = (size_t)n;
            if (take > can) { take = can; res->output_truncated = true; }
            out.append(buf, buf + take);
        } else {
            res->output_truncated = true;
        }
    };

    auto drain = [&]() {
        char buf[4096];
        while (true) {
            ssize_t n = read(out_pipe[0], buf, sizeof(buf));
            if (n > 0) { append_stdout(buf, n); continue; }
            if (n < 0 && errno == EINTR) continue;
            break;
        }
    };

    bool child_exited = false;
    int status = 0;
    struct rusage usage;
    std::memset(&usage, 0, sizeof(usage));

    while (true) {
        struct pollfd fds[2];
        nfds_t nfds = 0;
        int in_idx = -1;
        if (in_fd >= 0) {
            in_idx = (int)nfds;
            fds[nfds].fd = in_fd;
            fds[nfds].events = POLLOUT;
            nfds++;
        }
        const int out_idx = (int)nfds;
        fds[nfds].fd = out_pipe[0];
        fds[nfds].events = POLLIN;
        nfds++;

        const long elapsed = elapsed_ms_since(start);
        int slice = 50;
        if (lim.timeout_ms > 0) {
            long remaining = lim.timeout_ms - elapsed;
            if (remaining <= 0) {
                res->timed_out = true;
                kill_group(pid, &status, &usage);
                child_exited = true;
                break;
            }
            if (remaining < slice) slice = (int)remaining;
        }
        if (cancel && cancel()) {
            res->cancelled = true;
            kill_group(pid, &status, &usage);
            child_exited = true;
            break;
        }

        int pr = poll(fds, nfds, slice);
        if (pr < 0 && errno == EINTR) continue;

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            while (write_off < stdin_data.size()) {
                ssize_t n = write(in_fd, stdin_data.data() + write_off, stdin_data.size() - write_off);
                if (n > 0) { write_off += (size_t)n; continue; }
                if (n == -1 && errno == EINTR) continue;
                if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                write_off = stdin_data.size(); // child closed stdin
                break;
            }
            if (write_off >= stdin_data.size()) {
                close(in_fd);
                in_fd = -1;
            }
        }

        if (fds[out_idx].revents & (POLLIN | POLLERR | POLLHUP)) drain();

        pid_t w = wait4(pid, &status, WNOHANG, &usage);
        if (w == pid) {
            child_exited = true;
            break;
        }
    }

    if (in_fd >= 0) close(in_fd);
    drain();
    close(out_pipe[0]);

    res->duration_ms = elapsed_ms_since(start);
    if (child_exited) res->cpu_ms = cpu_ms_of(usage);
    res->output = std::move(out);
    if (!child_exited) {
        res->exit_code = 128;
        res->error = "child did not exit";
        return true;
    }
    if (WIFEXITED(status)) {
        res->exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        res->term_signal = WTERMSIG(status);
        res->exit_code = 128 + res->term_signal;
    } else {
        res->exit_code = 128;
    }
    return true;
}

} // namespace frameguard
