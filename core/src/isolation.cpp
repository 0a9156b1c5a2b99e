#include "frameguard/isolation.h"
#include "frameguard/sandbox.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <vector>

#include <fcntl.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <unistd.h>

namespace frameguard {

namespace {

std::string join(const std::vector<std::string>& v, const char* sep) {
    std::string out;
    for (size_t i = 0; i < v.size(); i++) {
        if (i) out += sep;
        out += v[i];
    }
    return out;
}

bool try_scratch(const std::string& root) {
    std::string tmpl = root + "/.frameguard-check-XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    int fd = mkstemp(buf.data());
    if (fd < 0) return false;
    bool ok = ::write(fd, "x", 1) == 1;
    ::close(fd);
    ::unlink(buf.data());
    return ok;
}

bool user_namespaces_usable() {
    std::ifstream f("/proc/sys/user/max_user_namespaces");
    long n = 0;
    if (!(f >> n) || n <= 0) return false;
    std::ifstream g("/proc/sys/kernel/unprivileged_userns_clone");
    int allowed = 1;
    if (g >> allowed) return allowed != 0;
    return true;
}

} // namespace

bool IsolationReport::ok() const {
    return error.empty() && network_isolated() && scratch_writable && !running_as_root && seccomp_available;
}

std::string IsolationReport::summary() const {
    std::string s;
    s += "network=" + (network_isolated() ? std::string("isolated") : "up(" + join(network_interfaces, ",") + ")");
    s += std::string(" scratch=") + (scratch_writable ? "ok" : "unwritable");
    s += std::string(" root=") + (running_as_root ? "yes" : "no");
    s += std::string(" seccomp=") + (seccomp_available ? "yes" : "no");
    s += std::string(" userns=") + (user_namespaces ? "yes" : "no");
    return s;
}

std::string IsolationReport::failures() const {
    std::vector<std::string> why;
    if (!error.empty()) why.push_back(error);
    if (!network_isolated()) why.push_back("network interfaces up: " + join(network_interfaces, ","));
    if (!scratch_writable) why.push_back("scratch area not writable");
    if (running_as_root) why.push_back("running as root");
    if (!seccomp_available) why.push_back("seccomp unavailable");
    return join(why, "; ");
}

IsolationReport check_isolation(const std::string& scratch_root) {
    IsolationReport rep;

    struct ifaddrs* ifs = nullptr;
    if (getifaddrs(&ifs) != 0) {
        rep.error = std::string("getifaddrs: ") + std::strerror(errno);
    } else {
        for (struct ifaddrs* it = ifs; it; it = it->ifa_next) {
            if (!it->ifa_name) continue;
            if (it->ifa_flags & IFF_LOOPBACK) continue;
            if (!(it->ifa_flags & IFF_UP)) continue;
            std::string name = it->ifa_name;
            bool seen = false;
            for (const auto& n : rep.network_interfaces) seen = seen || n == name;
            if (!seen) rep.network_interfaces.push_back(name);
        }
        freeifaddrs(ifs);
    }

    rep.scratch_writable = try_scratch(scratch_root);
    rep.running_as_root = (geteuid() == 0);
    rep.seccomp_available = seccomp_available();
    rep.user_namespaces = user_namespaces_usable();
    return rep;
}

} // namespace frameguard
