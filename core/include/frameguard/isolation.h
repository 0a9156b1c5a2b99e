#pragma once

// Startup check of the deployment contract around the service: no usable
// network, a writable scratch area, not running as root, seccomp present.

#include <string>
#include <vector>

namespace frameguard {

struct IsolationReport {
    std::vector<std::string> network_interfaces; // non-loopback, up
    bool scratch_writable{false};
    bool running_as_root{false};
    bool seccomp_available{false};
    bool user_namespaces{false};                 // informational
    std::string error;                           // the check itself failed

    bool network_isolated() const { return network_interfaces.empty(); }
    bool ok() const;
    // "network=isolated scratch=ok root=no seccomp=yes userns=no"
    std::string summary() const;
    // Why ok() is false; empty when it is not.
    std::string failures() const;
};

IsolationReport check_isolation(const std::string& scratch_root);

} // namespace frameguard
