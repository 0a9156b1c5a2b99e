#include "test_common.h"

#include "frameguard/isolation.h"

#include <string>

#include <stdlib.h>
#include <unistd.h>

using namespace frameguard;

int main() {
    char tmpl[] = "/tmp/frameguard-iso-XXXXXX";
    if (!mkdtemp(tmpl)) die("mkdtemp failed");

    IsolationReport rep = check_isolation(tmpl);
    expect_true(rep.error.empty(), "check error: " + rep.error);
    expect_true(rep.scratch_writable, "temp dir is writable");
    expect_true(rep.summary().find("scratch=ok") != std::string::npos, "summary: " + rep.summary());
    expect_true(rep.running_as_root == (geteuid() == 0), "root detection");
    expect_true(rep.ok() == rep.failures().empty(), "failures explain ok()");
    ::rmdir(tmpl);

    // A missing directory cannot be written, even by root
    IsolationReport bad = check_isolation("/nonexistent/frameguard-scratch");
    expect_true(!bad.scratch_writable, "missing scratch not writable");
    expect_true(!bad.ok(), "not ok");
    expect_true(bad.failures().find("scratch") != std::string::npos, "failure names scratch");

    // Report composition
    IsolationReport r;
    r.scratch_writable = true;
    r.seccomp_available = true;
    expect_true(r.ok(), "isolated report is ok");
    r.network_interfaces.push_back("eth0");
    expect_true(!r.ok() && !r.network_isolated(), "interface up breaks isolation");
    expect_true(r.summary().find("network=up(eth0)") != std::string::npos, "summary names interface");

    std::cerr << "test_isolation: ALL PASSED" << std::endl;
    return 0;
}
