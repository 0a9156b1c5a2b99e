#include "commands.h"
#include "runner_utils.h"
#include "serve_http.h"

#include "frameguard/gateway.h"
#include "frameguard/json_mini.h"
#include "frameguard/log.h"
#include "frameguard/serialization.h"
#include "frameguard/workbench.h"
#include "frameguard/workshop.h"

#include <json-c/json.h>

#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <list>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>

using namespace frameguard;

namespace {

int http_code_for(ExecStatus st) {
    switch (st) {
        case ExecStatus::MALFORMED_REQUEST: return 400;
        case ExecStatus::OVERLOADED: return 503;
        default: return 200;
    }
}

std::string error_json(const std::string& msg) {
    return "{\"success\":false,\"error_message\":" + json_quote(msg) + "}";
}

bool is_loopback_host(const std::string& host) {
    return host == "127.0.0.1" || host.rfind("127.", 0) == 0;
}

struct ConnThread {
    std::thread t;
    std::shared_ptr<std::atomic<bool>> done;
};

} // namespace

int cmd_serve(int argc, char** argv) {
    // Ignore SIGPIPE: writing to disconnected clients should not crash the server
    ::signal(SIGPIPE, SIG_IGN);

    ServiceConfig cfg;
    if (!prepare_service("serve", &cfg)) return 3;

    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--host" && i + 1 < argc) { cfg.host = argv[++i]; continue; }
        if (a == "--port" && i + 1 < argc) { cfg.port = std::atoi(argv[++i]); continue; }
        if (a == "--workers" && i + 1 < argc) { cfg.workers = (size_t)std::clamp(std::atoi(argv[++i]), 1, 64); continue; }
        if (a == "--queue" && i + 1 < argc) { cfg.queue_capacity = (size_t)std::clamp(std::atoi(argv[++i]), 0, 4096); continue; }
        std::cerr << "usage: frameguard_cli serve [--host H] [--port P] [--workers N] [--queue N]\n";
        return 2;
    }
    if (cfg.port <= 0 || cfg.port > 65535) {
        std::cerr << "[serve] port out of range: " << cfg.port << "\n";
        return 2;
    }

    const Workshop& workshop = Workshop::initialize();
    Workbench workbench(workshop, workbench_options_from(cfg, argv[0]));
    WorkbenchExecutor executor(workbench);

    AuditLog audit(cfg.audit_log_path);
    if (!audit.error().empty()) {
        std::cerr << "[serve] " << audit.error() << " (" << cfg.audit_log_path << ")\n";
        return 2;
    }

    // Create server socket BEFORE starting worker threads, so that failures here
    // don't leave running threads dangling.
    int sfd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (sfd < 0) { std::cerr << "[serve] socket failed\n"; return 2; }
    {
        int one = 1;
        ::setsockopt(sfd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons((uint16_t)cfg.port);
    if (::inet_pton(AF_INET, cfg.host.c_str(), &addr.sin_addr) <= 0) {
        std::cerr << "[serve] bad host: " << cfg.host << "\n";
        ::close(sfd);
        return 2;
    }
    if (::bind(sfd, (sockaddr*)&addr, sizeof(addr)) < 0) {
        std::cerr << "[serve] bind failed on " << cfg.host << ":" << cfg.port << "\n";
        ::close(sfd);
        return 2;
    }
    if (::listen(sfd, 64) < 0) {
        std::cerr << "[serve] listen failed\n";
        ::close(sfd);
        return 2;
    }

    if (cfg.api_token.empty()) {
        std::cerr << "[WARN] FRAMEGUARD_API_TOKEN is unset; /shutdown is disabled (fail-closed).\n";
        if (!is_loopback_host(cfg.host)) {
            std::cerr << "[WARN] listening on " << cfg.host << " without a token; any reachable client may submit code.\n";
        }
    }

    Gateway gateway(executor, gateway_options_from(cfg), &audit);
    const GatewayOptions gopt = gateway.options();

    std::atomic<int> active_conns{0};
    std::atomic<bool> running{true};
    std::list<ConnThread> conns;

    std::cerr << "[serve] http://" << cfg.host << ":" << cfg.port
              << " workers=" << gopt.workers << " queue=" << gopt.queue_capacity
              << " workhost=" << workbench.options().workhost_path;
    if (audit.enabled()) std::cerr << " audit=" << audit.path();
    std::cerr << "\n";

    auto handle_conn = [&](int cfd, const std::string& peer) {
        std::string head, body;
        ReadStatus rs = read_http_request(cfd, head, body, cfg.max_body_bytes);
        if (rs == ReadStatus::CLOSED) return;
        if (rs == ReadStatus::TOO_LARGE) {
            send_json(cfd, 413, error_json("request exceeds " + std::to_string(cfg.max_body_bytes) + " bytes"));
            return;
        }
        if (rs == ReadStatus::BAD_REQUEST) {
            send_json(cfd, 400, error_json("bad request framing"));
            return;
        }

        std::istringstream iss(head);
        std::string method, path, ver;
        iss >> method >> path >> ver;
        auto q = path.find('?');
        if (q != std::string::npos) path.resize(q);

        if (method == "GET" && path == "/health") {
            send_json(cfd, 200, std::string("{\"ok\":true,\"profile\":\"") + profile_name(cfg.profile) + "\"}");
            return;
        }

        if (!api_token_ok(head, cfg.api_token)) {
            send_json(cfd, 401, error_json("unauthorized"));
            return;
        }

        if (method == "GET" && path == "/stats") {
            send_json(cfd, 200, stats_to_json(gateway.stats(), gopt));
            return;
        }

        if (method == "GET" && path == "/metrics") {
            send_response(cfd, 200, "text/plain; version=0.0.4; charset=utf-8",
                          stats_to_prometheus(gateway.stats(), gopt));
            return;
        }

        if (method == "POST" && path == "/shutdown") {
            // Fail-closed: without a token nobody can stop the service over HTTP
            if (cfg.api_token.empty()) {
                send_json(cfd, 403, error_json("shutdown disabled: no token configured"));
                return;
            }
            send_json(cfd, 200, "{\"ok\":true,\"message\":\"shutting_down\"}");
            std::cerr << "[serve] shutdown requested by " << peer << "\n";
            running.store(false);
            return;
        }

        if (method == "POST" && path == "/scan") {
            json_mini::Doc d = json_mini::parse(body);
            std::string src;
            if (!d || !json_get_string(d.root, "code_snippet", &src)) {
                send_json(cfd, 400, error_json("body must be an object with a string code_snippet"));
                return;
            }
            json_mini::Doc out(decision_to_json(gateway.screen(src)));
            send_json(cfd, 200, json_mini::dump(out.root));
            return;
        }

        if (method == "POST" && path == "/execute") {
            ExecutionRequest req;
            std::string err;
            if (!request_from_json_string(body, &req, &err)) {
                ExecutionResult bad;
                bad.status = ExecStatus::MALFORMED_REQUEST;
                bad.diagnostics = err;
                audit.record(req, bad);
                send_json(cfd, 400, result_to_json_string(bad));
                return;
            }
            const std::string rid = req.request_id;
            auto fut = gateway.submit(std::move(req), [cfd] { return peer_disconnected(cfd); });
            ExecutionResult res = fut.get();
            if (peer_disconnected(cfd)) {
                std::cerr << "[serve] client " << peer << " went away"
                          << (rid.empty() ? "" : " (request " + rid + ")") << "\n";
                return;
            }
            send_json(cfd, http_code_for(res.status), result_to_json_string(res));
            return;
        }

        if (path == "/execute" || path == "/scan" || path == "/shutdown" || path == "/health" ||
            path == "/stats" || path == "/metrics") {
            send_json(cfd, 405, error_json("method not allowed"));
            return;
        }
        send_json(cfd, 404, error_json("not found"));
    };

    while (running.load()) {
        // reap finished connection threads
        for (auto it = conns.begin(); it != conns.end();) {
            if (it->done->load()) {
                if (it->t.joinable()) it->t.join();
                it = conns.erase(it);
            } else {
                ++it;
            }
        }

        struct pollfd p{};
        p.fd = sfd;
        p.events = POLLIN;
        int pr = ::poll(&p, 1, 250);
        if (pr <= 0) continue;

        sockaddr_in caddr{};
        socklen_t clen = sizeof(caddr);
        int cfd = ::accept4(sfd, (sockaddr*)&caddr, &clen, SOCK_CLOEXEC);
        if (cfd < 0) continue;

        char ipbuf[64] = {0};
        (void)inet_ntop(AF_INET, &caddr.sin_addr, ipbuf, sizeof(ipbuf));
        std::string peer = ipbuf;

        if (!cfg.allow_clients.empty() &&
            std::find(cfg.allow_clients.begin(), cfg.allow_clients.end(), peer) == cfg.allow_clients.end()) {
            send_json(cfd, 403, error_json("client not allowed"));
            ::close(cfd);
            continue;
        }
        if (active_conns.load() >= cfg.max_conns) {
            send_json(cfd, 503, error_json("too many connections"));
            ::close(cfd);
            continue;
        }
        active_conns.fetch_add(1);
        set_socket_timeouts(cfd, cfg.socket_timeout_ms);

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread t([&, cfd, peer, done]() {
            try {
                handle_conn(cfd, peer);
            } catch (const std::exception& e) {
                std::cerr << "[serve] connection from " << peer << " failed: " << e.what() << "\n";
                send_json(cfd, 500, error_json("internal error"));
            }
            ::close(cfd);
            active_conns.fetch_sub(1);
            done->store(true);
        });
        conns.push_back(ConnThread{std::move(t), done});
    }

    // graceful shutdown: stop listening, finish open connections, drain the pool
    ::close(sfd);
    for (auto& c : conns) {
        if (c.t.joinable()) c.t.join();
    }
    conns.clear();
    gateway.shutdown();

    GatewayStats s = gateway.stats();
    std::cerr << "[serve] stopped after " << s.received << " requests (" << s.succeeded << " succeeded)\n";
    return 0;
}
