#include "test_common.h"

#include "serve_http.h"

#include "frameguard/gateway.h"
#include "frameguard/serialization.h"

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>

#include <sys/socket.h>
#include <unistd.h>

using namespace frameguard;

// Connected stream pair: [0] plays the server, [1] the client.
struct SocketPair {
    int fd[2]{-1, -1};
    SocketPair() {
        if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fd) != 0) die("socketpair failed");
    }
    ~SocketPair() {
        close_client();
        if (fd[0] >= 0) ::close(fd[0]);
    }
    int server() const { return fd[0]; }
    void close_client() {
        if (fd[1] >= 0) ::close(fd[1]);
        fd[1] = -1;
    }
    void send_all(const std::string& s) {
        size_t off = 0;
        while (off < s.size()) {
            ssize_t n = ::send(fd[1], s.data() + off, s.size() - off, MSG_NOSIGNAL);
            if (n <= 0) die("client send failed");
            off += (size_t)n;
        }
    }
};

static ReadStatus read_from(SocketPair& sp, std::string& head, std::string& body, size_t max_body = 1024) {
    return read_http_request(sp.server(), head, body, max_body);
}

// Waits for cancellation for up to five seconds.
class CancelAwareExecutor final : public IExecutor {
public:
    ExecutionResult run(const ExecutionRequest&, const ExecLimits&, const CancelFn& cancel) override {
        started.store(true);
        ExecutionResult r;
        for (int i = 0; i < 500; i++) {
            if (cancel && cancel()) {
                saw_cancel.store(true);
                r.status = ExecStatus::RUNTIME_ERROR;
                r.diagnostics = "execution cancelled";
                return r;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        r.status = ExecStatus::SUCCESS;
        return r;
    }

    std::atomic<bool> started{false};
    std::atomic<bool> saw_cancel{false};
};

int main() {
    std::string head, body;

    // Well-formed request; bytes past Content-Length are not part of the body
    {
        SocketPair sp;
        sp.send_all("POST /v1/execute HTTP/1.1\r\nHost: x\r\nContent-Length: 5\r\n\r\nhelloEXTRA");
        expect_true(read_from(sp, head, body) == ReadStatus::OK, "plain request");
        expect_true(head.find("POST /v1/execute") == 0, "head kept: " + head);
        expect_true(body == "hello", "body cut at Content-Length: " + body);
    }

    // Body arriving after the head in a later segment
    {
        SocketPair sp;
        std::thread late([&] {
            sp.send_all("POST / HTTP/1.1\r\ncontent-length: 11\r\n\r\nhello");
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            sp.send_all(" world");
        });
        ReadStatus rs = read_from(sp, head, body);
        late.join();
        expect_true(rs == ReadStatus::OK, "split body");
        expect_true(body == "hello world", "split body joined: " + body);
    }

    // Declared body above the ceiling is refused before it is read
    {
        SocketPair sp;
        sp.send_all("POST / HTTP/1.1\r\nContent-Length: 4096\r\n\r\n");
        expect_true(read_from(sp, head, body, 1024) == ReadStatus::TOO_LARGE, "oversized body");
        expect_true(body.empty(), "nothing read");
    }

    // Header block without a terminator past 64 KiB
    {
        SocketPair sp;
        const int client_fd = sp.fd[1];
        std::thread flood([client_fd] {
            // stops once the server side stops reading
            const std::string s = "GET / HTTP/1.1\r\nX-Pad: " + std::string(70 * 1024, 'a');
            size_t off = 0;
            while (off < s.size()) {
                ssize_t n = ::send(client_fd, s.data() + off, s.size() - off, MSG_NOSIGNAL);
                if (n <= 0) break;
                off += (size_t)n;
            }
        });
        ReadStatus rs = read_from(sp, head, body);
        ::shutdown(sp.server(), SHUT_RD);
        flood.join();
        expect_true(rs == ReadStatus::TOO_LARGE, "oversized head");
    }

    // Framing headers that allow request smuggling
    {
        SocketPair sp;
        sp.send_all("POST / HTTP/1.1\r\nContent-Length: 3\r\nContent-Length: 3\r\n\r\nabc");
        expect_true(read_from(sp, head, body) == ReadStatus::BAD_REQUEST, "duplicate Content-Length");
    }
    {
        SocketPair sp;
        sp.send_all("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nabc\r\n0\r\n\r\n");
        expect_true(read_from(sp, head, body) == ReadStatus::BAD_REQUEST, "Transfer-Encoding");
    }
    {
        SocketPair sp;
        sp.send_all("POST / HTTP/1.1\r\nContent-Length: -1\r\n\r\n");
        expect_true(read_from(sp, head, body) == ReadStatus::BAD_REQUEST, "negative Content-Length");
    }
    {
        SocketPair sp;
        sp.send_all("POST / HTTP/1.1\r\nContent-Length: 12abc\r\n\r\n");
        expect_true(read_from(sp, head, body) == ReadStatus::BAD_REQUEST, "non-numeric Content-Length");
    }

    // Peer going away mid-request
    {
        SocketPair sp;
        sp.send_all("POST / HTTP/1.1\r\nContent-Le");
        sp.close_client();
        expect_true(read_from(sp, head, body) == ReadStatus::CLOSED, "closed inside head");
    }
    {
        SocketPair sp;
        sp.send_all("POST / HTTP/1.1\r\nContent-Length: 10\r\n\r\nabc");
        sp.close_client();
        expect_true(read_from(sp, head, body) == ReadStatus::CLOSED, "closed inside body");
    }

    // Token check
    {
        const std::string tok = "s3cret-token";
        const std::string base = "POST /v1/execute HTTP/1.1\r\nHost: x\r\n";
        expect_true(api_token_ok(base + "X-Api-Token: s3cret-token\r\n\r\n", tok), "X-Api-Token accepted");
        expect_true(api_token_ok(base + "x-api-token: s3cret-token\r\n\r\n", tok), "header name case-insensitive");
        expect_true(api_token_ok(base + "Authorization: Bearer s3cret-token\r\n\r\n", tok), "bearer accepted");
        expect_true(!api_token_ok(base + "X-Api-Token: s3cret-tokeN\r\n\r\n", tok), "wrong token refused");
        expect_true(!api_token_ok(base + "Authorization: Basic s3cret-token\r\n\r\n", tok), "basic auth refused");
        expect_true(!api_token_ok(base + "Authorization: Bearer \r\n\r\n", tok), "empty bearer refused");
        expect_true(!api_token_ok(base + "\r\n", tok), "missing token refused");
        expect_true(api_token_ok(base + "\r\n", ""), "no token configured: open");

        expect_true(constant_time_eq("abc", "abc"), "equal strings");
        expect_true(!constant_time_eq("abc", "abd"), "differing byte");
        expect_true(!constant_time_eq("abc", "abcd"), "differing length");
        expect_true(header_value_ci(base + "X-Request-Id:   r-7\r\n\r\n", "x-request-id") == "r-7",
                    "header value trimmed");
    }

    // Disconnect detection
    {
        SocketPair sp;
        expect_true(!peer_disconnected(sp.server()), "open connection");
        sp.send_all("x");
        expect_true(!peer_disconnected(sp.server()), "unread data is not a disconnect");
        char c;
        if (::recv(sp.server(), &c, 1, 0) != 1) die("recv failed");
        ::shutdown(sp.fd[1], SHUT_WR);
        expect_true(peer_disconnected(sp.server()), "half-close seen");
    }
    {
        SocketPair sp;
        sp.close_client();
        expect_true(peer_disconnected(sp.server()), "close seen");
    }

    // A client hanging up cancels its run
    {
        CancelAwareExecutor ex;
        GatewayOptions opt;
        opt.workers = 1;
        Gateway gw(ex, opt);

        SocketPair sp;
        ExecutionRequest req;
        req.request_id = "http-1";
        req.source_code = "x = 1\n";
        std::string err;
        if (!dataset_from_records_json(R"([{"a":1}])", &req.dataset, &err)) die(err);

        const int server_fd = sp.server();
        auto fut = gw.submit(std::move(req), [server_fd] { return peer_disconnected(server_fd); });
        for (int i = 0; i < 500 && !ex.started.load(); i++) std::this_thread::sleep_for(std::chrono::milliseconds(5));
        expect_true(ex.started.load(), "run started");
        sp.close_client();

        expect_true(fut.wait_for(std::chrono::seconds(3)) == std::future_status::ready, "cancel is prompt");
        ExecutionResult r = fut.get();
        expect_true(ex.saw_cancel.load(), "executor saw the disconnect");
        expect_true(r.status == ExecStatus::RUNTIME_ERROR, "cancelled run is an error");
        expect_true(r.diagnostics.find("cancelled") != std::string::npos, "diagnostic: " + r.diagnostics);
    }

    std::cerr << "test_http: ALL PASSED" << std::endl;
    return 0;
}
