#pragma once

// HTTP helper functions for cmd_serve.cpp

#include <cstdint>
#include <sstream>
#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace frameguard {

// Set socket recv/send timeouts for Slowloris defense
inline void set_socket_timeouts(int fd, int timeout_ms) {
    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

enum class ReadStatus { OK, CLOSED, TOO_LARGE, BAD_REQUEST };

// Content-Length exceeding max_body is rejected without reading the body.
inline ReadStatus read_http_request(int fd, std::string& head, std::string& body, size_t max_body) {
    head.clear();
    body.clear();
    std::string buf;
    buf.resize(8192);
    std::string all;

    while (all.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, buf.data(), buf.size(), 0);
        if (n <= 0) return ReadStatus::CLOSED; // timeout or disconnect
        all.append(buf.data(), (size_t)n);
        if (all.size() > 64 * 1024 && all.find("\r\n\r\n") == std::string::npos) return ReadStatus::TOO_LARGE;
    }

    size_t p = all.find("\r\n\r\n");
    head = all.substr(0, p + 4);
    std::string rest = all.substr(p + 4);

    size_t cl = 0;
    {
        int cl_count = 0;
        std::istringstream iss(head);
        std::string line;
        while (std::getline(iss, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            std::string low = line;
            for (char& c : low) if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
            if (low.rfind("transfer-encoding:", 0) == 0) return ReadStatus::BAD_REQUEST; // chunked unsupported
            if (low.rfind("content-length:", 0) == 0) {
                cl_count++;
                if (cl_count > 1) return ReadStatus::BAD_REQUEST; // duplicate Content-Length: request smuggling
                std::string v = line.substr(15);
                while (!v.empty() && (v[0] == ' ' || v[0] == '\t')) v.erase(0, 1);
                if (v.empty() || v.find_first_not_of("0123456789") != std::string::npos || v.size() > 15) {
                    return ReadStatus::BAD_REQUEST;
                }
                cl = (size_t)std::stoull(v);
            }
        }
    }

    if (cl > max_body) return ReadStatus::TOO_LARGE;

    body = rest;
    while (body.size() < cl) {
        ssize_t n = ::recv(fd, buf.data(), buf.size(), 0);
        if (n <= 0) return ReadStatus::CLOSED;
        body.append(buf.data(), (size_t)n);
    }
    if (body.size() > cl) body.resize(cl);
    return ReadStatus::OK;
}

inline const char* reason_phrase(int code) {
    switch (code) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 422: return "Unprocessable Entity";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
    }
    return "ERR";
}

inline void send_response(int fd, int code, const char* content_type, const std::string& body) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << code << " " << reason_phrase(code) << "\r\n";
    oss << "Content-Type: " << content_type << "\r\n";
    oss << "Content-Length: " << body.size() << "\r\n";
    oss << "Connection: close\r\n\r\n";
    oss << body;
    auto s = oss.str();
    size_t sent = 0;
    while (sent < s.size()) {
        ssize_t n = ::send(fd, s.data() + sent, s.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) break;
        sent += (size_t)n;
    }
}

inline void send_json(int fd, int code, const std::string& json) {
    send_response(fd, code, "application/json", json);
}

inline std::string header_value_ci(const std::string& head, const std::string& key_lower) {
    std::istringstream iss(head);
    std::string line;
    std::getline(iss, line);
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        auto c = line.find(':');
        if (c == std::string::npos) continue;
        std::string k = line.substr(0, c);
        for (char& ch : k) if (ch >= 'A' && ch <= 'Z') ch = (char)(ch - 'A' + 'a');
        if (k == key_lower) {
            std::string v = line.substr(c + 1);
            while (!v.empty() && (v[0] == ' ' || v[0] == '\t')) v.erase(0, 1);
            return v;
        }
    }
    return "";
}

// Length is not secret; contents are compared without early exit.
inline bool constant_time_eq(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    unsigned char diff = 0;
    for (size_t i = 0; i < a.size(); i++) diff |= (unsigned char)(a[i] ^ b[i]);
    return diff == 0;
}

inline bool api_token_ok(const std::string& head, const std::string& expected_token) {
    if (expected_token.empty()) return true;
    std::string x = header_value_ci(head, "x-api-token");
    if (!x.empty() && constant_time_eq(x, expected_token)) return true;
    std::string auth = header_value_ci(head, "authorization");
    const std::string pfx = "Bearer ";
    if (auth.rfind(pfx, 0) == 0) {
        std::string t = auth.substr(pfx.size());
        return constant_time_eq(t, expected_token);
    }
    return false;
}

// True once the peer has closed or half-closed its side. Never blocks.
inline bool peer_disconnected(int fd) {
    struct pollfd p{};
    p.fd = fd;
    p.events = POLLIN | POLLRDHUP;
    if (::poll(&p, 1, 0) <= 0) return false;
    if (p.revents & (POLLRDHUP | POLLHUP | POLLERR | POLLNVAL)) return true;
    if (p.revents & POLLIN) {
        char c;
        ssize_t n = ::recv(fd, &c, 1, MSG_PEEK | MSG_DONTWAIT);
        return n == 0;
    }
    return false;
}

} // namespace frameguard
