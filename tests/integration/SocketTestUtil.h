#pragma once

// Blocking-socket helpers shared by the integration tests.

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <string>

namespace testutil {

inline sockaddr_in makeAddr(const std::string& ip, uint16_t port) {
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    assert(::inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) == 1);
    return addr;
}

// Listening socket on ip with a kernel-chosen port.
inline int listenOn(const std::string& ip, uint16_t* port) {
    int lfd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(lfd >= 0);
    int one = 1;
    ::setsockopt(lfd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    sockaddr_in addr = makeAddr(ip, 0);
    assert(::bind(lfd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    assert(::listen(lfd, 16) == 0);
    socklen_t len = sizeof(addr);
    assert(::getsockname(lfd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    *port = ntohs(addr.sin_port);
    return lfd;
}

// A port on 127.0.0.1 that nothing listens on.
inline uint16_t unusedPort() {
    uint16_t port = 0;
    int fd = listenOn("127.0.0.1", &port);
    ::close(fd);
    return port;
}

inline int connectTo(const std::string& ip, uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);
    sockaddr_in addr = makeAddr(ip, port);
    assert(::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    return fd;
}

inline bool pollReadable(int fd, int timeoutMs) {
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN | POLLHUP | POLLERR;
    return ::poll(&pfd, 1, timeoutMs) == 1;
}

inline void sendAll(int fd, const std::string& s) {
    size_t off = 0;
    while (off < s.size()) {
        ssize_t n = ::send(fd, s.data() + off, s.size() - off, MSG_NOSIGNAL);
        assert(n > 0);
        off += static_cast<size_t>(n);
    }
}

// Empty on timeout or EOF.
inline std::string recvSome(int fd, int timeoutMs = 2000) {
    if (!pollReadable(fd, timeoutMs)) return {};
    char buf[16384];
    ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
    if (n <= 0) return {};
    return std::string(buf, buf + n);
}

inline std::string recvUntil(int fd, const std::string& marker, int timeoutMs = 3000) {
    std::string out;
    auto start = std::chrono::steady_clock::now();
    while (out.find(marker) == std::string::npos) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        if (elapsed > timeoutMs) break;
        out += recvSome(fd, 200);
    }
    return out;
}

inline std::string recvBytes(int fd, size_t n, int timeoutMs = 5000) {
    std::string out;
    auto start = std::chrono::steady_clock::now();
    while (out.size() < n) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        if (elapsed > timeoutMs) break;
        out += recvSome(fd, 200);
    }
    return out;
}

// Reads until the peer closes. Returns false on timeout.
inline bool recvUntilClose(int fd, std::string* out, int timeoutMs = 5000) {
    auto start = std::chrono::steady_clock::now();
    for (;;) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        if (elapsed > timeoutMs) return false;
        if (!pollReadable(fd, 200)) continue;
        char buf[16384];
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return true;
        out->append(buf, buf + n);
    }
}

inline std::string headerValue(const std::string& head, const std::string& name) {
    const std::string needle = "\r\n" + name + ":";
    size_t pos = head.find(needle);
    if (pos == std::string::npos) return {};
    pos += needle.size();
    while (pos < head.size() && (head[pos] == ' ' || head[pos] == '\t')) ++pos;
    size_t end = head.find("\r\n", pos);
    if (end == std::string::npos) return {};
    return head.substr(pos, end - pos);
}

// Reads one request or response head; leftover bytes go to *rest.
inline std::string readHead(int fd, std::string* rest) {
    std::string in = recvUntil(fd, "\r\n\r\n");
    const size_t end = in.find("\r\n\r\n");
    assert(end != std::string::npos);
    if (rest) *rest = in.substr(end + 4);
    return in.substr(0, end + 4);
}

} // namespace testutil
