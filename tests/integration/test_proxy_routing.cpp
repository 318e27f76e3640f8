#include "cmux/ProxyServer.h"
#include "cmux/common/Logger.h"
#include "cmux/isolation/ShadowAddress.h"
#include "cmux/network/EventLoop.h"
#include "SocketTestUtil.h"

#include <fcntl.h>

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <string>
#include <thread>
#include <vector>

using cmux::network::EventLoop;
using cmux::network::InetAddress;
using namespace testutil;

namespace {

struct Response {
    std::string head;
    std::string body;
};

Response readResponse(int fd) {
    Response r;
    std::string rest;
    r.head = readHead(fd, &rest);
    const std::string cl = headerValue(r.head, "Content-Length");
    assert(!cl.empty());
    const size_t len = static_cast<size_t>(std::strtoul(cl.c_str(), nullptr, 10));
    if (rest.size() < len) rest += recvBytes(fd, len - rest.size());
    assert(rest.size() == len);
    r.body = rest;
    return r;
}

// Answers count requests, one connection each, with the request head as body.
void echoHeadBackend(int lfd, int count, const std::string& name) {
    for (int i = 0; i < count; ++i) {
        int cfd = ::accept(lfd, nullptr, nullptr);
        assert(cfd >= 0);
        const std::string head = readHead(cfd, nullptr);
        sendAll(cfd, "HTTP/1.1 200 OK\r\n"
                     "Content-Length: " + std::to_string(head.size()) + "\r\n"
                     "X-Backend: " + name + "\r\n"
                     "Keep-Alive: timeout=5\r\n"
                     "\r\n" + head);
        ::close(cfd);
    }
    ::close(lfd);
}

void garbageBackend(int lfd) {
    int cfd = ::accept(lfd, nullptr, nullptr);
    assert(cfd >= 0);
    readHead(cfd, nullptr);
    sendAll(cfd, "SSH-2.0-OpenSSH_9.6\r\n\r\n");
    ::close(cfd);
    ::close(lfd);
}

void testHeaderAndHostRouting(uint16_t proxyPort, uint16_t plainPort, uint16_t alphaPort) {
    int fd = connectTo("127.0.0.1", proxyPort);

    sendAll(fd, "GET /hello?x=1 HTTP/1.1\r\n"
                "Host: localhost\r\n"
                "X-Cmux-Port-Internal: " + std::to_string(plainPort) + "\r\n"
                "Connection: keep-alive, X-Drop-Me\r\n"
                "X-Drop-Me: 1\r\n"
                "\r\n");
    Response r = readResponse(fd);
    assert(r.head.find("HTTP/1.1 200 OK\r\n") == 0);
    assert(headerValue(r.head, "X-Backend") == "plain");
    assert(headerValue(r.head, "Keep-Alive").empty());
    assert(r.body.find("GET /hello?x=1 HTTP/1.1\r\n") == 0);
    assert(r.body.find("X-Cmux-") == std::string::npos);
    assert(r.body.find("X-Drop-Me") == std::string::npos);
    assert(headerValue(r.body, "Host") == "localhost");

    // Same client connection, routed by Host to a workspace.
    sendAll(fd, "GET /ws HTTP/1.1\r\n"
                "Host: alpha-" + std::to_string(alphaPort) + ".localhost:8080\r\n"
                "\r\n");
    r = readResponse(fd);
    assert(r.head.find("HTTP/1.1 200 OK\r\n") == 0);
    assert(headerValue(r.head, "X-Backend") == "alpha");
    assert(r.body.find("GET /ws HTTP/1.1\r\n") == 0);
    ::close(fd);
    LOG_INFO << "Header and Host routing PASS";
}

void expectError(uint16_t proxyPort, const std::string& request, const std::string& status,
                 const std::string& bodyPart) {
    int fd = connectTo("127.0.0.1", proxyPort);
    sendAll(fd, request);
    std::string all;
    assert(recvUntilClose(fd, &all));
    assert(all.find("HTTP/1.1 " + status) == 0);
    assert(all.find("Content-Type: text/plain; charset=utf-8\r\n") != std::string::npos);
    assert(all.find("Connection: close\r\n") != std::string::npos);
    assert(all.find(bodyPart) != std::string::npos);
    ::close(fd);
}

void testErrors(uint16_t proxyPort, uint16_t alphaPort, uint16_t garbagePort) {
    expectError(proxyPort, "GET / HTTP/1.1\r\nHost: localhost\r\n\r\n",
                "400 Bad Request", "missing required header: X-Cmux-Port-Internal");
    expectError(proxyPort, "GET / HTTP/1.1\r\nX-Cmux-Port-Internal: 99999\r\n\r\n",
                "400 Bad Request", "X-Cmux-Port-Internal");
    expectError(proxyPort, "GET / HTTP/1.1\r\nX-Cmux-Workspace-Internal:\r\nX-Cmux-Port-Internal: 80\r\n\r\n",
                "400 Bad Request", "X-Cmux-Workspace-Internal");
    expectError(proxyPort, "BROKEN\r\n\r\n", "400 Bad Request", "malformed request");
    expectError(proxyPort, "PRI * HTTP/2.0\r\n\r\nSM\r\n\r\n", "400 Bad Request", "HTTP/2 is not supported");
    expectError(proxyPort, "POST / HTTP/1.1\r\nX-Cmux-Port-Internal: 80\r\nTransfer-Encoding: gzip\r\n\r\n",
                "400 Bad Request", "Transfer-Encoding");

    // Nothing listens: refused.
    expectError(proxyPort, "GET / HTTP/1.1\r\nX-Cmux-Port-Internal: " + std::to_string(unusedPort()) + "\r\n\r\n",
                "502 Bad Gateway", "connection refused");
    // The port is taken in alpha, not in beta.
    expectError(proxyPort, "GET / HTTP/1.1\r\nX-Cmux-Workspace-Internal: beta\r\n"
                           "X-Cmux-Port-Internal: " + std::to_string(alphaPort) + "\r\n\r\n",
                "502 Bad Gateway", "upstream " + cmux::isolation::ShadowAddressString("beta"));
    // Upstream answers with something that is not HTTP.
    expectError(proxyPort, "GET / HTTP/1.1\r\nX-Cmux-Port-Internal: " + std::to_string(garbagePort) + "\r\n\r\n",
                "502 Bad Gateway", "malformed response head");
    LOG_INFO << "Error responses PASS";
}

// Listener with a zero backlog whose queue is already full: the kernel
// drops further SYNs, so a dial to it can only time out.
int saturatedListener(uint16_t* port, std::vector<int>* fillers) {
    int lfd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(lfd >= 0);
    sockaddr_in addr = makeAddr("127.0.0.1", 0);
    assert(::bind(lfd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    assert(::listen(lfd, 0) == 0);
    socklen_t len = sizeof(addr);
    assert(::getsockname(lfd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    *port = ntohs(addr.sin_port);

    for (int i = 0; i < 4; ++i) {
        int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        assert(fd >= 0);
        ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);
        ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        fillers->push_back(fd);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    return lfd;
}

void testConnectTimeout(uint16_t proxyPort) {
    uint16_t port = 0;
    std::vector<int> fillers;
    int lfd = saturatedListener(&port, &fillers);

    const auto start = std::chrono::steady_clock::now();
    int fd = connectTo("127.0.0.1", proxyPort);
    sendAll(fd, "GET / HTTP/1.1\r\nX-Cmux-Port-Internal: " + std::to_string(port) + "\r\n\r\n");
    std::string all;
    assert(recvUntilClose(fd, &all, 5000));
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    assert(all.find("HTTP/1.1 502 Bad Gateway\r\n") == 0);
    assert(all.find("upstream 127.0.0.1:" + std::to_string(port) + ": connect timed out") != std::string::npos);
    // connectTimeoutMs is 1000 in this test.
    assert(elapsed >= 900 && elapsed < 3000);
    ::close(fd);

    for (int f : fillers) ::close(f);
    ::close(lfd);
    LOG_INFO << "Bounded dial timeout PASS";
}

void testHttp10Close(uint16_t proxyPort, uint16_t plainPort) {
    int fd = connectTo("127.0.0.1", proxyPort);
    sendAll(fd, "GET /old HTTP/1.0\r\nX-Cmux-Port-Internal: " + std::to_string(plainPort) + "\r\n\r\n");
    std::string all;
    assert(recvUntilClose(fd, &all));
    assert(all.find("HTTP/1.1 200 OK\r\n") == 0);
    assert(all.find("Connection: close\r\n") != std::string::npos);
    assert(all.find("GET /old HTTP/1.0\r\n") != std::string::npos);
    ::close(fd);
    LOG_INFO << "HTTP/1.0 close PASS";
}

} // namespace

int main() {
    cmux::common::Logger::Instance().SetLevel(cmux::common::LogLevel::ERROR);

    uint16_t plainPort = 0;
    int plainFd = listenOn("127.0.0.1", &plainPort);
    uint16_t alphaPort = 0;
    int alphaFd = listenOn(cmux::isolation::ShadowAddressString("alpha"), &alphaPort);
    uint16_t garbagePort = 0;
    int garbageFd = listenOn("127.0.0.1", &garbagePort);

    std::thread plain([&]() { echoHeadBackend(plainFd, 2, "plain"); });
    std::thread alpha([&]() { echoHeadBackend(alphaFd, 1, "alpha"); });
    std::thread garbage([&]() { garbageBackend(garbageFd); });

    EventLoop loop;
    cmux::ProxyOptions options;
    options.connectTimeoutMs = 1000;
    cmux::ProxyServer server(&loop, {InetAddress("127.0.0.1", 0)}, options, "RoutingProxy");
    server.SetThreadNum(2);
    server.Start();
    const uint16_t proxyPort = server.listenAddresses().front().toPort();
    assert(proxyPort != 0);

    std::thread client([&]() {
        testHeaderAndHostRouting(proxyPort, plainPort, alphaPort);
        testErrors(proxyPort, alphaPort, garbagePort);
        testHttp10Close(proxyPort, plainPort);
        testConnectTimeout(proxyPort);
        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();
    plain.join();
    alpha.join();
    garbage.join();
    return 0;
}
