#include "cmux/ProxyServer.h"
#include "cmux/common/Logger.h"
#include "cmux/network/EventLoop.h"
#include "SocketTestUtil.h"

#include <cassert>
#include <string>
#include <thread>

using cmux::network::EventLoop;
using cmux::network::InetAddress;
using namespace testutil;

namespace {

// 101, a greeting in the same write, then echo until the client goes away.
void upgradeBackend(int lfd) {
    int cfd = ::accept(lfd, nullptr, nullptr);
    assert(cfd >= 0);
    std::string rest;
    const std::string head = readHead(cfd, &rest);
    assert(head.find("GET /socket HTTP/1.1\r\n") == 0);
    assert(headerValue(head, "Connection") == "Upgrade");
    assert(headerValue(head, "Upgrade") == "websocket");
    assert(headerValue(head, "Sec-WebSocket-Key") == "dGhlIHNhbXBsZSBub25jZQ==");
    assert(head.find("Keep-Alive") == std::string::npos);
    assert(head.find("X-Cmux-") == std::string::npos);

    sendAll(cfd, "HTTP/1.1 101 Switching Protocols\r\n"
                 "Upgrade: websocket\r\n"
                 "Connection: Upgrade\r\n"
                 "Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n"
                 "\r\n"
                 "server-hello");
    if (!rest.empty()) sendAll(cfd, rest);
    for (;;) {
        std::string data = recvSome(cfd, 3000);
        if (data.empty()) break;
        sendAll(cfd, data);
    }
    ::close(cfd);
    ::close(lfd);
}

// Declines the upgrade, then serves a plain request on a new connection.
void decliningBackend(int lfd) {
    for (int i = 0; i < 2; ++i) {
        int cfd = ::accept(lfd, nullptr, nullptr);
        assert(cfd >= 0);
        const std::string head = readHead(cfd, nullptr);
        if (i == 0) {
            assert(headerValue(head, "Upgrade") == "h2c");
            sendAll(cfd, "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nno");
        } else {
            assert(head.find("GET /after HTTP/1.1\r\n") == 0);
            sendAll(cfd, "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nafter");
        }
        ::close(cfd);
    }
    ::close(lfd);
}

// Switches protocols although nobody asked.
void rogueBackend(int lfd) {
    int cfd = ::accept(lfd, nullptr, nullptr);
    assert(cfd >= 0);
    readHead(cfd, nullptr);
    sendAll(cfd, "HTTP/1.1 101 Switching Protocols\r\nUpgrade: weird\r\nConnection: Upgrade\r\n\r\n");
    recvSome(cfd, 1000);
    ::close(cfd);
    ::close(lfd);
}

void testWebSocketRelay(uint16_t proxyPort, uint16_t backendPort) {
    int fd = connectTo("127.0.0.1", proxyPort);
    const std::string handshake =
        "GET /socket HTTP/1.1\r\n"
        "Host: example.invalid\r\n"
        "X-Cmux-Port-Internal: " + std::to_string(backendPort) + "\r\n"
        "Upgrade: websocket\r\n"
        "Connection: Upgrade\r\n"
        "Keep-Alive: timeout=5\r\n"
        "Sec-WebSocket-Version: 13\r\n"
        "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
        "\r\n";
    // Bytes after the head in the same write belong to the tunnel.
    sendAll(fd, handshake + "early");

    std::string rest;
    const std::string head = readHead(fd, &rest);
    assert(head.find("HTTP/1.1 101 Switching Protocols\r\n") == 0);
    assert(headerValue(head, "Sec-WebSocket-Accept") == "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");

    const std::string expected = "server-helloearly";
    if (rest.size() < expected.size()) rest += recvBytes(fd, expected.size() - rest.size());
    assert(rest == expected);

    sendAll(fd, "ping");
    assert(recvBytes(fd, 4) == "ping");
    const std::string big(256 * 1024, 'z');
    sendAll(fd, big);
    assert(recvBytes(fd, big.size()) == big);
    ::close(fd);
    LOG_INFO << "WebSocket relay PASS";
}

void testDeclinedUpgrade(uint16_t proxyPort, uint16_t backendPort) {
    int fd = connectTo("127.0.0.1", proxyPort);
    sendAll(fd, "GET /maybe HTTP/1.1\r\n"
                "X-Cmux-Port-Internal: " + std::to_string(backendPort) + "\r\n"
                "Upgrade: h2c\r\n"
                "Connection: Upgrade, HTTP2-Settings\r\n"
                "HTTP2-Settings: AAMAAABkAAQAAP__\r\n"
                "\r\n");
    std::string rest;
    std::string head = readHead(fd, &rest);
    assert(head.find("HTTP/1.1 200 OK\r\n") == 0);
    if (rest.size() < 2) rest += recvBytes(fd, 2 - rest.size());
    assert(rest == "no");

    // Still plain HTTP on the same connection.
    sendAll(fd, "GET /after HTTP/1.1\r\nX-Cmux-Port-Internal: " + std::to_string(backendPort) + "\r\n\r\n");
    head = readHead(fd, &rest);
    assert(head.find("HTTP/1.1 200 OK\r\n") == 0);
    if (rest.size() < 5) rest += recvBytes(fd, 5 - rest.size());
    assert(rest == "after");
    ::close(fd);
    LOG_INFO << "Declined upgrade PASS";
}

void testUnexpectedSwitch(uint16_t proxyPort, uint16_t backendPort) {
    int fd = connectTo("127.0.0.1", proxyPort);
    sendAll(fd, "GET /plain HTTP/1.1\r\nX-Cmux-Port-Internal: " + std::to_string(backendPort) + "\r\n\r\n");
    std::string all;
    assert(recvUntilClose(fd, &all));
    assert(all.find("HTTP/1.1 502 Bad Gateway\r\n") == 0);
    ::close(fd);
    LOG_INFO << "Unexpected 101 PASS";
}

} // namespace

int main() {
    cmux::common::Logger::Instance().SetLevel(cmux::common::LogLevel::ERROR);

    uint16_t wsPort = 0;
    int wsFd = listenOn("127.0.0.1", &wsPort);
    uint16_t declinePort = 0;
    int declineFd = listenOn("127.0.0.1", &declinePort);
    uint16_t roguePort = 0;
    int rogueFd = listenOn("127.0.0.1", &roguePort);

    std::thread ws([&]() { upgradeBackend(wsFd); });
    std::thread decline([&]() { decliningBackend(declineFd); });
    std::thread rogue([&]() { rogueBackend(rogueFd); });

    EventLoop loop;
    cmux::ProxyServer server(&loop, {InetAddress("127.0.0.1", 0)}, cmux::ProxyOptions(), "UpgradeProxy");
    server.SetThreadNum(1);
    server.Start();
    const uint16_t proxyPort = server.listenAddresses().front().toPort();

    std::thread client([&]() {
        testWebSocketRelay(proxyPort, wsPort);
        testDeclinedUpgrade(proxyPort, declinePort);
        testUnexpectedSwitch(proxyPort, roguePort);
        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();
    ws.join();
    decline.join();
    rogue.join();
    return 0;
}
