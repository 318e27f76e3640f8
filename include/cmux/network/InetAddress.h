#pragma once

#include <netinet/in.h>
#include <cstdint>
#include <string>

namespace cmux {
namespace network {

// IPv4 endpoint wrapper over sockaddr_in.
class InetAddress {
public:
    explicit InetAddress(uint16_t port = 0, bool loopbackOnly = false);
    // An unparsable ip leaves the address at 0.0.0.0; use Parse to validate.
    InetAddress(const std::string& ip, uint16_t port);
    explicit InetAddress(const struct sockaddr_in& addr)
        : addr_(addr) {}

    static InetAddress FromHostOrder(uint32_t ip, uint16_t port);
    // Dotted-quad only.
    static bool Parse(const std::string& ip, uint16_t port, InetAddress* out);
    // Dotted quad or host name (first IPv4 result of getaddrinfo).
    static bool Resolve(const std::string& host, uint16_t port, InetAddress* out);
    // Decimal digits only, 1..65535.
    static bool ParsePort(const std::string& s, uint16_t* port);

    sa_family_t family() const { return addr_.sin_family; }
    std::string toIp() const;
    std::string toIpPort() const;
    uint16_t toPort() const;
    uint32_t ipHostOrder() const { return ntohl(addr_.sin_addr.s_addr); }
    bool isAny() const { return addr_.sin_addr.s_addr == htonl(INADDR_ANY); }

    const struct sockaddr* getSockAddr() const { return reinterpret_cast<const struct sockaddr*>(&addr_); }
    void setSockAddr(const struct sockaddr_in& addr) { addr_ = addr; }

    bool operator==(const InetAddress& rhs) const {
        return addr_.sin_addr.s_addr == rhs.addr_.sin_addr.s_addr && addr_.sin_port == rhs.addr_.sin_port;
    }
    bool operator!=(const InetAddress& rhs) const { return !(*this == rhs); }

private:
    struct sockaddr_in addr_;
};

} // namespace network
} // namespace cmux
