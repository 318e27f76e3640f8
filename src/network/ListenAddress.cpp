#include "cmux/network/ListenAddress.h"

#include <algorithm>
#include <cctype>
#include <set>

namespace cmux {
namespace network {

namespace {

std::string Trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool ParseOne(const std::string& entry, InetAddress* out) {
    const size_t colon = entry.rfind(':');
    if (colon == std::string::npos || colon == 0) return false;
    uint16_t port = 0;
    if (!InetAddress::ParsePort(entry.substr(colon + 1), &port)) return false;
    return InetAddress::Parse(entry.substr(0, colon), port, out);
}

} // namespace

bool ParseListenList(const std::string& spec, std::vector<InetAddress>* out, std::string* err) {
    size_t pos = 0;
    bool any = false;
    while (pos <= spec.size()) {
        size_t comma = spec.find(',', pos);
        if (comma == std::string::npos) comma = spec.size();
        const std::string entry = Trim(spec.substr(pos, comma - pos));
        pos = comma + 1;
        if (entry.empty()) continue;

        InetAddress addr;
        if (!ParseOne(entry, &addr)) {
            if (err) *err = "invalid listen address: " + entry;
            return false;
        }
        out->push_back(addr);
        any = true;
    }
    if (!any) {
        if (err) *err = "empty listen address list";
        return false;
    }
    return true;
}

std::vector<InetAddress> DedupListenAddresses(std::vector<InetAddress> addrs) {
    std::sort(addrs.begin(), addrs.end(), [](const InetAddress& a, const InetAddress& b) {
        if (a.toPort() != b.toPort()) return a.toPort() < b.toPort();
        return a.ipHostOrder() < b.ipHostOrder();
    });
    addrs.erase(std::unique(addrs.begin(), addrs.end()), addrs.end());

    std::set<uint16_t> wildcardPorts;
    for (const auto& a : addrs) {
        if (a.isAny()) wildcardPorts.insert(a.toPort());
    }

    std::vector<InetAddress> result;
    result.reserve(addrs.size());
    for (const auto& a : addrs) {
        if (!a.isAny() && wildcardPorts.count(a.toPort())) continue;
        result.push_back(a);
    }
    return result;
}

} // namespace network
} // namespace cmux
