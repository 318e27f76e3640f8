#pragma once

#include "cmux/network/InetAddress.h"

#include <string>
#include <vector>

namespace cmux {
namespace network {

// Parses "host:port[,host:port...]" (IPv4 dotted quads, port 1..65535).
// Appends to out; on failure returns false and names the bad entry in err.
bool ParseListenList(const std::string& spec, std::vector<InetAddress>* out, std::string* err);

// Sorted by (port, ip), duplicates removed, and every IPv4 address dropped
// whose port is also bound by the wildcard 0.0.0.0.
std::vector<InetAddress> DedupListenAddresses(std::vector<InetAddress> addrs);

} // namespace network
} // namespace cmux
