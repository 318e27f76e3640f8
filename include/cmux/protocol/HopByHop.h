#pragma once

namespace cmux {
namespace protocol {

class HttpHeaders;

// Removes Connection, Keep-Alive, Proxy-Authenticate, Proxy-Authorization,
// TE, Trailers, Transfer-Encoding, Upgrade, Proxy-Connection and every
// header named by a Connection token.
void StripHopByHopHeaders(HttpHeaders* headers);

// Upgrade handshakes keep Connection and Upgrade.
void StripUpgradeHopHeaders(HttpHeaders* headers);

} // namespace protocol
} // namespace cmux
