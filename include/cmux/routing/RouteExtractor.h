#pragma once

#include "cmux/network/InetAddress.h"

#include <cstdint>
#include <optional>
#include <string>

namespace cmux {
namespace protocol {
class HttpHeaders;
class HttpRequest;
}

namespace routing {

extern const char kWorkspaceHeader[]; // X-Cmux-Workspace-Internal
extern const char kPortHeader[];      // X-Cmux-Port-Internal

// Where a request should be dialed. Without a workspace the proxy connects
// to its configured upstream host.
struct Route {
    std::optional<std::string> workspace;
    uint16_t port = 0;
};

enum class RouteError {
    kMissingRoute,
    kBadPort,
    kBadWorkspace,
};

const char* RouteErrorToString(RouteError err);

struct RouteResult {
    bool ok() const { return !error.has_value(); }

    Route route;
    std::optional<RouteError> error;
    // One-line explanation used as the 400 body.
    std::string message;
};

// Port header first, with the workspace from its own header or else from
// the Host pattern; then the Host pattern alone. A CONNECT target is never
// consulted.
RouteResult ExtractRoute(const protocol::HttpRequest& req);

// "<workspace>-<port>.<suffix>[:port]": the label before the first '.' is
// split at its last '-'. Both halves must be non-empty and the port valid.
bool ParseHostRoute(const std::string& host, std::string* workspace, uint16_t* port);

void StripRoutingHeaders(protocol::HttpHeaders* headers);

// Shadow address of the workspace, or upstreamHost; route.port either way.
network::InetAddress RouteTarget(const Route& route, const network::InetAddress& upstreamHost);

} // namespace routing
} // namespace cmux
