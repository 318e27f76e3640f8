#include "cmux/routing/RouteExtractor.h"
#include "cmux/isolation/ShadowAddress.h"
#include "cmux/protocol/HttpRequest.h"

namespace cmux {
namespace routing {

const char kWorkspaceHeader[] = "X-Cmux-Workspace-Internal";
const char kPortHeader[] = "X-Cmux-Port-Internal";

namespace {

RouteResult Fail(RouteError err, const std::string& message) {
    RouteResult r;
    r.error = err;
    r.message = message;
    return r;
}

} // namespace

const char* RouteErrorToString(RouteError err) {
    switch (err) {
        case RouteError::kMissingRoute: return "MissingRoute";
        case RouteError::kBadPort: return "BadPort";
        case RouteError::kBadWorkspace: return "BadWorkspace";
    }
    return "Unknown";
}

bool ParseHostRoute(const std::string& host, std::string* workspace, uint16_t* port) {
    const size_t dot = host.find('.');
    if (dot == std::string::npos) return false;
    // Suffix must be non-empty; any ":port" lives in it and is ignored.
    if (dot + 1 >= host.size() || host[dot + 1] == ':') return false;

    const std::string label = host.substr(0, dot);
    const size_t dash = label.rfind('-');
    if (dash == std::string::npos || dash == 0) return false;

    uint16_t p = 0;
    if (!network::InetAddress::ParsePort(label.substr(dash + 1), &p)) return false;

    *workspace = label.substr(0, dash);
    *port = p;
    return true;
}

RouteResult ExtractRoute(const protocol::HttpRequest& req) {
    const protocol::HttpHeaders& headers = req.headers();

    std::string hostWorkspace;
    uint16_t hostPort = 0;
    const std::string* host = headers.Find("Host");
    const bool hostRoutes = host != nullptr && ParseHostRoute(*host, &hostWorkspace, &hostPort);

    RouteResult result;
    const std::string* wsHeader = headers.Find(kWorkspaceHeader);
    if (wsHeader != nullptr && wsHeader->empty()) {
        return Fail(RouteError::kBadWorkspace, std::string(kWorkspaceHeader) + " cannot be empty");
    }

    const std::string* portHeader = headers.Find(kPortHeader);
    if (portHeader != nullptr) {
        if (!network::InetAddress::ParsePort(*portHeader, &result.route.port)) {
            return Fail(RouteError::kBadPort, std::string("invalid port in ") + kPortHeader);
        }
        if (wsHeader != nullptr) {
            result.route.workspace = *wsHeader;
        } else if (hostRoutes) {
            result.route.workspace = hostWorkspace;
        }
        return result;
    }

    if (hostRoutes) {
        // An explicit workspace header still wins over the Host label.
        result.route.workspace = wsHeader != nullptr ? *wsHeader : hostWorkspace;
        result.route.port = hostPort;
        return result;
    }

    return Fail(RouteError::kMissingRoute, std::string("missing required header: ") + kPortHeader);
}

void StripRoutingHeaders(protocol::HttpHeaders* headers) {
    headers->Remove(kWorkspaceHeader);
    headers->Remove(kPortHeader);
}

network::InetAddress RouteTarget(const Route& route, const network::InetAddress& upstreamHost) {
    if (route.workspace) {
        return network::InetAddress::FromHostOrder(isolation::ShadowAddress(*route.workspace), route.port);
    }
    return network::InetAddress::FromHostOrder(upstreamHost.ipHostOrder(), route.port);
}

} // namespace routing
} // namespace cmux
