#pragma once

#include "cmux/network/Buffer.h"
#include "cmux/network/InetAddress.h"
#include "cmux/protocol/HttpContext.h"
#include "cmux/protocol/HttpFraming.h"
#include "cmux/protocol/HttpResponseContext.h"
#include "cmux/routing/RouteExtractor.h"
#include "cmux/tunnel/UpstreamSession.h"

#include <cstddef>
#include <memory>
#include <string>

namespace cmux {

struct ProxyOptions;

// Per client connection state, stored in the connection's context.
//
// A connection alternates between reading a request head and relaying one
// exchange to a freshly dialed upstream. CONNECT and a successful Upgrade
// turn it into a raw tunnel for the rest of its life.
struct ProxySessionContext {
    enum State {
        kReadingHead,
        kDialing,
        kExchange,
        kTunnel,
        kClosing,
    };

    State state = kReadingHead;
    std::shared_ptr<const ProxyOptions> options;

    // Client bytes not yet consumed.
    network::Buffer input;
    // Scratch space for decoded payload and re-encoded output.
    network::Buffer payload;
    network::Buffer wire;

    protocol::HttpContext httpContext;
    routing::Route route;
    network::InetAddress target;
    tunnel::UpstreamSessionPtr upstream;

    // Request side of the current exchange.
    bool isConnect{false};
    bool isUpgrade{false};
    bool isHead{false};
    bool clientHttp10{false};
    bool clientKeepAlive{true};
    protocol::BodyDecoder requestBody;
    bool requestChunked{false};
    bool requestDone{false};

    // Response side.
    protocol::HttpResponseContext response;
    protocol::BodyDecoder responseBody;
    bool responseHeadDone{false};
    bool responseChunked{false};
    bool closeAfterResponse{false};
    // Something from this exchange has reached the client already.
    bool forwarded{false};
    int status{0};

    // Backpressure: reading from one side stops while the other side's
    // output is above the high-water mark.
    bool clientReadPaused{false};
    bool upstreamReadPaused{false};

    bool clientEof{false};
    bool upstreamEof{false};

    std::string peer;
    uint64_t exchanges{0};

    void ResetExchange() {
        httpContext.reset();
        route = routing::Route();
        upstream.reset();
        isConnect = isUpgrade = isHead = false;
        clientHttp10 = false;
        clientKeepAlive = true;
        requestBody.Reset(protocol::BodyDecoder::kNone);
        requestChunked = requestDone = false;
        response.reset();
        responseBody.Reset(protocol::BodyDecoder::kNone);
        responseHeadDone = responseChunked = closeAfterResponse = forwarded = false;
        status = 0;
        clientReadPaused = upstreamReadPaused = false;
        upstreamEof = false;
    }
};

using ProxySessionContextPtr = std::shared_ptr<ProxySessionContext>;

} // namespace cmux
