#include "cmux/ProxyServer.h"
#include "cmux/ProxySessionContext.h"
#include "cmux/common/Logger.h"
#include "cmux/network/EventLoop.h"
#include "cmux/network/TcpConnection.h"
#include "cmux/protocol/HopByHop.h"
#include "cmux/protocol/HttpResponse.h"

#include <any>
#include <functional>
#include <stdexcept>
#include <string>

namespace cmux {

using network::TcpConnection;
using network::TcpConnectionPtr;
using protocol::BodyDecoder;
using protocol::HttpRequest;

namespace {

const char kConnectEstablished[] = "HTTP/1.1 200 Connection Established\r\n\r\n";

ProxySessionContextPtr GetSession(const TcpConnectionPtr& conn) {
    const std::any& any = conn->GetContext();
    const ProxySessionContextPtr* ctx = std::any_cast<ProxySessionContextPtr>(&any);
    return ctx ? *ctx : ProxySessionContextPtr();
}

// Upstream callbacks fire only while the client connection and its session
// are alive and the session still owns that upstream.
struct UpstreamBinding {
    std::weak_ptr<TcpConnection> conn;
    std::weak_ptr<ProxySessionContext> ctx;
    const tunnel::UpstreamSession* upstream;

    bool Lock(TcpConnectionPtr* c, ProxySessionContextPtr* x) const {
        *c = conn.lock();
        *x = ctx.lock();
        return *c && *x && (*x)->upstream.get() == upstream;
    }
};

void ProcessClient(const TcpConnectionPtr& conn, const ProxySessionContextPtr& ctx);

void LogExchange(const ProxySessionContextPtr& ctx) {
    const HttpRequest& req = ctx->httpContext.request();
    LOG_INFO << ctx->peer << " \"" << req.methodString() << " " << req.target() << "\" -> "
             << (ctx->route.workspace ? *ctx->route.workspace : std::string("-")) << ":" << ctx->route.port
             << " via " << ctx->target.toIpPort() << " " << ctx->status;
}

void UpdateClientRead(const TcpConnectionPtr& conn, const ProxySessionContextPtr& ctx) {
    bool want = false;
    switch (ctx->state) {
        case ProxySessionContext::kReadingHead:
        case ProxySessionContext::kTunnel:
        case ProxySessionContext::kClosing:
            want = true;
            break;
        case ProxySessionContext::kExchange:
            want = !ctx->requestDone;
            break;
        case ProxySessionContext::kDialing:
            want = false;
            break;
    }
    if (ctx->clientReadPaused && ctx->state != ProxySessionContext::kClosing) want = false;
    if (want) {
        conn->StartRead();
    } else {
        conn->StopRead();
    }
}

void DropUpstream(const ProxySessionContextPtr& ctx) {
    if (ctx->upstream) {
        ctx->upstream->Close();
        ctx->upstream.reset();
    }
}

// Local error response, then close once it is written.
void Reject(const TcpConnectionPtr& conn, const ProxySessionContextPtr& ctx,
            int code, const char* reason, const std::string& body) {
    DropUpstream(ctx);
    ctx->state = ProxySessionContext::kClosing;
    ctx->input.RetrieveAll();
    conn->Send(protocol::PlainResponse(code, reason, body));
    conn->Shutdown();
    UpdateClientRead(conn, ctx);
}

void Abort(const TcpConnectionPtr& conn, const ProxySessionContextPtr& ctx) {
    DropUpstream(ctx);
    ctx->state = ProxySessionContext::kClosing;
    ctx->input.RetrieveAll();
    conn->ForceClose();
}

void BadUpstream(const TcpConnectionPtr& conn, const ProxySessionContextPtr& ctx, const std::string& what) {
    LOG_WARN << ctx->peer << " upstream " << ctx->target.toIpPort() << ": " << what;
    if (ctx->forwarded) {
        Abort(conn, ctx);
    } else {
        Reject(conn, ctx, protocol::HttpResponse::k502BadGateway, "Bad Gateway", what);
    }
}

// Moves decoded payload into wire, chunk-encoding it when asked.
void EncodePayload(network::Buffer* payload, bool chunked, network::Buffer* wire) {
    const size_t n = payload->ReadableBytes();
    if (n == 0) return;
    if (chunked) {
        protocol::AppendChunk(wire, payload->Peek(), n);
        payload->RetrieveAll();
    } else if (wire->ReadableBytes() == 0) {
        wire->Swap(*payload);
    } else {
        wire->Append(payload->Peek(), n);
        payload->RetrieveAll();
    }
}

void EnterTunnel(const TcpConnectionPtr& conn, const ProxySessionContextPtr& ctx) {
    ctx->state = ProxySessionContext::kTunnel;
    ctx->requestDone = true;
    UpdateClientRead(conn, ctx);
    // Bytes that followed the request head belong to the tunnel.
    ProcessClient(conn, ctx);
    if (ctx->clientEof && ctx->upstream) {
        ctx->upstream->ShutdownWrite();
    }
}

void FinishExchange(const TcpConnectionPtr& conn, const ProxySessionContextPtr& ctx) {
    if (ctx->responseChunked) {
        protocol::AppendLastChunk(&ctx->wire);
        conn->Send(&ctx->wire);
    }
    DropUpstream(ctx);

    const bool close = ctx->closeAfterResponse || ctx->clientEof;
    ctx->ResetExchange();
    if (close) {
        ctx->state = ProxySessionContext::kClosing;
        ctx->input.RetrieveAll();
        conn->Shutdown();
        UpdateClientRead(conn, ctx);
        return;
    }

    ctx->state = ProxySessionContext::kReadingHead;
    UpdateClientRead(conn, ctx);
    ProcessClient(conn, ctx);
}

void ForwardRequestBody(const TcpConnectionPtr& conn, const ProxySessionContextPtr& ctx) {
    if (!ctx->requestBody.Decode(&ctx->input, &ctx->payload)) {
        LOG_DEBUG << ctx->peer << " malformed chunked request body";
        if (ctx->forwarded) {
            Abort(conn, ctx);
        } else {
            Reject(conn, ctx, protocol::HttpResponse::k400BadRequest, "Bad Request", "malformed request body");
        }
        return;
    }

    EncodePayload(&ctx->payload, ctx->requestChunked, &ctx->wire);
    if (ctx->requestBody.done()) {
        if (ctx->requestChunked) protocol::AppendLastChunk(&ctx->wire);
        ctx->requestDone = true;
    }
    if (ctx->wire.ReadableBytes() > 0) ctx->upstream->Send(&ctx->wire);

    if (ctx->requestDone) {
        UpdateClientRead(conn, ctx);
    } else if (ctx->clientEof) {
        LOG_DEBUG << ctx->peer << " closed in the middle of a request body";
        Abort(conn, ctx);
    }
}

// Returns true when the caller should keep consuming upstream bytes as part
// of this exchange.
bool HandleResponseHead(const TcpConnectionPtr& conn, const ProxySessionContextPtr& ctx, network::Buffer* buf) {
    protocol::HttpResponse& resp = ctx->response.response();
    const int code = resp.statusCode();

    if (ctx->response.isInterim()) {
        if (!ctx->clientHttp10) {
            protocol::StripHopByHopHeaders(&resp.headers());
            resp.setVersionMinor(1);
            resp.appendHeadToBuffer(&ctx->wire);
            conn->Send(&ctx->wire);
            ctx->forwarded = true;
        }
        ctx->response.reset();
        return true;
    }

    if (code == protocol::HttpResponse::k101SwitchingProtocols) {
        if (!ctx->isUpgrade) {
            BadUpstream(conn, ctx, "unexpected 101 Switching Protocols");
            return false;
        }
        ctx->status = code;
        ctx->responseHeadDone = true;
        LogExchange(ctx);
        resp.appendHeadToBuffer(&ctx->wire);
        conn->Send(&ctx->wire);
        ctx->forwarded = true;
        if (buf->ReadableBytes() > 0) conn->Send(buf);
        EnterTunnel(conn, ctx);
        return false;
    }

    BodyDecoder::Mode mode = BodyDecoder::kNone;
    uint64_t length = 0;
    if (!protocol::ResponseBodyFraming(resp, ctx->isHead, &mode, &length)) {
        BadUpstream(conn, ctx, "invalid Content-Length in upstream response");
        return false;
    }
    ctx->responseBody.Reset(mode, length);
    ctx->responseHeadDone = true;
    ctx->status = code;

    protocol::HttpHeaders& headers = resp.headers();
    protocol::StripHopByHopHeaders(&headers);
    switch (mode) {
        case BodyDecoder::kContentLength:
            headers.Set("Content-Length", std::to_string(length));
            break;
        case BodyDecoder::kChunked:
            headers.Remove("Content-Length");
            if (ctx->clientHttp10) {
                ctx->closeAfterResponse = true;
            } else {
                headers.Add("Transfer-Encoding", "chunked");
                ctx->responseChunked = true;
            }
            break;
        case BodyDecoder::kUntilClose:
            headers.Remove("Content-Length");
            ctx->closeAfterResponse = true;
            break;
        case BodyDecoder::kNone:
            break;
    }
    // Unread request bytes would desynchronise the next request.
    if (!ctx->requestDone || !ctx->clientKeepAlive || ctx->clientEof) {
        ctx->closeAfterResponse = true;
    }
    if (ctx->closeAfterResponse) {
        headers.Add("Connection", "close");
    } else if (ctx->clientHttp10) {
        headers.Add("Connection", "keep-alive");
    }

    resp.setVersionMinor(1);
    resp.appendHeadToBuffer(&ctx->wire);
    conn->Send(&ctx->wire);
    ctx->forwarded = true;
    LogExchange(ctx);

    if (ctx->responseBody.done()) {
        FinishExchange(conn, ctx);
        return false;
    }
    return true;
}

void ForwardResponseBody(const TcpConnectionPtr& conn, const ProxySessionContextPtr& ctx, network::Buffer* buf) {
    if (!ctx->responseBody.Decode(buf, &ctx->payload)) {
        LOG_WARN << ctx->peer << " upstream " << ctx->target.toIpPort() << ": malformed chunked body";
        Abort(conn, ctx);
        return;
    }
    EncodePayload(&ctx->payload, ctx->responseChunked, &ctx->wire);
    if (ctx->wire.ReadableBytes() > 0) conn->Send(&ctx->wire);
    if (ctx->responseBody.done()) {
        FinishExchange(conn, ctx);
    }
}

void OnUpstreamMessage(const TcpConnectionPtr& conn, const ProxySessionContextPtr& ctx, network::Buffer* buf) {
    if (ctx->state == ProxySessionContext::kTunnel) {
        conn->Send(buf);
        return;
    }

    const tunnel::UpstreamSession* current = ctx->upstream.get();
    while (ctx->state == ProxySessionContext::kExchange && ctx->upstream.get() == current
           && buf->ReadableBytes() > 0) {
        if (!ctx->responseHeadDone) {
            if (!ctx->response.parseResponse(buf)) {
                BadUpstream(conn, ctx, "malformed response head");
                break;
            }
            if (!ctx->response.gotHead()) break;
            if (!HandleResponseHead(conn, ctx, buf)) break;
            continue;
        }
        ForwardResponseBody(conn, ctx, buf);
        break;
    }

    // Anything past the end of the response is not ours to relay.
    if (ctx->upstream.get() != current || ctx->state != ProxySessionContext::kExchange) {
        if (ctx->state != ProxySessionContext::kTunnel) buf->RetrieveAll();
    }
}

// The upstream will send nothing more on this exchange.
void UpstreamEnded(const TcpConnectionPtr& conn, const ProxySessionContextPtr& ctx) {
    if (!ctx->responseHeadDone) {
        BadUpstream(conn, ctx, "closed before sending a response");
        return;
    }
    ctx->responseBody.FinishOnClose();
    if (ctx->responseBody.done()) {
        FinishExchange(conn, ctx);
    } else {
        LOG_DEBUG << ctx->peer << " upstream " << ctx->target.toIpPort() << " closed mid-body";
        Abort(conn, ctx);
    }
}

void OnUpstreamHalfClose(const TcpConnectionPtr& conn, const ProxySessionContextPtr& ctx) {
    ctx->upstreamEof = true;
    if (ctx->state == ProxySessionContext::kTunnel) {
        conn->Shutdown();
    } else if (ctx->state == ProxySessionContext::kExchange) {
        UpstreamEnded(conn, ctx);
    }
}

void OnUpstreamClose(const TcpConnectionPtr& conn, const ProxySessionContextPtr& ctx) {
    if (ctx->state == ProxySessionContext::kExchange) {
        UpstreamEnded(conn, ctx);
        return;
    }
    if (ctx->state == ProxySessionContext::kTunnel) {
        LOG_DEBUG << ctx->peer << " tunnel to " << ctx->target.toIpPort() << " closed by upstream";
        const bool graceful = ctx->clientEof || ctx->upstreamEof;
        ctx->upstream.reset();
        ctx->state = ProxySessionContext::kClosing;
        if (graceful) {
            conn->Shutdown();
        } else {
            conn->ForceClose();
        }
        UpdateClientRead(conn, ctx);
    }
}

void OnUpstreamConnected(const TcpConnectionPtr& conn, const ProxySessionContextPtr& ctx) {
    if (ctx->isConnect) {
        ctx->status = protocol::HttpResponse::k200Ok;
        LogExchange(ctx);
        conn->Send(kConnectEstablished, sizeof(kConnectEstablished) - 1);
        ctx->forwarded = true;
        EnterTunnel(conn, ctx);
        return;
    }

    HttpRequest& req = ctx->httpContext.request();
    protocol::HttpHeaders& headers = req.headers();
    if (ctx->isUpgrade) {
        protocol::StripUpgradeHopHeaders(&headers);
    } else {
        protocol::StripHopByHopHeaders(&headers);
        headers.Add("Connection", "close");
    }
    switch (ctx->requestBody.mode()) {
        case BodyDecoder::kContentLength:
            headers.Set("Content-Length", std::to_string(ctx->requestBody.contentLength()));
            break;
        case BodyDecoder::kChunked:
            headers.Remove("Content-Length");
            headers.Add("Transfer-Encoding", "chunked");
            break;
        default:
            break;
    }

    req.appendHeadToBuffer(&ctx->wire);
    ctx->upstream->Send(&ctx->wire);
    ctx->state = ProxySessionContext::kExchange;
    ctx->requestDone = ctx->requestBody.done();
    UpdateClientRead(conn, ctx);
    ProcessClient(conn, ctx);
}

void OnUpstreamDialError(const TcpConnectionPtr& conn, const ProxySessionContextPtr& ctx,
                         tunnel::DialError err) {
    const HttpRequest& req = ctx->httpContext.request();
    LOG_WARN << ctx->peer << " \"" << req.methodString() << " " << req.target() << "\" dial "
             << ctx->target.toIpPort() << " failed: " << tunnel::DialErrorToString(err);
    // The session closes itself once this callback returns.
    ctx->upstream.reset();
    Reject(conn, ctx, protocol::HttpResponse::k502BadGateway, "Bad Gateway",
           "upstream " + ctx->target.toIpPort() + ": " + tunnel::DialErrorToString(err));
}

void StartUpstream(const TcpConnectionPtr& conn, const ProxySessionContextPtr& ctx) {
    const ProxyOptions& opts = *ctx->options;
    auto upstream = std::make_shared<tunnel::UpstreamSession>(
        conn->getLoop(), ctx->target, conn->name() + "-upstream",
        opts.connectTimeoutMs, opts.highWaterMarkBytes);
    ctx->upstream = upstream;

    const UpstreamBinding b{conn, ctx, upstream.get()};
    upstream->SetConnectedCallback([b]() {
        TcpConnectionPtr c;
        ProxySessionContextPtr x;
        if (b.Lock(&c, &x)) OnUpstreamConnected(c, x);
    });
    upstream->SetDialErrorCallback([b](tunnel::DialError err, int) {
        TcpConnectionPtr c;
        ProxySessionContextPtr x;
        if (b.Lock(&c, &x)) OnUpstreamDialError(c, x, err);
    });
    upstream->SetMessageCallback([b](network::Buffer* buf) {
        TcpConnectionPtr c;
        ProxySessionContextPtr x;
        if (b.Lock(&c, &x)) {
            OnUpstreamMessage(c, x, buf);
        } else {
            buf->RetrieveAll();
        }
    });
    upstream->SetHalfCloseCallback([b]() {
        TcpConnectionPtr c;
        ProxySessionContextPtr x;
        if (b.Lock(&c, &x)) OnUpstreamHalfClose(c, x);
    });
    upstream->SetCloseCallback([b]() {
        TcpConnectionPtr c;
        ProxySessionContextPtr x;
        if (b.Lock(&c, &x)) OnUpstreamClose(c, x);
    });
    upstream->SetHighWaterMarkCallback([b]() {
        TcpConnectionPtr c;
        ProxySessionContextPtr x;
        if (b.Lock(&c, &x)) {
            x->clientReadPaused = true;
            UpdateClientRead(c, x);
        }
    });
    upstream->SetWriteCompleteCallback([b]() {
        TcpConnectionPtr c;
        ProxySessionContextPtr x;
        if (b.Lock(&c, &x) && x->clientReadPaused) {
            x->clientReadPaused = false;
            UpdateClientRead(c, x);
        }
    });

    upstream->Start();
}

void BeginExchange(const TcpConnectionPtr& conn, const ProxySessionContextPtr& ctx) {
    HttpRequest& req = ctx->httpContext.request();
    ++ctx->exchanges;
    ctx->isConnect = req.getMethod() == HttpRequest::kConnect;
    ctx->isUpgrade = !ctx->isConnect && req.isUpgrade();
    ctx->isHead = req.getMethod() == HttpRequest::kHead;
    ctx->clientHttp10 = req.getVersion() == HttpRequest::kHttp10;
    ctx->clientKeepAlive = req.keepAlive();

    routing::RouteResult rr = routing::ExtractRoute(req);
    if (!rr.ok()) {
        LOG_INFO << ctx->peer << " \"" << req.methodString() << " " << req.target() << "\" 400 "
                 << routing::RouteErrorToString(*rr.error);
        Reject(conn, ctx, protocol::HttpResponse::k400BadRequest, "Bad Request", rr.message);
        return;
    }
    ctx->route = rr.route;

    if (!ctx->isConnect) {
        BodyDecoder::Mode mode = BodyDecoder::kNone;
        uint64_t length = 0;
        if (!protocol::RequestBodyFraming(req, &mode, &length)) {
            LOG_INFO << ctx->peer << " \"" << req.methodString() << " " << req.target()
                     << "\" 400 invalid body framing";
            Reject(conn, ctx, protocol::HttpResponse::k400BadRequest, "Bad Request",
                   "unsupported Transfer-Encoding or invalid Content-Length");
            return;
        }
        ctx->requestBody.Reset(mode, length);
        ctx->requestChunked = mode == BodyDecoder::kChunked;
    }
    routing::StripRoutingHeaders(&req.headers());

    ctx->target = routing::RouteTarget(ctx->route, ctx->options->upstreamHost);
    ctx->state = ProxySessionContext::kDialing;
    UpdateClientRead(conn, ctx);
    StartUpstream(conn, ctx);
}

void ProcessClient(const TcpConnectionPtr& conn, const ProxySessionContextPtr& ctx) {
    switch (ctx->state) {
        case ProxySessionContext::kReadingHead:
            if (ctx->input.ReadableBytes() == 0) {
                if (ctx->clientEof) {
                    ctx->state = ProxySessionContext::kClosing;
                    conn->Shutdown();
                }
                return;
            }
            if (!ctx->httpContext.parseRequest(&ctx->input)) {
                if (protocol::HttpContext::LooksLikeHttp2Preface(&ctx->input)) {
                    LOG_INFO << ctx->peer << " HTTP/2 preface rejected";
                    Reject(conn, ctx, protocol::HttpResponse::k400BadRequest, "Bad Request",
                           "HTTP/2 is not supported");
                } else {
                    LOG_INFO << ctx->peer << " malformed request";
                    Reject(conn, ctx, protocol::HttpResponse::k400BadRequest, "Bad Request", "malformed request");
                }
                return;
            }
            if (!ctx->httpContext.gotHead()) {
                if (ctx->clientEof) {
                    ctx->state = ProxySessionContext::kClosing;
                    conn->Shutdown();
                }
                return;
            }
            BeginExchange(conn, ctx);
            return;
        case ProxySessionContext::kDialing:
            return;
        case ProxySessionContext::kExchange:
            if (!ctx->requestDone) ForwardRequestBody(conn, ctx);
            return;
        case ProxySessionContext::kTunnel:
            if (ctx->input.ReadableBytes() > 0 && ctx->upstream) {
                ctx->upstream->Send(&ctx->input);
            }
            return;
        case ProxySessionContext::kClosing:
            ctx->input.RetrieveAll();
            return;
    }
}

void OnClientHalfClose(const TcpConnectionPtr& conn) {
    ProxySessionContextPtr ctx = GetSession(conn);
    if (!ctx) return;
    ctx->clientEof = true;
    switch (ctx->state) {
        case ProxySessionContext::kReadingHead:
        case ProxySessionContext::kExchange:
            ProcessClient(conn, ctx);
            break;
        case ProxySessionContext::kTunnel:
            if (ctx->upstream) ctx->upstream->ShutdownWrite();
            break;
        case ProxySessionContext::kDialing:
        case ProxySessionContext::kClosing:
            break;
    }
}

} // namespace

ProxyServer::ProxyServer(network::EventLoop* loop,
                         const std::vector<network::InetAddress>& listenAddrs,
                         const ProxyOptions& options,
                         const std::string& name)
    : loop_(loop),
      options_(std::make_shared<const ProxyOptions>(options)) {
    if (listenAddrs.empty()) {
        throw std::invalid_argument("ProxyServer needs at least one listen address");
    }
    server_.reset(new network::TcpServer(loop, listenAddrs.front(), name));
    for (size_t i = 1; i < listenAddrs.size(); ++i) {
        server_->AddListenAddress(listenAddrs[i]);
    }
    server_->SetConnectionCallback(
        std::bind(&ProxyServer::OnConnection, this, std::placeholders::_1));
    server_->SetMessageCallback(
        std::bind(&ProxyServer::OnMessage, this, std::placeholders::_1,
                  std::placeholders::_2, std::placeholders::_3));
}

void ProxyServer::SetThreadNum(int numThreads) {
    server_->SetThreadNum(numThreads);
}

void ProxyServer::Start() {
    for (const auto& addr : server_->listenAddresses()) {
        LOG_INFO << "ProxyServer listening on " << addr.toIpPort();
    }
    LOG_INFO << "ProxyServer upstream host " << options_->upstreamHost.toIp()
             << ", connect timeout " << options_->connectTimeoutMs << " ms";
    server_->Start();
}

void ProxyServer::OnConnection(const TcpConnectionPtr& conn) {
    if (conn->connected()) {
        LOG_DEBUG << "ProxyServer - " << conn->peerAddress().toIpPort() << " -> "
                  << conn->localAddress().toIpPort() << " is UP";
        auto ctx = std::make_shared<ProxySessionContext>();
        ctx->options = options_;
        ctx->peer = conn->peerAddress().toIpPort();
        conn->SetContext(ctx);
        conn->SetTcpNoDelay(true);
        conn->SetHalfCloseCallback(&OnClientHalfClose);
        conn->SetHighWaterMarkCallback([](const TcpConnectionPtr& c, size_t) {
            ProxySessionContextPtr x = GetSession(c);
            if (x && x->upstream) {
                x->upstreamReadPaused = true;
                x->upstream->StopRead();
            }
        }, options_->highWaterMarkBytes);
        conn->SetWriteCompleteCallback([](const TcpConnectionPtr& c) {
            ProxySessionContextPtr x = GetSession(c);
            if (x && x->upstream && x->upstreamReadPaused) {
                x->upstreamReadPaused = false;
                x->upstream->StartRead();
            }
        });
        return;
    }

    LOG_DEBUG << "ProxyServer - " << conn->peerAddress().toIpPort() << " is DOWN";
    ProxySessionContextPtr ctx = GetSession(conn);
    if (!ctx) return;
    if (ctx->upstream) {
        if (ctx->state == ProxySessionContext::kTunnel && ctx->upstreamEof) {
            ctx->upstream->Release();
        } else {
            ctx->upstream->Close();
        }
        ctx->upstream.reset();
    }
    ctx->state = ProxySessionContext::kClosing;
    conn->SetContext(std::any());
}

void ProxyServer::OnMessage(const TcpConnectionPtr& conn,
                            network::Buffer* buf,
                            std::chrono::system_clock::time_point) {
    ProxySessionContextPtr ctx = GetSession(conn);
    if (!ctx || ctx->state == ProxySessionContext::kClosing) {
        buf->RetrieveAll();
        return;
    }
    if (ctx->input.ReadableBytes() == 0) {
        ctx->input.Swap(*buf);
    } else {
        ctx->input.Append(buf->Peek(), buf->ReadableBytes());
        buf->RetrieveAll();
    }
    ProcessClient(conn, ctx);
}

} // namespace cmux
