#pragma once

#include "cmux/protocol/HttpHeaders.h"

#include <string>

namespace cmux {
namespace network {
class Buffer;
}

namespace protocol {

// A response head plus an optional in-memory body. Used both for responses
// the proxy writes itself and for upstream heads being forwarded.
class HttpResponse {
public:
    enum HttpStatusCode {
        kUnknown,
        k101SwitchingProtocols = 101,
        k200Ok = 200,
        k204NoContent = 204,
        k304NotModified = 304,
        k400BadRequest = 400,
        k502BadGateway = 502,
    };

    explicit HttpResponse(bool close = true)
        : statusCode_(kUnknown), versionMinor_(1), closeConnection_(close) {}

    void setStatusCode(int code) { statusCode_ = code; }
    int statusCode() const { return statusCode_; }
    void setStatusMessage(const std::string& message) { statusMessage_ = message; }
    const std::string& statusMessage() const { return statusMessage_; }
    void setVersionMinor(int minor) { versionMinor_ = minor; }
    int versionMinor() const { return versionMinor_; }
    void setCloseConnection(bool on) { closeConnection_ = on; }
    bool closeConnection() const { return closeConnection_; }
    void setContentType(const std::string& contentType) { headers_.Set("Content-Type", contentType); }

    void addHeader(const std::string& key, const std::string& value) { headers_.Add(key, value); }
    HttpHeaders& headers() { return headers_; }
    const HttpHeaders& headers() const { return headers_; }

    void setBody(const std::string& body) { body_ = body; }
    const std::string& body() const { return body_; }

    // Status line and headers exactly as held, then the blank line.
    void appendHeadToBuffer(network::Buffer* output) const;

    // Complete response with Content-Length and Connection derived from the
    // body and closeConnection().
    void appendToBuffer(network::Buffer* output) const;

    void swap(HttpResponse& that);

private:
    int statusCode_;
    int versionMinor_;
    std::string statusMessage_;
    bool closeConnection_;
    HttpHeaders headers_;
    std::string body_;
};

// text/plain response with a one-line body, e.g. PlainResponse(400, "Bad Request", "missing route").
std::string PlainResponse(int code, const std::string& reason, const std::string& body, bool close = true);

} // namespace protocol
} // namespace cmux
