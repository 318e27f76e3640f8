#pragma once

#include "cmux/protocol/HttpHeaders.h"

#include <string>
#include <utility>

namespace cmux {
namespace network {
class Buffer;
}

namespace protocol {

class HttpRequest {
public:
    enum Method {
        kInvalid, kGet, kPost, kHead, kPut, kDelete, kConnect, kOptions, kPatch, kTrace, kOther
    };

    enum Version {
        kUnknown, kHttp10, kHttp11
    };

    HttpRequest() : method_(kInvalid), version_(kUnknown) {}

    void setVersion(Version v) { version_ = v; }
    Version getVersion() const { return version_; }
    const char* versionString() const { return version_ == kHttp10 ? "HTTP/1.0" : "HTTP/1.1"; }

    // Any token is accepted; unknown ones map to kOther and are forwarded as is.
    bool setMethod(const char* start, const char* end);
    Method getMethod() const { return method_; }
    const std::string& methodString() const { return methodString_; }

    void setPath(const char* start, const char* end) { path_.assign(start, end); }
    const std::string& path() const { return path_; }

    // Includes the leading '?'.
    void setQuery(const char* start, const char* end) { query_.assign(start, end); }
    const std::string& query() const { return query_; }

    // Request target exactly as received (authority form for CONNECT).
    std::string target() const { return path_ + query_; }

    HttpHeaders& headers() { return headers_; }
    const HttpHeaders& headers() const { return headers_; }

    // HTTP/1.1 persists unless "Connection: close"; HTTP/1.0 only with keep-alive.
    bool keepAlive() const;
    // "Connection: upgrade" plus an Upgrade header.
    bool isUpgrade() const;

    // Request line and header block, terminated by the blank line.
    void appendHeadToBuffer(network::Buffer* output) const;

    void swap(HttpRequest& that) {
        std::swap(method_, that.method_);
        std::swap(version_, that.version_);
        methodString_.swap(that.methodString_);
        path_.swap(that.path_);
        query_.swap(that.query_);
        headers_.swap(that.headers_);
    }

private:
    Method method_;
    Version version_;
    std::string methodString_;
    std::string path_;
    std::string query_;
    HttpHeaders headers_;
};

} // namespace protocol
} // namespace cmux
