#pragma once

#include "cmux/protocol/HttpRequest.h"

#include <cstddef>

namespace cmux {
namespace network {
class Buffer;
}

namespace protocol {

// Incremental parser for a request head (request line and headers). The
// body is left in the buffer for a BodyDecoder.
class HttpContext {
public:
    enum HttpRequestParseState {
        kExpectRequestLine,
        kExpectHeaders,
        kGotHead,
    };

    static const size_t kMaxHeadBytes = 64 * 1024;

    HttpContext()
        : state_(kExpectRequestLine), headBytes_(0) {}

    // Consumes as much of the head as buf holds. Returns false on a
    // malformed head or one larger than kMaxHeadBytes.
    bool parseRequest(network::Buffer* buf);

    bool gotHead() const { return state_ == kGotHead; }
    void reset() {
        state_ = kExpectRequestLine;
        headBytes_ = 0;
        HttpRequest dummy;
        request_.swap(dummy);
    }

    const HttpRequest& request() const { return request_; }
    HttpRequest& request() { return request_; }

    // "PRI * HTTP/2.0", or a prefix of it when fewer bytes have arrived.
    static bool LooksLikeHttp2Preface(const network::Buffer* buf);

private:
    bool processRequestLine(const char* begin, const char* end);

    HttpRequestParseState state_;
    HttpRequest request_;
    size_t headBytes_;
};

} // namespace protocol
} // namespace cmux
