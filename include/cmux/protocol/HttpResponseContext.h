#pragma once

#include "cmux/protocol/HttpResponse.h"

#include <cstddef>

namespace cmux {
namespace network {
class Buffer;
}

namespace protocol {

// Incremental HTTP/1.x response head parser. The body stays in the buffer
// for a BodyDecoder chosen by ResponseBodyFraming().
class HttpResponseContext {
public:
    enum ParseState { kExpectStatusLine, kExpectHeaders, kGotHead, kError };

    static const size_t kMaxHeadBytes = 64 * 1024;

    // Returns false once the head is known to be malformed or too large.
    bool parseResponse(network::Buffer* buf);

    bool gotHead() const { return state_ == kGotHead; }
    bool hasError() const { return state_ == kError; }

    void reset();

    int statusCode() const { return response_.statusCode(); }
    // 1xx other than 101: another head follows on the same connection.
    bool isInterim() const {
        return statusCode() >= 100 && statusCode() < 200 && statusCode() != HttpResponse::k101SwitchingProtocols;
    }

    const HttpResponse& response() const { return response_; }
    HttpResponse& response() { return response_; }

private:
    bool processStatusLine(const char* begin, const char* end);

    ParseState state_{kExpectStatusLine};
    size_t headBytes_{0};
    HttpResponse response_;
};

} // namespace protocol
} // namespace cmux
