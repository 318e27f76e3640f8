#include "cmux/protocol/HttpResponseContext.h"
#include "cmux/network/Buffer.h"

#include <algorithm>

namespace cmux {
namespace protocol {

void HttpResponseContext::reset() {
    state_ = kExpectStatusLine;
    headBytes_ = 0;
    HttpResponse dummy;
    response_.swap(dummy);
}

// HTTP/1.1 200 OK
bool HttpResponseContext::processStatusLine(const char* begin, const char* end) {
    if (end - begin < 12 || !std::equal(begin, begin + 7, "HTTP/1.")) return false;
    const char minor = begin[7];
    if ((minor != '0' && minor != '1') || begin[8] != ' ') return false;

    const char* code = begin + 9;
    int status = 0;
    for (int i = 0; i < 3; ++i) {
        if (code[i] < '0' || code[i] > '9') return false;
        status = status * 10 + (code[i] - '0');
    }
    if (status < 100) return false;

    const char* reason = code + 3;
    if (reason < end) {
        if (*reason != ' ') return false;
        ++reason;
    }

    response_.setVersionMinor(minor - '0');
    response_.setStatusCode(status);
    response_.setStatusMessage(std::string(reason, end));
    return true;
}

bool HttpResponseContext::parseResponse(network::Buffer* buf) {
    while (state_ == kExpectStatusLine || state_ == kExpectHeaders) {
        const char* crlf = buf->FindCRLF();
        if (crlf == nullptr) {
            if (headBytes_ + buf->ReadableBytes() > kMaxHeadBytes) state_ = kError;
            break;
        }
        const size_t lineBytes = static_cast<size_t>(crlf + 2 - buf->Peek());
        headBytes_ += lineBytes;
        if (headBytes_ > kMaxHeadBytes) {
            state_ = kError;
            break;
        }

        if (state_ == kExpectStatusLine) {
            if (!processStatusLine(buf->Peek(), crlf)) {
                state_ = kError;
                break;
            }
            state_ = kExpectHeaders;
        } else if (crlf == buf->Peek()) {
            state_ = kGotHead;
        } else if (*buf->Peek() == ' ' || *buf->Peek() == '\t' ||
                   !response_.headers().AddLine(buf->Peek(), crlf)) {
            state_ = kError;
            break;
        }
        buf->Retrieve(lineBytes);
    }
    return state_ != kError;
}

} // namespace protocol
} // namespace cmux
