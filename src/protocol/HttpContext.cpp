#include "cmux/protocol/HttpContext.h"
#include "cmux/network/Buffer.h"

#include <algorithm>
#include <cstring>

namespace cmux {
namespace protocol {

namespace {
const char kHttp2Preface[] = "PRI * HTTP/2.0\r\n";
} // namespace

bool HttpContext::LooksLikeHttp2Preface(const network::Buffer* buf) {
    const size_t n = std::min(buf->ReadableBytes(), sizeof(kHttp2Preface) - 1);
    return n >= 3 && std::memcmp(buf->Peek(), kHttp2Preface, n) == 0;
}

bool HttpContext::processRequestLine(const char* begin, const char* end) {
    bool succeed = false;
    const char* start = begin;
    const char* space = std::find(start, end, ' ');
    if (space != end && request_.setMethod(start, space)) {
        start = space + 1;
        space = std::find(start, end, ' ');
        if (space != end && space != start) {
            const char* question = std::find(start, space, '?');
            if (question != space) {
                request_.setPath(start, question);
                request_.setQuery(question, space);
            } else {
                request_.setPath(start, space);
            }
            start = space + 1;
            succeed = end - start == 8 && std::equal(start, end - 1, "HTTP/1.");
            if (succeed) {
                if (*(end - 1) == '1') {
                    request_.setVersion(HttpRequest::kHttp11);
                } else if (*(end - 1) == '0') {
                    request_.setVersion(HttpRequest::kHttp10);
                } else {
                    succeed = false;
                }
            }
        }
    }
    return succeed;
}

bool HttpContext::parseRequest(network::Buffer* buf) {
    while (state_ != kGotHead) {
        const char* crlf = buf->FindCRLF();
        if (crlf == nullptr) {
            return headBytes_ + buf->ReadableBytes() <= kMaxHeadBytes;
        }
        const size_t lineBytes = static_cast<size_t>(crlf + 2 - buf->Peek());
        headBytes_ += lineBytes;
        if (headBytes_ > kMaxHeadBytes) return false;

        if (state_ == kExpectRequestLine) {
            // Stray CRLFs between pipelined requests are skipped.
            if (crlf == buf->Peek()) {
                buf->Retrieve(2);
                headBytes_ -= 2;
                continue;
            }
            if (!processRequestLine(buf->Peek(), crlf)) return false;
            state_ = kExpectHeaders;
        } else {
            if (crlf == buf->Peek()) {
                state_ = kGotHead;
            } else {
                // obs-fold continuation lines are rejected.
                if (*buf->Peek() == ' ' || *buf->Peek() == '\t') return false;
                if (!request_.headers().AddLine(buf->Peek(), crlf)) return false;
            }
        }
        buf->Retrieve(lineBytes);
    }
    return true;
}

} // namespace protocol
} // namespace cmux
