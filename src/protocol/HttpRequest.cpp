#include "cmux/protocol/HttpRequest.h"
#include "cmux/network/Buffer.h"

#include <cstring>

namespace cmux {
namespace protocol {

namespace {

bool IsTokenChar(char c) {
    if ((c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) return true;
    return c != '\0' && std::strchr("!#$%&'*+-.^_`|~", c) != nullptr;
}

} // namespace

bool HttpRequest::setMethod(const char* start, const char* end) {
    if (start == end) {
        method_ = kInvalid;
        return false;
    }
    for (const char* p = start; p < end; ++p) {
        if (!IsTokenChar(*p)) {
            method_ = kInvalid;
            return false;
        }
    }
    methodString_.assign(start, end);
    const std::string& m = methodString_;
    if (m == "GET") method_ = kGet;
    else if (m == "POST") method_ = kPost;
    else if (m == "HEAD") method_ = kHead;
    else if (m == "PUT") method_ = kPut;
    else if (m == "DELETE") method_ = kDelete;
    else if (m == "CONNECT") method_ = kConnect;
    else if (m == "OPTIONS") method_ = kOptions;
    else if (m == "PATCH") method_ = kPatch;
    else if (m == "TRACE") method_ = kTrace;
    else method_ = kOther;
    return true;
}

bool HttpRequest::keepAlive() const {
    if (version_ == kHttp10) {
        return headers_.HasToken("Connection", "keep-alive");
    }
    return !headers_.HasToken("Connection", "close");
}

bool HttpRequest::isUpgrade() const {
    return headers_.HasToken("Connection", "upgrade") && headers_.Has("Upgrade");
}

void HttpRequest::appendHeadToBuffer(network::Buffer* output) const {
    output->Append(methodString_);
    output->Append(" ", 1);
    output->Append(path_);
    output->Append(query_);
    output->Append(" ", 1);
    output->Append(versionString(), 8);
    output->Append("\r\n", 2);
    headers_.AppendTo(output);
    output->Append("\r\n", 2);
}

} // namespace protocol
} // namespace cmux
