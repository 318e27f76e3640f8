#include "cmux/protocol/HttpResponse.h"
#include "cmux/network/Buffer.h"

#include <cstdio>
#include <cstring>
#include <utility>

namespace cmux {
namespace protocol {

void HttpResponse::appendHeadToBuffer(network::Buffer* output) const {
    char buf[32];
    std::snprintf(buf, sizeof buf, "HTTP/1.%d %d ", versionMinor_, statusCode_);
    output->Append(buf, std::strlen(buf));
    output->Append(statusMessage_);
    output->Append("\r\n", 2);
    headers_.AppendTo(output);
    output->Append("\r\n", 2);
}

void HttpResponse::appendToBuffer(network::Buffer* output) const {
    char buf[64];
    std::snprintf(buf, sizeof buf, "HTTP/1.1 %d ", statusCode_);
    output->Append(buf, std::strlen(buf));
    output->Append(statusMessage_);
    output->Append("\r\n", 2);

    std::snprintf(buf, sizeof buf, "Content-Length: %zu\r\n", body_.size());
    output->Append(buf, std::strlen(buf));
    if (closeConnection_) {
        output->Append("Connection: close\r\n");
    } else {
        output->Append("Connection: keep-alive\r\n");
    }

    headers_.AppendTo(output);
    output->Append("\r\n", 2);
    output->Append(body_);
}

void HttpResponse::swap(HttpResponse& that) {
    std::swap(statusCode_, that.statusCode_);
    std::swap(versionMinor_, that.versionMinor_);
    statusMessage_.swap(that.statusMessage_);
    std::swap(closeConnection_, that.closeConnection_);
    headers_.swap(that.headers_);
    body_.swap(that.body_);
}

std::string PlainResponse(int code, const std::string& reason, const std::string& body, bool close) {
    HttpResponse resp(close);
    resp.setStatusCode(code);
    resp.setStatusMessage(reason);
    resp.setContentType("text/plain; charset=utf-8");
    resp.setBody(body + "\n");
    network::Buffer out;
    resp.appendToBuffer(&out);
    return out.RetrieveAllAsString();
}

} // namespace protocol
} // namespace cmux
