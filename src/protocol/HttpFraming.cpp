#include "cmux/protocol/HttpFraming.h"
#include "cmux/protocol/HttpRequest.h"
#include "cmux/protocol/HttpResponse.h"
#include "cmux/network/Buffer.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

namespace cmux {
namespace protocol {

namespace {

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Chunk size line: hex digits, optional ";ext", optional whitespace.
bool ParseChunkSize(const char* begin, const char* end, uint64_t* size) {
    const char* p = begin;
    uint64_t v = 0;
    int digits = 0;
    while (p < end && HexValue(*p) >= 0) {
        if (++digits > 15) return false;
        v = (v << 4) | static_cast<uint64_t>(HexValue(*p));
        ++p;
    }
    if (digits == 0) return false;
    while (p < end && (*p == ' ' || *p == '\t')) ++p;
    if (p < end && *p != ';') return false;
    *size = v;
    return true;
}

bool ParseDigits(const std::string& s, uint64_t* out) {
    if (s.empty() || s.size() > 19) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<uint64_t>(c - '0');
    }
    *out = v;
    return true;
}

} // namespace

void BodyDecoder::Reset(Mode mode, uint64_t length) {
    mode_ = mode;
    contentLength_ = mode == kContentLength ? length : 0;
    remaining_ = contentLength_;
    error_ = false;
    chunkState_ = kChunkSize;
    done_ = mode == kNone || (mode == kContentLength && length == 0);
}

bool BodyDecoder::Decode(network::Buffer* in, network::Buffer* out) {
    if (done_ || error_) return !error_;

    switch (mode_) {
    case kNone:
        break;
    case kContentLength: {
        const size_t n = static_cast<size_t>(std::min<uint64_t>(remaining_, in->ReadableBytes()));
        if (n > 0) {
            out->Append(in->Peek(), n);
            in->Retrieve(n);
            remaining_ -= n;
        }
        if (remaining_ == 0) done_ = true;
        break;
    }
    case kUntilClose:
        if (in->ReadableBytes() > 0) {
            out->Append(in->Peek(), in->ReadableBytes());
            in->RetrieveAll();
        }
        break;
    case kChunked:
        if (!DecodeChunked(in, out)) error_ = true;
        break;
    }
    return !error_;
}

bool BodyDecoder::DecodeChunked(network::Buffer* in, network::Buffer* out) {
    while (!done_) {
        if (chunkState_ == kChunkData) {
            if (in->ReadableBytes() == 0) return true;
            const size_t n = static_cast<size_t>(std::min<uint64_t>(remaining_, in->ReadableBytes()));
            out->Append(in->Peek(), n);
            in->Retrieve(n);
            remaining_ -= n;
            if (remaining_ == 0) chunkState_ = kChunkDataCrlf;
            continue;
        }

        if (chunkState_ == kChunkDataCrlf) {
            if (in->ReadableBytes() < 2) return true;
            if (in->Peek()[0] != '\r' || in->Peek()[1] != '\n') return false;
            in->Retrieve(2);
            chunkState_ = kChunkSize;
            continue;
        }

        // Size line or trailer line.
        const char* crlf = in->FindCRLF();
        if (crlf == nullptr) {
            return in->ReadableBytes() <= kMaxChunkLineBytes;
        }
        const size_t lineBytes = static_cast<size_t>(crlf + 2 - in->Peek());
        if (lineBytes > kMaxChunkLineBytes) return false;

        if (chunkState_ == kChunkSize) {
            uint64_t size = 0;
            if (!ParseChunkSize(in->Peek(), crlf, &size)) return false;
            in->Retrieve(lineBytes);
            if (size == 0) {
                chunkState_ = kChunkTrailer;
            } else {
                remaining_ = size;
                chunkState_ = kChunkData;
            }
        } else {
            // Trailer fields are dropped.
            const bool last = crlf == in->Peek();
            in->Retrieve(lineBytes);
            if (last) done_ = true;
        }
    }
    return true;
}

bool ParseContentLength(const HttpHeaders& headers, bool* present, uint64_t* length) {
    *present = false;
    *length = 0;
    for (const std::string& v : headers.GetAll("Content-Length")) {
        // "5, 5" from merged duplicates is accepted when every element agrees.
        size_t pos = 0;
        while (pos <= v.size()) {
            size_t comma = v.find(',', pos);
            if (comma == std::string::npos) comma = v.size();
            std::string item = v.substr(pos, comma - pos);
            const size_t b = item.find_first_not_of(" \t");
            const size_t e = item.find_last_not_of(" \t");
            item = b == std::string::npos ? std::string() : item.substr(b, e - b + 1);

            uint64_t n = 0;
            if (!ParseDigits(item, &n)) return false;
            if (*present && n != *length) return false;
            *present = true;
            *length = n;
            pos = comma + 1;
        }
    }
    return true;
}

// chunked must be the final coding; nothing else is decoded.
static bool ChunkedIsFinalCoding(const HttpHeaders& headers) {
    const std::vector<std::string> te = headers.GetAll("Transfer-Encoding");
    if (te.empty()) return false;
    std::string last = te.back();
    const size_t comma = last.rfind(',');
    if (comma != std::string::npos) last = last.substr(comma + 1);
    const size_t b = last.find_first_not_of(" \t");
    const size_t e = last.find_last_not_of(" \t");
    last = b == std::string::npos ? std::string() : last.substr(b, e - b + 1);
    return IEquals(last, "chunked");
}

bool RequestBodyFraming(const HttpRequest& req, BodyDecoder::Mode* mode, uint64_t* length) {
    *mode = BodyDecoder::kNone;
    *length = 0;

    if (req.headers().Has("Transfer-Encoding")) {
        if (!ChunkedIsFinalCoding(req.headers())) return false;
        *mode = BodyDecoder::kChunked;
        return true;
    }

    bool present = false;
    if (!ParseContentLength(req.headers(), &present, length)) return false;
    if (present && *length > 0) *mode = BodyDecoder::kContentLength;
    return true;
}

bool ResponseBodyFraming(const HttpResponse& resp, bool headRequest,
                         BodyDecoder::Mode* mode, uint64_t* length) {
    *mode = BodyDecoder::kNone;
    *length = 0;

    const int code = resp.statusCode();
    if (headRequest || (code >= 100 && code < 200) ||
        code == HttpResponse::k204NoContent || code == HttpResponse::k304NotModified) {
        return true;
    }

    if (resp.headers().Has("Transfer-Encoding")) {
        *mode = ChunkedIsFinalCoding(resp.headers()) ? BodyDecoder::kChunked : BodyDecoder::kUntilClose;
        return true;
    }

    bool present = false;
    if (!ParseContentLength(resp.headers(), &present, length)) return false;
    if (present) {
        *mode = *length > 0 ? BodyDecoder::kContentLength : BodyDecoder::kNone;
    } else {
        *mode = BodyDecoder::kUntilClose;
    }
    return true;
}

void AppendChunk(network::Buffer* out, const char* data, size_t len) {
    if (len == 0) return;
    char line[32];
    const int n = std::snprintf(line, sizeof line, "%zx\r\n", len);
    out->Append(line, static_cast<size_t>(n));
    out->Append(data, len);
    out->Append("\r\n", 2);
}

void AppendLastChunk(network::Buffer* out) {
    out->Append("0\r\n\r\n", 5);
}

} // namespace protocol
} // namespace cmux
