#pragma once

#include <cstddef>
#include <cstdint>

namespace cmux {
namespace network {
class Buffer;
}

namespace protocol {

class HttpHeaders;
class HttpRequest;
class HttpResponse;

// Streaming decoder for one message body. Payload bytes are moved out of
// the wire buffer as they arrive; anything past the end of the body stays
// there for the next message.
class BodyDecoder {
public:
    enum Mode {
        kNone,          // no body
        kContentLength,
        kChunked,
        kUntilClose,    // response delimited by the connection closing
    };

    static const size_t kMaxChunkLineBytes = 4096;

    BodyDecoder() { Reset(kNone); }
    BodyDecoder(Mode mode, uint64_t length) { Reset(mode, length); }

    void Reset(Mode mode, uint64_t length = 0);

    // Returns false on a malformed chunked encoding.
    bool Decode(network::Buffer* in, network::Buffer* out);

    // The peer closed. Completes a kUntilClose body; any other unfinished
    // body is truncated and reported as such by done().
    void FinishOnClose() { if (mode_ == kUntilClose) done_ = true; }

    bool done() const { return done_; }
    bool hasError() const { return error_; }
    Mode mode() const { return mode_; }
    uint64_t contentLength() const { return contentLength_; }

private:
    enum ChunkState { kChunkSize, kChunkData, kChunkDataCrlf, kChunkTrailer };

    bool DecodeChunked(network::Buffer* in, network::Buffer* out);

    Mode mode_;
    uint64_t contentLength_;
    uint64_t remaining_;
    bool done_;
    bool error_;
    ChunkState chunkState_;
};

// Content-Length, if present. All copies must agree and be plain digits.
// Returns false when the header is malformed.
bool ParseContentLength(const HttpHeaders& headers, bool* present, uint64_t* length);

// Request bodies are chunked or Content-Length framed, otherwise empty.
// Returns false for a transfer coding other than chunked or a bad length.
bool RequestBodyFraming(const HttpRequest& req, BodyDecoder::Mode* mode, uint64_t* length);

// Responses to HEAD, 1xx, 204 and 304 never carry a body; without chunked
// or Content-Length the body runs until the upstream closes.
bool ResponseBodyFraming(const HttpResponse& resp, bool headRequest,
                         BodyDecoder::Mode* mode, uint64_t* length);

// Chunked encoding of decoded payload.
void AppendChunk(network::Buffer* out, const char* data, size_t len);
void AppendLastChunk(network::Buffer* out);

} // namespace protocol
} // namespace cmux
