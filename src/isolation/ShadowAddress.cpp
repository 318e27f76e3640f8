#include "cmux/isolation/ShadowAddress.h"

namespace cmux {
namespace isolation {

namespace {
constexpr uint32_t kFnvOffsetBasis = 0x811C9DC5u;
constexpr uint32_t kFnvPrime = 0x01000193u;
} // namespace

uint32_t Fnv1a32(const char* data, size_t len) noexcept {
    uint32_t h = kFnvOffsetBasis;
    for (size_t i = 0; i < len; ++i) {
        h ^= static_cast<unsigned char>(data[i]);
        h *= kFnvPrime;
    }
    return h;
}

uint32_t ShadowAddress(const char* name, size_t len) noexcept {
    if (name == nullptr || len == 0) return 0;

    const uint32_t h = Fnv1a32(name, len);
    uint32_t b1 = (h >> 16) & 0xFF;
    const uint32_t b2 = (h >> 8) & 0xFF;
    uint32_t b3 = h & 0xFF;

    // 127.0.0.0/24 holds 127.0.0.1 and the resolver stub 127.0.0.53.
    if (b1 == 0) b1 = 1;
    if (b3 == 0) b3 = 1;
    if (b3 == 255) b3 = 254;

    return (127u << 24) | (b1 << 16) | (b2 << 8) | b3;
}

bool FormatShadowAddress(uint32_t ipHostOrder, char* out, size_t cap) noexcept {
    char tmp[kShadowAddressStrLen];
    size_t n = 0;
    for (int shift = 24; shift >= 0; shift -= 8) {
        unsigned v = (ipHostOrder >> shift) & 0xFF;
        char digits[3];
        int nd = 0;
        do {
            digits[nd++] = static_cast<char>('0' + v % 10);
            v /= 10;
        } while (v != 0);
        while (nd > 0) tmp[n++] = digits[--nd];
        if (shift != 0) tmp[n++] = '.';
    }
    if (cap < n + 1) return false;
    for (size_t i = 0; i < n; ++i) out[i] = tmp[i];
    out[n] = '\0';
    return true;
}

std::string ShadowAddressString(const std::string& name) {
    const uint32_t ip = ShadowAddress(name);
    if (ip == 0) return std::string();
    char buf[kShadowAddressStrLen];
    FormatShadowAddress(ip, buf, sizeof buf);
    return buf;
}

} // namespace isolation
} // namespace cmux
