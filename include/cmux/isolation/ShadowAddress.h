#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace cmux {
namespace isolation {

// 127.0.0.1 in host byte order; the address every workspace believes it owns.
constexpr uint32_t kLoopbackHostOrder = 0x7F000001u;

// Longest dotted quad plus NUL.
constexpr size_t kShadowAddressStrLen = 16;

uint32_t Fnv1a32(const char* data, size_t len) noexcept;

// Loopback address (host byte order) a workspace's 127.0.0.1 is mapped to:
// 127.b1.b2.b3 from the low 24 bits of FNV-1a over the exact name bytes,
// with b1 kept non-zero and b3 kept away from 0 and 255.
// Returns 0 for an empty name, which is never a valid shadow address.
uint32_t ShadowAddress(const char* name, size_t len) noexcept;

inline uint32_t ShadowAddress(const std::string& name) noexcept {
    return ShadowAddress(name.data(), name.size());
}

// Writes "a.b.c.d" into out. False if cap is too small.
bool FormatShadowAddress(uint32_t ipHostOrder, char* out, size_t cap) noexcept;

// Dotted quad for name, or an empty string when the name is empty.
std::string ShadowAddressString(const std::string& name);

} // namespace isolation
} // namespace cmux
