#include "cmux/isolation/AddressRewriter.h"
#include "cmux/isolation/ShadowAddress.h"

#include <cstddef>
#include <cstring>

namespace cmux {
namespace isolation {

RewriteResult ShadowRewriter::RewriteOutbound(struct sockaddr_in* addr) const noexcept {
    if (addr == nullptr || addr->sin_family != AF_INET) return RewriteResult::kUnchanged;
    if (addr->sin_addr.s_addr != htonl(kLoopbackHostOrder)) return RewriteResult::kUnchanged;
    addr->sin_addr.s_addr = htonl(shadow_);
    return RewriteResult::kRewritten;
}

void ShadowRewriter::RestoreInbound(struct sockaddr* addr, socklen_t len) const noexcept {
    const size_t need = offsetof(struct sockaddr_in, sin_addr) + sizeof(struct in_addr);
    if (addr == nullptr || static_cast<size_t>(len) < need) return;

    struct sockaddr_in in;
    std::memcpy(&in, addr, need);
    if (in.sin_family != AF_INET || in.sin_addr.s_addr != htonl(shadow_)) return;

    in.sin_addr.s_addr = htonl(kLoopbackHostOrder);
    std::memcpy(addr, &in, need);
}

} // namespace isolation
} // namespace cmux
