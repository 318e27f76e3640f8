#pragma once

#include <cstdint>
#include <netinet/in.h>
#include <sys/socket.h>

namespace cmux {
namespace isolation {

enum class RewriteResult {
    kUnchanged,
    kRewritten,
};

// Translates socket addresses between what a workspace process sees and
// what the kernel sees. Implementations are stateless apart from their
// shadow address and never allocate.
class AddressRewriter {
public:
    virtual ~AddressRewriter() = default;

    // Address about to be handed to bind/connect.
    virtual RewriteResult RewriteOutbound(struct sockaddr_in* addr) const noexcept = 0;
    // Address returned by accept/getsockname/getpeername. len is the number
    // of valid bytes at addr.
    virtual void RestoreInbound(struct sockaddr* addr, socklen_t len) const noexcept = 0;
};

class PassThroughRewriter final : public AddressRewriter {
public:
    RewriteResult RewriteOutbound(struct sockaddr_in*) const noexcept override {
        return RewriteResult::kUnchanged;
    }
    void RestoreInbound(struct sockaddr*, socklen_t) const noexcept override {}
};

// 127.0.0.1:P <-> shadow:P. Ports are never touched.
class ShadowRewriter final : public AddressRewriter {
public:
    explicit ShadowRewriter(uint32_t shadowHostOrder) noexcept : shadow_(shadowHostOrder) {}

    RewriteResult RewriteOutbound(struct sockaddr_in* addr) const noexcept override;
    void RestoreInbound(struct sockaddr* addr, socklen_t len) const noexcept override;

    uint32_t shadow() const noexcept { return shadow_; }

private:
    uint32_t shadow_;
};

} // namespace isolation
} // namespace cmux
