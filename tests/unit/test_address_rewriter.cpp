#include "cmux/isolation/AddressRewriter.h"
#include "cmux/isolation/ShadowAddress.h"
#include "cmux/common/Logger.h"

#include <arpa/inet.h>
#include <cassert>
#include <cstddef>
#include <cstring>

using namespace cmux::isolation;

namespace {

sockaddr_in makeAddr(const char* ip, uint16_t port) {
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    assert(::inet_pton(AF_INET, ip, &addr.sin_addr) == 1);
    return addr;
}

uint32_t ipOf(const sockaddr_in& addr) { return ntohl(addr.sin_addr.s_addr); }

} // namespace

void testOutbound() {
    const uint32_t shadow = ShadowAddress("alpha");
    ShadowRewriter rewriter(shadow);

    sockaddr_in loop = makeAddr("127.0.0.1", 3000);
    assert(rewriter.RewriteOutbound(&loop) == RewriteResult::kRewritten);
    assert(ipOf(loop) == shadow);
    assert(ntohs(loop.sin_port) == 3000);

    sockaddr_in any = makeAddr("0.0.0.0", 3000);
    assert(rewriter.RewriteOutbound(&any) == RewriteResult::kUnchanged);
    assert(ipOf(any) == 0);

    sockaddr_in other = makeAddr("127.0.0.2", 3000);
    assert(rewriter.RewriteOutbound(&other) == RewriteResult::kUnchanged);

    sockaddr_in remote = makeAddr("10.1.2.3", 80);
    assert(rewriter.RewriteOutbound(&remote) == RewriteResult::kUnchanged);
    assert(ipOf(remote) == 0x0A010203u);

    sockaddr_in notInet = makeAddr("127.0.0.1", 3000);
    notInet.sin_family = AF_UNIX;
    assert(rewriter.RewriteOutbound(&notInet) == RewriteResult::kUnchanged);
    LOG_INFO << "Outbound PASS";
}

void testInbound() {
    const uint32_t shadow = ShadowAddress("alpha");
    ShadowRewriter rewriter(shadow);

    sockaddr_in addr = makeAddr("127.0.0.1", 4000);
    addr.sin_addr.s_addr = htonl(shadow);
    rewriter.RestoreInbound(reinterpret_cast<sockaddr*>(&addr), sizeof addr);
    assert(ipOf(addr) == kLoopbackHostOrder);
    assert(ntohs(addr.sin_port) == 4000);

    // Another workspace's shadow stays as it is.
    sockaddr_in foreign = makeAddr("127.0.0.1", 4000);
    foreign.sin_addr.s_addr = htonl(ShadowAddress("beta"));
    rewriter.RestoreInbound(reinterpret_cast<sockaddr*>(&foreign), sizeof foreign);
    assert(ipOf(foreign) == ShadowAddress("beta"));

    // Truncated result: the address bytes are not all there.
    sockaddr_in truncated = makeAddr("127.0.0.1", 4000);
    truncated.sin_addr.s_addr = htonl(shadow);
    rewriter.RestoreInbound(reinterpret_cast<sockaddr*>(&truncated),
                            static_cast<socklen_t>(offsetof(sockaddr_in, sin_addr) + 2));
    assert(ipOf(truncated) == shadow);
    LOG_INFO << "Inbound PASS";
}

void testPassThrough() {
    PassThroughRewriter rewriter;
    const AddressRewriter& base = rewriter;
    sockaddr_in loop = makeAddr("127.0.0.1", 3000);
    assert(base.RewriteOutbound(&loop) == RewriteResult::kUnchanged);
    assert(ipOf(loop) == kLoopbackHostOrder);

    sockaddr_in shadowed = makeAddr("127.0.0.1", 3000);
    shadowed.sin_addr.s_addr = htonl(ShadowAddress("alpha"));
    base.RestoreInbound(reinterpret_cast<sockaddr*>(&shadowed), sizeof shadowed);
    assert(ipOf(shadowed) == ShadowAddress("alpha"));
    LOG_INFO << "PassThrough PASS";
}

int main() {
    testOutbound();
    testInbound();
    testPassThrough();
    return 0;
}
