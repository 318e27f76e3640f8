// libworkspace_net.so: LD_PRELOAD module that gives every workspace its own
// view of 127.0.0.1.
//
// Everything here runs inside arbitrary host processes, possibly from signal
// handlers or between fork and exec: no heap, no locks, no C++ exceptions,
// and errno is left as the real call set it.

#include "cmux/isolation/AddressRewriter.h"
#include "cmux/isolation/ShadowAddress.h"
#include "cmux/isolation/WorkspaceResolver.h"

#include <atomic>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <dlfcn.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#define CMUX_EXPORT __attribute__((visibility("default")))

using cmux::isolation::AddressRewriter;
using cmux::isolation::PassThroughRewriter;
using cmux::isolation::ShadowRewriter;
using cmux::isolation::WorkspaceResolver;

namespace {

using BindFn = int (*)(int, const struct sockaddr*, socklen_t);
using ConnectFn = int (*)(int, const struct sockaddr*, socklen_t);
using ListenFn = int (*)(int, int);
using AcceptFn = int (*)(int, struct sockaddr*, socklen_t*);
using Accept4Fn = int (*)(int, struct sockaddr*, socklen_t*, int);
using SockNameFn = int (*)(int, struct sockaddr*, socklen_t*);
using ChdirFn = int (*)(const char*);
using FchdirFn = int (*)(int);

std::atomic<BindFn> g_bind{nullptr};
std::atomic<ConnectFn> g_connect{nullptr};
std::atomic<ListenFn> g_listen{nullptr};
std::atomic<AcceptFn> g_accept{nullptr};
std::atomic<Accept4Fn> g_accept4{nullptr};
std::atomic<SockNameFn> g_getsockname{nullptr};
std::atomic<SockNameFn> g_getpeername{nullptr};
std::atomic<ChdirFn> g_chdir{nullptr};
std::atomic<FchdirFn> g_fchdir{nullptr};

template <typename Fn>
Fn Real(std::atomic<Fn>& slot, const char* name) noexcept {
    Fn fn = slot.load(std::memory_order_acquire);
    if (fn == nullptr) {
        fn = reinterpret_cast<Fn>(::dlsym(RTLD_NEXT, name));
        slot.store(fn, std::memory_order_release);
    }
    return fn;
}

enum class Mode : uint64_t {
    kPassThrough = 1,
    kShadow = 2,
    kInvalid = 3,
};

struct Workspace {
    Mode mode;
    uint32_t shadow;
};

// Cache word: generation in bits 34..63, mode in 32..33, shadow in 0..31.
// Zero means nothing cached. chdir/fchdir bump the generation.
constexpr int kModeShift = 32;
constexpr int kGenerationShift = 34;
constexpr uint64_t kGenerationMask = (uint64_t(1) << (64 - kGenerationShift)) - 1;

std::atomic<uint64_t> g_generation{1};
std::atomic<uint64_t> g_cache{0};
// -1 unknown, 0 off, 1 on.
std::atomic<int> g_debug{-1};

bool DebugEnabled() noexcept {
    int d = g_debug.load(std::memory_order_relaxed);
    if (d < 0) {
        const char* v = ::getenv("CMUX_NET_DEBUG");
        d = (v != nullptr && v[0] != '\0' && std::strcmp(v, "0") != 0) ? 1 : 0;
        g_debug.store(d, std::memory_order_relaxed);
    }
    return d == 1;
}

class LineWriter {
public:
    void Put(const char* s) noexcept {
        while (*s != '\0' && len_ < sizeof(buf_) - 1) buf_[len_++] = *s++;
    }
    void PutUint(unsigned v) noexcept {
        char digits[12];
        int n = 0;
        do {
            digits[n++] = static_cast<char>('0' + v % 10);
            v /= 10;
        } while (v != 0);
        while (n > 0 && len_ < sizeof(buf_) - 1) buf_[len_++] = digits[--n];
    }
    void PutIp(uint32_t ipHostOrder) noexcept {
        char ip[cmux::isolation::kShadowAddressStrLen];
        if (cmux::isolation::FormatShadowAddress(ipHostOrder, ip, sizeof ip)) Put(ip);
    }
    void Flush() noexcept {
        buf_[len_++] = '\n';
        const ssize_t n = ::write(STDERR_FILENO, buf_, len_);
        (void)n; // best effort diagnostics
        len_ = 0;
    }

private:
    char buf_[256];
    size_t len_ = 0;
};

void DebugWorkspace(const char* name, const Workspace& ws) noexcept {
    LineWriter w;
    w.Put("[workspace_net] pid ");
    w.PutUint(static_cast<unsigned>(::getpid()));
    if (ws.mode == Mode::kShadow) {
        w.Put(" workspace ");
        w.Put(name);
        w.Put(" -> ");
        w.PutIp(ws.shadow);
    } else if (ws.mode == Mode::kInvalid) {
        w.Put(" workspace unusable, loopback binds fail with EINVAL");
    } else {
        w.Put(" no workspace, pass-through");
    }
    w.Flush();
}

void DebugRewrite(const char* op, uint32_t from, uint32_t to, uint16_t port) noexcept {
    LineWriter w;
    w.Put("[workspace_net] ");
    w.Put(op);
    w.Put(" ");
    w.PutIp(from);
    w.Put(":");
    w.PutUint(port);
    w.Put(" -> ");
    w.PutIp(to);
    w.Put(":");
    w.PutUint(port);
    w.Flush();
}

Workspace CurrentWorkspace() noexcept {
    const uint64_t gen = g_generation.load(std::memory_order_acquire) & kGenerationMask;
    const uint64_t cached = g_cache.load(std::memory_order_acquire);
    if (cached != 0 && (cached >> kGenerationShift) == gen) {
        return Workspace{static_cast<Mode>((cached >> kModeShift) & 0x3),
                         static_cast<uint32_t>(cached & 0xFFFFFFFFu)};
    }

    const WorkspaceResolver resolver = WorkspaceResolver::FromEnvironment();
    char name[cmux::isolation::kMaxWorkspaceName + 1];
    name[0] = '\0';
    Workspace ws{Mode::kPassThrough, 0};
    switch (resolver.ResolveCurrent(name, sizeof name)) {
        case WorkspaceResolver::Resolution::kNone:
            break;
        case WorkspaceResolver::Resolution::kInvalid:
            ws.mode = Mode::kInvalid;
            break;
        case WorkspaceResolver::Resolution::kWorkspace:
            ws.shadow = cmux::isolation::ShadowAddress(name, std::strlen(name));
            ws.mode = ws.shadow != 0 ? Mode::kShadow : Mode::kInvalid;
            break;
    }

    g_cache.store((gen << kGenerationShift) | (static_cast<uint64_t>(ws.mode) << kModeShift) | ws.shadow,
                  std::memory_order_release);
    if (DebugEnabled()) DebugWorkspace(name, ws);
    return ws;
}

void InvalidateWorkspace() noexcept {
    g_generation.fetch_add(1, std::memory_order_acq_rel);
}

bool IsDefaultLoopback(const struct sockaddr_in& in) noexcept {
    return in.sin_addr.s_addr == htonl(cmux::isolation::kLoopbackHostOrder);
}

// bind/connect: 127.0.0.1:P becomes shadow:P. Anything that is not a
// well-formed AF_INET address goes to the kernel untouched.
template <typename Call>
int Outbound(const char* op, const struct sockaddr* addr, socklen_t len, Call call) noexcept {
    if (addr == nullptr || len < static_cast<socklen_t>(sizeof(struct sockaddr_in)) ||
        addr->sa_family != AF_INET) {
        return call(addr, len);
    }
    struct sockaddr_in in;
    std::memcpy(&in, addr, sizeof in);
    if (!IsDefaultLoopback(in)) {
        return call(addr, len);
    }

    const int savedErrno = errno;
    const Workspace ws = CurrentWorkspace();
    if (ws.mode == Mode::kInvalid) {
        errno = EINVAL;
        return -1;
    }

    const PassThroughRewriter passThrough;
    const ShadowRewriter shadow(ws.shadow);
    const AddressRewriter& rewriter = ws.mode == Mode::kShadow
        ? static_cast<const AddressRewriter&>(shadow)
        : static_cast<const AddressRewriter&>(passThrough);

    errno = savedErrno;
    if (rewriter.RewriteOutbound(&in) == cmux::isolation::RewriteResult::kUnchanged) {
        return call(addr, len);
    }
    if (DebugEnabled()) {
        DebugRewrite(op, cmux::isolation::kLoopbackHostOrder, ws.shadow, ntohs(in.sin_port));
        errno = savedErrno;
    }
    return call(reinterpret_cast<const struct sockaddr*>(&in), static_cast<socklen_t>(sizeof in));
}

// accept/getsockname/getpeername: shadow:P is reported back as 127.0.0.1:P.
void Inbound(struct sockaddr* addr, const socklen_t* lenp, socklen_t provided) noexcept {
    if (addr == nullptr || lenp == nullptr) return;
    const socklen_t valid = *lenp < provided ? *lenp : provided;
    const size_t need = offsetof(struct sockaddr_in, sin_addr) + sizeof(struct in_addr);
    if (static_cast<size_t>(valid) < need || addr->sa_family != AF_INET) return;

    struct sockaddr_in in;
    std::memcpy(&in, addr, need);
    const uint32_t ip = ntohl(in.sin_addr.s_addr);
    // Only 127/8 addresses other than 127.0.0.1 can be a shadow.
    if ((ip >> 24) != 127 || ip == cmux::isolation::kLoopbackHostOrder) return;

    const int savedErrno = errno;
    const Workspace ws = CurrentWorkspace();
    if (ws.mode == Mode::kShadow) {
        ShadowRewriter(ws.shadow).RestoreInbound(addr, valid);
    } else {
        PassThroughRewriter().RestoreInbound(addr, valid);
    }
    errno = savedErrno;
}

} // namespace

extern "C" {

CMUX_EXPORT int bind(int sockfd, const struct sockaddr* addr, socklen_t addrlen) noexcept {
    BindFn real = Real(g_bind, "bind");
    if (real == nullptr) {
        errno = ENOSYS;
        return -1;
    }
    return Outbound("bind", addr, addrlen, [real, sockfd](const struct sockaddr* a, socklen_t l) {
        return real(sockfd, a, l);
    });
}

CMUX_EXPORT int connect(int sockfd, const struct sockaddr* addr, socklen_t addrlen) {
    ConnectFn real = Real(g_connect, "connect");
    if (real == nullptr) {
        errno = ENOSYS;
        return -1;
    }
    return Outbound("connect", addr, addrlen, [real, sockfd](const struct sockaddr* a, socklen_t l) {
        return real(sockfd, a, l);
    });
}

CMUX_EXPORT int listen(int sockfd, int backlog) noexcept {
    ListenFn real = Real(g_listen, "listen");
    if (real == nullptr) {
        errno = ENOSYS;
        return -1;
    }
    return real(sockfd, backlog);
}

CMUX_EXPORT int accept(int sockfd, struct sockaddr* addr, socklen_t* addrlen) {
    AcceptFn real = Real(g_accept, "accept");
    if (real == nullptr) {
        errno = ENOSYS;
        return -1;
    }
    const socklen_t provided = addrlen ? *addrlen : 0;
    const int fd = real(sockfd, addr, addrlen);
    if (fd >= 0) Inbound(addr, addrlen, provided);
    return fd;
}

CMUX_EXPORT int accept4(int sockfd, struct sockaddr* addr, socklen_t* addrlen, int flags) {
    Accept4Fn real = Real(g_accept4, "accept4");
    if (real == nullptr) {
        errno = ENOSYS;
        return -1;
    }
    const socklen_t provided = addrlen ? *addrlen : 0;
    const int fd = real(sockfd, addr, addrlen, flags);
    if (fd >= 0) Inbound(addr, addrlen, provided);
    return fd;
}

CMUX_EXPORT int getsockname(int sockfd, struct sockaddr* addr, socklen_t* addrlen) noexcept {
    SockNameFn real = Real(g_getsockname, "getsockname");
    if (real == nullptr) {
        errno = ENOSYS;
        return -1;
    }
    const socklen_t provided = addrlen ? *addrlen : 0;
    const int rc = real(sockfd, addr, addrlen);
    if (rc == 0) Inbound(addr, addrlen, provided);
    return rc;
}

CMUX_EXPORT int getpeername(int sockfd, struct sockaddr* addr, socklen_t* addrlen) noexcept {
    SockNameFn real = Real(g_getpeername, "getpeername");
    if (real == nullptr) {
        errno = ENOSYS;
        return -1;
    }
    const socklen_t provided = addrlen ? *addrlen : 0;
    const int rc = real(sockfd, addr, addrlen);
    if (rc == 0) Inbound(addr, addrlen, provided);
    return rc;
}

CMUX_EXPORT int chdir(const char* path) noexcept {
    ChdirFn real = Real(g_chdir, "chdir");
    if (real == nullptr) {
        errno = ENOSYS;
        return -1;
    }
    const int rc = real(path);
    if (rc == 0) InvalidateWorkspace();
    return rc;
}

CMUX_EXPORT int fchdir(int fd) noexcept {
    FchdirFn real = Real(g_fchdir, "fchdir");
    if (real == nullptr) {
        errno = ENOSYS;
        return -1;
    }
    const int rc = real(fd);
    if (rc == 0) InvalidateWorkspace();
    return rc;
}

} // extern "C"
