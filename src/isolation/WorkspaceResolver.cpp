#include "cmux/isolation/WorkspaceResolver.h"

#include <climits>
#include <cstdlib>
#include <cstring>
#include <unistd.h>

namespace cmux {
namespace isolation {

WorkspaceResolver WorkspaceResolver::FromEnvironment() noexcept {
    return WorkspaceResolver(::getenv(kWorkspaceRootEnv), ::getenv(kWorkspaceOverrideEnv));
}

WorkspaceResolver::Resolution WorkspaceResolver::CopyName(const char* begin, size_t len,
                                                           char* out, size_t cap) noexcept {
    if (len == 0 || cap == 0 || len > cap - 1) return Resolution::kInvalid;
    std::memcpy(out, begin, len);
    out[len] = '\0';
    return Resolution::kWorkspace;
}

WorkspaceResolver::Resolution WorkspaceResolver::Resolve(const char* cwd, char* out, size_t cap) const noexcept {
    if (HasOverride()) {
        size_t end = std::strlen(override_);
        while (end > 0 && override_[end - 1] == '/') --end;
        size_t begin = end;
        while (begin > 0 && override_[begin - 1] != '/') --begin;
        return CopyName(override_ + begin, end - begin, out, cap);
    }

    if (!HasRoot()) return Resolution::kNone;
    if (cwd == nullptr) return Resolution::kInvalid;

    size_t rootLen = std::strlen(root_);
    while (rootLen > 0 && root_[rootLen - 1] == '/') --rootLen;

    if (std::strncmp(cwd, root_, rootLen) != 0) return Resolution::kNone;

    const char* p = cwd + rootLen;
    if (*p != '/') return Resolution::kNone; // equal to root, or "/rootfs" style prefix
    while (*p == '/') ++p;

    const char* begin = p;
    while (*p != '\0' && *p != '/') ++p;
    if (p == begin) return Resolution::kNone;

    return CopyName(begin, static_cast<size_t>(p - begin), out, cap);
}

WorkspaceResolver::Resolution WorkspaceResolver::ResolveCurrent(char* out, size_t cap) const noexcept {
    if (HasOverride() || !HasRoot()) {
        return Resolve(nullptr, out, cap);
    }
    char cwd[PATH_MAX];
    const char* p = ::getcwd(cwd, sizeof cwd);
    return Resolve(p, out, cap);
}

std::optional<std::string> WorkspaceResolver::ResolveCurrent() const {
    char name[kMaxWorkspaceName + 1];
    if (ResolveCurrent(name, sizeof name) != Resolution::kWorkspace) {
        return std::nullopt;
    }
    return std::string(name);
}

} // namespace isolation
} // namespace cmux
