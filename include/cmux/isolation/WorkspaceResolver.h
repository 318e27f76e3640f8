#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace cmux {
namespace isolation {

constexpr const char* kWorkspaceRootEnv = "CMUX_WORKSPACE_ROOT";
constexpr const char* kWorkspaceOverrideEnv = "CMUX_WORKSPACE_INTERNAL";

// Longest workspace name the resolver will hand out, excluding the NUL.
constexpr size_t kMaxWorkspaceName = 255;

// Derives the workspace a process belongs to from its working directory.
//
// Holds borrowed C strings (normally straight from getenv) and never
// allocates, so it is safe to use inside intercepted socket calls.
class WorkspaceResolver {
public:
    enum class Resolution {
        kNone,      // not inside any workspace: leave addresses alone
        kWorkspace, // out holds the workspace name
        kInvalid,   // a workspace applies but cannot be named
    };

    WorkspaceResolver(const char* root, const char* overrideName) noexcept
        : root_(root), override_(overrideName) {}

    static WorkspaceResolver FromEnvironment() noexcept;

    // An override (basename after the last '/') wins over the cwd. Without a
    // root every cwd resolves to kNone. Otherwise the single path component
    // directly under the root names the workspace; the root matches on a
    // component boundary and a trailing '/' on it is ignored. A null cwd with
    // a root configured, or a name that does not fit in cap - 1 bytes, is
    // kInvalid.
    Resolution Resolve(const char* cwd, char* out, size_t cap) const noexcept;

    // Resolve against getcwd().
    Resolution ResolveCurrent(char* out, size_t cap) const noexcept;

    std::optional<std::string> ResolveCurrent() const;

    bool HasRoot() const noexcept { return root_ != nullptr && root_[0] != '\0'; }
    bool HasOverride() const noexcept { return override_ != nullptr && override_[0] != '\0'; }

private:
    static Resolution CopyName(const char* begin, size_t len, char* out, size_t cap) noexcept;

    const char* root_;
    const char* override_;
};

} // namespace isolation
} // namespace cmux
