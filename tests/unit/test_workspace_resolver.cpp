#include "cmux/isolation/WorkspaceResolver.h"
#include "cmux/common/Logger.h"

#include <cassert>
#include <cstring>
#include <string>

using namespace cmux::isolation;
using Resolution = WorkspaceResolver::Resolution;

namespace {

Resolution resolve(const char* root, const char* overrideName, const char* cwd, std::string* name) {
    char out[kMaxWorkspaceName + 1];
    out[0] = '\0';
    WorkspaceResolver resolver(root, overrideName);
    Resolution r = resolver.Resolve(cwd, out, sizeof out);
    if (name) *name = out;
    return r;
}

} // namespace

void testNoRoot() {
    std::string name;
    assert(resolve(nullptr, nullptr, "/ws/alpha", &name) == Resolution::kNone);
    assert(resolve("", nullptr, "/ws/alpha", &name) == Resolution::kNone);
    assert(resolve(nullptr, nullptr, nullptr, &name) == Resolution::kNone);
    LOG_INFO << "No root PASS";
}

void testComponentUnderRoot() {
    std::string name;
    assert(resolve("/ws", nullptr, "/ws/alpha", &name) == Resolution::kWorkspace);
    assert(name == "alpha");
    assert(resolve("/ws", nullptr, "/ws/alpha/src/lib", &name) == Resolution::kWorkspace);
    assert(name == "alpha");
    assert(resolve("/ws/", nullptr, "/ws/beta/x", &name) == Resolution::kWorkspace);
    assert(name == "beta");
    assert(resolve("/ws", nullptr, "/ws//gamma", &name) == Resolution::kWorkspace);
    assert(name == "gamma");
    LOG_INFO << "Component under root PASS";
}

void testOutsideRoot() {
    std::string name;
    assert(resolve("/ws", nullptr, "/home/user", &name) == Resolution::kNone);
    assert(resolve("/ws", nullptr, "/ws", &name) == Resolution::kNone);
    assert(resolve("/ws", nullptr, "/ws/", &name) == Resolution::kNone);
    // Prefix of a longer component is not the root.
    assert(resolve("/ws", nullptr, "/wsx/alpha", &name) == Resolution::kNone);
    LOG_INFO << "Outside root PASS";
}

void testOverride() {
    std::string name;
    assert(resolve(nullptr, "delta", "/anywhere", &name) == Resolution::kWorkspace);
    assert(name == "delta");
    assert(resolve("/ws", "/ws/epsilon", "/ws/alpha", &name) == Resolution::kWorkspace);
    assert(name == "epsilon");
    assert(resolve("/ws", "/ws/zeta/", nullptr, &name) == Resolution::kWorkspace);
    assert(name == "zeta");
    assert(resolve("/ws", "/", "/ws/alpha", &name) == Resolution::kInvalid);
    LOG_INFO << "Override PASS";
}

void testInvalid() {
    std::string name;
    // Root configured but cwd unknown.
    assert(resolve("/ws", nullptr, nullptr, &name) == Resolution::kInvalid);

    const std::string longName(kMaxWorkspaceName + 1, 'x');
    const std::string cwd = "/ws/" + longName;
    assert(resolve("/ws", nullptr, cwd.c_str(), &name) == Resolution::kInvalid);

    const std::string fits(kMaxWorkspaceName, 'y');
    const std::string cwd2 = "/ws/" + fits + "/sub";
    assert(resolve("/ws", nullptr, cwd2.c_str(), &name) == Resolution::kWorkspace);
    assert(name == fits);

    char tiny[4];
    WorkspaceResolver resolver("/ws", nullptr);
    assert(resolver.Resolve("/ws/abcd", tiny, sizeof tiny) == Resolution::kInvalid);
    assert(resolver.Resolve("/ws/abc", tiny, sizeof tiny) == Resolution::kWorkspace);
    assert(std::strcmp(tiny, "abc") == 0);
    LOG_INFO << "Invalid PASS";
}

void testResolveCurrent() {
    WorkspaceResolver none(nullptr, nullptr);
    assert(!none.ResolveCurrent().has_value());

    WorkspaceResolver forced(nullptr, "forced");
    auto name = forced.ResolveCurrent();
    assert(name.has_value() && *name == "forced");
    LOG_INFO << "ResolveCurrent PASS";
}

int main() {
    testNoRoot();
    testComponentUnderRoot();
    testOutsideRoot();
    testOverride();
    testInvalid();
    testResolveCurrent();
    return 0;
}
