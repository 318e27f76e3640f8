// Runs copies of this binary under LD_PRELOAD=libworkspace_net.so, each in a
// workspace directory, and checks what they can bind and reach.

#include "cmux/common/Logger.h"
#include "cmux/isolation/ShadowAddress.h"
#include "SocketTestUtil.h"

#include <cassert>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <sys/stat.h>
#include <sys/wait.h>
#include <vector>

#ifndef CMUX_WORKSPACE_NET_LIB
#error "CMUX_WORKSPACE_NET_LIB must name the built libworkspace_net.so"
#endif

using namespace testutil;

namespace {

// ---- probe side: runs inside the preloaded child ----

std::string formatAddr(const sockaddr_in& addr) {
    char ip[INET_ADDRSTRLEN];
    ::inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof ip);
    return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
}

void report(const std::string& line) {
    std::printf("%s\n", line.c_str());
    std::fflush(stdout);
}

// "ok <local>" or "err <errno>"; the socket stays open on success.
int tryBind(uint16_t port, std::string* result) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);
    sockaddr_in addr = makeAddr("127.0.0.1", port);
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof addr) != 0 || ::listen(fd, 8) != 0) {
        *result = "err " + std::to_string(errno);
        ::close(fd);
        return -1;
    }
    socklen_t len = sizeof addr;
    assert(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    *result = "ok " + formatAddr(addr);
    return fd;
}

int probeHold(uint16_t port) {
    std::string result;
    int lfd = tryBind(port, &result);
    report(result);
    if (lfd < 0) return 1;

    sockaddr_in peer;
    socklen_t len = sizeof peer;
    int cfd = ::accept(lfd, reinterpret_cast<sockaddr*>(&peer), &len);
    if (cfd < 0) {
        report("err " + std::to_string(errno));
        return 1;
    }
    char ip[INET_ADDRSTRLEN];
    ::inet_ntop(AF_INET, &peer.sin_addr, ip, sizeof ip);
    report(std::string("peer ") + ip);

    // Hold the port until the parent closes our stdin.
    char c;
    while (::read(STDIN_FILENO, &c, 1) > 0) {
    }
    ::close(cfd);
    ::close(lfd);
    return 0;
}

int probeBindOnce(uint16_t port) {
    std::string result;
    int fd = tryBind(port, &result);
    report(result);
    if (fd >= 0) ::close(fd);
    return 0;
}

int probeConnect(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);
    sockaddr_in addr = makeAddr("127.0.0.1", port);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof addr) != 0) {
        report("err " + std::to_string(errno));
        ::close(fd);
        return 0;
    }
    socklen_t len = sizeof addr;
    assert(::getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    report("ok " + formatAddr(addr));
    ::close(fd);
    return 0;
}

// Binds once to prime the cached workspace, moves, binds again.
int probeChdirBind(uint16_t port, const char* dir) {
    std::string first;
    int fd = tryBind(port, &first);
    if (fd >= 0) ::close(fd);
    if (::chdir(dir) != 0) {
        report("chdir failed");
        return 1;
    }
    std::string second;
    fd = tryBind(port, &second);
    if (fd >= 0) ::close(fd);
    report(first + " | " + second);
    return 0;
}

int runProbe(int argc, char* argv[]) {
    const std::string mode = argv[2];
    const uint16_t port = static_cast<uint16_t>(std::atoi(argv[3]));
    if (mode == "hold") return probeHold(port);
    if (mode == "bind-once") return probeBindOnce(port);
    if (mode == "connect") return probeConnect(port);
    if (mode == "chdir-bind" && argc > 4) return probeChdirBind(port, argv[4]);
    std::fprintf(stderr, "unknown probe %s\n", mode.c_str());
    return 2;
}

// ---- parent side ----

struct Child {
    pid_t pid = -1;
    int out = -1; // child's stdout
    int in = -1;  // child's stdin
};

Child spawn(const std::string& cwd, const std::vector<std::string>& env,
            const std::vector<std::string>& args) {
    int outPipe[2];
    int inPipe[2];
    assert(::pipe(outPipe) == 0);
    assert(::pipe(inPipe) == 0);

    std::vector<std::string> argStore;
    argStore.push_back("test_workspace_net");
    argStore.push_back("--probe");
    argStore.insert(argStore.end(), args.begin(), args.end());
    std::vector<std::string> envStore = env;
    envStore.push_back(std::string("LD_PRELOAD=") + CMUX_WORKSPACE_NET_LIB);

    std::vector<char*> argv;
    for (auto& a : argStore) argv.push_back(&a[0]);
    argv.push_back(nullptr);
    std::vector<char*> envp;
    for (auto& e : envStore) envp.push_back(&e[0]);
    envp.push_back(nullptr);

    pid_t pid = ::fork();
    assert(pid >= 0);
    if (pid == 0) {
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(inPipe[0], STDIN_FILENO);
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        ::close(inPipe[0]);
        ::close(inPipe[1]);
        if (::chdir(cwd.c_str()) != 0) ::_exit(3);
        ::execve("/proc/self/exe", argv.data(), envp.data());
        ::_exit(4);
    }
    ::close(outPipe[1]);
    ::close(inPipe[0]);
    Child c;
    c.pid = pid;
    c.out = outPipe[0];
    c.in = inPipe[1];
    return c;
}

// One byte at a time so nothing past the newline is consumed.
std::string readLine(const Child& c) {
    std::string line;
    for (;;) {
        assert(pollReadable(c.out, 5000));
        char ch;
        const ssize_t n = ::read(c.out, &ch, 1);
        assert(n == 1);
        if (ch == '\n') return line;
        line += ch;
    }
}

void finish(Child* c) {
    ::close(c->in);
    int status = 0;
    assert(::waitpid(c->pid, &status, 0) == c->pid);
    assert(WIFEXITED(status) && WEXITSTATUS(status) == 0);
    ::close(c->out);
}

// Runs a probe to completion and returns its single output line.
std::string runOnce(const std::string& cwd, const std::vector<std::string>& env,
                    const std::vector<std::string>& args) {
    Child c = spawn(cwd, env, args);
    const std::string line = readLine(c);
    finish(&c);
    return line;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc >= 4 && std::string(argv[1]) == "--probe") {
        return runProbe(argc, argv);
    }

    char tmpl[] = "/tmp/cmux-wsnet-XXXXXX";
    assert(::mkdtemp(tmpl) != nullptr);
    char resolved[PATH_MAX];
    assert(::realpath(tmpl, resolved) != nullptr);
    const std::string root = resolved;
    const std::string alphaDir = root + "/alpha";
    const std::string betaDir = root + "/beta";
    assert(::mkdir(alphaDir.c_str(), 0755) == 0);
    assert(::mkdir(betaDir.c_str(), 0755) == 0);

    const std::vector<std::string> env = {"CMUX_WORKSPACE_ROOT=" + root};
    const uint16_t port = unusedPort();
    const std::string portStr = std::to_string(port);
    const std::string loopback = "127.0.0.1:" + portStr;

    // alpha listens on 127.0.0.1:port and sees exactly that address.
    Child holder = spawn(alphaDir, env, {"hold", portStr});
    assert(readLine(holder) == "ok " + loopback);

    // It actually sits on alpha's shadow address.
    int direct = connectTo(cmux::isolation::ShadowAddressString("alpha"), port);
    assert(readLine(holder) == "peer 127.0.0.1");
    ::close(direct);
    LOG_INFO << "Shadow bind and inbound restore PASS";

    // The real 127.0.0.1 is untouched.
    {
        int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr = makeAddr("127.0.0.1", port);
        assert(::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof addr) != 0);
        assert(errno == ECONNREFUSED);
        ::close(fd);
    }

    assert(runOnce(alphaDir, env, {"bind-once", portStr}) == "err " + std::to_string(EADDRINUSE));
    assert(runOnce(betaDir, env, {"bind-once", portStr}) == "ok " + loopback);
    LOG_INFO << "Per-workspace port space PASS";

    assert(runOnce(alphaDir, env, {"connect", portStr}) == "ok " + loopback);
    assert(runOnce(betaDir, env, {"connect", portStr}) == "err " + std::to_string(ECONNREFUSED));
    LOG_INFO << "Cross-workspace connect PASS";

    // Outside the root and without a root nothing is rewritten.
    assert(runOnce(root, env, {"bind-once", portStr}) == "ok " + loopback);
    assert(runOnce(alphaDir, {}, {"bind-once", portStr}) == "ok " + loopback);
    LOG_INFO << "Pass-through PASS";

    // The override wins over the directory; an empty name refuses loopback.
    assert(runOnce(betaDir, {"CMUX_WORKSPACE_ROOT=" + root, "CMUX_WORKSPACE_INTERNAL=alpha"},
                   {"bind-once", portStr}) == "err " + std::to_string(EADDRINUSE));
    assert(runOnce(alphaDir, {"CMUX_WORKSPACE_INTERNAL=/"}, {"bind-once", portStr}) ==
           "err " + std::to_string(EINVAL));
    LOG_INFO << "Workspace override PASS";

    assert(runOnce(alphaDir, env, {"chdir-bind", portStr, betaDir}) ==
           "err " + std::to_string(EADDRINUSE) + " | ok " + loopback);
    LOG_INFO << "chdir invalidation PASS";

    finish(&holder);
    ::rmdir(alphaDir.c_str());
    ::rmdir(betaDir.c_str());
    ::rmdir(root.c_str());
    return 0;
}
