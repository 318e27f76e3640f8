#include "cmux/ProxyServer.h"
#include "cmux/common/Config.h"
#include "cmux/common/Logger.h"
#include "cmux/network/Channel.h"
#include "cmux/network/EventLoop.h"
#include "cmux/network/InetAddress.h"
#include "cmux/network/ListenAddress.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <memory>
#include <pthread.h>
#include <stdexcept>
#include <string>
#include <sys/signalfd.h>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace {

const char* const kDefaultListen = "0.0.0.0:8080,127.0.0.1:8080";
const char* const kDefaultUpstreamHost = "127.0.0.1";
const int kDefaultThreads = 4;

void Usage(const char* prog) {
    std::printf("Usage: %s [-l host:port[,host:port...]]... [-u host] [-c config_file] [-t threads] [-C]\n", prog);
    std::printf("  -l, --listen         listen addresses (env CMUX_LISTEN, default %s)\n", kDefaultListen);
    std::printf("  -u, --upstream-host  host dialled for requests without a workspace (env CMUX_UPSTREAM_HOST)\n");
    std::printf("  -c, --config         INI config file, section [proxy]\n");
    std::printf("  -t, --threads        I/O threads (default %d)\n", kDefaultThreads);
    std::printf("  -C, --check          validate configuration and exit\n");
    std::printf("  -h, --help           show this help\n");
}

// flag > environment > config file > default
std::string Pick(const std::string& flag, const char* envName, const char* key, const std::string& fallback) {
    if (!flag.empty()) return flag;
    const char* env = std::getenv(envName);
    if (env != nullptr && env[0] != '\0') return env;
    return cmux::common::Config::Instance().GetString("proxy", key, fallback);
}

// Stops the base loop on SIGINT/SIGTERM. Signals are read from a signalfd so
// nothing runs in async-signal context.
class ShutdownSignal {
public:
    explicit ShutdownSignal(cmux::network::EventLoop* loop) : loop_(loop), fd_(-1) {
        sigset_t mask;
        sigemptyset(&mask);
        sigaddset(&mask, SIGINT);
        sigaddset(&mask, SIGTERM);
        if (::pthread_sigmask(SIG_BLOCK, &mask, nullptr) != 0) {
            throw std::system_error(errno, std::generic_category(), "pthread_sigmask");
        }
        fd_ = ::signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
        if (fd_ < 0) {
            throw std::system_error(errno, std::generic_category(), "signalfd");
        }
        channel_.reset(new cmux::network::Channel(loop_, fd_));
        channel_->SetReadCallback([this](std::chrono::system_clock::time_point) { HandleRead(); });
        channel_->EnableReading();
    }

    ~ShutdownSignal() {
        channel_->DisableAll();
        channel_->Remove();
        ::close(fd_);
    }

private:
    void HandleRead() {
        struct signalfd_siginfo info;
        const ssize_t n = ::read(fd_, &info, sizeof info);
        if (n != static_cast<ssize_t>(sizeof info)) return;
        LOG_INFO << "Received " << ::strsignal(static_cast<int>(info.ssi_signo)) << ", shutting down";
        loop_->Quit();
    }

    cmux::network::EventLoop* loop_;
    int fd_;
    std::unique_ptr<cmux::network::Channel> channel_;
};

} // namespace

int main(int argc, char* argv[]) {
    using namespace cmux;

    std::string listenFlag;
    std::string upstreamFlag;
    std::string configFile;
    int threadsFlag = -1;
    bool checkOnly = false;

    static const struct option kLongOptions[] = {
        {"listen", required_argument, nullptr, 'l'},
        {"upstream-host", required_argument, nullptr, 'u'},
        {"config", required_argument, nullptr, 'c'},
        {"threads", required_argument, nullptr, 't'},
        {"check", no_argument, nullptr, 'C'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int ch;
    while ((ch = getopt_long(argc, argv, "l:u:c:t:Ch", kLongOptions, nullptr)) != -1) {
        switch (ch) {
            case 'l':
                if (!listenFlag.empty()) listenFlag += ",";
                listenFlag += optarg;
                break;
            case 'u':
                upstreamFlag = optarg;
                break;
            case 'c':
                configFile = optarg;
                break;
            case 't': {
                char* endp = nullptr;
                const long v = std::strtol(optarg, &endp, 10);
                if (endp == optarg || *endp != '\0' || v < 0 || v > 1024) {
                    std::fprintf(stderr, "invalid thread count: %s\n", optarg);
                    return 2;
                }
                threadsFlag = static_cast<int>(v);
                break;
            }
            case 'C':
                checkOnly = true;
                break;
            case 'h':
                Usage(argv[0]);
                return 0;
            default:
                Usage(argv[0]);
                return 2;
        }
    }

    auto& conf = common::Config::Instance();
    if (!configFile.empty() && !conf.Load(configFile)) {
        return 2;
    }

    std::string levelName = conf.GetString("proxy", "log_level", "INFO");
    const char* envLevel = std::getenv("CMUX_LOG_LEVEL");
    if (envLevel != nullptr && envLevel[0] != '\0') levelName = envLevel;
    common::Logger::Instance().SetLevel(common::Logger::ParseLevel(levelName));

    const std::string listenSpec = Pick(listenFlag, "CMUX_LISTEN", "listen", kDefaultListen);
    const std::string upstreamName = Pick(upstreamFlag, "CMUX_UPSTREAM_HOST", "upstream_host", kDefaultUpstreamHost);
    const int threads = threadsFlag >= 0 ? threadsFlag : conf.GetInt("proxy", "threads", kDefaultThreads);

    std::vector<network::InetAddress> listenAddrs;
    std::string err;
    if (!network::ParseListenList(listenSpec, &listenAddrs, &err)) {
        LOG_ERROR << "Invalid listen address: " << err;
        return 2;
    }
    listenAddrs = network::DedupListenAddresses(std::move(listenAddrs));

    ProxyOptions options;
    if (!network::InetAddress::Resolve(upstreamName, 0, &options.upstreamHost)) {
        LOG_ERROR << "Cannot resolve upstream host: " << upstreamName;
        return 2;
    }
    options.connectTimeoutMs = conf.GetInt("proxy", "connect_timeout_ms", options.connectTimeoutMs);
    const std::int64_t hwm = conf.GetInt64("proxy", "high_water_mark_bytes",
                                           static_cast<std::int64_t>(options.highWaterMarkBytes));
    if (options.connectTimeoutMs <= 0 || hwm <= 0 || threads < 0) {
        LOG_ERROR << "connect_timeout_ms, high_water_mark_bytes and threads must be positive";
        return 2;
    }
    options.highWaterMarkBytes = static_cast<size_t>(hwm);

    if (checkOnly) {
        std::printf("OK\n");
        return 0;
    }

    ::signal(SIGPIPE, SIG_IGN);

    try {
        network::EventLoop loop;
        ShutdownSignal shutdown(&loop);
        ProxyServer server(&loop, listenAddrs, options);
        server.SetThreadNum(threads);
        server.Start();
        LOG_INFO << "cmux-proxy running with " << threads << " I/O threads";

        loop.Loop();
    } catch (const std::system_error& e) {
        LOG_ERROR << "Startup failed: " << e.what();
        return 1;
    } catch (const std::invalid_argument& e) {
        LOG_ERROR << "Startup failed: " << e.what();
        return 2;
    }
    return 0;
}
