#include "NetworkProfiler.h"
#include "ThreadPool.h"
#include "MetricsCollector.h"
#include "SocketGuard.h"
#include "Logger.h"
#include "LoggerMacros.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <future>
#include <memory>
#include <set>

#include <ifaddrs.h>
#include <netdb.h>
#include <sys/socket.h>

namespace CodeDrop {

    namespace {
        const char* const kComponent = "NetworkProfiler";

        const char* const kMobilePatterns[] = {"wwan", "ppp", "rmnet", "cellular", "lte"};

        const char* const kProxyVars[] = {
            "ALL_PROXY", "all_proxy", "HTTPS_PROXY", "https_proxy", "HTTP_PROXY", "http_proxy"
        };

        std::string toLower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        struct ProbeTask {
            std::string host;
            int port;
            std::future<ProbeOutcome> result;
        };
    }

    NetworkProfiler::NetworkProfiler(ThreadPool& pool, ProfilerOptions options, MetricsCollector* metrics)
        : pool_(pool)
        , options_(std::move(options))
        , metrics_(metrics)
        , probe_(&NetworkProfiler::tcpConnectProbe)
        , interfaces_(&NetworkProfiler::systemInterfaces)
        , env_(&NetworkProfiler::systemEnv)
    {
    }

    NetworkProfile NetworkProfiler::classify() const {
        return classify(options_.timeout);
    }

    NetworkProfile NetworkProfiler::classify(std::chrono::milliseconds timeout) const {
        SCOPED_TIMER_COMP("Network classification", kComponent);
        auto& logger = Logger::instance();

        using Clock = std::chrono::steady_clock;
        const auto deadline = Clock::now() + timeout;

        std::set<int> ports(options_.webPorts.begin(), options_.webPorts.end());
        ports.insert(options_.nativePorts.begin(), options_.nativePorts.end());

        std::vector<ProbeTask> tasks;
        tasks.reserve(options_.hosts.size() * ports.size());

        for (const auto& host : options_.hosts) {
            for (int port : ports) {
                auto probe = probe_;
                auto perProbe = options_.perProbeTimeout;
                // Budget is taken when the task starts so queued probes never outlive the deadline
                auto fut = pool_.enqueue([probe, host, port, perProbe, deadline]() {
                    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
                    auto budget = std::min(perProbe, remaining);
                    if (budget.count() <= 0) {
                        return ProbeOutcome::TimedOut;
                    }
                    return probe(host, port, budget);
                });
                tasks.push_back(ProbeTask{host, port, std::move(fut)});
            }
        }

        NetworkProfile profile;
        profile.probedAt = std::chrono::system_clock::now();
        profile.probesAttempted = static_cast<int>(tasks.size());

        for (auto& task : tasks) {
            ProbeOutcome outcome = ProbeOutcome::TimedOut;
            if (task.result.wait_until(deadline) == std::future_status::ready) {
                try {
                    outcome = task.result.get();
                } catch (const std::exception& e) {
                    LOG_DEBUG_COMP_IF("Probe " + task.host + ":" + std::to_string(task.port) +
                                      " failed: " + e.what(), kComponent);
                    outcome = ProbeOutcome::Unreachable;
                }
            }

            if (outcome == ProbeOutcome::Reachable) {
                profile.reachablePorts.insert(task.port);
            } else if (outcome == ProbeOutcome::TimedOut) {
                ++profile.probesTimedOut;
                LOG_DEBUG_COMP_IF("Probe " + task.host + ":" + std::to_string(task.port) +
                                  " timed out", kComponent);
            }
        }

        const bool webReachable = profile.anyReachable(options_.webPorts);
        const bool nativeReachable = profile.anyReachable(options_.nativePorts);

        profile.detectedProxyKind = detectProxy(env_);
        const bool mobile = hasMobileInterface(interfaces_());

        if (profile.reachablePorts.empty()) {
            logger.log(LogLevel::WARN, "No probe target reachable, assuming open network", kComponent);
            profile.isRestrictive = false;
            profile.networkType = NetworkType::Open;
        } else {
            profile.isRestrictive = webReachable && !nativeReachable;
            if (mobile) {
                profile.networkType = NetworkType::Mobile;
            } else if (profile.isRestrictive && profile.detectedProxyKind != ProxyKind::None) {
                profile.networkType = NetworkType::Corporate;
            } else if (profile.isRestrictive) {
                profile.networkType = NetworkType::Restrictive;
            } else {
                profile.networkType = NetworkType::Open;
            }
        }

        if (metrics_) {
            metrics_->incrementClassifications();
            metrics_->addProbesRun(static_cast<uint64_t>(profile.probesAttempted));
            metrics_->addProbesTimedOut(static_cast<uint64_t>(profile.probesTimedOut));
        }

        logger.log(LogLevel::INFO, "Network profile: " + profile.summary(), kComponent);
        return profile;
    }

    ProbeOutcome NetworkProfiler::tcpConnectProbe(const std::string& host, int port,
                                                  std::chrono::milliseconds timeout) {
        if (timeout.count() <= 0) {
            return ProbeOutcome::TimedOut;
        }

        struct addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_flags = AI_NUMERICSERV;

        struct addrinfo* result = nullptr;
        std::string service = std::to_string(port);
        if (getaddrinfo(host.c_str(), service.c_str(), &hints, &result) != 0 || !result) {
            return ProbeOutcome::Unreachable;
        }
        std::unique_ptr<struct addrinfo, decltype(&freeaddrinfo)> addrs(result, &freeaddrinfo);

        auto sock = SocketGuard::openFor(*addrs);
        if (!sock) {
            return ProbeOutcome::Unreachable;
        }

        switch (sock.startConnect(*addrs)) {
            case SocketGuard::Connect::Done:
                return ProbeOutcome::Reachable;
            case SocketGuard::Connect::Refused:
                return ProbeOutcome::Unreachable;
            case SocketGuard::Connect::InProgress:
                break;
        }

        switch (sock.waitWritable(timeout)) {
            case SocketGuard::Wait::TimedOut:
                return ProbeOutcome::TimedOut;
            case SocketGuard::Wait::Failed:
                return ProbeOutcome::Unreachable;
            case SocketGuard::Wait::Ready:
                break;
        }

        const int soError = sock.pendingError();
        if (soError != 0) {
            return soError == ETIMEDOUT ? ProbeOutcome::TimedOut : ProbeOutcome::Unreachable;
        }
        return ProbeOutcome::Reachable;
    }

    std::vector<std::string> NetworkProfiler::systemInterfaces() {
        std::vector<std::string> names;
        struct ifaddrs* ifaddr = nullptr;
        if (getifaddrs(&ifaddr) != 0) {
            LOG_DEBUG_COMP_IF(std::string("getifaddrs failed: ") + std::strerror(errno), kComponent);
            return names;
        }

        std::set<std::string> seen;
        for (auto* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
            if (ifa->ifa_name && seen.insert(ifa->ifa_name).second) {
                names.emplace_back(ifa->ifa_name);
            }
        }
        freeifaddrs(ifaddr);
        return names;
    }

    std::optional<std::string> NetworkProfiler::systemEnv(const std::string& name) {
        const char* value = std::getenv(name.c_str());
        if (!value) return std::nullopt;
        return std::string(value);
    }

    ProxyKind NetworkProfiler::detectProxy(const EnvLookup& env) {
        if (!env) return ProxyKind::None;

        for (const char* var : kProxyVars) {
            auto value = env(var);
            if (!value || value->empty()) continue;
            return toLower(*value).rfind("socks", 0) == 0 ? ProxyKind::Socks : ProxyKind::Http;
        }
        return ProxyKind::None;
    }

    bool NetworkProfiler::hasMobileInterface(const std::vector<std::string>& interfaces) {
        for (const auto& name : interfaces) {
            auto lower = toLower(name);
            for (const char* pattern : kMobilePatterns) {
                if (lower.find(pattern) != std::string::npos) {
                    return true;
                }
            }
        }
        return false;
    }

}
