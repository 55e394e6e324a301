#pragma once

#include "NetworkProfile.h"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace CodeDrop {

    class ThreadPool;
    class MetricsCollector;

    enum class ProbeOutcome {
        Reachable,
        Unreachable,
        TimedOut
    };

    struct ProfilerOptions {
        std::vector<std::string> hosts{"1.1.1.1", "8.8.8.8"};
        std::vector<int> webPorts{80, 443};
        std::vector<int> nativePorts{9009, 9010, 9001};
        std::chrono::milliseconds timeout{3000};
        std::chrono::milliseconds perProbeTimeout{1500};
    };

    /**
     * @brief Classifies the local network by probing TCP ports concurrently
     *
     * All probes of one classify() call share a single deadline. A probe that
     * errors or times out only counts as unreachable.
     */
    class NetworkProfiler {
    public:
        using PortProbe = std::function<ProbeOutcome(const std::string& host, int port,
                                                     std::chrono::milliseconds timeout)>;
        using InterfaceLister = std::function<std::vector<std::string>()>;
        using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

        NetworkProfiler(ThreadPool& pool, ProfilerOptions options, MetricsCollector* metrics = nullptr);

        NetworkProfile classify() const;
        NetworkProfile classify(std::chrono::milliseconds timeout) const;

        // Seams for tests; defaults use real sockets, getifaddrs and getenv
        void setPortProbe(PortProbe probe) { probe_ = std::move(probe); }
        void setInterfaceLister(InterfaceLister lister) { interfaces_ = std::move(lister); }
        void setEnvLookup(EnvLookup lookup) { env_ = std::move(lookup); }

        const ProfilerOptions& options() const { return options_; }

        // Non-blocking connect bounded by timeout
        static ProbeOutcome tcpConnectProbe(const std::string& host, int port,
                                            std::chrono::milliseconds timeout);
        static std::vector<std::string> systemInterfaces();
        static std::optional<std::string> systemEnv(const std::string& name);

        static ProxyKind detectProxy(const EnvLookup& env);
        static bool hasMobileInterface(const std::vector<std::string>& interfaces);

    private:
        ThreadPool& pool_;
        ProfilerOptions options_;
        MetricsCollector* metrics_;

        PortProbe probe_;
        InterfaceLister interfaces_;
        EnvLookup env_;
    };

}
