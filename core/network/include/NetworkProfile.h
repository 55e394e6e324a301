#pragma once

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace CodeDrop {

    enum class NetworkType {
        Open,
        Restrictive,
        Corporate,   // restrictive behind a configured proxy ("institutional")
        Mobile
    };

    enum class ProxyKind {
        None,
        Socks,
        Http
    };

    const char* toString(NetworkType type);
    const char* toString(ProxyKind kind);

    // Accepts the names above plus "institutional" and "university" for Corporate
    std::optional<NetworkType> parseNetworkType(const std::string& name);

    /**
     * @brief Result of one NetworkProfiler::classify() run
     *
     * Produced fresh for every session and never cached across runs.
     */
    struct NetworkProfile {
        bool isRestrictive{false};
        std::set<int> reachablePorts;
        ProxyKind detectedProxyKind{ProxyKind::None};
        NetworkType networkType{NetworkType::Open};
        int probesAttempted{0};
        int probesTimedOut{0};
        std::chrono::system_clock::time_point probedAt{};

        bool isReachable(int port) const {
            return reachablePorts.count(port) > 0;
        }

        bool anyReachable(const std::vector<int>& ports) const {
            for (int port : ports) {
                if (isReachable(port)) return true;
            }
            return false;
        }

        std::string summary() const;
    };

}
