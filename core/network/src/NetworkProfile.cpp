#include "NetworkProfile.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace CodeDrop {

    const char* toString(NetworkType type) {
        switch (type) {
            case NetworkType::Open: return "open";
            case NetworkType::Restrictive: return "restrictive";
            case NetworkType::Corporate: return "corporate";
            case NetworkType::Mobile: return "mobile";
        }
        return "unknown";
    }

    const char* toString(ProxyKind kind) {
        switch (kind) {
            case ProxyKind::None: return "none";
            case ProxyKind::Socks: return "socks";
            case ProxyKind::Http: return "http";
        }
        return "unknown";
    }

    std::optional<NetworkType> parseNetworkType(const std::string& name) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "open") return NetworkType::Open;
        if (lower == "restrictive") return NetworkType::Restrictive;
        if (lower == "corporate" || lower == "institutional" || lower == "university") {
            return NetworkType::Corporate;
        }
        if (lower == "mobile") return NetworkType::Mobile;
        return std::nullopt;
    }

    std::string NetworkProfile::summary() const {
        std::ostringstream ss;
        ss << "type=" << toString(networkType)
           << " restrictive=" << (isRestrictive ? "yes" : "no")
           << " proxy=" << toString(detectedProxyKind)
           << " reachable=[";
        bool first = true;
        for (int port : reachablePorts) {
            if (!first) ss << ",";
            ss << port;
            first = false;
        }
        ss << "] probes=" << probesAttempted << " timedOut=" << probesTimedOut;
        return ss.str();
    }

}
