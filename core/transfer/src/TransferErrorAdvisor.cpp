#include "TransferErrorAdvisor.h"

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace CodeDrop {

    namespace {

        std::string lower(std::string text) {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return text;
        }

        bool containsAny(const std::string& haystack, std::initializer_list<const char*> needles) {
            for (const char* needle : needles) {
                if (haystack.find(needle) != std::string::npos) {
                    return true;
                }
            }
            return false;
        }

        ErrorAdvice make(ErrorCategory category, ErrorSeverity severity, bool retryable,
                         std::string headline, std::string action) {
            ErrorAdvice advice;
            advice.category = category;
            advice.severity = severity;
            advice.retryable = retryable;
            advice.headline = std::move(headline);
            advice.userAction = std::move(action);
            return advice;
        }

        ErrorAdvice adviceForCategory(ErrorCategory category, NetworkType networkType) {
            switch (category) {
                case ErrorCategory::NetworkBlocked:
                    if (networkType == NetworkType::Corporate) {
                        return make(category, ErrorSeverity::Medium, true,
                                    "Corporate firewall is blocking the transfer",
                                    "Ask IT to allow the relay ports, or retry from a different network");
                    }
                    if (networkType == NetworkType::Restrictive) {
                        return make(category, ErrorSeverity::Medium, true,
                                    "This network only allows web traffic",
                                    "Retry so a web-port backend is used, or switch networks");
                    }
                    return make(category, ErrorSeverity::Medium, true,
                                "Connection was refused or the peer is unreachable",
                                "Check your internet connection and try again");

                case ErrorCategory::Timeout:
                    if (networkType == NetworkType::Mobile) {
                        return make(category, ErrorSeverity::Low, true,
                                    "The mobile connection is too slow",
                                    "Move to a stronger signal or Wi-Fi and try again");
                    }
                    return make(category, ErrorSeverity::Low, true,
                                "The transfer timed out",
                                "Make sure the other side is ready, then try again");

                case ErrorCategory::Dns:
                    return make(category, ErrorSeverity::Medium, true,
                                "Server name could not be resolved",
                                "Check DNS settings or try a different network");

                case ErrorCategory::Proxy:
                    return make(category, ErrorSeverity::Medium, true,
                                "The proxy rejected the connection",
                                "Check HTTPS_PROXY / ALL_PROXY settings");

                case ErrorCategory::InvalidCode:
                    return make(category, ErrorSeverity::High, false,
                                "The transfer code is invalid",
                                "Ask the sender for the full code and type it again");

                case ErrorCategory::Integrity:
                    return make(category, ErrorSeverity::High, false,
                                "The received data failed verification",
                                "Confirm both sides used the same code; ask the sender to send again");

                case ErrorCategory::FileAccess:
                    return make(category, ErrorSeverity::Medium, false,
                                "A file could not be read or written",
                                "Check the path and its permissions");

                case ErrorCategory::DiskSpace:
                    return make(category, ErrorSeverity::Medium, false,
                                "Not enough disk space",
                                "Free some space and try again");

                case ErrorCategory::TransportFailed:
                    return make(category, ErrorSeverity::Medium, true,
                                "No transfer method worked",
                                "Try again later or from a different network");

                case ErrorCategory::Busy:
                    return make(category, ErrorSeverity::Low, true,
                                "A transfer with this code is already running",
                                "Wait for it to finish");

                case ErrorCategory::Cancelled:
                    return make(category, ErrorSeverity::Low, true,
                                "Transfer cancelled", "Start it again when ready");

                case ErrorCategory::Configuration:
                    return make(category, ErrorSeverity::High, false,
                                "Configuration is invalid",
                                "Fix the configuration file and restart");

                case ErrorCategory::Unknown:
                    break;
            }
            return make(ErrorCategory::Unknown, ErrorSeverity::Medium, true,
                        "The transfer failed", "Try again");
        }

    } // namespace

    const char* toString(ErrorCategory category) {
        switch (category) {
            case ErrorCategory::NetworkBlocked: return "network-blocked";
            case ErrorCategory::Timeout: return "timeout";
            case ErrorCategory::Dns: return "dns";
            case ErrorCategory::Proxy: return "proxy";
            case ErrorCategory::InvalidCode: return "invalid-code";
            case ErrorCategory::Integrity: return "integrity";
            case ErrorCategory::FileAccess: return "file-access";
            case ErrorCategory::DiskSpace: return "disk-space";
            case ErrorCategory::TransportFailed: return "transport-failed";
            case ErrorCategory::Busy: return "busy";
            case ErrorCategory::Cancelled: return "cancelled";
            case ErrorCategory::Configuration: return "configuration";
            case ErrorCategory::Unknown: return "unknown";
        }
        return "unknown";
    }

    const char* toString(ErrorSeverity severity) {
        switch (severity) {
            case ErrorSeverity::Low: return "low";
            case ErrorSeverity::Medium: return "medium";
            case ErrorSeverity::High: return "high";
        }
        return "medium";
    }

    std::string ErrorAdvice::toString() const {
        std::string out = headline;
        if (!userAction.empty()) {
            out += ". " + userAction;
        }
        if (!technicalDetail.empty()) {
            out += " (" + technicalDetail + ")";
        }
        return out;
    }

    ErrorCategory TransferErrorAdvisor::classifyMessage(const std::string& message) {
        const std::string text = lower(message);

        if (containsAny(text, {"proxy"})) {
            return ErrorCategory::Proxy;
        }
        if (containsAny(text, {"no such host", "name resolution", "dns", "server misbehaving"})) {
            return ErrorCategory::Dns;
        }
        if (containsAny(text, {"connection refused", "network is unreachable", "network unreachable",
                               "host unreachable", "no route to host", "firewall", "blocked",
                               "connection reset"})) {
            return ErrorCategory::NetworkBlocked;
        }
        if (containsAny(text, {"timeout", "timed out", "deadline exceeded"})) {
            return ErrorCategory::Timeout;
        }
        if (containsAny(text, {"no space", "disk full"})) {
            return ErrorCategory::DiskSpace;
        }
        if (containsAny(text, {"permission denied", "no such file", "read-only"})) {
            return ErrorCategory::FileAccess;
        }
        return ErrorCategory::Unknown;
    }

    ErrorAdvice TransferErrorAdvisor::advise(const Error& error, NetworkType networkType) {
        ErrorCategory category = ErrorCategory::Unknown;

        switch (error.code) {
            case ErrorCode::WeakCode:
                category = ErrorCategory::InvalidCode;
                break;
            case ErrorCode::IntegrityError:
            case ErrorCode::CryptoFailure:
            case ErrorCode::InvalidPackage:
                category = ErrorCategory::Integrity;
                break;
            case ErrorCode::Cancelled:
                category = ErrorCategory::Cancelled;
                break;
            case ErrorCode::TransferInProgress:
                category = ErrorCategory::Busy;
                break;
            case ErrorCode::InvalidConfig:
                category = ErrorCategory::Configuration;
                break;
            case ErrorCode::ProbeTimeout:
            case ErrorCode::AttemptTimeout:
                category = ErrorCategory::Timeout;
                break;
            case ErrorCode::IoError: {
                const ErrorCategory refined = classifyMessage(error.message);
                category = refined == ErrorCategory::DiskSpace ? refined : ErrorCategory::FileAccess;
                break;
            }
            case ErrorCode::AllTransportsExhausted:
            case ErrorCode::BackendUnavailable:
            case ErrorCode::SendFailure:
            case ErrorCode::ReceiveFailure: {
                const ErrorCategory refined = classifyMessage(error.message);
                category = refined == ErrorCategory::Unknown ? ErrorCategory::TransportFailed : refined;
                break;
            }
            default:
                category = classifyMessage(error.message);
                break;
        }

        ErrorAdvice advice = adviceForCategory(category, networkType);
        advice.technicalDetail = error.toString();
        return advice;
    }

}
