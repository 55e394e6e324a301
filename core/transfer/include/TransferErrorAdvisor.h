#pragma once

#include "NetworkProfile.h"
#include "Result.h"

#include <string>

namespace CodeDrop {

    enum class ErrorCategory {
        NetworkBlocked,
        Timeout,
        Dns,
        Proxy,
        InvalidCode,
        Integrity,
        FileAccess,
        DiskSpace,
        TransportFailed,
        Busy,
        Cancelled,
        Configuration,
        Unknown
    };

    enum class ErrorSeverity {
        Low,
        Medium,
        High
    };

    const char* toString(ErrorCategory category);
    const char* toString(ErrorSeverity severity);

    /**
     * @brief What to tell the user about a failed transfer
     */
    struct ErrorAdvice {
        ErrorCategory category{ErrorCategory::Unknown};
        ErrorSeverity severity{ErrorSeverity::Medium};
        std::string headline;
        std::string userAction;
        bool retryable{false};
        std::string technicalDetail;

        std::string toString() const;
    };

    /**
     * @brief Maps session errors to user guidance
     *
     * The error code decides first. Transport failures are refined by
     * scanning the backend message for known keywords, and the advice is
     * specialised for the local network type.
     */
    class TransferErrorAdvisor {
    public:
        static ErrorAdvice advise(const Error& error, NetworkType networkType = NetworkType::Open);

        // Keyword classification of a backend message
        static ErrorCategory classifyMessage(const std::string& message);
    };

}
