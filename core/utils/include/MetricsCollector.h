#pragma once

#include <string>
#include <atomic>
#include <chrono>
#include <cstdint>

namespace CodeDrop {

    // Snapshot structs for returning metrics (non-atomic)
    struct SessionMetricsSnapshot {
        uint64_t sessionsStarted{0};
        uint64_t sessionsCompleted{0};
        uint64_t sessionsFailed{0};
        uint64_t sessionsCancelled{0};
    };

    struct TransportMetricsSnapshot {
        uint64_t attempts{0};
        uint64_t attemptFailures{0};
        uint64_t attemptTimeouts{0};
        uint64_t failovers{0};
        uint64_t bytesSent{0};
        uint64_t bytesReceived{0};
    };

    struct SecurityMetricsSnapshot {
        uint64_t keysDerived{0};
        uint64_t weakCodesRejected{0};
        uint64_t encryptionErrors{0};
        uint64_t integrityFailures{0};
    };

    struct ProbeMetricsSnapshot {
        uint64_t classifications{0};
        uint64_t probesRun{0};
        uint64_t probesTimedOut{0};
    };

    struct MetricsSnapshot {
        SessionMetricsSnapshot sessions;
        TransportMetricsSnapshot transport;
        SecurityMetricsSnapshot security;
        ProbeMetricsSnapshot probes;
        std::chrono::seconds uptime{0};
    };

    // Internal structs with atomics
    struct SessionMetrics {
        std::atomic<uint64_t> sessionsStarted{0};
        std::atomic<uint64_t> sessionsCompleted{0};
        std::atomic<uint64_t> sessionsFailed{0};
        std::atomic<uint64_t> sessionsCancelled{0};
    };

    struct TransportMetrics {
        std::atomic<uint64_t> attempts{0};
        std::atomic<uint64_t> attemptFailures{0};
        std::atomic<uint64_t> attemptTimeouts{0};
        std::atomic<uint64_t> failovers{0};
        std::atomic<uint64_t> bytesSent{0};
        std::atomic<uint64_t> bytesReceived{0};
    };

    struct SecurityMetrics {
        std::atomic<uint64_t> keysDerived{0};
        std::atomic<uint64_t> weakCodesRejected{0};
        std::atomic<uint64_t> encryptionErrors{0};
        std::atomic<uint64_t> integrityFailures{0};
    };

    struct ProbeMetrics {
        std::atomic<uint64_t> classifications{0};
        std::atomic<uint64_t> probesRun{0};
        std::atomic<uint64_t> probesTimedOut{0};
    };

    /**
     * @brief Counters for one OrchestrationContext
     */
    class MetricsCollector {
    public:
        MetricsCollector();

        MetricsCollector(const MetricsCollector&) = delete;
        MetricsCollector& operator=(const MetricsCollector&) = delete;

        // Session metrics
        void incrementSessionsStarted();
        void incrementSessionsCompleted();
        void incrementSessionsFailed();
        void incrementSessionsCancelled();

        // Transport metrics
        void incrementAttempts();
        void incrementAttemptFailures();
        void incrementAttemptTimeouts();
        void incrementFailovers();
        void addBytesSent(uint64_t bytes);
        void addBytesReceived(uint64_t bytes);

        // Security metrics
        void incrementKeysDerived();
        void incrementWeakCodesRejected();
        void incrementEncryptionErrors();
        void incrementIntegrityFailures();

        // Probe metrics
        void incrementClassifications();
        void addProbesRun(uint64_t count);
        void addProbesTimedOut(uint64_t count);

        MetricsSnapshot snapshot() const;

        std::string getMetricsSummary() const;

        void reset();

        std::chrono::seconds getUptime() const;

    private:
        SessionMetrics sessionMetrics_;
        TransportMetrics transportMetrics_;
        SecurityMetrics securityMetrics_;
        ProbeMetrics probeMetrics_;

        std::chrono::steady_clock::time_point startTime_;
    };

} // namespace CodeDrop
