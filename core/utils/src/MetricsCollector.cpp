#include "MetricsCollector.h"
#include <sstream>
#include <iomanip>

namespace CodeDrop {

    MetricsCollector::MetricsCollector()
        : startTime_(std::chrono::steady_clock::now()) {
    }

    // Session metrics
    void MetricsCollector::incrementSessionsStarted() { sessionMetrics_.sessionsStarted++; }
    void MetricsCollector::incrementSessionsCompleted() { sessionMetrics_.sessionsCompleted++; }
    void MetricsCollector::incrementSessionsFailed() { sessionMetrics_.sessionsFailed++; }
    void MetricsCollector::incrementSessionsCancelled() { sessionMetrics_.sessionsCancelled++; }

    // Transport metrics
    void MetricsCollector::incrementAttempts() { transportMetrics_.attempts++; }
    void MetricsCollector::incrementAttemptFailures() { transportMetrics_.attemptFailures++; }
    void MetricsCollector::incrementAttemptTimeouts() { transportMetrics_.attemptTimeouts++; }
    void MetricsCollector::incrementFailovers() { transportMetrics_.failovers++; }

    void MetricsCollector::addBytesSent(uint64_t bytes) {
        transportMetrics_.bytesSent += bytes;
    }

    void MetricsCollector::addBytesReceived(uint64_t bytes) {
        transportMetrics_.bytesReceived += bytes;
    }

    // Security metrics
    void MetricsCollector::incrementKeysDerived() { securityMetrics_.keysDerived++; }
    void MetricsCollector::incrementWeakCodesRejected() { securityMetrics_.weakCodesRejected++; }
    void MetricsCollector::incrementEncryptionErrors() { securityMetrics_.encryptionErrors++; }
    void MetricsCollector::incrementIntegrityFailures() { securityMetrics_.integrityFailures++; }

    // Probe metrics
    void MetricsCollector::incrementClassifications() { probeMetrics_.classifications++; }
    void MetricsCollector::addProbesRun(uint64_t count) { probeMetrics_.probesRun += count; }
    void MetricsCollector::addProbesTimedOut(uint64_t count) { probeMetrics_.probesTimedOut += count; }

    MetricsSnapshot MetricsCollector::snapshot() const {
        MetricsSnapshot s;
        s.sessions.sessionsStarted = sessionMetrics_.sessionsStarted.load();
        s.sessions.sessionsCompleted = sessionMetrics_.sessionsCompleted.load();
        s.sessions.sessionsFailed = sessionMetrics_.sessionsFailed.load();
        s.sessions.sessionsCancelled = sessionMetrics_.sessionsCancelled.load();

        s.transport.attempts = transportMetrics_.attempts.load();
        s.transport.attemptFailures = transportMetrics_.attemptFailures.load();
        s.transport.attemptTimeouts = transportMetrics_.attemptTimeouts.load();
        s.transport.failovers = transportMetrics_.failovers.load();
        s.transport.bytesSent = transportMetrics_.bytesSent.load();
        s.transport.bytesReceived = transportMetrics_.bytesReceived.load();

        s.security.keysDerived = securityMetrics_.keysDerived.load();
        s.security.weakCodesRejected = securityMetrics_.weakCodesRejected.load();
        s.security.encryptionErrors = securityMetrics_.encryptionErrors.load();
        s.security.integrityFailures = securityMetrics_.integrityFailures.load();

        s.probes.classifications = probeMetrics_.classifications.load();
        s.probes.probesRun = probeMetrics_.probesRun.load();
        s.probes.probesTimedOut = probeMetrics_.probesTimedOut.load();

        s.uptime = getUptime();
        return s;
    }

    std::string MetricsCollector::getMetricsSummary() const {
        auto s = snapshot();
        std::stringstream ss;

        ss << "=== CodeDrop Metrics Summary ===" << std::endl;
        ss << "Uptime: " << s.uptime.count() << "s" << std::endl << std::endl;

        ss << "--- Sessions ---" << std::endl;
        ss << "  Started: " << s.sessions.sessionsStarted << std::endl;
        ss << "  Completed: " << s.sessions.sessionsCompleted << std::endl;
        ss << "  Failed: " << s.sessions.sessionsFailed << std::endl;
        ss << "  Cancelled: " << s.sessions.sessionsCancelled << std::endl << std::endl;

        ss << "--- Transport ---" << std::endl;
        ss << std::fixed << std::setprecision(2);
        ss << "  Attempts: " << s.transport.attempts << std::endl;
        ss << "  Attempt Failures: " << s.transport.attemptFailures << std::endl;
        ss << "  Attempt Timeouts: " << s.transport.attemptTimeouts << std::endl;
        ss << "  Failovers: " << s.transport.failovers << std::endl;
        ss << "  Sent: " << s.transport.bytesSent / (1024.0 * 1024.0) << " MB" << std::endl;
        ss << "  Received: " << s.transport.bytesReceived / (1024.0 * 1024.0) << " MB" << std::endl << std::endl;

        ss << "--- Security ---" << std::endl;
        ss << "  Keys Derived: " << s.security.keysDerived << std::endl;
        ss << "  Weak Codes Rejected: " << s.security.weakCodesRejected << std::endl;
        ss << "  Encryption Errors: " << s.security.encryptionErrors << std::endl;
        ss << "  Integrity Failures: " << s.security.integrityFailures << std::endl << std::endl;

        ss << "--- Network Probes ---" << std::endl;
        ss << "  Classifications: " << s.probes.classifications << std::endl;
        ss << "  Probes Run: " << s.probes.probesRun << std::endl;
        ss << "  Probes Timed Out: " << s.probes.probesTimedOut << std::endl;

        return ss.str();
    }

    void MetricsCollector::reset() {
        sessionMetrics_.sessionsStarted = 0;
        sessionMetrics_.sessionsCompleted = 0;
        sessionMetrics_.sessionsFailed = 0;
        sessionMetrics_.sessionsCancelled = 0;

        transportMetrics_.attempts = 0;
        transportMetrics_.attemptFailures = 0;
        transportMetrics_.attemptTimeouts = 0;
        transportMetrics_.failovers = 0;
        transportMetrics_.bytesSent = 0;
        transportMetrics_.bytesReceived = 0;

        securityMetrics_.keysDerived = 0;
        securityMetrics_.weakCodesRejected = 0;
        securityMetrics_.encryptionErrors = 0;
        securityMetrics_.integrityFailures = 0;

        probeMetrics_.classifications = 0;
        probeMetrics_.probesRun = 0;
        probeMetrics_.probesTimedOut = 0;
    }

    std::chrono::seconds MetricsCollector::getUptime() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - startTime_);
    }

} // namespace CodeDrop
