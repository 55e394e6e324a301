#include "TransportManager.h"
#include "ThreadPool.h"
#include "MetricsCollector.h"
#include "Logger.h"
#include "LoggerMacros.h"

#include <algorithm>
#include <future>
#include <memory>
#include <sstream>
#include <tuple>

namespace CodeDrop {

namespace {
    const char* const kComponent = "TransportManager";

    using Clock = std::chrono::steady_clock;

    enum class WaitStatus {
        Ready,
        TimedOut,
        Cancelled
    };

    // Waits in short slices so caller cancellation is noticed promptly
    template<typename T>
    WaitStatus waitForResult(std::future<T>& future, Clock::time_point deadline, const CancellationToken& cancel) {
        const auto slice = std::chrono::milliseconds(20);
        for (;;) {
            if (future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
                return WaitStatus::Ready;
            }
            if (cancel.isCancelled()) {
                return WaitStatus::Cancelled;
            }
            auto now = Clock::now();
            if (now >= deadline) {
                return WaitStatus::TimedOut;
            }
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            future.wait_for(std::min(slice, remaining));
        }
    }

    std::chrono::milliseconds elapsedSince(Clock::time_point start) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    }
}

std::string FailoverError::toString() const {
    std::ostringstream ss;
    ss << error.toString();
    for (size_t i = 0; i < attempts.size(); ++i) {
        ss << "\n  " << (i + 1) << ". " << attempts[i].toString();
    }
    return ss.str();
}

TransportManager::TransportManager(TransportRegistry& registry, ThreadPool& pool,
                                   TransportManagerOptions options, MetricsCollector* metrics)
    : registry_(registry)
    , pool_(pool)
    , options_(options)
    , metrics_(metrics)
{
}

std::vector<RankedTransport> TransportManager::rank(const NetworkProfile& profile, uint64_t payloadSize,
                                                    const CancellationToken& cancel) const {
    const auto& entries = registry_.entries();
    std::vector<RankedTransport> ranked;
    ranked.reserve(entries.size());

    auto checkToken = cancel.child();
    std::vector<std::future<bool>> checks;
    checks.reserve(entries.size());
    for (const auto& entry : entries) {
        ITransport* transport = entry.transport.get();
        checks.push_back(pool_.enqueue([transport, checkToken]() {
            return transport->isAvailable(checkToken);
        }));
    }

    const auto deadline = Clock::now() + options_.availabilityTimeout;
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];

        RankedTransport r;
        r.transport = entry.transport.get();
        r.name = entry.name;
        r.priority = entry.priority;

        auto status = waitForResult(checks[i], deadline, cancel);
        if (status == WaitStatus::Ready) {
            try {
                r.available = checks[i].get();
            } catch (const std::exception& e) {
                Logger::instance().log(LogLevel::WARN,
                    "Availability check for '" + entry.name + "' threw: " + e.what(), kComponent);
                r.available = false;
            }
        } else {
            LOG_DEBUG_COMP_IF("Availability check for '" + entry.name + "' did not finish in time", kComponent);
            r.available = false;
        }

        const bool nativeBlocked = profile.isRestrictive && !entry.hints.nativePorts.empty() &&
                                   !profile.anyReachable(entry.hints.nativePorts);
        const bool tooLarge = entry.hints.maxPayloadBytes && payloadSize > *entry.hints.maxPayloadBytes;
        r.demoted = nativeBlocked || tooLarge;

        ranked.push_back(std::move(r));
    }

    // Stragglers are told to stop; their results are no longer read
    checkToken.cancel();

    std::stable_sort(ranked.begin(), ranked.end(), [](const RankedTransport& a, const RankedTransport& b) {
        return std::make_tuple(!a.available, a.demoted, a.priority) <
               std::make_tuple(!b.available, b.demoted, b.priority);
    });

    std::ostringstream ss;
    for (size_t i = 0; i < ranked.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << ranked[i].name << "(" << ranked[i].priority;
        if (!ranked[i].available) ss << ", unavailable";
        if (ranked[i].demoted) ss << ", demoted";
        ss << ")";
    }
    Logger::instance().log(LogLevel::INFO, "Transport order: " + ss.str(), kComponent);

    return ranked;
}

std::vector<ITransport*> TransportManager::selectOrder(const NetworkProfile& profile, uint64_t payloadSize,
                                                       const CancellationToken& cancel) const {
    std::vector<ITransport*> order;
    for (const auto& r : rank(profile, payloadSize, cancel)) {
        order.push_back(r.transport);
    }
    return order;
}

Result<std::vector<uint8_t>, FailoverError> TransportManager::runFailover(const char* operation,
                                                                          const std::vector<ITransport*>& order,
                                                                          const AttemptFn& attempt,
                                                                          AttemptLog& log,
                                                                          const CancellationToken& cancel,
                                                                          const AttemptObserver& observer) const {
    auto& logger = Logger::instance();

    auto record = [&](AttemptRecord rec, size_t index) {
        log.append(rec);
        if (observer) {
            observer(rec, index, order.size());
        }
    };

    auto cancelled = [&]() {
        logger.log(LogLevel::INFO, std::string(operation) + " cancelled", kComponent);
        return FailoverError{Error(ErrorCode::Cancelled, std::string(operation) + " cancelled", kComponent),
                             log.snapshot()};
    };

    if (order.empty()) {
        return FailoverError{Error(ErrorCode::AllTransportsExhausted, "No transports registered", kComponent),
                             log.snapshot()};
    }

    const auto totalDeadline = Clock::now() + options_.maxTotalTimeout;
    std::string lastError;
    size_t attempted = 0;
    bool budgetExhausted = false;

    for (size_t i = 0; i < order.size(); ++i) {
        ITransport* transport = order[i];

        if (cancel.isCancelled()) {
            return cancelled();
        }

        auto now = Clock::now();
        if (now >= totalDeadline) {
            budgetExhausted = true;
            const std::string reason = "overall time budget of " +
                                       std::to_string(options_.maxTotalTimeout.count()) + "ms exhausted";
            for (size_t j = i; j < order.size(); ++j) {
                AttemptRecord skipped;
                skipped.transportName = nameOf(order[j]);
                skipped.outcome = AttemptOutcome::Skipped;
                skipped.error = reason;
                log.append(skipped);
            }
            logger.log(LogLevel::WARN, reason + "; skipping " + std::to_string(order.size() - i) +
                       " remaining transports", kComponent);
            break;
        }
        auto budget = std::min(options_.attemptTimeout,
                               std::chrono::duration_cast<std::chrono::milliseconds>(totalDeadline - now));

        const std::string name = nameOf(transport);
        if (i > 0 && metrics_) {
            metrics_->incrementFailovers();
        }
        if (metrics_) {
            metrics_->incrementAttempts();
        }
        logger.log(LogLevel::INFO, std::string(operation) + " via '" + name + "' (" + std::to_string(i + 1) +
                   "/" + std::to_string(order.size()) + ")", kComponent);

        const auto load = pool_.load();
        if (load.saturated()) {
            // Abandoned attempts still hold workers; this one waits in the queue
            logger.log(LogLevel::WARN, "All " + std::to_string(load.workers) + " workers busy, '" + name +
                       "' queued behind " + std::to_string(load.queued) + " tasks", kComponent);
        }

        ++attempted;
        auto attemptToken = cancel.child();
        const auto attemptStart = Clock::now();
        auto future = pool_.enqueue([transport, attempt, attemptToken]() {
            return attempt(*transport, attemptToken);
        });

        AttemptRecord rec;
        rec.transportName = name;

        auto status = waitForResult(future, attemptStart + budget, cancel);
        rec.duration = elapsedSince(attemptStart);

        if (status == WaitStatus::Cancelled) {
            attemptToken.cancel();
            rec.outcome = AttemptOutcome::Cancelled;
            rec.error = "cancelled";
            record(rec, i);
            return cancelled();
        }

        if (status == WaitStatus::TimedOut) {
            attemptToken.cancel();
            rec.outcome = AttemptOutcome::TimedOut;
            rec.error = "no result within " + std::to_string(budget.count()) + "ms";
            lastError = Error(ErrorCode::AttemptTimeout, rec.error, name).toString();
            if (metrics_) {
                metrics_->incrementAttemptTimeouts();
                metrics_->incrementAttemptFailures();
            }
            logger.log(LogLevel::WARN, "'" + name + "' " + rec.error, kComponent);
            record(rec, i);
            continue;
        }

        try {
            auto result = future.get();
            if (result.isOk()) {
                rec.outcome = AttemptOutcome::Success;
                record(rec, i);
                logger.log(LogLevel::INFO, std::string(operation) + " succeeded via '" + name + "' in " +
                           std::to_string(rec.duration.count()) + "ms", kComponent);
                return result.takeValue();
            }
            rec.outcome = AttemptOutcome::Failed;
            rec.error = result.error().toString();
        } catch (const std::exception& e) {
            rec.outcome = AttemptOutcome::Failed;
            rec.error = std::string("backend threw: ") + e.what();
        }

        if (metrics_) {
            metrics_->incrementAttemptFailures();
        }
        lastError = rec.error;
        logger.log(LogLevel::WARN, "'" + name + "' failed: " + rec.error, kComponent);
        record(rec, i);

        if (cancel.isCancelled()) {
            return cancelled();
        }
    }

    std::string message = budgetExhausted
        ? std::string(operation) + " budget of " + std::to_string(options_.maxTotalTimeout.count()) +
              "ms exhausted after " + std::to_string(attempted) + " of " + std::to_string(order.size()) +
              " transports"
        : std::string(operation) + " failed on all " + std::to_string(attempted) + " attempted transports";
    if (!lastError.empty()) {
        message += "; last error: " + lastError;
    }
    logger.log(LogLevel::ERROR, message, kComponent);
    return FailoverError{Error(ErrorCode::AllTransportsExhausted, message, kComponent), log.snapshot()};
}

Result<void, FailoverError> TransportManager::sendWithFailover(const std::vector<ITransport*>& order,
                                                               const std::vector<uint8_t>& data,
                                                               const TransferMetadata& metadata,
                                                               AttemptLog& log,
                                                               const CancellationToken& cancel,
                                                               const AttemptObserver& observer) const {
    // Shared copies outlive attempts that are abandoned after a timeout
    auto payload = std::make_shared<const std::vector<uint8_t>>(data);
    auto meta = std::make_shared<const TransferMetadata>(metadata);

    AttemptFn attempt = [payload, meta](ITransport& transport, const CancellationToken& token)
        -> Result<std::vector<uint8_t>> {
        auto result = transport.send(*payload, *meta, token);
        if (result.isError()) {
            return result.error();
        }
        return std::vector<uint8_t>{};
    };

    auto result = runFailover("Send", order, attempt, log, cancel, observer);
    if (result.isError()) {
        return result.error();
    }
    if (metrics_) {
        metrics_->addBytesSent(data.size());
    }
    return Result<void, FailoverError>();
}

Result<std::vector<uint8_t>, FailoverError> TransportManager::receiveWithFailover(const std::vector<ITransport*>& order,
                                                                                  const TransferMetadata& metadata,
                                                                                  AttemptLog& log,
                                                                                  const CancellationToken& cancel,
                                                                                  const AttemptObserver& observer) const {
    auto meta = std::make_shared<const TransferMetadata>(metadata);

    AttemptFn attempt = [meta](ITransport& transport, const CancellationToken& token) {
        return transport.receive(*meta, token);
    };

    auto result = runFailover("Receive", order, attempt, log, cancel, observer);
    if (result.isOk() && metrics_) {
        metrics_->addBytesReceived(result.value().size());
    }
    return result;
}

Result<void, FailoverError> TransportManager::sendWithFailover(const NetworkProfile& profile,
                                                               const std::vector<uint8_t>& data,
                                                               const TransferMetadata& metadata,
                                                               AttemptLog& log,
                                                               const CancellationToken& cancel,
                                                               const AttemptObserver& observer) const {
    auto order = selectOrder(profile, data.size(), cancel);
    return sendWithFailover(order, data, metadata, log, cancel, observer);
}

Result<std::vector<uint8_t>, FailoverError> TransportManager::receiveWithFailover(const NetworkProfile& profile,
                                                                                  const TransferMetadata& metadata,
                                                                                  AttemptLog& log,
                                                                                  const CancellationToken& cancel,
                                                                                  const AttemptObserver& observer) const {
    auto order = selectOrder(profile, metadata.fileSize, cancel);
    return receiveWithFailover(order, metadata, log, cancel, observer);
}

void TransportManager::closeAll() {
    registry_.closeAll();
}

std::string TransportManager::nameOf(const ITransport* transport) const {
    if (const auto* entry = registry_.entryFor(transport)) {
        return entry->name;
    }
    return transport->getName();
}

} // namespace CodeDrop
