#pragma once

/**
 * @file TransportManager.h
 * @brief Ranks registered backends and fails over between them
 */

#include "AttemptLog.h"
#include "ITransport.h"
#include "NetworkProfile.h"
#include "TransportRegistry.h"
#include "Result.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace CodeDrop {

class ThreadPool;
class MetricsCollector;

struct TransportManagerOptions {
    std::chrono::milliseconds attemptTimeout{60000};
    std::chrono::milliseconds availabilityTimeout{5000};
    std::chrono::milliseconds maxTotalTimeout{300000};
};

/**
 * @brief A backend's place in the ranking and why
 */
struct RankedTransport {
    ITransport* transport{nullptr};
    std::string name;
    int priority{0};
    bool available{false};
    bool demoted{false};
};

/**
 * @brief Failure of a whole failover run
 *
 * Carries the attempt log as it stood when the run ended.
 */
struct FailoverError {
    Error error;
    std::vector<AttemptRecord> attempts;

    std::string toString() const;
};

/**
 * @brief Sequential failover across ranked transports
 *
 * Attempts run one at a time on the pool, each bounded by attemptTimeout and
 * all of them by maxTotalTimeout. The manager never reports success unless
 * exactly one backend did, and never mixes results from two backends.
 */
class TransportManager {
public:
    using AttemptObserver = std::function<void(const AttemptRecord& record, size_t index, size_t total)>;

    TransportManager(TransportRegistry& registry, ThreadPool& pool,
                     TransportManagerOptions options, MetricsCollector* metrics = nullptr);

    /**
     * @brief Rank every entry for this profile and payload
     *
     * Availability checks run concurrently, bounded by availabilityTimeout.
     * Order: available before unavailable, preferred before demoted, then
     * priority ascending, then registration order. An entry is demoted when
     * the network is restrictive and none of its native ports is reachable,
     * or when the payload exceeds its size hint.
     */
    std::vector<RankedTransport> rank(const NetworkProfile& profile, uint64_t payloadSize,
                                      const CancellationToken& cancel) const;

    std::vector<ITransport*> selectOrder(const NetworkProfile& profile, uint64_t payloadSize,
                                         const CancellationToken& cancel) const;

    /**
     * @brief Try each transport in order until one send succeeds
     * @param observer Called after every attempt with a copy of its record
     * @return AllTransportsExhausted with the full log, or Cancelled
     */
    Result<void, FailoverError> sendWithFailover(const std::vector<ITransport*>& order,
                                                 const std::vector<uint8_t>& data,
                                                 const TransferMetadata& metadata,
                                                 AttemptLog& log,
                                                 const CancellationToken& cancel,
                                                 const AttemptObserver& observer = {}) const;

    Result<std::vector<uint8_t>, FailoverError> receiveWithFailover(const std::vector<ITransport*>& order,
                                                                    const TransferMetadata& metadata,
                                                                    AttemptLog& log,
                                                                    const CancellationToken& cancel,
                                                                    const AttemptObserver& observer = {}) const;

    // Convenience overloads that rank first
    Result<void, FailoverError> sendWithFailover(const NetworkProfile& profile,
                                                 const std::vector<uint8_t>& data,
                                                 const TransferMetadata& metadata,
                                                 AttemptLog& log,
                                                 const CancellationToken& cancel,
                                                 const AttemptObserver& observer = {}) const;

    Result<std::vector<uint8_t>, FailoverError> receiveWithFailover(const NetworkProfile& profile,
                                                                    const TransferMetadata& metadata,
                                                                    AttemptLog& log,
                                                                    const CancellationToken& cancel,
                                                                    const AttemptObserver& observer = {}) const;

    void closeAll();

    const TransportManagerOptions& options() const { return options_; }

private:
    using AttemptFn = std::function<Result<std::vector<uint8_t>>(ITransport& transport,
                                                                 const CancellationToken& cancel)>;

    Result<std::vector<uint8_t>, FailoverError> runFailover(const char* operation,
                                                            const std::vector<ITransport*>& order,
                                                            const AttemptFn& attempt,
                                                            AttemptLog& log,
                                                            const CancellationToken& cancel,
                                                            const AttemptObserver& observer) const;

    std::string nameOf(const ITransport* transport) const;

    TransportRegistry& registry_;
    ThreadPool& pool_;
    TransportManagerOptions options_;
    MetricsCollector* metrics_;
};

} // namespace CodeDrop
