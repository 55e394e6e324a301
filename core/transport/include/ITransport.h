#pragma once

/**
 * @file ITransport.h
 * @brief Capability contract every transfer backend implements
 *
 * Backends (relay, anonymizing overlay, shared spool, ...) are interchangeable
 * behind this interface so the TransportManager can rank them and fail over.
 */

#include "Result.h"
#include "CancellationToken.h"
#include "TransferMetadata.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace CodeDrop {

/**
 * @brief Settings handed to ITransport::setup()
 *
 * Each backend reads only the fields it understands.
 */
struct TransportConfig {
    std::vector<std::string> relayServers;
    std::string overlayProxy;       // e.g. "127.0.0.1:9050"
    std::string httpsProxy;
    std::string spoolDir;
    std::chrono::milliseconds callTimeout{60000};
    std::map<std::string, std::string> extra;
};

/**
 * @brief Transfer backend interface
 *
 * send() and receive() must be safe to retry on a different backend.
 * Every blocking call takes a CancellationToken and returns promptly once it
 * is cancelled. close() is safe even if setup() never succeeded.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual VoidResult setup(const TransportConfig& config) = 0;

    virtual VoidResult send(const std::vector<uint8_t>& payload,
                            const TransferMetadata& metadata,
                            const CancellationToken& cancel) = 0;

    virtual Result<std::vector<uint8_t>> receive(const TransferMetadata& metadata,
                                                 const CancellationToken& cancel) = 0;

    /**
     * @brief Quick reachability check; must not block past cancellation
     */
    virtual bool isAvailable(const CancellationToken& cancel) = 0;

    /**
     * @brief Lower values are tried first
     */
    virtual int getPriority() const = 0;

    virtual std::string getName() const = 0;

    virtual VoidResult close() = 0;
};

} // namespace CodeDrop
