#pragma once

/**
 * @file SpoolTransport.h
 * @brief Store-and-forward backend over a shared directory
 *
 * The sender writes <transferId>.payload through a temporary file and a
 * rename, then drops <transferId>.ready. The receiver polls for the marker
 * and consumes both files.
 */

#include "ITransport.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>

namespace CodeDrop {

class SpoolTransport : public ITransport {
public:
    static constexpr const char* PAYLOAD_SUFFIX = ".payload";
    static constexpr const char* READY_SUFFIX = ".ready";
    static constexpr const char* TEMP_SUFFIX = ".tmp";

    explicit SpoolTransport(std::string name = "local-spool", int priority = 50);
    ~SpoolTransport() override;

    VoidResult setup(const TransportConfig& config) override;

    VoidResult send(const std::vector<uint8_t>& payload,
                    const TransferMetadata& metadata,
                    const CancellationToken& cancel) override;

    Result<std::vector<uint8_t>> receive(const TransferMetadata& metadata,
                                         const CancellationToken& cancel) override;

    bool isAvailable(const CancellationToken& cancel) override;

    int getPriority() const override { return priority_; }
    std::string getName() const override { return name_; }

    VoidResult close() override;

    std::filesystem::path payloadPath(const std::string& transferId) const;
    std::filesystem::path readyPath(const std::string& transferId) const;

private:
    static bool validTransferId(const std::string& transferId);
    std::filesystem::path directory() const;

    const std::string name_;
    const int priority_;

    mutable std::mutex mutex_;
    std::filesystem::path dir_;
    std::chrono::milliseconds receiveTimeout_{60000};
    std::chrono::milliseconds pollInterval_{100};
    std::atomic<bool> ready_{false};
};

} // namespace CodeDrop
