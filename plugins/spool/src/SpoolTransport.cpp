#include "SpoolTransport.h"
#include "Logger.h"

#include <unistd.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

namespace CodeDrop {

namespace {
    const char* kComponent = "SpoolTransport";
    using Clock = std::chrono::steady_clock;
}

SpoolTransport::SpoolTransport(std::string name, int priority)
    : name_(std::move(name)), priority_(priority) {}

SpoolTransport::~SpoolTransport() {
    auto result = close();
    if (result.isError()) {
        Logger::instance().log(LogLevel::WARN, result.error().toString(), kComponent);
    }
}

VoidResult SpoolTransport::setup(const TransportConfig& config) {
    if (config.spoolDir.empty()) {
        return Error(ErrorCode::InvalidConfig, "No spool directory configured", kComponent);
    }

    std::error_code ec;
    std::filesystem::create_directories(config.spoolDir, ec);
    if (ec) {
        return Error(ErrorCode::IoError,
                     "Cannot create spool directory " + config.spoolDir + ": " + ec.message(), kComponent);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    dir_ = config.spoolDir;
    receiveTimeout_ = config.callTimeout;

    auto it = config.extra.find("spool.poll_interval_ms");
    if (it != config.extra.end()) {
        try {
            pollInterval_ = std::chrono::milliseconds(std::max(1, std::stoi(it->second)));
        } catch (const std::exception&) {
            return Error(ErrorCode::InvalidConfig, "Bad spool.poll_interval_ms: " + it->second, kComponent);
        }
    }
    ready_ = true;

    Logger::instance().log(LogLevel::INFO, "Spool '" + name_ + "' using " + dir_.string(), kComponent);
    return Ok();
}

std::filesystem::path SpoolTransport::directory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dir_;
}

std::filesystem::path SpoolTransport::payloadPath(const std::string& transferId) const {
    return directory() / (transferId + PAYLOAD_SUFFIX);
}

std::filesystem::path SpoolTransport::readyPath(const std::string& transferId) const {
    return directory() / (transferId + READY_SUFFIX);
}

bool SpoolTransport::validTransferId(const std::string& transferId) {
    // Ids are lowercase hex; anything else could escape the directory
    return !transferId.empty() && std::all_of(transferId.begin(), transferId.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

VoidResult SpoolTransport::send(const std::vector<uint8_t>& payload,
                                const TransferMetadata& metadata,
                                const CancellationToken& cancel) {
    if (!ready_) {
        return Error(ErrorCode::BackendUnavailable, "Spool not set up", kComponent);
    }
    if (!validTransferId(metadata.transferId)) {
        return Error(ErrorCode::InvalidArgument, "Malformed transfer id", kComponent);
    }
    if (cancel.isCancelled()) {
        return Error(ErrorCode::Cancelled, "Send cancelled", kComponent);
    }

    const auto finalPath = payloadPath(metadata.transferId);
    auto tempPath = finalPath;
    tempPath += TEMP_SUFFIX;

    {
        std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error(ErrorCode::SendFailure, "Cannot open " + tempPath.string(), kComponent);
        }
        out.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
        out.flush();
        if (!out) {
            std::error_code ignored;
            std::filesystem::remove(tempPath, ignored);
            return Error(ErrorCode::SendFailure, "Short write to " + tempPath.string(), kComponent);
        }
    }

    if (cancel.isCancelled()) {
        std::error_code ignored;
        std::filesystem::remove(tempPath, ignored);
        return Error(ErrorCode::Cancelled, "Send cancelled", kComponent);
    }

    std::error_code ec;
    std::filesystem::rename(tempPath, finalPath, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tempPath, ignored);
        return Error(ErrorCode::SendFailure, "Rename failed: " + ec.message(), kComponent);
    }

    std::ofstream marker(readyPath(metadata.transferId), std::ios::trunc);
    marker << payload.size() << "\n";
    if (!marker) {
        return Error(ErrorCode::SendFailure, "Cannot write readiness marker", kComponent);
    }

    Logger::instance().log(LogLevel::INFO,
        "Spooled " + std::to_string(payload.size()) + " bytes for transfer " + metadata.transferId, kComponent);
    return Ok();
}

Result<std::vector<uint8_t>> SpoolTransport::receive(const TransferMetadata& metadata,
                                                     const CancellationToken& cancel) {
    if (!ready_) {
        return Error(ErrorCode::BackendUnavailable, "Spool not set up", kComponent);
    }
    if (!validTransferId(metadata.transferId)) {
        return Error(ErrorCode::InvalidArgument, "Malformed transfer id", kComponent);
    }

    std::chrono::milliseconds timeout;
    std::chrono::milliseconds interval;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        timeout = receiveTimeout_;
        interval = pollInterval_;
    }

    const auto marker = readyPath(metadata.transferId);
    const auto payloadFile = payloadPath(metadata.transferId);
    const auto deadline = Clock::now() + timeout;

    std::error_code ec;
    while (!std::filesystem::exists(marker, ec)) {
        if (Clock::now() >= deadline) {
            return Error(ErrorCode::ReceiveFailure,
                         "No package for transfer " + metadata.transferId + " within " +
                         std::to_string(timeout.count()) + "ms", kComponent);
        }
        if (cancel.waitFor(interval)) {
            return Error(ErrorCode::Cancelled, "Receive cancelled", kComponent);
        }
    }

    std::ifstream in(payloadFile, std::ios::binary);
    if (!in) {
        return Error(ErrorCode::ReceiveFailure, "Marker present but payload missing", kComponent);
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    in.close();

    std::error_code payloadError;
    std::error_code markerError;
    std::filesystem::remove(payloadFile, payloadError);
    std::filesystem::remove(marker, markerError);
    if (payloadError) {
        Logger::instance().log(LogLevel::WARN,
            "Could not remove " + payloadFile.string() + ": " + payloadError.message(), kComponent);
    }
    if (markerError) {
        Logger::instance().log(LogLevel::WARN,
            "Could not remove " + marker.string() + ": " + markerError.message(), kComponent);
    }

    Logger::instance().log(LogLevel::INFO,
        "Collected " + std::to_string(data.size()) + " bytes for transfer " + metadata.transferId, kComponent);
    return data;
}

bool SpoolTransport::isAvailable(const CancellationToken& cancel) {
    if (!ready_ || cancel.isCancelled()) {
        return false;
    }
    const auto dir = directory();
    std::error_code ec;
    return std::filesystem::is_directory(dir, ec) && ::access(dir.c_str(), W_OK) == 0;
}

VoidResult SpoolTransport::close() {
    ready_ = false;
    return Ok();
}

} // namespace CodeDrop
