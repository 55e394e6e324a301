#include "TransportRegistry.h"
#include "Logger.h"

namespace CodeDrop {

namespace {
    const char* const kComponent = "TransportRegistry";
}

TransportRegistry::~TransportRegistry() {
    closeAll();
}

VoidResult TransportRegistry::registerTransport(std::unique_ptr<ITransport> transport, TransportHints hints) {
    if (sealed_) {
        return Error(ErrorCode::InvalidState, "Registry is sealed; register transports at startup", kComponent);
    }
    if (!transport) {
        return Error(ErrorCode::InvalidArgument, "Cannot register a null transport", kComponent);
    }

    std::string name = transport->getName();
    if (find(name) != nullptr) {
        return Error(ErrorCode::InvalidArgument, "Transport '" + name + "' is already registered", kComponent);
    }

    TransportEntry entry;
    entry.name = name;
    entry.priority = transport->getPriority();
    entry.transport = std::move(transport);
    entry.hints = std::move(hints);
    entry.index = entries_.size();
    entries_.push_back(std::move(entry));

    Logger::instance().log(LogLevel::INFO,
        "Registered transport '" + name + "' with priority " + std::to_string(entries_.back().priority),
        kComponent);
    return Ok();
}

void TransportRegistry::seal() {
    if (!sealed_.exchange(true)) {
        Logger::instance().log(LogLevel::DEBUG,
            "Registry sealed with " + std::to_string(entries_.size()) + " transports", kComponent);
    }
}

ITransport* TransportRegistry::find(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.name == name) {
            return entry.transport.get();
        }
    }
    return nullptr;
}

const TransportEntry* TransportRegistry::entryFor(const ITransport* transport) const {
    for (const auto& entry : entries_) {
        if (entry.transport.get() == transport) {
            return &entry;
        }
    }
    return nullptr;
}

void TransportRegistry::closeAll() {
    if (closed_) {
        return;
    }
    closed_ = true;

    auto& logger = Logger::instance();
    for (auto& entry : entries_) {
        try {
            auto result = entry.transport->close();
            if (result.isError()) {
                logger.log(LogLevel::ERROR,
                    "Failed to close transport '" + entry.name + "': " + result.error().toString(), kComponent);
            }
        } catch (const std::exception& e) {
            logger.log(LogLevel::ERROR,
                "Transport '" + entry.name + "' threw during close: " + e.what(), kComponent);
        }
    }
}

} // namespace CodeDrop
