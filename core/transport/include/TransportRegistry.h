#pragma once

/**
 * @file TransportRegistry.h
 * @brief Append-only table of registered transport backends
 */

#include "ITransport.h"

#include <cstdint>
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace CodeDrop {

/**
 * @brief Ranking hints a backend declares at registration
 */
struct TransportHints {
    std::vector<int> nativePorts;              // ports the backend needs outbound
    std::optional<uint64_t> maxPayloadBytes;   // larger payloads demote the backend
};

struct TransportEntry {
    std::string name;
    int priority{0};
    std::unique_ptr<ITransport> transport;
    TransportHints hints;
    size_t index{0};   // registration order, final tie-breaker
};

/**
 * @brief Owns backends in registration order
 *
 * Registration happens at startup; seal() freezes the table before the first
 * session so later reads need no locking.
 */
class TransportRegistry {
public:
    TransportRegistry() = default;
    ~TransportRegistry();

    TransportRegistry(const TransportRegistry&) = delete;
    TransportRegistry& operator=(const TransportRegistry&) = delete;

    /**
     * @return InvalidState once sealed, InvalidArgument for null or duplicate names
     */
    VoidResult registerTransport(std::unique_ptr<ITransport> transport, TransportHints hints = {});

    /**
     * @brief Construct a backend in place
     * @return Non-owning pointer to the registered backend
     */
    template<typename T, typename... Args>
    Result<T*> emplaceTransport(TransportHints hints, Args&&... args) {
        static_assert(std::is_base_of<ITransport, T>::value, "T must implement ITransport");
        auto transport = std::make_unique<T>(std::forward<Args>(args)...);
        T* raw = transport.get();
        auto result = registerTransport(std::move(transport), std::move(hints));
        if (result.isError()) {
            return result.error();
        }
        return raw;
    }

    void seal();
    bool isSealed() const { return sealed_.load(); }

    const std::vector<TransportEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    ITransport* find(const std::string& name) const;
    const TransportEntry* entryFor(const ITransport* transport) const;

    /**
     * @brief Close every backend; errors are logged, never thrown
     */
    void closeAll();

private:
    std::vector<TransportEntry> entries_;
    std::atomic<bool> sealed_{false};
    bool closed_{false};
};

} // namespace CodeDrop
