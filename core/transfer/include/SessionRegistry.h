#pragma once

#include "Result.h"

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_set>

namespace CodeDrop {

    /**
     * @brief Tracks which transfer ids have an active session in this process
     *
     * A Guard holds the slot until it is destroyed or released.
     */
    class SessionRegistry {
    public:
        class Guard {
        public:
            Guard() = default;
            ~Guard() { release(); }

            Guard(Guard&& other) noexcept;
            Guard& operator=(Guard&& other) noexcept;

            Guard(const Guard&) = delete;
            Guard& operator=(const Guard&) = delete;

            void release();
            bool held() const { return registry_ != nullptr; }
            const std::string& key() const { return key_; }

        private:
            friend class SessionRegistry;
            Guard(SessionRegistry* registry, std::string key)
                : registry_(registry), key_(std::move(key)) {}

            SessionRegistry* registry_{nullptr};
            std::string key_;
        };

        SessionRegistry() = default;
        SessionRegistry(const SessionRegistry&) = delete;
        SessionRegistry& operator=(const SessionRegistry&) = delete;

        /**
         * @brief Claim a key; fails with TransferInProgress if already held
         */
        Result<Guard> acquire(const std::string& key);

        bool isActive(const std::string& key) const;
        size_t activeCount() const;

    private:
        void releaseKey(const std::string& key);

        mutable std::mutex mutex_;
        std::unordered_set<std::string> active_;
    };

}
