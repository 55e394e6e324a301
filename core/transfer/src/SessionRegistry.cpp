#include "SessionRegistry.h"

namespace CodeDrop {

    SessionRegistry::Guard::Guard(Guard&& other) noexcept
        : registry_(other.registry_), key_(std::move(other.key_)) {
        other.registry_ = nullptr;
    }

    SessionRegistry::Guard& SessionRegistry::Guard::operator=(Guard&& other) noexcept {
        if (this != &other) {
            release();
            registry_ = other.registry_;
            key_ = std::move(other.key_);
            other.registry_ = nullptr;
        }
        return *this;
    }

    void SessionRegistry::Guard::release() {
        if (registry_) {
            registry_->releaseKey(key_);
            registry_ = nullptr;
        }
    }

    Result<SessionRegistry::Guard> SessionRegistry::acquire(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_.insert(key).second) {
            return Error(ErrorCode::TransferInProgress,
                         "A session for transfer " + key + " is already active", "SessionRegistry");
        }
        return Guard(this, key);
    }

    bool SessionRegistry::isActive(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_.count(key) > 0;
    }

    size_t SessionRegistry::activeCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_.size();
    }

    void SessionRegistry::releaseKey(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        active_.erase(key);
    }

}
