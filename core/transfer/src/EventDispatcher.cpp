#include "EventDispatcher.h"
#include "Logger.h"

#include <algorithm>
#include <exception>

namespace CodeDrop {

    SessionEvent SessionEvent::stateChanged(std::shared_ptr<SessionObserver> observer, std::string transferId,
                                            SessionState from, SessionState to) {
        SessionEvent event;
        event.kind = Kind::StateChanged;
        event.observer = std::move(observer);
        event.transferId = std::move(transferId);
        event.from = from;
        event.to = to;
        return event;
    }

    SessionEvent SessionEvent::status(std::shared_ptr<SessionObserver> observer, std::string transferId,
                                      std::string phase) {
        SessionEvent event;
        event.kind = Kind::Status;
        event.observer = std::move(observer);
        event.transferId = std::move(transferId);
        event.text = std::move(phase);
        return event;
    }

    SessionEvent SessionEvent::progress(std::shared_ptr<SessionObserver> observer, std::string transferId,
                                        uint64_t bytes, uint64_t total, std::string fileName) {
        SessionEvent event;
        event.kind = Kind::Progress;
        event.observer = std::move(observer);
        event.transferId = std::move(transferId);
        event.bytes = bytes;
        event.total = total;
        event.text = std::move(fileName);
        return event;
    }

    EventDispatcher::EventDispatcher(size_t capacity)
        : capacity_(std::max<size_t>(capacity, 1)) {
        worker_ = std::thread(&EventDispatcher::run, this);
    }

    EventDispatcher::~EventDispatcher() {
        stop();
    }

    bool EventDispatcher::publish(SessionEvent event) {
        if (!event.observer) {
            return true;
        }

        bool droppedSomething = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                dropped_++;
                return false;
            }

            published_++;
            if (queue_.size() >= capacity_) {
                droppedSomething = true;
                if (!evictOne(SessionEvent::Kind::Progress) &&
                    !evictOne(SessionEvent::Kind::Status)) {
                    // Only state changes queued: keep them, lose the newcomer
                    dropped_++;
                    Logger::instance().log(LogLevel::WARN,
                        "Event queue full, dropping event for transfer " + event.transferId,
                        "EventDispatcher");
                    return false;
                }
            }
            queue_.push_back(std::move(event));
        }
        cv_.notify_one();
        return !droppedSomething;
    }

    bool EventDispatcher::evictOne(SessionEvent::Kind kind) {
        auto it = std::find_if(queue_.begin(), queue_.end(),
                               [kind](const SessionEvent& e) { return e.kind == kind; });
        if (it == queue_.end()) {
            return false;
        }
        queue_.erase(it);
        dropped_++;
        return true;
    }

    void EventDispatcher::flush() {
        std::unique_lock<std::mutex> lock(mutex_);
        idleCv_.wait(lock, [this] { return (queue_.empty() && !busy_) || !running_; });
    }

    void EventDispatcher::stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                return;
            }
            stopping_ = true;
        }
        cv_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
        idleCv_.notify_all();
    }

    EventDispatcher::Stats EventDispatcher::stats() const {
        Stats s;
        s.published = published_.load();
        s.delivered = delivered_.load();
        s.dropped = dropped_.load();
        s.failed = failed_.load();
        return s;
    }

    void EventDispatcher::run() {
        for (;;) {
            SessionEvent event;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
                if (queue_.empty()) {
                    // stopping_ and drained
                    running_ = false;
                    idleCv_.notify_all();
                    return;
                }
                event = std::move(queue_.front());
                queue_.pop_front();
                busy_ = true;
            }

            deliver(event);

            {
                std::lock_guard<std::mutex> lock(mutex_);
                busy_ = false;
            }
            idleCv_.notify_all();
        }
    }

    void EventDispatcher::deliver(const SessionEvent& event) {
        try {
            switch (event.kind) {
                case SessionEvent::Kind::StateChanged:
                    event.observer->onStateChanged(event.transferId, event.from, event.to);
                    break;
                case SessionEvent::Kind::Status:
                    event.observer->onStatus(event.transferId, event.text);
                    break;
                case SessionEvent::Kind::Progress:
                    event.observer->onProgress(event.transferId, event.bytes, event.total, event.text);
                    break;
            }
            delivered_++;
        } catch (const std::exception& e) {
            failed_++;
            Logger::instance().log(LogLevel::WARN,
                std::string("Observer threw for transfer ") + event.transferId + ": " + e.what(),
                "EventDispatcher");
        }
    }

}
