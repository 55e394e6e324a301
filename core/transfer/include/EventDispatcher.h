#pragma once

#include "SessionObserver.h"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace CodeDrop {

    struct SessionEvent {
        enum class Kind {
            StateChanged,
            Status,
            Progress
        };

        Kind kind{Kind::Status};
        std::shared_ptr<SessionObserver> observer;
        std::string transferId;
        SessionState from{SessionState::Idle};
        SessionState to{SessionState::Idle};
        std::string text;        // status phase or progress file name
        uint64_t bytes{0};
        uint64_t total{0};

        static SessionEvent stateChanged(std::shared_ptr<SessionObserver> observer, std::string transferId,
                                         SessionState from, SessionState to);
        static SessionEvent status(std::shared_ptr<SessionObserver> observer, std::string transferId,
                                   std::string phase);
        static SessionEvent progress(std::shared_ptr<SessionObserver> observer, std::string transferId,
                                     uint64_t bytes, uint64_t total, std::string fileName);
    };

    /**
     * @brief Delivers session events to observers on a dedicated thread
     *
     * publish() never blocks. When the queue is full the oldest progress event
     * is evicted first, then the oldest status event; if only state changes
     * are queued the new event is dropped.
     */
    class EventDispatcher {
    public:
        struct Stats {
            uint64_t published{0};
            uint64_t delivered{0};
            uint64_t dropped{0};
            uint64_t failed{0};
        };

        explicit EventDispatcher(size_t capacity);
        ~EventDispatcher();

        EventDispatcher(const EventDispatcher&) = delete;
        EventDispatcher& operator=(const EventDispatcher&) = delete;

        /**
         * @return false if an event had to be dropped to honour the capacity
         */
        bool publish(SessionEvent event);

        // Block until every queued event has been delivered
        void flush();

        // Deliver what is queued, then stop the thread
        void stop();

        Stats stats() const;
        size_t capacity() const { return capacity_; }

    private:
        void run();
        bool evictOne(SessionEvent::Kind kind);
        void deliver(const SessionEvent& event);

        const size_t capacity_;
        std::deque<SessionEvent> queue_;
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::condition_variable idleCv_;
        bool stopping_{false};
        bool busy_{false};
        bool running_{true};

        std::atomic<uint64_t> published_{0};
        std::atomic<uint64_t> delivered_{0};
        std::atomic<uint64_t> dropped_{0};
        std::atomic<uint64_t> failed_{0};

        std::thread worker_;
    };

}
