#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace CodeDrop {

    enum class AttemptOutcome {
        Success,
        Failed,
        TimedOut,
        Cancelled,
        Skipped     // overall budget ran out before this backend was tried
    };

    const char* toString(AttemptOutcome outcome);

    struct AttemptRecord {
        std::string transportName;
        AttemptOutcome outcome{AttemptOutcome::Failed};
        std::string error;
        std::chrono::milliseconds duration{0};

        std::string toString() const;
    };

    /**
     * @brief Ordered record of backend attempts for one session
     *
     * Thread-safe; readers get copies.
     */
    class AttemptLog {
    public:
        void append(AttemptRecord record);
        std::vector<AttemptRecord> snapshot() const;
        size_t size() const;
        bool empty() const;
        void clear();

    private:
        mutable std::mutex mutex_;
        std::vector<AttemptRecord> records_;
    };

}
