#include "AttemptLog.h"

namespace CodeDrop {

    const char* toString(AttemptOutcome outcome) {
        switch (outcome) {
            case AttemptOutcome::Success: return "success";
            case AttemptOutcome::Failed: return "failed";
            case AttemptOutcome::TimedOut: return "timed out";
            case AttemptOutcome::Cancelled: return "cancelled";
            case AttemptOutcome::Skipped: return "skipped";
        }
        return "unknown";
    }

    std::string AttemptRecord::toString() const {
        std::string text = transportName + ": " + CodeDrop::toString(outcome) +
                           " after " + std::to_string(duration.count()) + "ms";
        if (!error.empty()) {
            text += " (" + error + ")";
        }
        return text;
    }

    void AttemptLog::append(AttemptRecord record) {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(std::move(record));
    }

    std::vector<AttemptRecord> AttemptLog::snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    size_t AttemptLog::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

    bool AttemptLog::empty() const {
        return size() == 0;
    }

    void AttemptLog::clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.clear();
    }

}
