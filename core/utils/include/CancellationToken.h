#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace CodeDrop {

    /**
     * @brief Cooperative cancellation handle
     *
     * Copies share the same state. A child token is cancelled together with
     * its parent, cancelling a child leaves the parent untouched. Blocking
     * code polls isCancelled() or sleeps through waitFor().
     */
    class CancellationToken {
    public:
        CancellationToken();

        void cancel();
        bool isCancelled() const;

        /**
         * @brief Sleep until cancelled or the timeout elapses
         * @return true if the token was cancelled
         */
        bool waitFor(std::chrono::milliseconds timeout) const;

        CancellationToken child() const;

    private:
        struct State {
            std::atomic<bool> cancelled{false};
            std::mutex mutex;
            std::condition_variable cv;
            std::vector<std::weak_ptr<State>> children;
        };

        explicit CancellationToken(std::shared_ptr<State> state);
        static void cancelState(const std::shared_ptr<State>& state);

        std::shared_ptr<State> state_;
    };

} // namespace CodeDrop
