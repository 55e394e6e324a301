#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace CodeDrop {

    /**
     * @brief Fixed set of workers for probes, availability checks and attempts
     *
     * An attempt the TransportManager gave up on keeps its worker until the
     * backend returns, so callers watch load() to notice a starved pool.
     */
    class ThreadPool {
    public:
        struct Load {
            std::size_t workers{0};
            std::size_t busy{0};
            std::size_t queued{0};

            bool saturated() const { return busy >= workers; }
        };

        // 0 picks std::thread::hardware_concurrency()
        explicit ThreadPool(std::size_t threadCount);
        ~ThreadPool();

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * @return Future for the task's result. Once shutdown() has begun the
         *         task is discarded and get() throws std::future_error.
         */
        template<typename F>
        auto enqueue(F&& func) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
            using R = std::invoke_result_t<std::decay_t<F>>;

            auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(func));
            std::future<R> fut = task->get_future();
            submit([task]() { (*task)(); });
            return fut;
        }

        // Runs everything already queued, then joins
        void shutdown();

        Load load() const;
        std::size_t size() const { return workerCount_; }

    private:
        void workerLoop();
        void submit(std::function<void()> job);

        std::vector<std::thread> workers_;
        std::deque<std::function<void()>> jobs_;
        mutable std::mutex mutex_;
        std::condition_variable wake_;
        bool accepting_{true};
        std::size_t workerCount_{0};
        std::atomic<std::size_t> busy_{0};
    };

} // namespace CodeDrop
