#include "ThreadPool.h"
#include "Logger.h"

#include <algorithm>

namespace CodeDrop {

    ThreadPool::ThreadPool(std::size_t threadCount)
        : workerCount_(threadCount != 0 ? threadCount
                                        : std::max<std::size_t>(1, std::thread::hardware_concurrency())) {
        workers_.reserve(workerCount_);
        for (std::size_t i = 0; i < workerCount_; ++i) {
            workers_.emplace_back([this]() { workerLoop(); });
        }
    }

    ThreadPool::~ThreadPool() {
        shutdown();
    }

    void ThreadPool::submit(std::function<void()> job) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!accepting_) {
            // Dropping the job destroys its packaged_task: the future reports broken_promise
            return;
        }
        jobs_.push_back(std::move(job));
        lock.unlock();
        wake_.notify_one();
    }

    void ThreadPool::shutdown() {
        std::size_t pending = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!accepting_) {
                return;
            }
            accepting_ = false;
            pending = jobs_.size();
        }
        wake_.notify_all();

        if (pending > 0 || busy_.load() > 0) {
            Logger::instance().log(LogLevel::DEBUG,
                "Thread pool draining " + std::to_string(pending) + " queued and " +
                std::to_string(busy_.load()) + " running tasks", "ThreadPool");
        }

        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();
    }

    ThreadPool::Load ThreadPool::load() const {
        Load l;
        l.workers = workerCount_;
        l.busy = busy_.load();
        std::lock_guard<std::mutex> lock(mutex_);
        l.queued = jobs_.size();
        return l;
    }

    void ThreadPool::workerLoop() {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            wake_.wait(lock, [this]() { return !accepting_ || !jobs_.empty(); });
            if (jobs_.empty()) {
                return;
            }

            std::function<void()> job = std::move(jobs_.front());
            jobs_.pop_front();
            busy_++;
            lock.unlock();

            job();

            lock.lock();
            busy_--;
        }
    }

} // namespace CodeDrop
