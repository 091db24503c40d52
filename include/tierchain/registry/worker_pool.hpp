#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace tierchain::registry {

    /// Fixed set of mining threads fed from a bounded queue. submit() blocks while the queue is full
    class WorkerPool {
      public:
        explicit WorkerPool(size_t workers, size_t queue_capacity = 64);
        ~WorkerPool();

        WorkerPool(const WorkerPool &) = delete;
        WorkerPool &operator=(const WorkerPool &) = delete;

        /// Queues `fn` and returns its future. After stop() the task runs on the caller's thread
        template <typename F> auto submit(F &&fn) -> std::future<std::invoke_result_t<F>> {
            using R = std::invoke_result_t<F>;
            auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
            auto future = task->get_future();

            {
                std::unique_lock<std::mutex> lock(mutex_);
                not_full_.wait(lock, [this] { return !running_.load() || queue_.size() < capacity_; });
                if (running_.load()) {
                    queue_.emplace_back([task] { (*task)(); });
                    not_empty_.notify_one();
                    return future;
                }
            }

            (*task)();
            return future;
        }

        /// Drains queued tasks and joins the threads
        void stop();

        inline size_t workerCount() const { return workers_.size(); }
        size_t pending() const;

      private:
        void workerLoop();

        std::vector<std::thread> workers_;
        std::deque<std::function<void()>> queue_;
        size_t capacity_;
        std::atomic<bool> running_{true};
        mutable std::mutex mutex_;
        std::condition_variable not_empty_;
        std::condition_variable not_full_;
    };

} // namespace tierchain::registry
