#include <tierchain/registry/worker_pool.hpp>

namespace tierchain::registry {

    WorkerPool::WorkerPool(size_t workers, size_t queue_capacity)
        : capacity_(queue_capacity == 0 ? 1 : queue_capacity) {
        if (workers == 0)
            workers = 1;
        workers_.reserve(workers);
        for (size_t i = 0; i < workers; ++i)
            workers_.emplace_back([this] { workerLoop(); });
    }

    WorkerPool::~WorkerPool() { stop(); }

    void WorkerPool::stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_.exchange(false))
                return;
        }
        not_empty_.notify_all();
        not_full_.notify_all();

        for (auto &worker : workers_) {
            if (worker.joinable())
                worker.join();
        }
    }

    size_t WorkerPool::pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    void WorkerPool::workerLoop() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                not_empty_.wait(lock, [this] { return !running_.load() || !queue_.empty(); });
                // Queued work still runs after stop() so no future is left without a value
                if (queue_.empty())
                    return;
                task = std::move(queue_.front());
                queue_.pop_front();
            }
            not_full_.notify_one();
            task();
        }
    }

} // namespace tierchain::registry
