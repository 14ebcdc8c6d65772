#include "worker_pool.hpp"
#include <stdexcept>

namespace sfs {

WorkerPool::WorkerPool(size_t num_workers, std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger))
{
    if (num_workers == 0) {
        throw std::invalid_argument("WorkerPool needs at least one worker");
    }
    workers_.reserve(num_workers);
    for (size_t i = 0; i < num_workers; i++) {
        workers_.emplace_back(&WorkerPool::worker_loop, this, i);
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::worker_loop(size_t index) {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            // Drain the queue before honouring a stop request
            if (queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            logger_->error("Worker {}: task failed: {}", index, e.what());
        }
    }
}

} // namespace sfs
