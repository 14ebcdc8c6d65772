#pragma once

#include <spdlog/spdlog.h>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace sfs {

// Fixed set of worker threads draining an unbounded FIFO queue.
// When every worker is busy, submitted tasks wait in the queue.
class WorkerPool {
public:
    using Task = std::function<void()>;

    WorkerPool(size_t num_workers, std::shared_ptr<spdlog::logger> logger);
    ~WorkerPool();

    // Non-copyable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false once shutdown() has been called
    bool submit(Task task);

    // Run every queued task to completion, then join the workers
    void shutdown();

    size_t size() const { return workers_.size(); }

private:
    void worker_loop(size_t index);

    std::shared_ptr<spdlog::logger> logger_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> queue_;
    bool stopping_ = false;
    std::vector<std::thread> workers_;
};

} // namespace sfs
