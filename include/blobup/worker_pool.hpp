#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace blobup {

/// Fixed-size pool of threads draining a FIFO of tasks.
/// Used by the request server to serve client connections.
class WorkerPool {
public:
    explicit WorkerPool(size_t num_threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue a task. Returns false once shutdown has begun.
    bool execute(std::function<void()> task);

    /// Stop accepting tasks and join all workers.
    /// @param drain  Run tasks already queued before exiting.
    void shutdown(bool drain = true);

    size_t size() const { return workers_.size(); }

    /// Tasks currently running on a worker.
    size_t active() const;

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> tasks_;
    size_t active_ = 0;
    bool stopping_ = false;
};

}  // namespace blobup
