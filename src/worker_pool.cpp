#include "blobup/worker_pool.hpp"
#include "blobup/log.hpp"

#include <exception>

namespace blobup {

WorkerPool::WorkerPool(size_t num_threads) {
    if (num_threads == 0) num_threads = 1;
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&WorkerPool::worker_loop, this);
    }
}

WorkerPool::~WorkerPool() {
    shutdown(false);
}

bool WorkerPool::execute(std::function<void()> task) {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) return false;
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void WorkerPool::shutdown(bool drain) {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
        if (!drain) tasks_.clear();
    }
    cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
}

size_t WorkerPool::active() const {
    std::lock_guard lock(mutex_);
    return active_;
}

void WorkerPool::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) return;  // stopping and drained
            task = std::move(tasks_.front());
            tasks_.pop_front();
            ++active_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            log_error("Worker task failed: %s", e.what());
        }

        std::lock_guard lock(mutex_);
        --active_;
    }
}

}  // namespace blobup
