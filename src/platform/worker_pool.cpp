#include "worker_pool.hpp"
#include <core/log.hpp>
#include <algorithm>
#include <exception>

namespace platform {

WorkerPool::WorkerPool(int threads) {
    int n = std::max(1, threads);
    threads_.reserve(n);
    for (int i = 0; i < n; ++i) {
        threads_.emplace_back(&WorkerPool::worker_loop, this);
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(Job job) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stopping_) return false;
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
    return true;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

void WorkerPool::worker_loop() {
    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
            if (jobs_.empty()) return;  // stopping and drained
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        try {
            job();
        } catch (const std::exception& e) {
            log_error(std::string("worker job failed: ") + e.what());
        }
    }
}

} // namespace platform
