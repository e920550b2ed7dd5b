#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace platform {

// Fixed set of threads draining a FIFO of jobs.
class WorkerPool {
public:
    using Job = std::function<void()>;

    explicit WorkerPool(int threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Queue a job. Returns false once shutdown() has started.
    bool submit(Job job);

    // Stop accepting jobs, run everything already queued, join the threads.
    void shutdown();

    int size() const { return static_cast<int>(threads_.size()); }

private:
    void worker_loop();

    std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<Job> jobs_;
    bool stopping_ = false;
    std::vector<std::thread> threads_;
};

} // namespace platform
