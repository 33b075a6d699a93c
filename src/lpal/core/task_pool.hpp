#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace lpal {

/// Fixed-size worker pool for hotkey flows and window transitions.
class TaskPool
{
public:
    explicit TaskPool(size_t workers);
    ~TaskPool();

    TaskPool(TaskPool const&) = delete;
    TaskPool& operator=(TaskPool const&) = delete;

    /// Returns false once the pool is shutting down.
    bool submit(std::function<void()> task);

    /// Finish queued tasks and join all workers.
    void shutdown();

private:
    void worker_loop();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> tasks_;
    std::vector<std::thread> workers_;
    bool stopping_ = false;
};

} // namespace lpal
