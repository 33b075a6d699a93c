#include "lpal/core/task_pool.hpp"
#include "lpal/core/log.hpp"
#include <algorithm>

namespace lpal {

TaskPool::TaskPool(size_t workers)
{
    workers = std::max<size_t>(1, workers);
    workers_.reserve(workers);
    for (size_t i = 0; i < workers; ++i)
    {
        workers_.emplace_back([this]() { worker_loop(); });
    }
}

TaskPool::~TaskPool()
{
    shutdown();
}

bool TaskPool::submit(std::function<void()> task)
{
    {
        std::lock_guard lock(mutex_);
        if (stopping_)
            return false;
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void TaskPool::shutdown()
{
    {
        std::lock_guard lock(mutex_);
        if (stopping_ && workers_.empty())
            return;
        stopping_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_)
    {
        if (worker.joinable())
            worker.join();
    }
    workers_.clear();
}

void TaskPool::worker_loop()
{
    for (;;)
    {
        std::function<void()> task;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty())
                return;
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        try
        {
            task();
        }
        catch (std::exception const& e)
        {
            LOG_ERROR("Background task failed: {}", e.what());
        }
    }
}

} // namespace lpal
