#include "lpal/core/ui_dispatcher.hpp"
#include "lpal/core/log.hpp"
#include <cerrno>
#include <cstring>
#include <future>
#include <memory>
#include <poll.h>
#include <stdexcept>
#include <sys/eventfd.h>
#include <unistd.h>

namespace lpal {

UiDispatcher::UiDispatcher()
{
    wakeup_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wakeup_fd_ < 0)
    {
        throw std::runtime_error(std::string("eventfd failed: ") + std::strerror(errno));
    }
}

UiDispatcher::~UiDispatcher()
{
    stop();
    if (wakeup_fd_ >= 0)
        close(wakeup_fd_);
}

void UiDispatcher::bind_to_current_thread()
{
    ui_thread_.store(std::this_thread::get_id(), std::memory_order_release);
    LOG_DEBUG("UI dispatcher bound to current thread");
}

bool UiDispatcher::on_ui_thread() const
{
    return ui_thread_.load(std::memory_order_acquire) == std::this_thread::get_id();
}

void UiDispatcher::run_on_ui_thread(std::function<void()> work)
{
    if (on_ui_thread())
    {
        work();
        return;
    }

    if (ui_thread_.load(std::memory_order_acquire) == std::thread::id{})
    {
        throw std::logic_error("run_on_ui_thread called before a UI thread was bound");
    }

    auto done = std::make_shared<std::promise<void>>();
    auto future = done->get_future();

    Item item;
    item.work = [done, work = std::move(work)]()
    {
        try
        {
            work();
            done->set_value();
        }
        catch (...)
        {
            // Forwarded to the waiting caller, which rethrows it.
            done->set_exception(std::current_exception());
        }
    };
    item.reject = [done]()
    { done->set_exception(std::make_exception_ptr(std::runtime_error("UI thread stopped before running work"))); };

    enqueue(std::move(item));
    future.get();
}

void UiDispatcher::post(std::function<void()> work)
{
    Item item;
    item.work = std::move(work);
    enqueue(std::move(item));
}

void UiDispatcher::enqueue(Item item)
{
    {
        std::lock_guard lock(mutex_);
        if (stopped_.load(std::memory_order_acquire))
        {
            if (item.reject)
                item.reject();
            return;
        }
        queue_.push_back(std::move(item));
    }

    uint64_t value = 1;
    if (write(wakeup_fd_, &value, sizeof(value)) < 0 && errno != EAGAIN)
    {
        LOG_ERROR("UI dispatcher wakeup failed: {}", std::strerror(errno));
    }
}

void UiDispatcher::drain()
{
    uint64_t value = 0;
    while (read(wakeup_fd_, &value, sizeof(value)) > 0)
        ;

    std::deque<Item> batch;
    {
        std::lock_guard lock(mutex_);
        batch.swap(queue_);
    }

    for (auto& item : batch)
    {
        try
        {
            item.work();
        }
        catch (std::exception const& e)
        {
            LOG_ERROR("Posted UI work failed: {}", e.what());
        }
    }
}

void UiDispatcher::run()
{
    bind_to_current_thread();

    pollfd pfd = {};
    pfd.fd = wakeup_fd_;
    pfd.events = POLLIN;

    while (!stopped())
    {
        int result = poll(&pfd, 1, 100);
        if (result < 0 && errno != EINTR)
        {
            LOG_ERROR("UI dispatcher poll failed: {}", std::strerror(errno));
            break;
        }
        drain();
    }
}

void UiDispatcher::stop()
{
    std::deque<Item> rejected;
    {
        std::lock_guard lock(mutex_);
        if (stopped_.exchange(true, std::memory_order_acq_rel))
            return;
        rejected.swap(queue_);
    }

    for (auto& item : rejected)
    {
        if (item.reject)
            item.reject();
    }

    uint64_t value = 1;
    if (write(wakeup_fd_, &value, sizeof(value)) < 0 && errno != EAGAIN)
    {
        LOG_ERROR("UI dispatcher wakeup failed: {}", std::strerror(errno));
    }
}

} // namespace lpal
