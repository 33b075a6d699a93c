#pragma once

#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>

namespace lpal {

/**
 * @brief Runs work on the single UI thread that owns window-server state.
 *
 * The UI thread binds itself with bind_to_current_thread() and then either
 * calls run() or integrates wakeup_fd() into its own poll loop and calls
 * drain() when the descriptor becomes readable.
 *
 * run_on_ui_thread() returns only after the work has completed. Called on
 * the UI thread it runs the work directly; from any other thread it queues
 * the work and blocks on a one-shot completion signal. An exception thrown
 * by the work is rethrown in the caller.
 *
 * Work executed by run_on_ui_thread() must not block on another thread that
 * is itself waiting in run_on_ui_thread(): the UI thread is serial, so such
 * a wait never completes. In particular, never take a lock on the UI thread
 * that a worker may hold while it waits here.
 */
class UiDispatcher
{
public:
    UiDispatcher();
    ~UiDispatcher();

    UiDispatcher(UiDispatcher const&) = delete;
    UiDispatcher& operator=(UiDispatcher const&) = delete;

    void bind_to_current_thread();
    bool on_ui_thread() const;

    void run_on_ui_thread(std::function<void()> work);

    /// run_on_ui_thread() returning the work's result through a shared slot.
    template<typename F>
    auto run_sync(F&& work) -> std::invoke_result_t<F>
    {
        using R = std::invoke_result_t<F>;
        if constexpr (std::is_void_v<R>)
        {
            run_on_ui_thread(std::forward<F>(work));
        }
        else
        {
            std::optional<R> slot;
            run_on_ui_thread([&slot, &work]() { slot.emplace(work()); });
            return std::move(*slot);
        }
    }

    /// Queue work without waiting for it. Dropped if the dispatcher stops first.
    void post(std::function<void()> work);

    int wakeup_fd() const { return wakeup_fd_; }

    /// Execute everything queued so far. UI thread only.
    void drain();

    /// Block the calling (UI) thread, draining work until stop().
    void run();

    /// Stop accepting work and fail everything still queued.
    void stop();

    bool stopped() const { return stopped_.load(std::memory_order_acquire); }

private:
    struct Item
    {
        std::function<void()> work;
        std::function<void()> reject; // empty for posted work
    };

    void enqueue(Item item);

    int wakeup_fd_ = -1;
    std::atomic<std::thread::id> ui_thread_{};
    std::atomic<bool> stopped_{ false };
    mutable std::mutex mutex_;
    std::deque<Item> queue_;
};

} // namespace lpal
