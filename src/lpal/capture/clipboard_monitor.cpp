#include "lpal/capture/clipboard_monitor.hpp"
#include "lpal/capture/platform.hpp"
#include "lpal/core/log.hpp"
#include "lpal/core/shared_state.hpp"
#include <algorithm>

namespace lpal {

std::string_view to_string(TickOutcome outcome)
{
    switch (outcome)
    {
        case TickOutcome::Baseline:
            return "baseline";
        case TickOutcome::Unchanged:
            return "unchanged";
        case TickOutcome::Recorded:
            return "recorded";
        case TickOutcome::GhostIgnored:
            return "ghost-ignored";
        case TickOutcome::GhostConsumed:
            return "ghost-consumed";
        case TickOutcome::Failed:
            return "failed";
        case TickOutcome::Disabled:
            return "disabled";
    }
    return "unknown";
}

ClipboardMonitor::ClipboardMonitor(
    ClipboardAccess& clipboard,
    GhostSuppressor& ghost,
    Sink sink,
    std::chrono::milliseconds interval,
    bool enabled
)
    : clipboard_(clipboard)
    , ghost_(ghost)
    , sink_(std::move(sink))
    , interval_(interval)
    , enabled_(enabled)
{
}

ClipboardMonitor::~ClipboardMonitor()
{
    stop();
}

TickOutcome ClipboardMonitor::tick()
{
    bool ghost = ghost_.consume();

    if (!enabled_.load())
        return TickOutcome::Disabled;

    std::optional<std::string> text;
    try
    {
        text = clipboard_.read_text();
    }
    catch (std::exception const& e)
    {
        uint32_t errors = ++errors_;
        if (errors == ERROR_THRESHOLD)
            LOG_WARN("ClipboardMonitor: {} consecutive read errors, backing off", errors);
        LOG_DEBUG("ClipboardMonitor: read failed: {}", e.what());
        return TickOutcome::Failed;
    }
    errors_ = 0;

    if (!text)
        return ghost ? TickOutcome::GhostConsumed : TickOutcome::Unchanged;

    if (!last_)
    {
        last_ = std::move(text);
        return ghost ? TickOutcome::GhostConsumed : TickOutcome::Baseline;
    }

    bool changed = *text != *last_;
    if (ghost)
    {
        if (!changed)
        {
            LOG_TRACE("ClipboardMonitor: ghost flag consumed, content unchanged");
            return TickOutcome::GhostConsumed;
        }
        LOG_DEBUG("ClipboardMonitor: ignoring ghost copy ({} bytes)", text->size());
        last_ = std::move(text);
        return TickOutcome::GhostIgnored;
    }

    if (!changed)
        return TickOutcome::Unchanged;

    last_ = std::move(text);
    if (sink_)
    {
        try
        {
            sink_(*last_);
        }
        catch (std::exception const& e)
        {
            LOG_ERROR("ClipboardMonitor: history sink failed: {}", e.what());
        }
    }
    return TickOutcome::Recorded;
}

std::chrono::milliseconds ClipboardMonitor::current_interval() const
{
    uint32_t errors = errors_.load();
    if (errors < ERROR_THRESHOLD)
        return interval_;

    auto interval = interval_;
    for (uint32_t i = ERROR_THRESHOLD; i <= errors && interval < MAX_INTERVAL; ++i)
        interval *= 2;
    return std::min(interval, MAX_INTERVAL);
}

void ClipboardMonitor::start()
{
    std::lock_guard lock(mutex_);
    if (thread_.joinable())
        return;
    stopping_ = false;
    thread_ = std::thread([this]() { run(); });
    LOG_INFO("ClipboardMonitor: started ({} ms)", interval_.count());
}

void ClipboardMonitor::stop()
{
    {
        std::lock_guard lock(mutex_);
        if (!thread_.joinable())
            return;
        stopping_ = true;
    }
    cv_.notify_all();
    thread_.join();
    LOG_INFO("ClipboardMonitor: stopped");
}

void ClipboardMonitor::set_enabled(bool enabled)
{
    enabled_.store(enabled);
    LOG_INFO("ClipboardMonitor: {}", enabled ? "enabled" : "disabled");
}

bool ClipboardMonitor::toggle()
{
    bool now = !enabled_.load();
    set_enabled(now);
    return now;
}

void ClipboardMonitor::run()
{
    std::unique_lock lock(mutex_);
    while (!stopping_)
    {
        lock.unlock();
        TickOutcome outcome = tick();
        if (outcome == TickOutcome::Recorded || outcome == TickOutcome::GhostIgnored)
            LOG_DEBUG("ClipboardMonitor: {}", to_string(outcome));
        lock.lock();

        cv_.wait_for(lock, current_interval(), [this]() { return stopping_; });
    }
}

} // namespace lpal
