#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace lpal {

class ClipboardAccess;
class GhostSuppressor;

enum class TickOutcome
{
    Baseline,      // first successful read, nothing recorded
    Unchanged,
    Recorded,      // user copy passed to the sink
    GhostIgnored,  // changed by this process, not recorded
    GhostConsumed, // ghost flag set but content unchanged
    Failed,
    Disabled
};

std::string_view to_string(TickOutcome outcome);

/**
 * @brief Polls the clipboard and feeds user copies to a history sink.
 *
 * Every tick consumes the ghost flag, so a flag armed before a programmatic
 * write never survives more than one tick.
 */
class ClipboardMonitor
{
public:
    using Sink = std::function<void(std::string const&)>;

    static constexpr uint32_t ERROR_THRESHOLD = 10;
    static constexpr std::chrono::milliseconds MAX_INTERVAL{ 5000 };

    ClipboardMonitor(
        ClipboardAccess& clipboard,
        GhostSuppressor& ghost,
        Sink sink,
        std::chrono::milliseconds interval = std::chrono::milliseconds(500),
        bool enabled = true
    );
    ~ClipboardMonitor();

    ClipboardMonitor(ClipboardMonitor const&) = delete;
    ClipboardMonitor& operator=(ClipboardMonitor const&) = delete;

    TickOutcome tick();

    /// Base interval, doubled per error beyond the threshold, capped at MAX_INTERVAL.
    std::chrono::milliseconds current_interval() const;
    uint32_t consecutive_errors() const { return errors_.load(); }

    void start();
    void stop();

    void set_enabled(bool enabled);
    bool enabled() const { return enabled_.load(); }
    bool toggle();

private:
    void run();

    ClipboardAccess& clipboard_;
    GhostSuppressor& ghost_;
    Sink sink_;
    std::chrono::milliseconds interval_;
    std::atomic<bool> enabled_;
    std::atomic<uint32_t> errors_{ 0 };
    std::optional<std::string> last_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
    std::thread thread_;
};

} // namespace lpal
