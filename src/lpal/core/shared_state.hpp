#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <limits>

namespace lpal {

/**
 * @brief Marks the next clipboard change as one this process made itself.
 *
 * Armed immediately before any programmatic clipboard write or synthesized
 * copy. The clipboard monitor consumes it on its next poll tick whether or
 * not the content changed, so it never survives two ticks.
 */
class GhostSuppressor
{
public:
    void arm() { armed_.store(true, std::memory_order_seq_cst); }

    /// Read-and-clear.
    bool consume() { return armed_.exchange(false, std::memory_order_seq_cst); }

    bool armed() const { return armed_.load(std::memory_order_seq_cst); }

private:
    std::atomic<bool> armed_{ false };
};

/// Consecutive failed focus-restore / synthetic-paste attempts (circuit breaker).
class PasteFailureCounter
{
public:
    static constexpr uint32_t DEFAULT_CEILING = 5;

    explicit PasteFailureCounter(uint32_t ceiling = DEFAULT_CEILING)
        : ceiling_(ceiling)
    {
    }

    bool is_open() const { return failures_.load(std::memory_order_acquire) >= ceiling_; }
    uint32_t failures() const { return failures_.load(std::memory_order_acquire); }
    uint32_t ceiling() const { return ceiling_; }

    void record_failure() { failures_.fetch_add(1, std::memory_order_acq_rel); }
    void record_success() { failures_.store(0, std::memory_order_release); }

private:
    uint32_t ceiling_;
    std::atomic<uint32_t> failures_{ 0 };
};

/// Accepts a palette trigger unless the previous accepted one is younger than the window.
class PaletteDebounce
{
public:
    using Clock = std::chrono::steady_clock;

    bool try_trigger(std::chrono::milliseconds window, Clock::time_point now = Clock::now())
    {
        int64_t ticks = now.time_since_epoch().count();
        int64_t span = std::chrono::duration_cast<Clock::duration>(window).count();
        int64_t last = last_.load(std::memory_order_acquire);
        do
        {
            if (last != NEVER && ticks - last < span)
                return false;
        } while (!last_.compare_exchange_weak(last, ticks, std::memory_order_acq_rel));
        return true;
    }

    /// Forget the last trigger, e.g. when it could not be scheduled.
    void reset() { last_.store(NEVER, std::memory_order_release); }

private:
    static constexpr int64_t NEVER = std::numeric_limits<int64_t>::min();

    std::atomic<int64_t> last_{ NEVER };
};

/**
 * @brief Process-scoped flags shared between the launcher's components.
 *
 * Owned by whoever assembles the components and passed to them by
 * reference, so tests can build isolated instances.
 */
struct SharedState
{
    explicit SharedState(uint32_t paste_failure_ceiling = PasteFailureCounter::DEFAULT_CEILING)
        : paste_failures(paste_failure_ceiling)
    {
    }

    GhostSuppressor ghost;
    PasteFailureCounter paste_failures;
    PaletteDebounce palette_debounce;
};

} // namespace lpal
