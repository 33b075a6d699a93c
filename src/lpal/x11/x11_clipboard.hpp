#pragma once

#include "lpal/capture/platform.hpp"
#include "lpal/core/connection.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace lpal {

/**
 * @brief X selections over a private connection.
 *
 * A hidden window owns CLIPBOARD for writes and receives conversions for
 * reads. A dedicated thread answers SelectionRequest events, collects
 * SelectionNotify replies and counts XFIXES owner changes on CLIPBOARD.
 * INCR transfers are not supported; larger selections come back truncated.
 */
class X11Clipboard : public ClipboardAccess
{
public:
    static constexpr std::chrono::milliseconds READ_TIMEOUT{ 500 };

    X11Clipboard();
    ~X11Clipboard() override;

    X11Clipboard(X11Clipboard const&) = delete;
    X11Clipboard& operator=(X11Clipboard const&) = delete;

    uint64_t change_count() const override { return change_count_.load(); }
    std::optional<std::string> read_text() override;
    bool write_text(std::string const& text) override;

    /// Convert PRIMARY if it is currently owned by owner.
    std::optional<std::string> read_primary_owned_by(xcb_window_t owner);

    bool has_xfixes() const { return conn_.has_xfixes(); }

private:
    // A SelectionNotify answers the read in flight only if it echoes the same
    // selection, target and transfer property.
    struct PendingRead
    {
        bool active = false;
        bool done = false;
        bool ok = false;
        xcb_atom_t selection = XCB_NONE;
        xcb_atom_t target = XCB_NONE;
        xcb_atom_t property = XCB_NONE;
        std::string data;
    };

    std::optional<std::string> read_selection(xcb_atom_t selection);
    xcb_window_t selection_owner(xcb_atom_t selection) const;

    void run();
    void handle_event(xcb_generic_event_t const& event);
    void handle_selection_request(xcb_selection_request_event_t const& ev);
    void handle_selection_notify(xcb_selection_notify_event_t const& ev);
    void handle_selection_clear(xcb_selection_clear_event_t const& ev);

    Connection conn_;
    xcb_window_t window_ = XCB_NONE;

    xcb_atom_t clipboard_ = XCB_NONE;
    xcb_atom_t utf8_string_ = XCB_NONE;
    xcb_atom_t targets_ = XCB_NONE;
    xcb_atom_t text_ = XCB_NONE;
    std::array<xcb_atom_t, 4> transfer_properties_{};
    size_t next_property_ = 0;

    std::atomic<uint64_t> change_count_{ 0 };

    std::mutex read_mutex_; // one conversion in flight at a time
    std::mutex mutex_;
    std::condition_variable cv_;
    PendingRead pending_;
    std::optional<std::string> owned_text_;

    int stop_fd_ = -1;
    std::thread thread_;
};

} // namespace lpal
