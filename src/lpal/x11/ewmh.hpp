#pragma once

#include "lpal/core/connection.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <xcb/xcb_ewmh.h>

namespace lpal {

/// _NET_WM_DESKTOP value for windows shown on every desktop.
constexpr uint32_t ALL_DESKTOPS = 0xFFFFFFFF;

/**
 * @brief Client-side EWMH access.
 *
 * Window properties can be written directly while a window is withdrawn
 * (never mapped or unmapped). Once mapped, the window manager owns
 * _NET_WM_STATE and _NET_WM_DESKTOP, so changes go through the request_*
 * client messages and take effect asynchronously.
 */
class Ewmh
{
public:
    explicit Ewmh(Connection& conn);
    ~Ewmh();

    Ewmh(Ewmh const&) = delete;
    Ewmh& operator=(Ewmh const&) = delete;

    /// Whether an EWMH-compliant window manager is running.
    bool wm_present() const;

    xcb_window_t active_window() const;
    void request_active_window(xcb_window_t window, xcb_window_t current);

    // Window type
    xcb_atom_t window_type(xcb_window_t window) const;
    void set_window_type(xcb_window_t window, xcb_atom_t type);

    // _NET_WM_STATE
    std::vector<xcb_atom_t> window_states(xcb_window_t window) const;
    bool has_window_state(xcb_window_t window, xcb_atom_t state) const;
    void set_window_state(xcb_window_t window, xcb_atom_t state, bool enabled);
    void request_window_state(xcb_window_t window, xcb_atom_t first, xcb_atom_t second, bool enabled);

    // _NET_WM_DESKTOP
    std::optional<uint32_t> window_desktop(xcb_window_t window) const;
    void set_window_desktop(xcb_window_t window, uint32_t desktop);
    void request_window_desktop(xcb_window_t window, uint32_t desktop);
    uint32_t current_desktop() const;

    void set_user_time(xcb_window_t window, uint32_t time);
    void set_wm_name(xcb_window_t window, std::string const& name);
    void set_wm_pid(xcb_window_t window, uint32_t pid);

    xcb_ewmh_connection_t* get() { return &ewmh_; }
    xcb_ewmh_connection_t* get() const { return &ewmh_; }

private:
    Connection& conn_;
    mutable xcb_ewmh_connection_t ewmh_; // mutable: XCB EWMH API isn't const-correct
};

} // namespace lpal
