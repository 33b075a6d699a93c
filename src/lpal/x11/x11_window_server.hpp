#pragma once

#include "lpal/core/connection.hpp"
#include "lpal/window/window_server.hpp"
#include "lpal/x11/ewmh.hpp"
#include <mutex>
#include <unordered_map>

namespace lpal {

class UiDispatcher;

/**
 * @brief WindowServer over X11 and an EWMH window manager.
 *
 * Stacking levels map to window types: NORMAL is a plain window, FLOATING a
 * UTILITY window kept above, STATUS a NOTIFICATION window kept above (EWMH
 * window managers stack those over full-screen clients). Without a window
 * manager every property is written directly and read back as written.
 */
class X11WindowServer : public WindowServer
{
public:
    X11WindowServer(Connection& conn, Ewmh& ewmh, UiDispatcher& dispatcher);
    ~X11WindowServer() override;

    X11WindowServer(X11WindowServer const&) = delete;
    X11WindowServer& operator=(X11WindowServer const&) = delete;

    NativeWindow create_window(WindowSpec const& spec) override;
    void retain(NativeWindow window) override;
    void release(NativeWindow window) override;
    bool is_alive(NativeWindow window) const override;

    StackingLevel stacking_level(NativeWindow window) const override;
    bool set_stacking_level(NativeWindow window, StackingLevel level) override;

    SpaceFlags space_flags(NativeWindow window) const override;
    bool set_space_flags(NativeWindow window, SpaceFlags flags) override;

    bool is_non_activating(NativeWindow window) const override;
    bool set_non_activating(NativeWindow window, bool non_activating) override;

    bool order_front_regardless(NativeWindow window) override;
    bool activate(NativeWindow window) override;
    bool hide(NativeWindow window) override;
    bool is_visible(NativeWindow window) const override;

    bool move_resize(NativeWindow window, Geometry geometry) override;

    std::vector<Monitor> monitors() const override;
    std::optional<Point> pointer_position() const override;

    // Event plumbing for the launcher's X event loop.
    bool owns(xcb_window_t window) const;
    void mark_destroyed(xcb_window_t window);
    bool is_delete_request(xcb_client_message_event_t const& ev) const;
    bool wm_present() const { return wm_present_; }

private:
    struct Record
    {
        uint32_t refs = 0;
        bool mapped = false;
        bool destroyed = false;
    };

    bool writes_directly(NativeWindow window) const;
    void set_mapped(NativeWindow window, bool mapped);
    void destroy(NativeWindow window);
    void set_size_hints(xcb_window_t window, Geometry geometry, bool resizable);
    void set_decorations(xcb_window_t window, bool decorations);

    Connection& conn_;
    Ewmh& ewmh_;
    UiDispatcher& dispatcher_;
    bool wm_present_ = false;

    xcb_atom_t wm_protocols_ = XCB_NONE;
    xcb_atom_t wm_delete_window_ = XCB_NONE;
    xcb_atom_t motif_wm_hints_ = XCB_NONE;

    mutable std::mutex mutex_;
    std::unordered_map<NativeWindow, Record> windows_;
};

} // namespace lpal
