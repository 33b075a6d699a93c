#include "lpal/x11/x11_window_server.hpp"
#include "lpal/core/log.hpp"
#include "lpal/core/ui_dispatcher.hpp"
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <unistd.h>
#include <xcb/randr.h>
#include <xcb/xcb_icccm.h>

namespace lpal {

namespace {

// _MOTIF_WM_HINTS layout: flags, functions, decorations, input_mode, status.
constexpr uint32_t MWM_HINTS_DECORATIONS = 1u << 1;

bool check(xcb_connection_t* conn, xcb_void_cookie_t cookie)
{
    xcb_generic_error_t* err = xcb_request_check(conn, cookie);
    if (!err)
        return true;
    LOG_DEBUG("X request failed: error_code={} major={} minor={}", err->error_code, err->major_code, err->minor_code);
    free(err);
    return false;
}

}

X11WindowServer::X11WindowServer(Connection& conn, Ewmh& ewmh, UiDispatcher& dispatcher)
    : conn_(conn)
    , ewmh_(ewmh)
    , dispatcher_(dispatcher)
{
    wm_present_ = ewmh_.wm_present();
    wm_protocols_ = conn_.intern_atom("WM_PROTOCOLS");
    wm_delete_window_ = conn_.intern_atom("WM_DELETE_WINDOW");
    motif_wm_hints_ = conn_.intern_atom("_MOTIF_WM_HINTS");
    LOG_INFO("X11WindowServer: EWMH window manager {}", wm_present_ ? "detected" : "not detected");
}

X11WindowServer::~X11WindowServer()
{
    std::lock_guard lock(mutex_);
    for (auto const& [window, record] : windows_)
    {
        if (!record.destroyed)
            xcb_destroy_window(conn_.get(), window);
    }
    windows_.clear();
    conn_.flush();
}

// ─────────────────────────────────────────────────────────────────────────────
// Lifetime
// ─────────────────────────────────────────────────────────────────────────────

NativeWindow X11WindowServer::create_window(WindowSpec const& spec)
{
    xcb_connection_t* conn = conn_.get();
    xcb_window_t window = xcb_generate_id(conn);

    uint32_t mask = XCB_CW_BACK_PIXEL | XCB_CW_EVENT_MASK;
    uint32_t values[] = {
        conn_.screen()->black_pixel,
        XCB_EVENT_MASK_FOCUS_CHANGE | XCB_EVENT_MASK_STRUCTURE_NOTIFY | XCB_EVENT_MASK_KEY_PRESS
            | XCB_EVENT_MASK_EXPOSURE,
    };

    auto cookie = xcb_create_window_checked(
        conn,
        XCB_COPY_FROM_PARENT,
        window,
        conn_.root(),
        spec.geometry.x,
        spec.geometry.y,
        std::max<uint16_t>(spec.geometry.width, 1),
        std::max<uint16_t>(spec.geometry.height, 1),
        0,
        XCB_WINDOW_CLASS_INPUT_OUTPUT,
        XCB_COPY_FROM_PARENT,
        mask,
        values
    );
    if (!check(conn, cookie))
    {
        LOG_ERROR("X11WindowServer: failed to create window for '{}'", spec.name);
        return NULL_WINDOW;
    }

    xcb_icccm_set_wm_name(conn, window, XCB_ATOM_STRING, 8, spec.title.size(), spec.title.c_str());
    ewmh_.set_wm_name(window, spec.title);
    ewmh_.set_wm_pid(window, static_cast<uint32_t>(getpid()));

    std::string wm_class = "lpal-" + spec.name;
    wm_class.push_back('\0');
    wm_class += "lpal";
    wm_class.push_back('\0');
    xcb_icccm_set_wm_class(conn, window, wm_class.size(), wm_class.data());

    if (wm_protocols_ != XCB_NONE && wm_delete_window_ != XCB_NONE)
        xcb_icccm_set_wm_protocols(conn, window, wm_protocols_, 1, &wm_delete_window_);

    set_size_hints(window, spec.geometry, spec.resizable);
    set_decorations(window, spec.decorations);
    conn_.flush();

    {
        std::lock_guard lock(mutex_);
        windows_[window] = Record{ 1, false, false };
    }
    LOG_DEBUG("X11WindowServer: created {:#x} for '{}' ({}x{})", window, spec.name, spec.geometry.width, spec.geometry.height);
    return window;
}

void X11WindowServer::retain(NativeWindow window)
{
    std::lock_guard lock(mutex_);
    auto it = windows_.find(window);
    if (it == windows_.end())
    {
        LOG_WARN("X11WindowServer: retain of unknown window {:#x}", window);
        return;
    }
    ++it->second.refs;
}

void X11WindowServer::release(NativeWindow window)
{
    {
        std::lock_guard lock(mutex_);
        auto it = windows_.find(window);
        if (it == windows_.end() || it->second.refs == 0)
        {
            LOG_WARN("X11WindowServer: release of unknown window {:#x}", window);
            return;
        }
        if (--it->second.refs > 0)
            return;
    }

    if (dispatcher_.on_ui_thread())
        destroy(window);
    else
        dispatcher_.post([this, window]() { destroy(window); });
}

void X11WindowServer::destroy(NativeWindow window)
{
    bool already_gone = false;
    {
        std::lock_guard lock(mutex_);
        auto it = windows_.find(window);
        if (it == windows_.end() || it->second.refs > 0)
            return;
        already_gone = it->second.destroyed;
        windows_.erase(it);
    }

    if (!already_gone)
    {
        xcb_destroy_window(conn_.get(), window);
        conn_.flush();
    }
    LOG_DEBUG("X11WindowServer: destroyed {:#x}", window);
}

bool X11WindowServer::is_alive(NativeWindow window) const
{
    std::lock_guard lock(mutex_);
    auto it = windows_.find(window);
    return it != windows_.end() && it->second.refs > 0 && !it->second.destroyed;
}

bool X11WindowServer::owns(xcb_window_t window) const
{
    std::lock_guard lock(mutex_);
    return windows_.contains(window);
}

void X11WindowServer::mark_destroyed(xcb_window_t window)
{
    std::lock_guard lock(mutex_);
    auto it = windows_.find(window);
    if (it != windows_.end())
        it->second.destroyed = true;
}

bool X11WindowServer::is_delete_request(xcb_client_message_event_t const& ev) const
{
    return ev.type == wm_protocols_ && ev.format == 32 && ev.data.data32[0] == wm_delete_window_;
}

bool X11WindowServer::writes_directly(NativeWindow window) const
{
    if (!wm_present_)
        return true;
    std::lock_guard lock(mutex_);
    auto it = windows_.find(window);
    return it == windows_.end() || !it->second.mapped;
}

void X11WindowServer::set_mapped(NativeWindow window, bool mapped)
{
    std::lock_guard lock(mutex_);
    auto it = windows_.find(window);
    if (it != windows_.end())
        it->second.mapped = mapped;
}

// ─────────────────────────────────────────────────────────────────────────────
// Window-server state
// ─────────────────────────────────────────────────────────────────────────────

StackingLevel X11WindowServer::stacking_level(NativeWindow window) const
{
    auto* ewmh = ewmh_.get();
    if (!ewmh_.has_window_state(window, ewmh->_NET_WM_STATE_ABOVE))
        return stacking::NORMAL;
    if (ewmh_.window_type(window) == ewmh->_NET_WM_WINDOW_TYPE_NOTIFICATION)
        return stacking::STATUS;
    return stacking::FLOATING;
}

bool X11WindowServer::set_stacking_level(NativeWindow window, StackingLevel level)
{
    if (!is_alive(window))
        return false;

    auto* ewmh = ewmh_.get();
    xcb_atom_t type = ewmh->_NET_WM_WINDOW_TYPE_NORMAL;
    if (level >= stacking::STATUS)
        type = ewmh->_NET_WM_WINDOW_TYPE_NOTIFICATION;
    else if (level >= stacking::FLOATING)
        type = ewmh->_NET_WM_WINDOW_TYPE_UTILITY;
    bool above = level >= stacking::FLOATING;

    // The window type is client-owned; most window managers only read it at map time.
    ewmh_.set_window_type(window, type);

    if (writes_directly(window))
        ewmh_.set_window_state(window, ewmh->_NET_WM_STATE_ABOVE, above);
    else
        ewmh_.request_window_state(window, ewmh->_NET_WM_STATE_ABOVE, XCB_ATOM_NONE, above);

    conn_.flush();
    return true;
}

SpaceFlags X11WindowServer::space_flags(NativeWindow window) const
{
    auto* ewmh = ewmh_.get();
    auto states = ewmh_.window_states(window);
    auto has = [&](xcb_atom_t atom) { return std::find(states.begin(), states.end(), atom) != states.end(); };

    SpaceFlags flags;
    flags.join_all_spaces = ewmh_.window_desktop(window) == ALL_DESKTOPS && has(ewmh->_NET_WM_STATE_STICKY);
    flags.fullscreen_auxiliary = has(ewmh->_NET_WM_STATE_SKIP_TASKBAR) && has(ewmh->_NET_WM_STATE_SKIP_PAGER);
    return flags;
}

bool X11WindowServer::set_space_flags(NativeWindow window, SpaceFlags flags)
{
    if (!is_alive(window))
        return false;

    auto* ewmh = ewmh_.get();
    uint32_t desktop = flags.join_all_spaces ? ALL_DESKTOPS : ewmh_.current_desktop();

    if (writes_directly(window))
    {
        ewmh_.set_window_desktop(window, desktop);
        ewmh_.set_window_state(window, ewmh->_NET_WM_STATE_STICKY, flags.join_all_spaces);
        ewmh_.set_window_state(window, ewmh->_NET_WM_STATE_SKIP_TASKBAR, flags.fullscreen_auxiliary);
        ewmh_.set_window_state(window, ewmh->_NET_WM_STATE_SKIP_PAGER, flags.fullscreen_auxiliary);
    }
    else
    {
        ewmh_.request_window_desktop(window, desktop);
        ewmh_.request_window_state(window, ewmh->_NET_WM_STATE_STICKY, XCB_ATOM_NONE, flags.join_all_spaces);
        ewmh_.request_window_state(
            window,
            ewmh->_NET_WM_STATE_SKIP_TASKBAR,
            ewmh->_NET_WM_STATE_SKIP_PAGER,
            flags.fullscreen_auxiliary
        );
    }

    conn_.flush();
    return true;
}

bool X11WindowServer::is_non_activating(NativeWindow window) const
{
    xcb_icccm_wm_hints_t hints;
    if (!xcb_icccm_get_wm_hints_reply(conn_.get(), xcb_icccm_get_wm_hints(conn_.get(), window), &hints, nullptr))
        return false;
    return (hints.flags & XCB_ICCCM_WM_HINT_INPUT) && !hints.input;
}

bool X11WindowServer::set_non_activating(NativeWindow window, bool non_activating)
{
    if (!is_alive(window))
        return false;

    xcb_icccm_wm_hints_t hints;
    std::memset(&hints, 0, sizeof(hints));
    xcb_icccm_get_wm_hints_reply(conn_.get(), xcb_icccm_get_wm_hints(conn_.get(), window), &hints, nullptr);
    xcb_icccm_wm_hints_set_input(&hints, non_activating ? 0 : 1);

    auto cookie = xcb_icccm_set_wm_hints_checked(conn_.get(), window, &hints);
    if (!check(conn_.get(), cookie))
        return false;

    // A user time of zero asks the window manager not to focus the window when it maps.
    if (non_activating)
        ewmh_.set_user_time(window, 0);
    else
        xcb_delete_property(conn_.get(), window, ewmh_.get()->_NET_WM_USER_TIME);

    conn_.flush();
    return true;
}

// ─────────────────────────────────────────────────────────────────────────────
// Presentation
// ─────────────────────────────────────────────────────────────────────────────

bool X11WindowServer::order_front_regardless(NativeWindow window)
{
    if (!is_alive(window))
        return false;

    if (!check(conn_.get(), xcb_map_window_checked(conn_.get(), window)))
        return false;

    uint32_t stack_mode = XCB_STACK_MODE_ABOVE;
    xcb_configure_window(conn_.get(), window, XCB_CONFIG_WINDOW_STACK_MODE, &stack_mode);
    set_mapped(window, true);
    conn_.flush();
    return true;
}

bool X11WindowServer::activate(NativeWindow window)
{
    if (!is_alive(window))
        return false;

    if (wm_present_)
        ewmh_.request_active_window(window, ewmh_.active_window());

    // SetInputFocus fails with BadMatch until the window is viewable. With a
    // window manager the map may still be pending; _NET_ACTIVE_WINDOW covers that case.
    auto* attrs = xcb_get_window_attributes_reply(conn_.get(), xcb_get_window_attributes(conn_.get(), window), nullptr);
    bool viewable = attrs && attrs->map_state == XCB_MAP_STATE_VIEWABLE;
    free(attrs);

    bool focused = true;
    if (viewable)
    {
        focused = check(
            conn_.get(),
            xcb_set_input_focus_checked(conn_.get(), XCB_INPUT_FOCUS_POINTER_ROOT, window, XCB_CURRENT_TIME)
        );
    }
    else if (!wm_present_)
    {
        focused = false;
    }

    conn_.flush();
    return focused;
}

bool X11WindowServer::hide(NativeWindow window)
{
    if (!is_alive(window))
        return false;

    xcb_unmap_window(conn_.get(), window);

    // ICCCM 4.1.4: withdraw with a synthetic UnmapNotify to the root.
    xcb_unmap_notify_event_t ev;
    std::memset(&ev, 0, sizeof(ev));
    ev.response_type = XCB_UNMAP_NOTIFY;
    ev.event = conn_.root();
    ev.window = window;
    ev.from_configure = 0;
    xcb_send_event(
        conn_.get(),
        0,
        conn_.root(),
        XCB_EVENT_MASK_SUBSTRUCTURE_REDIRECT | XCB_EVENT_MASK_SUBSTRUCTURE_NOTIFY,
        reinterpret_cast<char const*>(&ev)
    );

    set_mapped(window, false);
    conn_.flush();
    return true;
}

bool X11WindowServer::is_visible(NativeWindow window) const
{
    std::lock_guard lock(mutex_);
    auto it = windows_.find(window);
    return it != windows_.end() && it->second.mapped && !it->second.destroyed;
}

bool X11WindowServer::move_resize(NativeWindow window, Geometry geometry)
{
    if (!is_alive(window))
        return false;

    uint32_t values[] = {
        static_cast<uint32_t>(static_cast<int32_t>(geometry.x)),
        static_cast<uint32_t>(static_cast<int32_t>(geometry.y)),
        std::max<uint32_t>(geometry.width, 1),
        std::max<uint32_t>(geometry.height, 1),
    };
    xcb_configure_window(
        conn_.get(),
        window,
        XCB_CONFIG_WINDOW_X | XCB_CONFIG_WINDOW_Y | XCB_CONFIG_WINDOW_WIDTH | XCB_CONFIG_WINDOW_HEIGHT,
        values
    );
    conn_.flush();
    return true;
}

void X11WindowServer::set_size_hints(xcb_window_t window, Geometry geometry, bool resizable)
{
    xcb_size_hints_t hints;
    std::memset(&hints, 0, sizeof(hints));
    xcb_icccm_size_hints_set_position(&hints, 0, geometry.x, geometry.y);
    xcb_icccm_size_hints_set_size(&hints, 0, geometry.width, geometry.height);
    if (!resizable)
    {
        xcb_icccm_size_hints_set_min_size(&hints, geometry.width, geometry.height);
        xcb_icccm_size_hints_set_max_size(&hints, geometry.width, geometry.height);
    }
    xcb_icccm_set_wm_normal_hints(conn_.get(), window, &hints);
}

void X11WindowServer::set_decorations(xcb_window_t window, bool decorations)
{
    if (motif_wm_hints_ == XCB_NONE)
        return;
    uint32_t hints[5] = { MWM_HINTS_DECORATIONS, 0, decorations ? 1u : 0u, 0, 0 };
    xcb_change_property(conn_.get(), XCB_PROP_MODE_REPLACE, window, motif_wm_hints_, motif_wm_hints_, 32, 5, hints);
}

// ─────────────────────────────────────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────────────────────────────────────

std::vector<Monitor> X11WindowServer::monitors() const
{
    std::vector<Monitor> result;

    if (conn_.has_randr())
    {
        auto res_cookie = xcb_randr_get_screen_resources_current(conn_.get(), conn_.root());
        auto* res_reply = xcb_randr_get_screen_resources_current_reply(conn_.get(), res_cookie, nullptr);
        if (res_reply)
        {
            int num_outputs = xcb_randr_get_screen_resources_current_outputs_length(res_reply);
            xcb_randr_output_t* outputs = xcb_randr_get_screen_resources_current_outputs(res_reply);

            for (int i = 0; i < num_outputs; ++i)
            {
                auto out_cookie = xcb_randr_get_output_info(conn_.get(), outputs[i], res_reply->config_timestamp);
                auto* out_reply = xcb_randr_get_output_info_reply(conn_.get(), out_cookie, nullptr);
                if (!out_reply)
                    continue;
                if (out_reply->connection != XCB_RANDR_CONNECTION_CONNECTED || out_reply->crtc == XCB_NONE)
                {
                    free(out_reply);
                    continue;
                }

                int name_len = xcb_randr_get_output_info_name_length(out_reply);
                uint8_t* name_data = xcb_randr_get_output_info_name(out_reply);

                auto crtc_cookie = xcb_randr_get_crtc_info(conn_.get(), out_reply->crtc, res_reply->config_timestamp);
                auto* crtc_reply = xcb_randr_get_crtc_info_reply(conn_.get(), crtc_cookie, nullptr);
                if (crtc_reply && crtc_reply->width > 0 && crtc_reply->height > 0)
                {
                    Monitor monitor;
                    monitor.name.assign(reinterpret_cast<char*>(name_data), name_len);
                    monitor.x = crtc_reply->x;
                    monitor.y = crtc_reply->y;
                    monitor.width = crtc_reply->width;
                    monitor.height = crtc_reply->height;
                    result.push_back(monitor);
                }

                free(crtc_reply);
                free(out_reply);
            }
            free(res_reply);
        }
    }

    if (result.empty())
    {
        Monitor monitor;
        monitor.name = "default";
        monitor.width = conn_.screen()->width_in_pixels;
        monitor.height = conn_.screen()->height_in_pixels;
        result.push_back(monitor);
    }

    std::ranges::sort(result, [](Monitor const& a, Monitor const& b) { return a.x < b.x; });
    return result;
}

std::optional<Point> X11WindowServer::pointer_position() const
{
    auto* reply = xcb_query_pointer_reply(conn_.get(), xcb_query_pointer(conn_.get(), conn_.root()), nullptr);
    if (!reply)
        return std::nullopt;
    Point point{ reply->root_x, reply->root_y };
    free(reply);
    return point;
}

} // namespace lpal
