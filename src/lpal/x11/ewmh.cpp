#include "ewmh.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace lpal {

Ewmh::Ewmh(Connection& conn)
    : conn_(conn)
{
    xcb_intern_atom_cookie_t* cookies = xcb_ewmh_init_atoms(conn_.get(), &ewmh_);
    if (!xcb_ewmh_init_atoms_replies(&ewmh_, cookies, nullptr))
    {
        throw std::runtime_error("Failed to initialize EWMH atoms");
    }
}

Ewmh::~Ewmh()
{
    xcb_ewmh_connection_wipe(&ewmh_);
}

bool Ewmh::wm_present() const
{
    xcb_window_t check = XCB_NONE;
    if (!xcb_ewmh_get_supporting_wm_check_reply(
            &ewmh_,
            xcb_ewmh_get_supporting_wm_check(&ewmh_, conn_.root()),
            &check,
            nullptr
        ))
        return false;
    if (check == XCB_NONE)
        return false;

    // A stale property left by a dead window manager points at a window that no longer exists.
    xcb_window_t self = XCB_NONE;
    return xcb_ewmh_get_supporting_wm_check_reply(&ewmh_, xcb_ewmh_get_supporting_wm_check(&ewmh_, check), &self, nullptr)
        && self == check;
}

xcb_window_t Ewmh::active_window() const
{
    xcb_window_t active = XCB_NONE;
    if (!xcb_ewmh_get_active_window_reply(&ewmh_, xcb_ewmh_get_active_window(&ewmh_, 0), &active, nullptr))
        return XCB_NONE;
    return active;
}

void Ewmh::request_active_window(xcb_window_t window, xcb_window_t current)
{
    // Source indication 2: request from a pager or similar tool acting for the user.
    xcb_ewmh_request_change_active_window(&ewmh_, 0, window, XCB_EWMH_CLIENT_SOURCE_TYPE_OTHER, XCB_CURRENT_TIME, current);
}

xcb_atom_t Ewmh::window_type(xcb_window_t window) const
{
    xcb_ewmh_get_atoms_reply_t types;
    if (!xcb_ewmh_get_wm_window_type_reply(&ewmh_, xcb_ewmh_get_wm_window_type(&ewmh_, window), &types, nullptr))
        return XCB_ATOM_NONE;

    xcb_atom_t type = (types.atoms_len > 0) ? types.atoms[0] : XCB_ATOM_NONE;
    xcb_ewmh_get_atoms_reply_wipe(&types);
    return type;
}

void Ewmh::set_window_type(xcb_window_t window, xcb_atom_t type)
{
    xcb_ewmh_set_wm_window_type(&ewmh_, window, 1, &type);
}

std::vector<xcb_atom_t> Ewmh::window_states(xcb_window_t window) const
{
    xcb_ewmh_get_atoms_reply_t current;
    if (!xcb_ewmh_get_wm_state_reply(&ewmh_, xcb_ewmh_get_wm_state(&ewmh_, window), &current, nullptr))
        return {};

    std::vector<xcb_atom_t> states(current.atoms, current.atoms + current.atoms_len);
    xcb_ewmh_get_atoms_reply_wipe(&current);
    return states;
}

bool Ewmh::has_window_state(xcb_window_t window, xcb_atom_t state) const
{
    auto states = window_states(window);
    return std::find(states.begin(), states.end(), state) != states.end();
}

void Ewmh::set_window_state(xcb_window_t window, xcb_atom_t state, bool enabled)
{
    std::vector<xcb_atom_t> new_state;
    for (xcb_atom_t atom : window_states(window))
    {
        if (atom != state)
            new_state.push_back(atom);
    }

    if (enabled)
        new_state.push_back(state);

    if (new_state.empty())
        xcb_delete_property(conn_.get(), window, ewmh_._NET_WM_STATE);
    else
        xcb_ewmh_set_wm_state(&ewmh_, window, new_state.size(), new_state.data());
}

void Ewmh::request_window_state(xcb_window_t window, xcb_atom_t first, xcb_atom_t second, bool enabled)
{
    xcb_ewmh_request_change_wm_state(
        &ewmh_,
        0,
        window,
        enabled ? XCB_EWMH_WM_STATE_ADD : XCB_EWMH_WM_STATE_REMOVE,
        first,
        second,
        XCB_EWMH_CLIENT_SOURCE_TYPE_OTHER
    );
}

std::optional<uint32_t> Ewmh::window_desktop(xcb_window_t window) const
{
    uint32_t desktop = 0;
    if (!xcb_ewmh_get_wm_desktop_reply(&ewmh_, xcb_ewmh_get_wm_desktop(&ewmh_, window), &desktop, nullptr))
        return std::nullopt;
    return desktop;
}

void Ewmh::set_window_desktop(xcb_window_t window, uint32_t desktop)
{
    xcb_ewmh_set_wm_desktop(&ewmh_, window, desktop);
}

void Ewmh::request_window_desktop(xcb_window_t window, uint32_t desktop)
{
    xcb_ewmh_request_change_wm_desktop(&ewmh_, 0, window, desktop, XCB_EWMH_CLIENT_SOURCE_TYPE_OTHER);
}

uint32_t Ewmh::current_desktop() const
{
    uint32_t desktop = 0;
    if (!xcb_ewmh_get_current_desktop_reply(&ewmh_, xcb_ewmh_get_current_desktop(&ewmh_, 0), &desktop, nullptr))
        return 0;
    return desktop;
}

void Ewmh::set_user_time(xcb_window_t window, uint32_t time)
{
    xcb_ewmh_set_wm_user_time(&ewmh_, window, time);
}

void Ewmh::set_wm_name(xcb_window_t window, std::string const& name)
{
    xcb_ewmh_set_wm_name(&ewmh_, window, name.length(), name.c_str());
}

void Ewmh::set_wm_pid(xcb_window_t window, uint32_t pid)
{
    xcb_ewmh_set_wm_pid(&ewmh_, window, pid);
}

} // namespace lpal
