#include "lpal/x11/x11_automation.hpp"
#include "lpal/core/log.hpp"
#include "lpal/x11/ewmh.hpp"
#include <X11/keysym.h>
#include <cstdlib>
#include <xcb/xtest.h>

namespace lpal {

namespace {

xcb_keysym_t const HELD_MODIFIERS[] = {
    XK_Shift_L, XK_Shift_R, XK_Alt_L, XK_Alt_R, XK_Super_L, XK_Super_R, XK_Meta_L, XK_Meta_R,
};

}

X11Automation::X11Automation(Connection& conn, Ewmh& ewmh)
    : conn_(conn)
    , ewmh_(ewmh)
{
}

bool X11Automation::is_trusted() const
{
    return conn_.has_xtest() && conn_.has_xfixes();
}

std::optional<AppId> X11Automation::active_application()
{
    xcb_window_t active = ewmh_.active_window();
    if (active != XCB_NONE)
        return active;

    auto* reply = xcb_get_input_focus_reply(conn_.get(), xcb_get_input_focus(conn_.get()), nullptr);
    if (!reply)
        return std::nullopt;
    xcb_window_t focus = reply->focus;
    free(reply);
    if (focus == XCB_NONE || focus == XCB_INPUT_FOCUS_POINTER_ROOT || focus == conn_.root())
        return std::nullopt;
    return focus;
}

bool X11Automation::restore_focus(AppId app)
{
    if (ewmh_.wm_present())
    {
        ewmh_.request_active_window(app, ewmh_.active_window());
        conn_.flush();
        return true;
    }

    auto cookie = xcb_set_input_focus_checked(conn_.get(), XCB_INPUT_FOCUS_POINTER_ROOT, app, XCB_CURRENT_TIME);
    if (auto* err = xcb_request_check(conn_.get(), cookie))
    {
        LOG_DEBUG("X11Automation: SetInputFocus({:#x}) failed with error {}", app, err->error_code);
        free(err);
        return false;
    }
    return true;
}

bool X11Automation::send_copy()
{
    return send_with_control(XK_c);
}

bool X11Automation::send_paste()
{
    return send_with_control(XK_v);
}

bool X11Automation::fake_key(xcb_keycode_t keycode, bool press)
{
    auto cookie = xcb_test_fake_input_checked(
        conn_.get(),
        press ? XCB_KEY_PRESS : XCB_KEY_RELEASE,
        keycode,
        XCB_CURRENT_TIME,
        XCB_NONE,
        0,
        0,
        0
    );
    if (auto* err = xcb_request_check(conn_.get(), cookie))
    {
        LOG_DEBUG("X11Automation: FakeInput failed with error {}", err->error_code);
        free(err);
        return false;
    }
    return true;
}

void X11Automation::release_held_modifiers()
{
    // The hotkey that triggered us is usually still held; Shift+Ctrl+C is not copy everywhere.
    auto* keymap = xcb_query_keymap_reply(conn_.get(), xcb_query_keymap(conn_.get()), nullptr);
    if (!keymap)
        return;

    for (xcb_keysym_t keysym : HELD_MODIFIERS)
    {
        xcb_keycode_t* codes = xcb_key_symbols_get_keycode(conn_.keysyms(), keysym);
        if (!codes)
            continue;
        for (xcb_keycode_t* kc = codes; *kc != XCB_NO_SYMBOL; ++kc)
        {
            if (keymap->keys[*kc / 8] & (1 << (*kc % 8)))
                fake_key(*kc, false);
        }
        free(codes);
    }
    free(keymap);
}

bool X11Automation::send_with_control(xcb_keysym_t keysym)
{
    if (!conn_.has_xtest())
        return false;

    xcb_keycode_t* control = xcb_key_symbols_get_keycode(conn_.keysyms(), XK_Control_L);
    xcb_keycode_t* key = xcb_key_symbols_get_keycode(conn_.keysyms(), keysym);
    bool ok = control && key && *control != XCB_NO_SYMBOL && *key != XCB_NO_SYMBOL;

    if (ok)
    {
        release_held_modifiers();
        ok = fake_key(*control, true) && fake_key(*key, true);
        // Always release, even after a failed press.
        ok = fake_key(*key, false) && ok;
        ok = fake_key(*control, false) && ok;
        conn_.flush();
    }
    else
    {
        LOG_WARN("X11Automation: no keycode for keysym {:#x}", keysym);
    }

    free(control);
    free(key);
    return ok;
}

} // namespace lpal
