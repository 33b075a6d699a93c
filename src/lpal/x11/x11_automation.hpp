#pragma once

#include "lpal/capture/platform.hpp"
#include "lpal/core/connection.hpp"
#include <xcb/xproto.h>

namespace lpal {

class Ewmh;

/// Synthetic keyboard input through XTEST, focus through EWMH.
class X11Automation : public InputAutomation
{
public:
    X11Automation(Connection& conn, Ewmh& ewmh);

    bool is_trusted() const override;
    std::optional<AppId> active_application() override;
    bool restore_focus(AppId app) override;
    bool send_copy() override;
    bool send_paste() override;

private:
    bool send_with_control(xcb_keysym_t keysym);
    void release_held_modifiers();
    bool fake_key(xcb_keycode_t keycode, bool press);

    Connection& conn_;
    Ewmh& ewmh_;
};

} // namespace lpal
