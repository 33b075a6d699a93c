#pragma once

#include "lpal/capture/auto_paste.hpp"
#include "lpal/capture/clipboard_monitor.hpp"
#include "lpal/capture/selection_capture.hpp"
#include "lpal/commands.hpp"
#include "lpal/config/config.hpp"
#include "lpal/core/connection.hpp"
#include "lpal/core/shared_state.hpp"
#include "lpal/core/task_pool.hpp"
#include "lpal/core/ui_dispatcher.hpp"
#include "lpal/keybind/keybind.hpp"
#include "lpal/window/handle_registry.hpp"
#include "lpal/window/overlay.hpp"
#include "lpal/window/presentation.hpp"
#include "lpal/x11/ewmh.hpp"
#include "lpal/x11/x11_accessibility.hpp"
#include "lpal/x11/x11_automation.hpp"
#include "lpal/x11/x11_clipboard.hpp"
#include "lpal/x11/x11_window_server.hpp"
#include <atomic>

namespace lpal {

/**
 * @brief Owns the X connection, the UI thread loop and every component.
 *
 * The thread that constructs the launcher and calls run() is the UI thread.
 * Hotkeys and window events are turned into tasks on the worker pool.
 */
class Launcher
{
public:
    explicit Launcher(Config config);
    ~Launcher();

    Launcher(Launcher const&) = delete;
    Launcher& operator=(Launcher const&) = delete;

    void run();
    void stop();

    Commands& commands() { return commands_; }

    /// Read-and-clear, for an external clipboard monitor.
    bool consume_ghost_flag() { return state_.ghost.consume(); }

    /// Runtime switch for the built-in clipboard monitor.
    bool toggle_clipboard_monitor() { return monitor_.toggle(); }

private:
    void handle_event(xcb_generic_event_t const& event);
    void handle_key_press(xcb_key_press_event_t const& ev);
    void handle_focus_out(xcb_focus_out_event_t const& ev);
    void handle_client_message(xcb_client_message_event_t const& ev);
    void handle_destroy_notify(xcb_destroy_notify_event_t const& ev);

    void dispatch_action(Action const& action);

    Config config_;
    Connection conn_;
    Ewmh ewmh_;
    OverlayStrategy strategy_;
    UiDispatcher dispatcher_;
    SharedState state_;

    X11WindowServer server_;
    X11Clipboard clipboard_;
    X11Accessibility tree_;
    X11Automation automation_;

    WindowHandleRegistry registry_;
    OverlayConfigurator configurator_;
    PresentationController presentation_;
    SelectionCapture capture_;
    AutoPaste auto_paste_;
    ClipboardMonitor monitor_;
    KeybindManager keybinds_;
    TaskPool pool_;
    Commands commands_;

    std::atomic<bool> running_{ false };
};

} // namespace lpal
