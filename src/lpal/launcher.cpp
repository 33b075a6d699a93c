#include "lpal/launcher.hpp"
#include "lpal/core/log.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <poll.h>

namespace lpal {

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void stop_handler(int /*sig*/)
{
    g_stop_requested = 1;
}

void setup_signal_handlers()
{
    struct sigaction sa = {};
    sa.sa_handler = stop_handler;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

OverlayStrategy choose_strategy(Config const& config, Ewmh const& ewmh)
{
    if (config.overlay.strategy == OverlayStrategy::Basic)
        return OverlayStrategy::Basic;
    if (!ewmh.wm_present())
    {
        LOG_WARN("No EWMH window manager, falling back to basic windows without selection capture");
        return OverlayStrategy::Basic;
    }
    return OverlayStrategy::Overlay;
}

PresentationController::Options presentation_options(Config const& config, OverlayStrategy strategy)
{
    PresentationController::Options options;
    options.strategy = strategy;
    options.palette_takes_keyboard = config.palette.take_keyboard;
    options.widget_overrides = config.widgets;
    return options;
}

Commands::Options command_options(Config const& config, X11WindowServer const& server)
{
    Commands::Options options;
    options.debounce = std::chrono::milliseconds(config.palette.debounce_ms);
    options.owns_window = [&server](AppId app) { return server.owns(app); };
    options.permission_notice = []()
    {
        LOG_ERROR(
            "Selection capture needs the XTEST and XFIXES extensions. Enable them in the X server "
            "configuration (Section \"Extensions\") and restart lpal."
        );
    };
    return options;
}

CaptureOptions capture_options(Config const& config, OverlayStrategy strategy)
{
    CaptureOptions options;
    options.enabled = strategy == OverlayStrategy::Overlay;
    options.max_depth = config.capture.max_depth;
    options.max_fan_out = config.capture.max_fan_out;
    options.poll_attempts = config.capture.poll_attempts;
    options.poll_interval = std::chrono::milliseconds(config.capture.poll_interval_ms);
    return options;
}

}

Launcher::Launcher(Config config)
    : config_(std::move(config))
    , conn_()
    , ewmh_(conn_)
    , strategy_(choose_strategy(config_, ewmh_))
    , state_(config_.paste.failure_ceiling)
    , server_(conn_, ewmh_, dispatcher_)
    , clipboard_()
    , tree_(conn_, ewmh_, clipboard_)
    , automation_(conn_, ewmh_)
    , registry_(server_)
    , configurator_(server_, dispatcher_)
    , presentation_(server_, dispatcher_, registry_, configurator_, presentation_options(config_, strategy_))
    , capture_(tree_, clipboard_, automation_, dispatcher_, state_.ghost, capture_options(config_, strategy_))
    , auto_paste_(
          automation_,
          clipboard_,
          dispatcher_,
          state_.ghost,
          state_.paste_failures,
          std::chrono::milliseconds(config_.paste.delay_ms)
      )
    , monitor_(
          clipboard_,
          state_.ghost,
          [](std::string const& text) { LOG_INFO("Clipboard: new entry ({} bytes)", text.size()); },
          std::chrono::milliseconds(config_.clipboard_monitor.interval_ms),
          config_.clipboard_monitor.enabled
      )
    , keybinds_(conn_, config_)
    , pool_(config_.workers)
    , commands_(
          dispatcher_,
          pool_,
          state_,
          presentation_,
          capture_,
          auto_paste_,
          automation_,
          command_options(config_, server_)
      )
{
    setup_signal_handlers();
    dispatcher_.bind_to_current_thread();
    keybinds_.grab_keys(conn_.root());
    monitor_.start();

    LOG_INFO(
        "Launcher ready: strategy={} keybinds={} xtest={} xfixes={}",
        strategy_ == OverlayStrategy::Overlay ? "overlay" : "basic",
        keybinds_.size(),
        conn_.has_xtest(),
        conn_.has_xfixes()
    );
}

Launcher::~Launcher()
{
    // Workers blocked in run_on_ui_thread() are released by stop() with an error.
    dispatcher_.stop();
    pool_.shutdown();
    monitor_.stop();
    keybinds_.ungrab_keys(conn_.root());
}

void Launcher::stop()
{
    running_ = false;
}

void Launcher::run()
{
    running_ = true;

    pollfd fds[2] = {};
    fds[0].fd = xcb_get_file_descriptor(conn_.get());
    fds[0].events = POLLIN;
    fds[1].fd = dispatcher_.wakeup_fd();
    fds[1].events = POLLIN;

    while (running_ && !g_stop_requested)
    {
        int poll_result = poll(fds, 2, 250);
        if (poll_result > 0)
        {
            while (auto event = xcb_poll_for_event(conn_.get()))
            {
                std::unique_ptr<xcb_generic_event_t, decltype(&free)> eventPtr(event, free);
                handle_event(*eventPtr);
            }
        }

        dispatcher_.drain();

        if (xcb_connection_has_error(conn_.get()))
        {
            LOG_ERROR("X connection lost");
            break;
        }
    }

    running_ = false;
    LOG_INFO("Event loop stopped");
}

// ─────────────────────────────────────────────────────────────────────────────
// X events (UI thread)
// ─────────────────────────────────────────────────────────────────────────────

void Launcher::handle_event(xcb_generic_event_t const& event)
{
    uint8_t type = event.response_type & ~0x80;

    switch (type)
    {
        case 0:
        {
            auto const& err = reinterpret_cast<xcb_generic_error_t const&>(event);
            LOG_DEBUG("X error: code={} major={} minor={}", err.error_code, err.major_code, err.minor_code);
            break;
        }
        case XCB_KEY_PRESS:
            handle_key_press(reinterpret_cast<xcb_key_press_event_t const&>(event));
            break;
        case XCB_FOCUS_OUT:
            handle_focus_out(reinterpret_cast<xcb_focus_out_event_t const&>(event));
            break;
        case XCB_CLIENT_MESSAGE:
            handle_client_message(reinterpret_cast<xcb_client_message_event_t const&>(event));
            break;
        case XCB_DESTROY_NOTIFY:
            handle_destroy_notify(reinterpret_cast<xcb_destroy_notify_event_t const&>(event));
            break;
        default:
            break;
    }
}

void Launcher::handle_key_press(xcb_key_press_event_t const& ev)
{
    if (auto action = keybinds_.resolve(ev))
        dispatch_action(*action);
}

void Launcher::handle_focus_out(xcb_focus_out_event_t const& ev)
{
    // Grab-related and inferior focus changes do not mean the user left the window.
    if (ev.mode == XCB_NOTIFY_MODE_GRAB || ev.mode == XCB_NOTIFY_MODE_UNGRAB)
        return;
    if (ev.detail == XCB_NOTIFY_DETAIL_INFERIOR || ev.detail == XCB_NOTIFY_DETAIL_POINTER)
        return;
    if (!server_.owns(ev.event))
        return;

    xcb_window_t window = ev.event;
    commands_.submit("focus-out", [this, window]() { presentation_.on_focus_lost(window); });
}

void Launcher::handle_client_message(xcb_client_message_event_t const& ev)
{
    if (!server_.owns(ev.window) || !server_.is_delete_request(ev))
        return;

    xcb_window_t window = ev.window;
    commands_.submit("close-request", [this, window]() { presentation_.on_close_requested(window); });
}

void Launcher::handle_destroy_notify(xcb_destroy_notify_event_t const& ev)
{
    if (!server_.owns(ev.window))
        return;

    server_.mark_destroyed(ev.window);
    xcb_window_t window = ev.window;
    commands_.submit("destroy-notify", [this, window]() { presentation_.on_destroyed(window); });
}

void Launcher::dispatch_action(Action const& action)
{
    switch (action.type)
    {
        case ActionType::Palette:
            commands_.trigger_palette();
            break;
        case ActionType::ShowWidget:
            commands_.submit("show " + action.widget, [this, name = action.widget]() { commands_.show_widget(name); });
            break;
        case ActionType::HideWidget:
            commands_.submit("hide " + action.widget, [this, name = action.widget]() { commands_.hide_widget(name); });
            break;
        case ActionType::PasteBack:
            commands_.submit("paste-back", [this]() { commands_.paste_last_capture(); });
            break;
    }
}

} // namespace lpal
