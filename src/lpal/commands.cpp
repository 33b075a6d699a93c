#include "lpal/commands.hpp"
#include "lpal/capture/auto_paste.hpp"
#include "lpal/capture/platform.hpp"
#include "lpal/capture/selection_capture.hpp"
#include "lpal/core/error.hpp"
#include "lpal/core/log.hpp"
#include "lpal/core/shared_state.hpp"
#include "lpal/core/task_pool.hpp"
#include "lpal/core/ui_dispatcher.hpp"
#include "lpal/window/presentation.hpp"
#include "lpal/window/widgets.hpp"

namespace lpal {

Commands::Commands(
    UiDispatcher& dispatcher,
    TaskPool& pool,
    SharedState& state,
    PresentationController& presentation,
    SelectionCapture& capture,
    AutoPaste& auto_paste,
    InputAutomation& automation,
    Options options
)
    : dispatcher_(dispatcher)
    , pool_(pool)
    , state_(state)
    , presentation_(presentation)
    , capture_(capture)
    , auto_paste_(auto_paste)
    , automation_(automation)
    , options_(std::move(options))
{
}

bool Commands::submit(std::string what, std::function<void()> task)
{
    bool accepted = pool_.submit(
        [what, task = std::move(task)]()
        {
            try
            {
                task();
            }
            catch (Error const& e)
            {
                LOG_WARN("{}: {}", what, e.what());
            }
        }
    );
    if (!accepted)
        LOG_DEBUG("{}: dropped, shutting down", what);
    return accepted;
}

bool Commands::handed_off(char const* what, std::function<void()> task)
{
    if (!dispatcher_.on_ui_thread())
        return false;
    LOG_TRACE("{}: called on the UI thread, moving to the pool", what);
    submit(what, std::move(task));
    return true;
}

void Commands::show_widget(std::string const& name)
{
    if (handed_off("show", [this, name]() { presentation_.show_widget(name); }))
        return;
    presentation_.show_widget(name);
}

void Commands::hide_widget(std::string const& name)
{
    if (handed_off("hide", [this, name]() { presentation_.hide_widget(name); }))
        return;
    presentation_.hide_widget(name);
}

std::string Commands::capture_selected_text()
{
    try
    {
        return capture_.capture().text;
    }
    catch (Error const& e)
    {
        if (e.kind() == ErrorKind::PermissionDenied)
            report_permission_denied();
        throw;
    }
}

bool Commands::trigger_palette()
{
    if (!state_.palette_debounce.try_trigger(options_.debounce))
    {
        LOG_DEBUG("Palette trigger debounced");
        return false;
    }

    if (!submit("palette", [this]() { palette_flow(); }))
    {
        state_.palette_debounce.reset();
        return false;
    }
    return true;
}

void Commands::report_permission_denied()
{
    if (permission_reported_.exchange(true))
        return;
    if (options_.permission_notice)
        options_.permission_notice();
}

void Commands::palette_flow()
{
    if (handed_off("palette", [this]() { palette_flow(); }))
        return;

    auto app = dispatcher_.run_sync([this]() { return automation_.active_application(); });
    if (app && !(options_.owns_window && options_.owns_window(*app)))
    {
        std::lock_guard lock(last_mutex_);
        last_app_ = app;
    }

    // The synthetic copy goes to whichever window has focus, so the palette
    // must not exist on screen yet.
    CaptureResult result;
    try
    {
        result = capture_.capture();
    }
    catch (Error const& e)
    {
        if (e.kind() != ErrorKind::PermissionDenied)
            throw;
        report_permission_denied();
    }

    LOG_DEBUG("Palette: capture source={} bytes={}", to_string(result.source), result.text.size());
    {
        std::lock_guard lock(last_mutex_);
        last_capture_ = result.text;
    }

    presentation_.show_widget(widgets::PALETTE, !result.empty());
}

void Commands::paste_back(std::string const& text)
{
    if (handed_off("paste-back", [this, text]() { paste_back(text); }))
        return;

    auto app = last_application();
    if (!app)
    {
        LOG_WARN("Paste-back: no application recorded");
        return;
    }

    if (!auto_paste_.publish(text))
        throw Error(ErrorKind::Backend, "clipboard write failed");
    presentation_.hide_widget(widgets::PALETTE);
    auto_paste_.auto_paste_flow(*app);
}

void Commands::paste_last_capture()
{
    auto text = last_capture();
    if (text.empty())
    {
        LOG_DEBUG("Paste-back: nothing captured");
        return;
    }
    paste_back(text);
}

std::string Commands::last_capture() const
{
    std::lock_guard lock(last_mutex_);
    return last_capture_;
}

std::optional<AppId> Commands::last_application() const
{
    std::lock_guard lock(last_mutex_);
    return last_app_;
}

} // namespace lpal
