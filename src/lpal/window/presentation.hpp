#pragma once

#include "lpal/config/config.hpp"
#include "lpal/core/types.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace lpal {

class OverlayConfigurator;
class UiDispatcher;
class WindowHandleRegistry;
class WindowServer;

enum class WidgetState
{
    Uncreated,
    Hidden,
    Visible
};

/**
 * @brief Show/hide transitions for named widget windows.
 *
 * A widget's window is built on its first show and never destroyed by a
 * hide or close request. Transitions serialize on one lock and block on the
 * UI thread while holding it, so UI-thread callers go through Commands.
 */
class PresentationController
{
public:
    struct Options
    {
        OverlayStrategy strategy = OverlayStrategy::Overlay;
        bool palette_takes_keyboard = true;
        std::map<std::string, WidgetOverride> widget_overrides;
    };

    PresentationController(
        WindowServer& server,
        UiDispatcher& dispatcher,
        WindowHandleRegistry& registry,
        OverlayConfigurator& configurator,
        Options options
    );

    // has_selection puts the palette at the pointer. Any other widget hides a
    // visible palette after it has itself been presented.
    void show_widget(std::string const& name, bool has_selection = false);

    void hide_widget(std::string const& name);

    void on_focus_lost(NativeWindow window);
    void on_close_requested(NativeWindow window);
    void on_destroyed(NativeWindow window);

    WidgetState state(std::string const& name) const;

private:
    void hide_locked(std::string const& name);
    void set_state(std::string const& name, WidgetState state);
    Geometry placement_for(std::string const& name, WidgetGeometry const& geometry, bool has_selection) const;

    WindowServer& server_;
    UiDispatcher& dispatcher_;
    WindowHandleRegistry& registry_;
    OverlayConfigurator& configurator_;
    Options options_;

    std::mutex transition_mutex_;
    mutable std::mutex state_mutex_;
    std::map<std::string, WidgetState> states_;
};

std::string_view to_string(WidgetState state);

} // namespace lpal
