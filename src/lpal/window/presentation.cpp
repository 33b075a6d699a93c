#include "lpal/window/presentation.hpp"
#include "lpal/core/error.hpp"
#include "lpal/core/log.hpp"
#include "lpal/core/placement.hpp"
#include "lpal/core/ui_dispatcher.hpp"
#include "lpal/window/handle_registry.hpp"
#include "lpal/window/overlay.hpp"
#include "lpal/window/widgets.hpp"
#include "lpal/window/window_server.hpp"

namespace lpal {

std::string_view to_string(WidgetState state)
{
    switch (state)
    {
        case WidgetState::Uncreated:
            return "uncreated";
        case WidgetState::Hidden:
            return "hidden";
        case WidgetState::Visible:
            return "visible";
    }
    return "unknown";
}

PresentationController::PresentationController(
    WindowServer& server,
    UiDispatcher& dispatcher,
    WindowHandleRegistry& registry,
    OverlayConfigurator& configurator,
    Options options
)
    : server_(server)
    , dispatcher_(dispatcher)
    , registry_(registry)
    , configurator_(configurator)
    , options_(std::move(options))
{
}

WidgetState PresentationController::state(std::string const& name) const
{
    std::lock_guard lock(state_mutex_);
    auto it = states_.find(name);
    return it == states_.end() ? WidgetState::Uncreated : it->second;
}

void PresentationController::set_state(std::string const& name, WidgetState state)
{
    std::lock_guard lock(state_mutex_);
    auto& slot = states_[name];
    if (slot != state)
        LOG_DEBUG("Widget '{}': {} -> {}", name, to_string(slot), to_string(state));
    slot = state;
}

Geometry PresentationController::placement_for(
    std::string const& name,
    WidgetGeometry const& geometry,
    bool has_selection
) const
{
    std::optional<Point> pointer;
    if (name == widgets::PALETTE && has_selection)
        pointer = server_.pointer_position();
    auto monitors = server_.monitors();
    return placement::place_widget(monitors, pointer, geometry.width, geometry.height);
}

void PresentationController::show_widget(std::string const& name, bool has_selection)
{
    std::lock_guard transition(transition_mutex_);

    auto const geometry = widgets::geometry_for(name, options_.widget_overrides);
    auto const config = widgets::overlay_config_for(name, options_.strategy, options_.palette_takes_keyboard);

    auto handle = registry_.get(name);
    if (!handle)
    {
        NativeWindow window = dispatcher_.run_sync(
            [&]()
            {
                WindowSpec spec;
                spec.name = name;
                spec.title = geometry.title;
                spec.geometry = placement_for(name, geometry, has_selection);
                spec.resizable = geometry.resizable;
                spec.decorations = geometry.decorations;
                return server_.create_window(spec);
            }
        );
        if (window == NULL_WINDOW)
        {
            LOG_ERROR("Widget '{}': window creation failed", name);
            throw Error(ErrorKind::HandleInvalid, "window creation returned null for '" + name + "'");
        }

        // The registry holds its own reference; drop the one from creation.
        try
        {
            handle = registry_.register_window(name, window);
        }
        catch (...)
        {
            server_.release(window);
            throw;
        }
        server_.release(window);

        if (!dispatcher_.run_sync([&]() { return server_.hide(window); }))
            LOG_WARN("Widget '{}': initial hide of {:#x} was rejected", name, window);
        set_state(name, WidgetState::Hidden);

        auto report = configurator_.configure(*handle, config);
        if (!report.all_verified())
            LOG_WARN("Widget '{}': initial configuration not fully verified", name);
        LOG_INFO("Widget '{}': created window {:#x}", name, window);
    }
    else if (name == widgets::PALETTE)
    {
        NativeWindow window = handle->id();
        bool moved = dispatcher_.run_sync(
            [&]()
            {
                if (!server_.is_alive(window))
                    return false;
                return server_.move_resize(window, placement_for(name, geometry, has_selection));
            }
        );
        if (!moved)
            LOG_DEBUG("Widget '{}': could not reposition {:#x}", name, window);
    }

    try
    {
        configurator_.present(*handle, config);
    }
    catch (Error const& e)
    {
        if (e.kind() == ErrorKind::HandleInvalid)
        {
            LOG_ERROR("Widget '{}': {}", name, e.what());
            registry_.remove(name);
            set_state(name, WidgetState::Uncreated);
        }
        throw;
    }
    set_state(name, WidgetState::Visible);

    if (name != widgets::PALETTE && state(widgets::PALETTE) == WidgetState::Visible)
        hide_locked(widgets::PALETTE);
}

void PresentationController::hide_widget(std::string const& name)
{
    std::lock_guard transition(transition_mutex_);
    hide_locked(name);
}

void PresentationController::hide_locked(std::string const& name)
{
    if (state(name) != WidgetState::Visible)
        return;

    auto handle = registry_.get(name);
    if (!handle)
    {
        set_state(name, WidgetState::Uncreated);
        return;
    }

    NativeWindow window = handle->id();
    bool hidden = dispatcher_.run_sync(
        [&]()
        {
            if (!server_.is_alive(window))
                return false;
            return server_.hide(window);
        }
    );
    if (!hidden)
        LOG_WARN("Widget '{}': hide of {:#x} was rejected", name, window);
    set_state(name, WidgetState::Hidden);
}

void PresentationController::on_focus_lost(NativeWindow window)
{
    auto name = registry_.name_of(window);
    if (!name || !widgets::hides_on_focus_loss(*name))
        return;
    LOG_DEBUG("Widget '{}': focus lost", *name);
    hide_widget(*name);
}

void PresentationController::on_close_requested(NativeWindow window)
{
    auto name = registry_.name_of(window);
    if (!name)
        return;
    LOG_DEBUG("Widget '{}': close request converted to hide", *name);
    hide_widget(*name);
}

void PresentationController::on_destroyed(NativeWindow window)
{
    std::lock_guard transition(transition_mutex_);
    auto name = registry_.name_of(window);
    if (!name)
        return;
    LOG_WARN("Widget '{}': window {:#x} destroyed externally", *name, window);
    registry_.remove(*name);
    set_state(*name, WidgetState::Uncreated);
}

} // namespace lpal
