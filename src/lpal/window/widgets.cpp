#include "lpal/window/widgets.hpp"

namespace lpal::widgets {

namespace {

struct BuiltinWidget
{
    char const* name;
    WidgetGeometry geometry;
};

// clang-format off
BuiltinWidget const BUILTIN[] = {
    { "palette",        { "Command Palette", 550, 328, false, false } },
    { "clipboard",      { "Clipboard",       500, 400, true,  false } },
    { "translator",     { "Translator",      700, 550, true,  false } },
    { "currency",       { "Currency",        500, 400, true,  false } },
    { "time_converter", { "Time Converter",  600, 500, true,  false } },
    { "settings",       { "Settings",        800, 600, true,  false } },
};
// clang-format on

}

WidgetGeometry builtin_geometry(std::string const& name)
{
    for (auto const& widget : BUILTIN)
    {
        if (name == widget.name)
            return widget.geometry;
    }
    return WidgetGeometry{};
}

WidgetGeometry geometry_for(std::string const& name, std::map<std::string, WidgetOverride> const& overrides)
{
    WidgetGeometry geometry = builtin_geometry(name);

    auto it = overrides.find(name);
    if (it == overrides.end())
        return geometry;

    auto const& o = it->second;
    if (o.title)
        geometry.title = *o.title;
    if (o.width)
        geometry.width = *o.width;
    if (o.height)
        geometry.height = *o.height;
    if (o.resizable)
        geometry.resizable = *o.resizable;
    if (o.decorations)
        geometry.decorations = *o.decorations;
    return geometry;
}

OverlayConfig overlay_config_for(std::string const& name, OverlayStrategy strategy, bool palette_takes_keyboard)
{
    OverlayConfig config;

    if (strategy == OverlayStrategy::Basic)
    {
        config.level = stacking::FLOATING;
        config.non_activating = false;
        config.needs_keyboard = true;
        return config;
    }

    config.level = stacking::STATUS;
    config.spaces.join_all_spaces = true;
    config.spaces.fullscreen_auxiliary = true;

    if (name == PALETTE)
    {
        config.non_activating = true;
        config.needs_keyboard = palette_takes_keyboard;
    }
    else
    {
        config.non_activating = false;
        config.needs_keyboard = true;
    }
    return config;
}

} // namespace lpal::widgets
