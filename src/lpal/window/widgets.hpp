#pragma once

#include "lpal/config/config.hpp"
#include "lpal/core/types.hpp"
#include <map>
#include <string>

namespace lpal::widgets {

inline constexpr char const* PALETTE = "palette";

/// Built-in geometry for a widget name; unknown names get the 600x400 default.
WidgetGeometry builtin_geometry(std::string const& name);

/// Built-in geometry with [widgets.<name>] overrides applied.
WidgetGeometry geometry_for(std::string const& name, std::map<std::string, WidgetOverride> const& overrides);

/// Window-server state for a widget name under the given strategy.
OverlayConfig overlay_config_for(std::string const& name, OverlayStrategy strategy, bool palette_takes_keyboard);

/// Focus loss hides every widget except the palette.
inline bool hides_on_focus_loss(std::string const& name) { return name != PALETTE; }

} // namespace lpal::widgets
