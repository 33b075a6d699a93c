#pragma once

#include "lpal/core/types.hpp"
#include <optional>
#include <span>

namespace lpal::placement {

std::optional<size_t> monitor_index_at_point(std::span<Monitor const> monitors, int16_t x, int16_t y);

/// Center a window of the given size in area, clamped to the area origin.
Geometry place_centered(Geometry area, uint16_t width, uint16_t height);

/// Put the window's top-left corner at the point, clamped so it stays inside area.
Geometry place_at_point(Geometry area, Point point, uint16_t width, uint16_t height);

/**
 * @brief Choose a geometry for a widget window.
 *
 * With a pointer position, the window is placed at the pointer on the monitor
 * containing it (first monitor if none does). Without one, the window is
 * centered on the first monitor.
 */
Geometry place_widget(std::span<Monitor const> monitors, std::optional<Point> pointer, uint16_t width, uint16_t height);

} // namespace lpal::placement
