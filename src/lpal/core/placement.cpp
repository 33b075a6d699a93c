#include "lpal/core/placement.hpp"
#include "lpal/core/log.hpp"
#include <algorithm>

namespace lpal::placement {

namespace {

int32_t clamp_axis(int32_t target, int32_t origin, uint16_t area_size, uint16_t size)
{
    int32_t min_v = origin;
    int32_t max_v = origin + static_cast<int32_t>(area_size) - static_cast<int32_t>(size);
    if (max_v < min_v)
        max_v = min_v;
    return std::clamp(target, min_v, max_v);
}

} // namespace

std::optional<size_t> monitor_index_at_point(std::span<Monitor const> monitors, int16_t x, int16_t y)
{
    for (size_t i = 0; i < monitors.size(); ++i)
    {
        auto const& monitor = monitors[i];
        if (x >= monitor.x && x < monitor.x + monitor.width && y >= monitor.y && y < monitor.y + monitor.height)
        {
            return i;
        }
    }
    return std::nullopt;
}

Geometry place_centered(Geometry area, uint16_t width, uint16_t height)
{
    int32_t target_x = static_cast<int32_t>(area.x) + (static_cast<int32_t>(area.width) - static_cast<int32_t>(width)) / 2;
    int32_t target_y =
        static_cast<int32_t>(area.y) + (static_cast<int32_t>(area.height) - static_cast<int32_t>(height)) / 2;

    Geometry result;
    result.x = static_cast<int16_t>(clamp_axis(target_x, area.x, area.width, width));
    result.y = static_cast<int16_t>(clamp_axis(target_y, area.y, area.height, height));
    result.width = width;
    result.height = height;
    return result;
}

Geometry place_at_point(Geometry area, Point point, uint16_t width, uint16_t height)
{
    Geometry result;
    result.x = static_cast<int16_t>(clamp_axis(point.x, area.x, area.width, width));
    result.y = static_cast<int16_t>(clamp_axis(point.y, area.y, area.height, height));
    result.width = width;
    result.height = height;
    return result;
}

Geometry place_widget(std::span<Monitor const> monitors, std::optional<Point> pointer, uint16_t width, uint16_t height)
{
    if (monitors.empty())
        return { 0, 0, width, height };

    if (!pointer)
        return place_centered(monitors.front().geometry(), width, height);

    auto index = monitor_index_at_point(monitors, pointer->x, pointer->y);
    auto const& monitor = monitors[index.value_or(0)];
    LOG_TRACE("place_widget: pointer ({}, {}) on monitor {}", pointer->x, pointer->y, monitor.name);
    return place_at_point(monitor.geometry(), *pointer, width, height);
}

} // namespace lpal::placement
