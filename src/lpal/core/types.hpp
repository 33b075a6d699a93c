#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace lpal {

// ─────────────────────────────────────────────────────────────────────────────
// Native identifiers
// ─────────────────────────────────────────────────────────────────────────────

/// Window server identifier of a top-level window (an XID on X11).
using NativeWindow = uint32_t;
constexpr NativeWindow NULL_WINDOW = 0;

/// Accessibility element (an XID of any window in the focused client's tree).
using ElementId = uint32_t;

/// Application identity used for focus restoration (its top-level window).
using AppId = uint32_t;

// ─────────────────────────────────────────────────────────────────────────────
// Geometry
// ─────────────────────────────────────────────────────────────────────────────

struct Geometry
{
    int16_t x = 0;
    int16_t y = 0;
    uint16_t width = 0;
    uint16_t height = 0;

    bool operator==(Geometry const&) const = default;
};

struct Point
{
    int16_t x = 0;
    int16_t y = 0;
};

struct Monitor
{
    std::string name;
    int16_t x = 0;
    int16_t y = 0;
    uint16_t width = 0;
    uint16_t height = 0;

    Geometry geometry() const { return { x, y, width, height }; }
};

// ─────────────────────────────────────────────────────────────────────────────
// Window-server state
// ─────────────────────────────────────────────────────────────────────────────

/// Ordinal stacking level; higher renders above lower across all clients.
using StackingLevel = int32_t;

namespace stacking {

constexpr StackingLevel NORMAL = 0;
constexpr StackingLevel FLOATING = 3;
/// Renders above full-screen clients.
constexpr StackingLevel STATUS = 25;

} // namespace stacking

struct SpaceFlags
{
    bool join_all_spaces = false;      ///< member of every desktop
    bool fullscreen_auxiliary = false; ///< may accompany a full-screen client

    bool operator==(SpaceFlags const&) const = default;
};

/**
 * @brief Desired window-server state for one widget type.
 *
 * Application is idempotent: applying the same config twice leaves the
 * window in the same state.
 */
struct OverlayConfig
{
    StackingLevel level = stacking::NORMAL;
    SpaceFlags spaces;
    bool non_activating = false;
    bool needs_keyboard = false;

    bool operator==(OverlayConfig const&) const = default;
};

/// Per-widget window geometry supplied by settings.
struct WidgetGeometry
{
    std::string title = "Widget";
    uint16_t width = 600;
    uint16_t height = 400;
    bool resizable = true;
    bool decorations = false;
};

/// Everything needed to build a widget's native window.
struct WindowSpec
{
    std::string name;
    std::string title;
    Geometry geometry;
    bool resizable = true;
    bool decorations = false;
};

} // namespace lpal
