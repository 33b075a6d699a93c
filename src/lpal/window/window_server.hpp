#pragma once

#include "lpal/core/types.hpp"
#include <optional>
#include <vector>

namespace lpal {

/**
 * @brief Native window-server operations the overlay core relies on.
 *
 * Reference counting follows the create rule: create_window() returns a
 * window holding one reference owned by the caller; retain() and release()
 * add and drop references; the window is destroyed when the count reaches
 * zero. retain() and release() are safe from any thread. Every other
 * operation mutates or inspects window-server state and must be called on
 * the UI thread.
 *
 * Setters return false when the window server rejected the request. A true
 * return does not mean the state is observable yet; callers verify with the
 * matching getter.
 */
class WindowServer
{
public:
    virtual ~WindowServer() = default;

    virtual NativeWindow create_window(WindowSpec const& spec) = 0;
    virtual void retain(NativeWindow window) = 0;
    virtual void release(NativeWindow window) = 0;
    virtual bool is_alive(NativeWindow window) const = 0;

    virtual StackingLevel stacking_level(NativeWindow window) const = 0;
    virtual bool set_stacking_level(NativeWindow window, StackingLevel level) = 0;

    virtual SpaceFlags space_flags(NativeWindow window) const = 0;
    virtual bool set_space_flags(NativeWindow window, SpaceFlags flags) = 0;

    virtual bool is_non_activating(NativeWindow window) const = 0;
    virtual bool set_non_activating(NativeWindow window, bool non_activating) = 0;

    /// Bring to front and show without activating the owning process.
    virtual bool order_front_regardless(NativeWindow window) = 0;
    /// Activate the owning process and give the window keyboard focus.
    virtual bool activate(NativeWindow window) = 0;
    /// OS-level hide; the window stays alive.
    virtual bool hide(NativeWindow window) = 0;
    virtual bool is_visible(NativeWindow window) const = 0;

    virtual bool move_resize(NativeWindow window, Geometry geometry) = 0;

    virtual std::vector<Monitor> monitors() const = 0;
    virtual std::optional<Point> pointer_position() const = 0;
};

} // namespace lpal
