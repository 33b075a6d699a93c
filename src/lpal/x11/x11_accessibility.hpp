#pragma once

#include "lpal/capture/platform.hpp"
#include "lpal/core/connection.hpp"

namespace lpal {

class Ewmh;
class X11Clipboard;

/**
 * @brief Accessibility tree over the X window hierarchy.
 *
 * The focused application is the active top-level window, the focused
 * element is the input-focus window, and an element's selected text is the
 * PRIMARY selection when that element owns it.
 */
class X11Accessibility : public AccessibilityTree
{
public:
    X11Accessibility(Connection& conn, Ewmh& ewmh, X11Clipboard& clipboard);

    std::optional<AppId> focused_application() override;
    std::optional<ElementId> focused_element(AppId app) override;
    std::vector<ElementId> children(ElementId element) override;
    std::optional<std::string> selected_text(ElementId element) override;

private:
    xcb_window_t input_focus() const;

    Connection& conn_;
    Ewmh& ewmh_;
    X11Clipboard& clipboard_;
};

} // namespace lpal
