#include "lpal/x11/x11_accessibility.hpp"
#include "lpal/core/error.hpp"
#include "lpal/x11/ewmh.hpp"
#include "lpal/x11/x11_clipboard.hpp"
#include <cstdlib>

namespace lpal {

X11Accessibility::X11Accessibility(Connection& conn, Ewmh& ewmh, X11Clipboard& clipboard)
    : conn_(conn)
    , ewmh_(ewmh)
    , clipboard_(clipboard)
{
}

xcb_window_t X11Accessibility::input_focus() const
{
    auto* reply = xcb_get_input_focus_reply(conn_.get(), xcb_get_input_focus(conn_.get()), nullptr);
    if (!reply)
        throw Error(ErrorKind::Backend, "GetInputFocus failed");
    xcb_window_t focus = reply->focus;
    free(reply);
    if (focus == XCB_INPUT_FOCUS_POINTER_ROOT || focus == conn_.root())
        return XCB_NONE;
    return focus;
}

std::optional<AppId> X11Accessibility::focused_application()
{
    xcb_window_t active = ewmh_.active_window();
    if (active == XCB_NONE)
        active = input_focus();
    if (active == XCB_NONE)
        return std::nullopt;
    return active;
}

std::optional<ElementId> X11Accessibility::focused_element(AppId app)
{
    xcb_window_t focus = input_focus();
    return focus == XCB_NONE ? app : focus;
}

std::vector<ElementId> X11Accessibility::children(ElementId element)
{
    auto* reply = xcb_query_tree_reply(conn_.get(), xcb_query_tree(conn_.get(), element), nullptr);
    if (!reply)
        throw Error(ErrorKind::Backend, "QueryTree failed");

    xcb_window_t* windows = xcb_query_tree_children(reply);
    int count = xcb_query_tree_children_length(reply);
    std::vector<ElementId> result(windows, windows + count);
    free(reply);
    return result;
}

std::optional<std::string> X11Accessibility::selected_text(ElementId element)
{
    return clipboard_.read_primary_owned_by(element);
}

} // namespace lpal
