#pragma once

#include "lpal/config/config.hpp"
#include "lpal/core/connection.hpp"
#include <compare>
#include <map>
#include <optional>
#include <string>

namespace lpal {

struct KeyBinding
{
    uint16_t modifier;
    xcb_keysym_t keysym;

    auto operator<=>(KeyBinding const&) const = default;
};

enum class ActionType
{
    Palette,    // capture the selection, then show the palette
    ShowWidget,
    HideWidget,
    PasteBack   // paste the last capture into the previously active application
};

struct Action
{
    ActionType type;
    std::string widget;
};

std::optional<ActionType> parse_action(std::string const& name);

class KeybindManager
{
public:
    KeybindManager(Connection& conn, Config const& config);

    /// Grab every binding on window, with and without NumLock / CapsLock.
    void grab_keys(xcb_window_t window);
    void ungrab_keys(xcb_window_t window);

    std::optional<Action> resolve(uint16_t state, xcb_keysym_t keysym) const;
    std::optional<Action> resolve(xcb_key_press_event_t const& ev) const;

    size_t size() const { return bindings_.size(); }

    static uint16_t parse_modifier(std::string const& mod);
    static xcb_keysym_t parse_keysym(std::string const& key);

private:
    Connection& conn_;
    std::map<KeyBinding, Action> bindings_;
};

} // namespace lpal
