#include "keybind.hpp"
#include "lpal/core/log.hpp"
#include <X11/Xlib.h>
#include <cstdlib>
#include <sstream>

namespace lpal {

std::optional<ActionType> parse_action(std::string const& name)
{
    if (name == "palette")
        return ActionType::Palette;
    if (name == "show_widget")
        return ActionType::ShowWidget;
    if (name == "hide_widget")
        return ActionType::HideWidget;
    if (name == "paste_back")
        return ActionType::PasteBack;
    return std::nullopt;
}

KeybindManager::KeybindManager(Connection& conn, Config const& config)
    : conn_(conn)
{
    for (auto const& kb : config.keybinds)
    {
        auto type = parse_action(kb.action);
        if (!type)
        {
            LOG_WARN("Keybind {}+{}: unknown action '{}'", kb.mod, kb.key, kb.action);
            continue;
        }
        if ((*type == ActionType::ShowWidget || *type == ActionType::HideWidget) && kb.widget.empty())
        {
            LOG_WARN("Keybind {}+{}: action '{}' needs a widget name", kb.mod, kb.key, kb.action);
            continue;
        }

        uint16_t mod = parse_modifier(kb.mod);
        xcb_keysym_t keysym = parse_keysym(kb.key);

        if (keysym != XCB_NO_SYMBOL)
        {
            KeyBinding binding{ mod, keysym };
            bindings_[binding] = Action{ *type, kb.widget };
        }
        else
        {
            LOG_WARN("Keybind {}+{}: unknown key", kb.mod, kb.key);
        }
    }
}

void KeybindManager::grab_keys(xcb_window_t window)
{
    xcb_ungrab_key(conn_.get(), XCB_GRAB_ANY, window, XCB_MOD_MASK_ANY);

    for (auto const& [binding, action] : bindings_)
    {
        xcb_keycode_t* keycode = xcb_key_symbols_get_keycode(conn_.keysyms(), binding.keysym);
        if (keycode)
        {
            uint16_t const modifiers[] = {
                binding.modifier,
                static_cast<uint16_t>(binding.modifier | XCB_MOD_MASK_2),
                static_cast<uint16_t>(binding.modifier | XCB_MOD_MASK_LOCK),
                static_cast<uint16_t>(binding.modifier | XCB_MOD_MASK_2 | XCB_MOD_MASK_LOCK)
            };

            for (auto mod : modifiers)
            {
                auto cookie = xcb_grab_key_checked(
                    conn_.get(),
                    1,
                    window,
                    mod,
                    *keycode,
                    XCB_GRAB_MODE_ASYNC,
                    XCB_GRAB_MODE_ASYNC
                );
                if (auto* err = xcb_request_check(conn_.get(), cookie))
                {
                    // BadAccess: another client already grabbed this combination.
                    LOG_WARN("Keybind: grab of keysym {:#x} (mod {:#x}) failed: {}", binding.keysym, mod, err->error_code);
                    free(err);
                }
            }
            free(keycode);
        }
    }

    conn_.flush();
}

void KeybindManager::ungrab_keys(xcb_window_t window)
{
    xcb_ungrab_key(conn_.get(), XCB_GRAB_ANY, window, XCB_MOD_MASK_ANY);
    conn_.flush();
}

std::optional<Action> KeybindManager::resolve(uint16_t state, xcb_keysym_t keysym) const
{
    uint16_t cleanMod = state & ~(XCB_MOD_MASK_LOCK | XCB_MOD_MASK_2);

    auto it = bindings_.find({ cleanMod, keysym });
    if (it != bindings_.end())
    {
        return it->second;
    }
    return std::nullopt;
}

std::optional<Action> KeybindManager::resolve(xcb_key_press_event_t const& ev) const
{
    xcb_keysym_t keysym = xcb_key_symbols_get_keysym(conn_.keysyms(), ev.detail, 0);
    return resolve(ev.state, keysym);
}

uint16_t KeybindManager::parse_modifier(std::string const& mod)
{
    uint16_t result = 0;
    std::istringstream stream(mod);
    std::string token;

    while (std::getline(stream, token, '+'))
    {
        if (token == "super")
            result |= XCB_MOD_MASK_4;
        else if (token == "shift")
            result |= XCB_MOD_MASK_SHIFT;
        else if (token == "ctrl" || token == "control")
            result |= XCB_MOD_MASK_CONTROL;
        else if (token == "alt")
            result |= XCB_MOD_MASK_1;
    }

    return result;
}

xcb_keysym_t KeybindManager::parse_keysym(std::string const& key)
{
    KeySym sym = XStringToKeysym(key.c_str());
    if (sym != NoSymbol)
    {
        return static_cast<xcb_keysym_t>(sym);
    }
    return XCB_NO_SYMBOL;
}

} // namespace lpal
