#include "config.hpp"
#include "lpal/core/log.hpp"
#include <cstdlib>
#include <limits>
#include <optional>
#include <string_view>
#include <toml++/toml.hpp>

namespace lpal {

namespace {

template<typename T>
void read_uint(toml::table const& tbl, char const* key, T& out)
{
    if (auto v = tbl[key].value<int64_t>())
    {
        if (*v < 0)
        {
            LOG_WARN("Config: {} must not be negative (got {}), keeping {}", key, *v, out);
            return;
        }
        if (static_cast<uint64_t>(*v) > std::numeric_limits<T>::max())
        {
            LOG_WARN("Config: {} is out of range (got {}, max {}), keeping {}", key, *v, std::numeric_limits<T>::max(), out);
            return;
        }
        out = static_cast<T>(*v);
    }
}

std::optional<uint16_t> read_dimension(toml::table const& tbl, std::string_view widget, char const* key)
{
    auto v = tbl[key].value<int64_t>();
    if (!v)
        return std::nullopt;
    if (*v <= 0 || *v > std::numeric_limits<uint16_t>::max())
    {
        LOG_WARN(
            "Config: widgets.{}.{} must be between 1 and {} (got {}), ignoring",
            widget,
            key,
            std::numeric_limits<uint16_t>::max(),
            *v
        );
        return std::nullopt;
    }
    return static_cast<uint16_t>(*v);
}

void read_bool(toml::table const& tbl, char const* key, bool& out)
{
    if (auto v = tbl[key].value<bool>())
        out = *v;
}

Config from_table(toml::table const& tbl)
{
    Config cfg = default_config();

    if (auto log = tbl["log"].as_table())
    {
        if (auto v = (*log)["level"].value<std::string>())
            cfg.log.level = *v;
        if (auto v = (*log)["file"].value<std::string>())
            cfg.log.file = *v;
    }

    if (auto overlay = tbl["overlay"].as_table())
    {
        if (auto v = (*overlay)["strategy"].value<std::string>())
        {
            if (*v == "basic")
                cfg.overlay.strategy = OverlayStrategy::Basic;
            else if (*v == "overlay")
                cfg.overlay.strategy = OverlayStrategy::Overlay;
            else
                LOG_WARN("Config: unknown overlay strategy '{}', using 'overlay'", *v);
        }
    }

    if (auto capture = tbl["capture"].as_table())
    {
        read_uint(*capture, "max_depth", cfg.capture.max_depth);
        read_uint(*capture, "max_fan_out", cfg.capture.max_fan_out);
        read_uint(*capture, "poll_attempts", cfg.capture.poll_attempts);
        read_uint(*capture, "poll_interval_ms", cfg.capture.poll_interval_ms);
    }

    if (auto paste = tbl["paste"].as_table())
    {
        read_uint(*paste, "delay_ms", cfg.paste.delay_ms);
        read_uint(*paste, "failure_ceiling", cfg.paste.failure_ceiling);
    }

    if (auto monitor = tbl["clipboard_monitor"].as_table())
    {
        read_bool(*monitor, "enabled", cfg.clipboard_monitor.enabled);
        read_uint(*monitor, "interval_ms", cfg.clipboard_monitor.interval_ms);
    }

    if (auto palette = tbl["palette"].as_table())
    {
        read_bool(*palette, "take_keyboard", cfg.palette.take_keyboard);
        read_uint(*palette, "debounce_ms", cfg.palette.debounce_ms);
    }

    if (auto general = tbl["general"].as_table())
    {
        read_uint(*general, "workers", cfg.workers);
        if (cfg.workers == 0)
            cfg.workers = 1;
    }

    if (auto widgets = tbl["widgets"].as_table())
    {
        for (auto const& [name, node] : *widgets)
        {
            auto const* widget = node.as_table();
            if (!widget)
                continue;

            WidgetOverride entry;
            if (auto v = (*widget)["title"].value<std::string>())
                entry.title = *v;
            entry.width = read_dimension(*widget, name.str(), "width");
            entry.height = read_dimension(*widget, name.str(), "height");
            if (auto v = (*widget)["resizable"].value<bool>())
                entry.resizable = *v;
            if (auto v = (*widget)["decorations"].value<bool>())
                entry.decorations = *v;
            cfg.widgets[std::string(name.str())] = entry;
        }
    }

    if (auto keybinds = tbl["keybinds"].as_array())
    {
        cfg.keybinds.clear();
        for (auto const& item : *keybinds)
        {
            if (auto kb = item.as_table())
            {
                KeybindConfig keybind;
                if (auto v = (*kb)["mod"].value<std::string>())
                    keybind.mod = *v;
                if (auto v = (*kb)["key"].value<std::string>())
                    keybind.key = *v;
                if (auto v = (*kb)["action"].value<std::string>())
                    keybind.action = *v;
                if (auto v = (*kb)["widget"].value<std::string>())
                    keybind.widget = *v;
                cfg.keybinds.push_back(keybind);
            }
        }
    }

    return cfg;
}

}

Config default_config()
{
    Config cfg;
    cfg.keybinds = {
        { "ctrl+shift", "space", "palette", "" },
    };
    return cfg;
}

std::optional<Config> load_config(std::string const& path)
{
    try
    {
        auto tbl = toml::parse_file(path);
        return from_table(tbl);
    }
    catch (toml::parse_error const& err)
    {
        LOG_ERROR("Config parse error in {}: {}", path, err.description());
        return std::nullopt;
    }
    catch (std::exception const& e)
    {
        LOG_ERROR("Config error: {}", e.what());
        return std::nullopt;
    }
}

std::optional<Config> parse_config(std::string const& text)
{
    try
    {
        auto tbl = toml::parse(text);
        return from_table(tbl);
    }
    catch (toml::parse_error const& err)
    {
        LOG_ERROR("Config parse error: {}", err.description());
        return std::nullopt;
    }
}

std::string resolve_config_path(char const* argv_path)
{
    if (argv_path && *argv_path)
        return argv_path;
    if (char const* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return std::string(xdg) + "/lpal/config.toml";
    if (char const* home = std::getenv("HOME"); home && *home)
        return std::string(home) + "/.config/lpal/config.toml";
    return "config.toml";
}

} // namespace lpal
