#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lpal {

struct LogConfig
{
    std::string level = "info";
    std::string file = "/tmp/lpal.log"; // empty disables the file sink
};

enum class OverlayStrategy
{
    Overlay, // status level, every desktop, non-activating palette
    Basic    // plain always-on-top window, capture disabled
};

struct OverlaySection
{
    OverlayStrategy strategy = OverlayStrategy::Overlay;
};

struct CaptureConfig
{
    uint32_t max_depth = 3;
    uint32_t max_fan_out = 1000;
    uint32_t poll_attempts = 20;
    uint32_t poll_interval_ms = 50;
};

struct PasteConfig
{
    uint32_t delay_ms = 100;
    uint32_t failure_ceiling = 5;
};

struct ClipboardMonitorConfig
{
    bool enabled = true;
    uint32_t interval_ms = 500;
};

struct PaletteConfig
{
    bool take_keyboard = true;
    uint32_t debounce_ms = 500;
};

/// Per-name geometry overrides from [widgets.<name>].
struct WidgetOverride
{
    std::optional<std::string> title;
    std::optional<uint16_t> width;
    std::optional<uint16_t> height;
    std::optional<bool> resizable;
    std::optional<bool> decorations;
};

struct KeybindConfig
{
    std::string mod;
    std::string key;
    std::string action;
    std::string widget;
};

struct Config
{
    LogConfig log;
    OverlaySection overlay;
    CaptureConfig capture;
    PasteConfig paste;
    ClipboardMonitorConfig clipboard_monitor;
    PaletteConfig palette;
    uint32_t workers = 4;
    std::map<std::string, WidgetOverride> widgets;
    std::vector<KeybindConfig> keybinds;
};

/// Parse a config file. Returns nullopt if the file is missing or malformed.
std::optional<Config> load_config(std::string const& path);

/// Parse TOML text; nullopt on parse error.
std::optional<Config> parse_config(std::string const& text);

Config default_config();

/// argv path if given, else $XDG_CONFIG_HOME/lpal/config.toml, else ~/.config/lpal/config.toml.
std::string resolve_config_path(char const* argv_path);

} // namespace lpal
