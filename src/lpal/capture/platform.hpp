#pragma once

#include "lpal/core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lpal {

/// Queries may throw Error(Backend). UI thread only.
class AccessibilityTree
{
public:
    virtual ~AccessibilityTree() = default;

    virtual std::optional<AppId> focused_application() = 0;
    virtual std::optional<ElementId> focused_element(AppId app) = 0;
    virtual std::vector<ElementId> children(ElementId element) = 0;
    virtual std::optional<std::string> selected_text(ElementId element) = 0;
};

/// System clipboard. Safe from any thread.
class ClipboardAccess
{
public:
    virtual ~ClipboardAccess() = default;

    /// Monotonic counter, incremented on every ownership change.
    virtual uint64_t change_count() const = 0;

    /// @throws Error(Backend) when the clipboard cannot be read.
    virtual std::optional<std::string> read_text() = 0;

    virtual bool write_text(std::string const& text) = 0;
};

/// Synthetic input and focus control. UI thread only, except is_trusted().
class InputAutomation
{
public:
    virtual ~InputAutomation() = default;

    virtual bool is_trusted() const = 0;

    virtual std::optional<AppId> active_application() = 0;
    virtual bool restore_focus(AppId app) = 0;
    virtual bool send_copy() = 0;
    virtual bool send_paste() = 0;
};

} // namespace lpal
