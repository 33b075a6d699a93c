#pragma once

#include "lpal/core/types.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lpal {

class AccessibilityTree;
class ClipboardAccess;
class GhostSuppressor;
class InputAutomation;
class UiDispatcher;

struct CaptureOptions
{
    bool enabled = true; // false in basic mode: capture always returns empty
    uint32_t max_depth = 3;
    uint32_t max_fan_out = 1000;
    uint32_t poll_attempts = 20;
    std::chrono::milliseconds poll_interval{ 50 };
};

enum class CaptureSource
{
    None,
    Introspection,
    SimulatedCopy
};

std::string_view to_string(CaptureSource source);

/// Empty text is a valid result: nothing was selected, or polling ran out.
struct CaptureResult
{
    CaptureSource source = CaptureSource::None;
    std::string text;
    bool timed_out = false;

    bool empty() const { return text.empty(); }
};

// Tier 1 walks the focused element's subtree depth first and publishes the
// first non-blank selection. Tier 2 synthesizes a copy and polls the change
// counter. The ghost flag is armed before either tier touches the clipboard.
class SelectionCapture
{
public:
    SelectionCapture(
        AccessibilityTree& tree,
        ClipboardAccess& clipboard,
        InputAutomation& automation,
        UiDispatcher& dispatcher,
        GhostSuppressor& ghost,
        CaptureOptions options = {}
    );

    /// @throws Error(PermissionDenied) before any tier runs.
    CaptureResult capture();

    CaptureOptions const& options() const { return options_; }

private:
    std::optional<std::string> walk_tree();
    std::optional<std::string> find_selection(ElementId element, uint32_t depth);
    CaptureResult simulated_copy();

    AccessibilityTree& tree_;
    ClipboardAccess& clipboard_;
    InputAutomation& automation_;
    UiDispatcher& dispatcher_;
    GhostSuppressor& ghost_;
    CaptureOptions options_;
};

} // namespace lpal
