#pragma once

#include "lpal/core/types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace lpal {

class UiDispatcher;
class WindowHandle;
class WindowServer;

/// Outcome of writing one window-server property.
enum class ApplyStatus
{
    Verified,          // read-back matches the desired value
    AppliedUnverified, // write accepted, read-back disagrees (transient during desktop changes)
    Failed             // the window server rejected the write
};

std::string_view to_string(ApplyStatus status);

struct PropertyReport
{
    std::string property;
    ApplyStatus status = ApplyStatus::Verified;
    std::string desired;
    std::string observed;
};

struct ConfigureReport
{
    std::vector<PropertyReport> properties;

    bool all_verified() const;
    bool any_failed() const;
    PropertyReport const* find(std::string const& property) const;
};

/**
 * @brief Applies OverlayConfig to a window and verifies each property.
 *
 * Mismatches and rejected writes are reported and logged, never thrown.
 */
class OverlayConfigurator
{
public:
    OverlayConfigurator(WindowServer& server, UiDispatcher& dispatcher);

    ConfigureReport configure(WindowHandle const& handle, OverlayConfig const& config);

    // Activation style, level, spaces, order-front, then activate only when the
    // config takes the keyboard. A failed step does not stop the later ones.
    ConfigureReport present(WindowHandle const& handle, OverlayConfig const& config);

private:
    void require_alive(NativeWindow window) const;

    PropertyReport apply_activation_style(NativeWindow window, bool non_activating);
    PropertyReport apply_level(NativeWindow window, StackingLevel level);
    PropertyReport apply_spaces(NativeWindow window, SpaceFlags flags);

    WindowServer& server_;
    UiDispatcher& dispatcher_;
};

std::string describe(SpaceFlags flags);

} // namespace lpal
