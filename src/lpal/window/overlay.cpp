#include "lpal/window/overlay.hpp"
#include "lpal/core/error.hpp"
#include "lpal/core/log.hpp"
#include "lpal/core/ui_dispatcher.hpp"
#include "lpal/window/window_handle.hpp"
#include "lpal/window/window_server.hpp"
#include <algorithm>

namespace lpal {

namespace {

// Write only when the current value differs, then classify the read-back.
template<typename T, typename Read, typename Write, typename Describe>
PropertyReport apply_property(
    std::string property,
    NativeWindow window,
    T const& desired,
    Read read,
    Write write,
    Describe describe_value
)
{
    PropertyReport report;
    report.property = std::move(property);
    report.desired = describe_value(desired);

    T current = read();
    if (current == desired)
    {
        report.observed = describe_value(current);
        report.status = ApplyStatus::Verified;
        LOG_TRACE("Overlay {:#x}: {} already {}", window, report.property, report.desired);
        return report;
    }

    if (!write())
    {
        report.observed = describe_value(current);
        report.status = ApplyStatus::Failed;
        LOG_WARN(
            "Overlay {:#x}: setting {} rejected (desired={} observed={})",
            window,
            report.property,
            report.desired,
            report.observed
        );
        return report;
    }

    T after = read();
    report.observed = describe_value(after);
    if (after == desired)
    {
        report.status = ApplyStatus::Verified;
        LOG_DEBUG("Overlay {:#x}: {} {} -> {}", window, report.property, describe_value(current), report.observed);
    }
    else
    {
        report.status = ApplyStatus::AppliedUnverified;
        LOG_WARN(
            "Overlay {:#x}: {} mismatch after write (desired={} observed={})",
            window,
            report.property,
            report.desired,
            report.observed
        );
    }
    return report;
}

std::string describe_bool(bool value) { return value ? "true" : "false"; }

std::string describe_level(StackingLevel level) { return std::to_string(level); }

PropertyReport action_report(std::string property, bool ok)
{
    PropertyReport report;
    report.property = std::move(property);
    report.desired = "done";
    report.observed = ok ? "done" : "rejected";
    report.status = ok ? ApplyStatus::Verified : ApplyStatus::Failed;
    return report;
}

}

std::string_view to_string(ApplyStatus status)
{
    switch (status)
    {
        case ApplyStatus::Verified:
            return "verified";
        case ApplyStatus::AppliedUnverified:
            return "applied-unverified";
        case ApplyStatus::Failed:
            return "failed";
    }
    return "unknown";
}

std::string describe(SpaceFlags flags)
{
    std::string out = "{";
    if (flags.join_all_spaces)
        out += "join_all_spaces";
    if (flags.fullscreen_auxiliary)
    {
        if (flags.join_all_spaces)
            out += ",";
        out += "fullscreen_auxiliary";
    }
    out += "}";
    return out;
}

bool ConfigureReport::all_verified() const
{
    return std::all_of(
        properties.begin(),
        properties.end(),
        [](PropertyReport const& p) { return p.status == ApplyStatus::Verified; }
    );
}

bool ConfigureReport::any_failed() const
{
    return std::any_of(
        properties.begin(),
        properties.end(),
        [](PropertyReport const& p) { return p.status == ApplyStatus::Failed; }
    );
}

PropertyReport const* ConfigureReport::find(std::string const& property) const
{
    for (auto const& p : properties)
    {
        if (p.property == property)
            return &p;
    }
    return nullptr;
}

OverlayConfigurator::OverlayConfigurator(WindowServer& server, UiDispatcher& dispatcher)
    : server_(server)
    , dispatcher_(dispatcher)
{
}

void OverlayConfigurator::require_alive(NativeWindow window) const
{
    if (!server_.is_alive(window))
    {
        LOG_ERROR("Overlay: window {:#x} is no longer alive", window);
        throw Error(ErrorKind::HandleInvalid, "window destroyed out-of-band");
    }
}

PropertyReport OverlayConfigurator::apply_activation_style(NativeWindow window, bool non_activating)
{
    return apply_property(
        "non_activating",
        window,
        non_activating,
        [&]() { return server_.is_non_activating(window); },
        [&]() { return server_.set_non_activating(window, non_activating); },
        describe_bool
    );
}

PropertyReport OverlayConfigurator::apply_level(NativeWindow window, StackingLevel level)
{
    return apply_property(
        "stacking_level",
        window,
        level,
        [&]() { return server_.stacking_level(window); },
        [&]() { return server_.set_stacking_level(window, level); },
        describe_level
    );
}

PropertyReport OverlayConfigurator::apply_spaces(NativeWindow window, SpaceFlags flags)
{
    return apply_property(
        "space_flags",
        window,
        flags,
        [&]() { return server_.space_flags(window); },
        [&]() { return server_.set_space_flags(window, flags); },
        [](SpaceFlags f) { return describe(f); }
    );
}

ConfigureReport OverlayConfigurator::configure(WindowHandle const& handle, OverlayConfig const& config)
{
    NativeWindow window = handle.id();
    return dispatcher_.run_sync(
        [&]()
        {
            require_alive(window);

            ConfigureReport report;
            report.properties.push_back(apply_level(window, config.level));
            report.properties.push_back(apply_spaces(window, config.spaces));
            report.properties.push_back(apply_activation_style(window, config.non_activating));

            LOG_DEBUG(
                "Overlay {:#x}: configured level={} spaces={} non_activating={} ({})",
                window,
                config.level,
                describe(config.spaces),
                config.non_activating,
                report.all_verified() ? "verified" : "unverified"
            );
            return report;
        }
    );
}

ConfigureReport OverlayConfigurator::present(WindowHandle const& handle, OverlayConfig const& config)
{
    NativeWindow window = handle.id();
    return dispatcher_.run_sync(
        [&]()
        {
            require_alive(window);

            ConfigureReport report;
            // Style and level must be in place before the first order-front,
            // otherwise the window server may keep the window in the wrong layer.
            report.properties.push_back(apply_activation_style(window, config.non_activating));
            report.properties.push_back(apply_level(window, config.level));
            report.properties.push_back(apply_spaces(window, config.spaces));

            bool fronted = server_.order_front_regardless(window);
            if (!fronted)
                LOG_WARN("Overlay {:#x}: order-front rejected", window);
            report.properties.push_back(action_report("order_front", fronted));

            if (config.needs_keyboard)
            {
                bool activated = server_.activate(window);
                if (!activated)
                    LOG_WARN("Overlay {:#x}: activation rejected", window);
                report.properties.push_back(action_report("activate", activated));
            }

            LOG_DEBUG("Overlay {:#x}: presented (keyboard={})", window, config.needs_keyboard);
            return report;
        }
    );
}

} // namespace lpal
