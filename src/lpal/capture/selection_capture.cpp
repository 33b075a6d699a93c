#include "lpal/capture/selection_capture.hpp"
#include "lpal/capture/platform.hpp"
#include "lpal/core/error.hpp"
#include "lpal/core/log.hpp"
#include "lpal/core/shared_state.hpp"
#include "lpal/core/ui_dispatcher.hpp"
#include <algorithm>
#include <cctype>
#include <thread>

namespace lpal {

namespace {

bool is_blank(std::string const& text)
{
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

}

std::string_view to_string(CaptureSource source)
{
    switch (source)
    {
        case CaptureSource::None:
            return "none";
        case CaptureSource::Introspection:
            return "introspection";
        case CaptureSource::SimulatedCopy:
            return "simulated-copy";
    }
    return "unknown";
}

SelectionCapture::SelectionCapture(
    AccessibilityTree& tree,
    ClipboardAccess& clipboard,
    InputAutomation& automation,
    UiDispatcher& dispatcher,
    GhostSuppressor& ghost,
    CaptureOptions options
)
    : tree_(tree)
    , clipboard_(clipboard)
    , automation_(automation)
    , dispatcher_(dispatcher)
    , ghost_(ghost)
    , options_(options)
{
}

CaptureResult SelectionCapture::capture()
{
    if (!options_.enabled)
    {
        LOG_DEBUG("Capture: disabled, returning no selection");
        return {};
    }

    if (!automation_.is_trusted())
    {
        LOG_ERROR("Capture: accessibility permission denied");
        throw Error(ErrorKind::PermissionDenied, "input automation is not available");
    }

    std::optional<std::string> found;
    try
    {
        found = dispatcher_.run_sync([this]() { return walk_tree(); });
    }
    catch (std::exception const& e)
    {
        LOG_WARN("Capture: tree walk failed ({}), falling back to simulated copy", e.what());
    }

    if (found)
    {
        LOG_DEBUG("Capture: tree walk found {} bytes", found->size());
        ghost_.arm();
        if (!clipboard_.write_text(*found))
            LOG_WARN("Capture: failed to publish selection to the clipboard");
        return { CaptureSource::Introspection, std::move(*found), false };
    }

    LOG_DEBUG("Capture: tree walk found nothing, falling back to simulated copy");
    return simulated_copy();
}

std::optional<std::string> SelectionCapture::walk_tree()
{
    auto app = tree_.focused_application();
    if (!app)
    {
        LOG_TRACE("Capture: no focused application");
        return std::nullopt;
    }

    auto element = tree_.focused_element(*app);
    if (!element)
    {
        LOG_TRACE("Capture: application {:#x} has no focused element", *app);
        return std::nullopt;
    }

    return find_selection(*element, 0);
}

std::optional<std::string> SelectionCapture::find_selection(ElementId element, uint32_t depth)
{
    LOG_TRACE("Capture: visiting element {:#x} at depth {}", element, depth);

    if (auto text = tree_.selected_text(element); text && !is_blank(*text))
    {
        LOG_DEBUG("Capture: selection at depth {} of {}", depth, options_.max_depth);
        return text;
    }

    if (depth >= options_.max_depth)
        return std::nullopt;

    auto children = tree_.children(element);
    size_t count = std::min<size_t>(children.size(), options_.max_fan_out);
    for (size_t i = 0; i < count; ++i)
    {
        try
        {
            if (auto text = find_selection(children[i], depth + 1))
                return text;
        }
        catch (Error const& e)
        {
            LOG_DEBUG("Capture: skipping child {:#x}: {}", children[i], e.what());
        }
    }
    return std::nullopt;
}

CaptureResult SelectionCapture::simulated_copy()
{
    uint64_t start = clipboard_.change_count();

    ghost_.arm();
    bool sent = dispatcher_.run_sync([this]() { return automation_.send_copy(); });
    if (!sent)
    {
        LOG_WARN("Capture: synthetic copy was rejected");
        return {};
    }

    for (uint32_t attempt = 1; attempt <= options_.poll_attempts; ++attempt)
    {
        std::this_thread::sleep_for(options_.poll_interval);

        if (clipboard_.change_count() == start)
            continue;

        LOG_DEBUG("Capture: clipboard changed after {} poll(s)", attempt);
        try
        {
            auto text = clipboard_.read_text();
            if (!text || is_blank(*text))
                return {};
            return { CaptureSource::SimulatedCopy, std::move(*text), false };
        }
        catch (Error const& e)
        {
            LOG_WARN("Capture: clipboard read failed: {}", e.what());
            return {};
        }
    }

    LOG_DEBUG("Capture: clipboard unchanged after {} polls", options_.poll_attempts);
    CaptureResult result;
    result.timed_out = true;
    return result;
}

} // namespace lpal
