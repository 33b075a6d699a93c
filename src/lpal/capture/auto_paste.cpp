#include "lpal/capture/auto_paste.hpp"
#include "lpal/capture/platform.hpp"
#include "lpal/core/error.hpp"
#include "lpal/core/log.hpp"
#include "lpal/core/shared_state.hpp"
#include "lpal/core/ui_dispatcher.hpp"
#include <thread>

namespace lpal {

AutoPaste::AutoPaste(
    InputAutomation& automation,
    ClipboardAccess& clipboard,
    UiDispatcher& dispatcher,
    GhostSuppressor& ghost,
    PasteFailureCounter& failures,
    std::chrono::milliseconds delay
)
    : automation_(automation)
    , clipboard_(clipboard)
    , dispatcher_(dispatcher)
    , ghost_(ghost)
    , failures_(failures)
    , delay_(delay)
{
}

void AutoPaste::fail(char const* what)
{
    failures_.record_failure();
    LOG_WARN("AutoPaste: {} ({}/{} consecutive failures)", what, failures_.failures(), failures_.ceiling());
    throw Error(ErrorKind::Backend, what);
}

void AutoPaste::auto_paste_flow(AppId app)
{
    if (failures_.is_open())
    {
        LOG_WARN("AutoPaste: refused, {} consecutive failures", failures_.failures());
        throw Error(ErrorKind::CircuitOpen, "paste failure ceiling reached");
    }

    if (!dispatcher_.run_sync([&]() { return automation_.restore_focus(app); }))
        fail("focus restore failed");

    std::this_thread::sleep_for(delay_);

    if (!dispatcher_.run_sync([&]() { return automation_.send_paste(); }))
        fail("synthetic paste failed");

    failures_.record_success();
    LOG_DEBUG("AutoPaste: pasted into {:#x}", app);
}

bool AutoPaste::publish(std::string const& text)
{
    ghost_.arm();
    if (!clipboard_.write_text(text))
    {
        LOG_WARN("AutoPaste: clipboard write failed");
        return false;
    }
    return true;
}

} // namespace lpal
