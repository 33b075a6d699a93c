#pragma once

#include "lpal/core/types.hpp"
#include <chrono>
#include <string>

namespace lpal {

class ClipboardAccess;
class GhostSuppressor;
class InputAutomation;
class PasteFailureCounter;
class UiDispatcher;

/**
 * @brief Pastes into a previously active application.
 *
 * Guarded by a circuit breaker: once the consecutive failure count reaches
 * its ceiling, attempts are refused without touching the OS until a success
 * resets the count.
 */
class AutoPaste
{
public:
    AutoPaste(
        InputAutomation& automation,
        ClipboardAccess& clipboard,
        UiDispatcher& dispatcher,
        GhostSuppressor& ghost,
        PasteFailureCounter& failures,
        std::chrono::milliseconds delay = std::chrono::milliseconds(100)
    );

    /// @throws Error(CircuitOpen) at the ceiling, Error(Backend) when a step fails.
    void auto_paste_flow(AppId app);

    bool publish(std::string const& text);

private:
    void fail(char const* what);

    InputAutomation& automation_;
    ClipboardAccess& clipboard_;
    UiDispatcher& dispatcher_;
    GhostSuppressor& ghost_;
    PasteFailureCounter& failures_;
    std::chrono::milliseconds delay_;
};

} // namespace lpal
