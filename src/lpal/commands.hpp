#pragma once

#include "lpal/core/types.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace lpal {

class AutoPaste;
class InputAutomation;
class PresentationController;
class SelectionCapture;
class TaskPool;
class UiDispatcher;
struct SharedState;

/**
 * @brief The operations the launcher exposes to hotkeys and collaborators.
 *
 * Callable from any thread. Presentation transitions block on the UI thread
 * while holding the transition lock, so a call made on the UI thread is
 * handed to the worker pool and returns before the work has run.
 */
class Commands
{
public:
    struct Options
    {
        std::chrono::milliseconds debounce{ 500 };
        // Windows of this process are never recorded as the paste-back target.
        std::function<bool(AppId)> owns_window;
        // Called at most once, the first time capture reports PermissionDenied.
        std::function<void()> permission_notice;
    };

    Commands(
        UiDispatcher& dispatcher,
        TaskPool& pool,
        SharedState& state,
        PresentationController& presentation,
        SelectionCapture& capture,
        AutoPaste& auto_paste,
        InputAutomation& automation,
        Options options
    );

    void show_widget(std::string const& name);
    void hide_widget(std::string const& name);

    /// Empty when nothing is selected. @throws Error(PermissionDenied)
    std::string capture_selected_text();

    /// Returns false when the trigger was debounced or could not be scheduled.
    bool trigger_palette();

    /// Record the active application, capture, then show the palette.
    void palette_flow();

    /// Publish text, hide the palette and paste into the recorded application.
    void paste_back(std::string const& text);

    /// paste_back() with the text of the last palette capture.
    void paste_last_capture();

    std::string last_capture() const;
    std::optional<AppId> last_application() const;

    /// Run task on the pool, logging Error instead of letting it reach the worker.
    bool submit(std::string what, std::function<void()> task);

private:
    bool handed_off(char const* what, std::function<void()> task);
    void report_permission_denied();

    UiDispatcher& dispatcher_;
    TaskPool& pool_;
    SharedState& state_;
    PresentationController& presentation_;
    SelectionCapture& capture_;
    AutoPaste& auto_paste_;
    InputAutomation& automation_;
    Options options_;

    mutable std::mutex last_mutex_;
    std::optional<AppId> last_app_;
    std::string last_capture_;

    std::atomic<bool> permission_reported_{ false };
};

} // namespace lpal
