#pragma once

#include "lpal/capture/platform.hpp"
#include "lpal/core/error.hpp"
#include "lpal/core/ui_dispatcher.hpp"
#include "lpal/window/window_server.hpp"
#include <atomic>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace lpal::test {

/// Runs a UiDispatcher on its own thread for the lifetime of the object.
class DispatcherThread
{
public:
    DispatcherThread()
    {
        auto ready = bound_.get_future();
        thread_ = std::thread(
            [this]()
            {
                dispatcher_.bind_to_current_thread();
                bound_.set_value();
                dispatcher_.run();
            }
        );
        ready.wait();
    }

    ~DispatcherThread()
    {
        dispatcher_.stop();
        thread_.join();
    }

    UiDispatcher& get() { return dispatcher_; }
    std::thread::id id() const { return thread_.get_id(); }

private:
    UiDispatcher dispatcher_;
    std::promise<void> bound_;
    std::thread thread_;
};

/**
 * @brief In-memory window server.
 *
 * Records every call in order, tracks reference counts and visibility, and
 * can be told to reject or silently drop writes.
 */
class FakeWindowServer : public WindowServer
{
public:
    struct Window
    {
        WindowSpec spec;
        Geometry geometry;
        int refs = 0;
        bool alive = true;
        bool visible = false;
        bool focused = false;
        StackingLevel level = stacking::NORMAL;
        SpaceFlags spaces;
        bool non_activating = false;
    };

    // Failure injection
    bool reject_level = false;
    bool drop_space_writes = false; // accepted but never observable
    bool reject_order_front = false;

    std::vector<Monitor> monitor_list{ { "DP-1", 0, 0, 1920, 1080 } };
    std::optional<Point> pointer;

    NativeWindow create_window(WindowSpec const& spec) override
    {
        std::lock_guard lock(mutex_);
        NativeWindow id = next_id_++;
        Window w;
        w.spec = spec;
        w.geometry = spec.geometry;
        w.refs = 1;
        windows_[id] = w;
        log_locked("create:" + spec.name);
        ui_thread_calls_.push_back(std::this_thread::get_id());
        return id;
    }

    void retain(NativeWindow window) override
    {
        std::lock_guard lock(mutex_);
        ++windows_.at(window).refs;
    }

    void release(NativeWindow window) override
    {
        std::lock_guard lock(mutex_);
        auto& w = windows_.at(window);
        if (--w.refs == 0)
        {
            w.alive = false;
            ++destroyed_;
        }
    }

    bool is_alive(NativeWindow window) const override
    {
        std::lock_guard lock(mutex_);
        auto it = windows_.find(window);
        return it != windows_.end() && it->second.alive;
    }

    StackingLevel stacking_level(NativeWindow window) const override
    {
        std::lock_guard lock(mutex_);
        return windows_.at(window).level;
    }

    bool set_stacking_level(NativeWindow window, StackingLevel level) override
    {
        std::lock_guard lock(mutex_);
        log_locked("set_level");
        if (reject_level)
            return false;
        windows_.at(window).level = level;
        return true;
    }

    SpaceFlags space_flags(NativeWindow window) const override
    {
        std::lock_guard lock(mutex_);
        return windows_.at(window).spaces;
    }

    bool set_space_flags(NativeWindow window, SpaceFlags flags) override
    {
        std::lock_guard lock(mutex_);
        log_locked("set_spaces");
        if (!drop_space_writes)
            windows_.at(window).spaces = flags;
        return true;
    }

    bool is_non_activating(NativeWindow window) const override
    {
        std::lock_guard lock(mutex_);
        return windows_.at(window).non_activating;
    }

    bool set_non_activating(NativeWindow window, bool non_activating) override
    {
        std::lock_guard lock(mutex_);
        log_locked("set_non_activating");
        windows_.at(window).non_activating = non_activating;
        return true;
    }

    bool order_front_regardless(NativeWindow window) override
    {
        std::lock_guard lock(mutex_);
        log_locked("order_front:" + windows_.at(window).spec.name);
        ui_thread_calls_.push_back(std::this_thread::get_id());
        if (reject_order_front)
            return false;
        windows_.at(window).visible = true;
        record_visible_locked();
        return true;
    }

    bool activate(NativeWindow window) override
    {
        std::lock_guard lock(mutex_);
        log_locked("activate:" + windows_.at(window).spec.name);
        for (auto& [id, w] : windows_)
            w.focused = id == window;
        return true;
    }

    bool hide(NativeWindow window) override
    {
        std::lock_guard lock(mutex_);
        log_locked("hide:" + windows_.at(window).spec.name);
        auto& w = windows_.at(window);
        if (w.visible)
        {
            w.visible = false;
            record_visible_locked();
        }
        return true;
    }

    bool is_visible(NativeWindow window) const override
    {
        std::lock_guard lock(mutex_);
        return windows_.at(window).visible;
    }

    bool move_resize(NativeWindow window, Geometry geometry) override
    {
        std::lock_guard lock(mutex_);
        log_locked("move_resize:" + windows_.at(window).spec.name);
        windows_.at(window).geometry = geometry;
        return true;
    }

    std::vector<Monitor> monitors() const override { return monitor_list; }
    std::optional<Point> pointer_position() const override { return pointer; }

    // ── inspection ──────────────────────────────────────────────────────────

    /// Destroy a window behind everyone's back.
    void kill(NativeWindow window)
    {
        std::lock_guard lock(mutex_);
        windows_.at(window).alive = false;
    }

    Window window(NativeWindow id) const
    {
        std::lock_guard lock(mutex_);
        return windows_.at(id);
    }

    int refs(NativeWindow id) const { return window(id).refs; }

    size_t created() const
    {
        std::lock_guard lock(mutex_);
        return windows_.size();
    }

    int destroyed() const
    {
        std::lock_guard lock(mutex_);
        return destroyed_;
    }

    std::vector<std::string> calls() const
    {
        std::lock_guard lock(mutex_);
        return calls_;
    }

    void clear_calls()
    {
        std::lock_guard lock(mutex_);
        calls_.clear();
    }

    /// Visible-window count after every visibility change.
    std::vector<size_t> visible_history() const
    {
        std::lock_guard lock(mutex_);
        return visible_history_;
    }

    std::vector<std::thread::id> ui_thread_calls() const
    {
        std::lock_guard lock(mutex_);
        return ui_thread_calls_;
    }

private:
    void log_locked(std::string entry) { calls_.push_back(std::move(entry)); }

    void record_visible_locked()
    {
        size_t count = 0;
        for (auto const& [id, w] : windows_)
        {
            if (w.alive && w.visible)
                ++count;
        }
        visible_history_.push_back(count);
    }

    mutable std::mutex mutex_;
    NativeWindow next_id_ = 0x100;
    std::map<NativeWindow, Window> windows_;
    std::vector<std::string> calls_;
    std::vector<size_t> visible_history_;
    std::vector<std::thread::id> ui_thread_calls_;
    int destroyed_ = 0;
};

class FakeClipboard : public ClipboardAccess
{
public:
    uint64_t change_count() const override
    {
        ++count_reads;
        return count_.load();
    }

    std::optional<std::string> read_text() override
    {
        std::lock_guard lock(mutex_);
        ++reads;
        if (fail_reads)
            throw Error(ErrorKind::Backend, "clipboard unavailable");
        return text_;
    }

    bool write_text(std::string const& text) override
    {
        if (on_write)
            on_write();
        std::lock_guard lock(mutex_);
        ++writes;
        text_ = text;
        ++count_;
        return true;
    }

    /// Another application copied text.
    void external_copy(std::string const& text)
    {
        std::lock_guard lock(mutex_);
        text_ = text;
        ++count_;
    }

    std::optional<std::string> text() const
    {
        std::lock_guard lock(mutex_);
        return text_;
    }

    std::function<void()> on_write; // runs before the write lands
    std::atomic<bool> fail_reads{ false };
    std::atomic<int> reads{ 0 };
    std::atomic<int> writes{ 0 };
    mutable std::atomic<int> count_reads{ 0 };

private:
    mutable std::mutex mutex_;
    std::optional<std::string> text_;
    std::atomic<uint64_t> count_{ 0 };
};

class FakeAutomation : public InputAutomation
{
public:
    explicit FakeAutomation(FakeClipboard& clipboard)
        : clipboard_(clipboard)
    {
    }

    bool is_trusted() const override { return trusted; }

    std::optional<AppId> active_application() override { return active_app; }

    bool restore_focus(AppId app) override
    {
        ++restore_calls;
        if (on_restore)
            on_restore();
        if (restore_ok)
            active_app = app;
        return restore_ok;
    }

    bool send_copy() override
    {
        ++copy_calls;
        copy_thread = std::this_thread::get_id();
        if (on_copy)
            on_copy();
        if (copy_result)
            clipboard_.external_copy(*copy_result);
        return copy_ok;
    }

    bool send_paste() override
    {
        ++paste_calls;
        return paste_ok;
    }

    int os_calls() const { return restore_calls + copy_calls + paste_calls; }

    bool trusted = true;
    std::optional<AppId> active_app = 0x42;
    bool restore_ok = true;
    bool paste_ok = true;
    bool copy_ok = true;
    std::optional<std::string> copy_result; // what the focused app puts on the clipboard
    std::function<void()> on_copy;
    std::function<void()> on_restore;

    int restore_calls = 0;
    int copy_calls = 0;
    int paste_calls = 0;
    std::thread::id copy_thread;

private:
    FakeClipboard& clipboard_;
};

/// Accessibility tree built from explicit nodes.
class FakeAccessibilityTree : public AccessibilityTree
{
public:
    struct Node
    {
        std::optional<std::string> selected;
        std::vector<ElementId> children;
        bool broken = false; // selected_text throws
    };

    std::optional<AppId> app = 0x42;
    std::optional<ElementId> focused = 1;
    std::map<ElementId, Node> nodes;
    bool fail_focus = false;

    std::vector<ElementId> visited;

    std::optional<AppId> focused_application() override { return app; }

    std::optional<ElementId> focused_element(AppId /*app*/) override
    {
        if (fail_focus)
            throw Error(ErrorKind::Backend, "focused element unavailable");
        return focused;
    }

    std::vector<ElementId> children(ElementId element) override
    {
        auto it = nodes.find(element);
        return it == nodes.end() ? std::vector<ElementId>{} : it->second.children;
    }

    std::optional<std::string> selected_text(ElementId element) override
    {
        visited.push_back(element);
        auto it = nodes.find(element);
        if (it == nodes.end())
            return std::nullopt;
        if (it->second.broken)
            throw Error(ErrorKind::Backend, "element went away");
        return it->second.selected;
    }
};

} // namespace lpal::test
