#include "fakes.hpp"
#include "lpal/capture/auto_paste.hpp"
#include "lpal/capture/selection_capture.hpp"
#include "lpal/commands.hpp"
#include "lpal/core/error.hpp"
#include "lpal/core/shared_state.hpp"
#include "lpal/core/task_pool.hpp"
#include "lpal/window/handle_registry.hpp"
#include "lpal/window/overlay.hpp"
#include "lpal/window/presentation.hpp"
#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <future>
#include <thread>

using namespace lpal;
using namespace std::chrono_literals;

namespace {

CaptureOptions fast_capture()
{
    CaptureOptions options;
    options.poll_attempts = 5;
    options.poll_interval = 1ms;
    return options;
}

struct Fixture
{
    test::DispatcherThread ui;
    test::FakeWindowServer server;
    WindowHandleRegistry registry{ server };
    OverlayConfigurator configurator{ server, ui.get() };
    PresentationController presentation{ server, ui.get(), registry, configurator, {} };

    test::FakeClipboard clipboard;
    test::FakeAutomation automation{ clipboard };
    test::FakeAccessibilityTree tree;
    SharedState state;
    SelectionCapture capture;
    AutoPaste auto_paste{ automation, clipboard, ui.get(), state.ghost, state.paste_failures, 1ms };
    TaskPool pool{ 2 };
    Commands commands;

    std::atomic<int> permission_notices{ 0 };

    explicit Fixture(Commands::Options options = {}, CaptureOptions capture_options = fast_capture())
        : capture(tree, clipboard, automation, ui.get(), state.ghost, capture_options)
        , commands(ui.get(), pool, state, presentation, capture, auto_paste, automation, with_notice(std::move(options)))
    {
    }

    Commands::Options with_notice(Commands::Options options)
    {
        options.permission_notice = [this]() { ++permission_notices; };
        return options;
    }

    /// Selected text on the focused element, found by the tree walk.
    void select_in_tree(std::string const& text) { tree.nodes[1].selected = text; }

    /// Nothing reachable through the tree; the focused app answers a synthetic copy.
    void select_for_copy(std::string const& text)
    {
        tree.focused.reset();
        automation.copy_result = text;
    }
};

bool contains(std::vector<std::string> const& calls, std::string const& entry)
{
    return std::find(calls.begin(), calls.end(), entry) != calls.end();
}

bool palette_touched(std::vector<std::string> const& calls)
{
    return std::any_of(
        calls.begin(),
        calls.end(),
        [](std::string const& c) { return c.find("palette") != std::string::npos; }
    );
}

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Palette flow
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("the synthetic copy happens before the palette window exists", "[commands]")
{
    Fixture f;
    f.select_for_copy("hello");

    std::vector<std::string> calls_at_copy;
    f.automation.on_copy = [&]() { calls_at_copy = f.server.calls(); };

    f.commands.palette_flow();

    REQUIRE(f.automation.copy_calls == 1);
    REQUIRE_FALSE(palette_touched(calls_at_copy));
    REQUIRE(contains(f.server.calls(), "order_front:palette"));
    REQUIRE(f.presentation.state("palette") == WidgetState::Visible);
    REQUIRE(f.commands.last_capture() == "hello");
}

TEST_CASE("a tree-walk selection is published before the palette window exists", "[commands]")
{
    Fixture f;
    f.select_in_tree("from the tree");

    std::vector<std::string> calls_at_write;
    f.clipboard.on_write = [&]() { calls_at_write = f.server.calls(); };

    f.commands.palette_flow();

    REQUIRE(f.clipboard.writes == 1);
    REQUIRE_FALSE(palette_touched(calls_at_write));
    REQUIRE(f.automation.copy_calls == 0);
    REQUIRE(f.commands.last_capture() == "from the tree");
}

TEST_CASE("the palette flow records the active application", "[commands]")
{
    Fixture f;
    f.automation.active_app = 0x77;
    f.commands.palette_flow();
    REQUIRE(f.commands.last_application() == AppId{ 0x77 });
}

TEST_CASE("windows of this process are never recorded as the paste target", "[commands]")
{
    Commands::Options options;
    options.owns_window = [](AppId app) { return app == 0x99; };
    Fixture f(std::move(options));

    f.automation.active_app = 0x77;
    f.commands.palette_flow();

    f.automation.active_app = 0x99;
    f.commands.palette_flow();

    REQUIRE(f.commands.last_application() == AppId{ 0x77 });
}

TEST_CASE("permission denial is reported once and the palette still shows", "[commands]")
{
    Fixture f;
    f.automation.trusted = false;
    f.select_in_tree("unreachable");

    f.commands.palette_flow();
    f.commands.hide_widget("palette");
    f.commands.palette_flow();

    REQUIRE(f.permission_notices == 1);
    REQUIRE(f.presentation.state("palette") == WidgetState::Visible);
    REQUIRE(f.commands.last_capture().empty());
    REQUIRE(f.clipboard.writes == 0);
    REQUIRE(f.clipboard.reads == 0);
    REQUIRE_FALSE(f.state.ghost.armed());

    try
    {
        f.commands.capture_selected_text();
        FAIL("capture_selected_text did not throw");
    }
    catch (Error const& e)
    {
        REQUIRE(e.kind() == ErrorKind::PermissionDenied);
    }
    REQUIRE(f.permission_notices == 1);
}

// ─────────────────────────────────────────────────────────────────────────────
// Debounce
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("a second trigger inside the debounce window is ignored", "[commands][debounce]")
{
    Commands::Options options;
    options.debounce = 10s;
    Fixture f(std::move(options));
    f.select_for_copy("once");

    REQUIRE(f.commands.trigger_palette());
    REQUIRE_FALSE(f.commands.trigger_palette());

    f.pool.shutdown();
    REQUIRE(f.automation.copy_calls == 1);
    REQUIRE(f.presentation.state("palette") == WidgetState::Visible);
}

TEST_CASE("the debounce window starts at the trigger, not at the end of the flow", "[commands][debounce]")
{
    CaptureOptions slow = fast_capture();
    slow.poll_attempts = 30;
    slow.poll_interval = 10ms;

    Commands::Options options;
    options.debounce = 50ms;
    Fixture f(std::move(options), slow);
    f.tree.focused.reset(); // copy never changes the clipboard: the flow polls for 300 ms

    REQUIRE(f.commands.trigger_palette());
    std::this_thread::sleep_for(100ms);
    REQUIRE(f.commands.trigger_palette());
}

TEST_CASE("palette debounce compares against the last accepted trigger", "[debounce]")
{
    PaletteDebounce debounce;
    auto t0 = PaletteDebounce::Clock::now();

    REQUIRE(debounce.try_trigger(500ms, t0));
    REQUIRE_FALSE(debounce.try_trigger(500ms, t0 + 499ms));
    REQUIRE(debounce.try_trigger(500ms, t0 + 500ms));
    REQUIRE_FALSE(debounce.try_trigger(500ms, t0 + 700ms));

    debounce.reset();
    REQUIRE(debounce.try_trigger(500ms, t0 + 700ms));
}

// ─────────────────────────────────────────────────────────────────────────────
// Paste-back
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("paste-back arms the ghost flag, hides the palette, then pastes", "[commands][paste]")
{
    Fixture f;
    f.select_in_tree("source");
    f.commands.palette_flow();
    REQUIRE(f.state.ghost.consume());

    bool ghost_at_write = false;
    std::vector<std::string> calls_at_restore;
    f.clipboard.on_write = [&]() { ghost_at_write = f.state.ghost.armed(); };
    f.automation.on_restore = [&]() { calls_at_restore = f.server.calls(); };
    f.server.clear_calls();

    f.commands.paste_back("translated");

    REQUIRE(ghost_at_write);
    REQUIRE(f.clipboard.text() == std::optional<std::string>("translated"));
    REQUIRE(contains(calls_at_restore, "hide:palette"));
    REQUIRE(f.presentation.state("palette") == WidgetState::Hidden);
    REQUIRE(f.automation.restore_calls == 1);
    REQUIRE(f.automation.paste_calls == 1);
    REQUIRE(f.automation.active_app == AppId{ 0x42 });
}

TEST_CASE("paste-back without a recorded application does nothing", "[commands][paste]")
{
    Fixture f;
    f.commands.paste_back("text");

    REQUIRE(f.clipboard.writes == 0);
    REQUIRE(f.automation.os_calls() == 0);
    REQUIRE_FALSE(f.state.ghost.armed());
}

TEST_CASE("paste_last_capture pastes what the palette captured", "[commands][paste]")
{
    Fixture f;
    f.select_for_copy("copied");
    f.commands.palette_flow();

    f.commands.paste_last_capture();

    REQUIRE(f.clipboard.text() == std::optional<std::string>("copied"));
    REQUIRE(f.automation.paste_calls == 1);
}

// ─────────────────────────────────────────────────────────────────────────────
// UI-thread callers
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("show_widget on the UI thread does not wait on a worker's transition", "[commands][threads]")
{
    Fixture f;

    std::promise<void> ui_returned;
    auto ui_done = ui_returned.get_future();
    f.ui.get().post(
        [&]()
        {
            // The worker below takes the transition lock and waits for this thread.
            std::this_thread::sleep_for(100ms);
            f.commands.show_widget("settings");
            ui_returned.set_value();
        }
    );

    auto worker = std::async(
        std::launch::async,
        [&]()
        {
            std::this_thread::sleep_for(20ms);
            f.commands.show_widget("translator");
        }
    );

    REQUIRE(ui_done.wait_for(3s) == std::future_status::ready);
    REQUIRE(worker.wait_for(3s) == std::future_status::ready);
    worker.get();

    f.pool.shutdown();
    REQUIRE(f.presentation.state("translator") == WidgetState::Visible);
    REQUIRE(f.presentation.state("settings") == WidgetState::Visible);
}

TEST_CASE("operations called on the UI thread run on the pool", "[commands][threads]")
{
    Fixture f;
    f.select_in_tree("picked");

    f.ui.get().run_sync(
        [&]()
        {
            f.commands.palette_flow();
            f.commands.show_widget("settings");
        }
    );

    f.pool.shutdown();
    REQUIRE(f.presentation.state("palette") == WidgetState::Visible);
    REQUIRE(f.presentation.state("settings") == WidgetState::Visible);
    REQUIRE(f.commands.last_capture() == "picked");
}
