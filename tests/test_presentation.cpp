#include "fakes.hpp"
#include "lpal/core/error.hpp"
#include "lpal/window/handle_registry.hpp"
#include "lpal/window/overlay.hpp"
#include "lpal/window/presentation.hpp"
#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <thread>

using namespace lpal;

namespace {

struct Fixture
{
    test::DispatcherThread ui;
    test::FakeWindowServer server;
    WindowHandleRegistry registry{ server };
    OverlayConfigurator configurator{ server, ui.get() };
    PresentationController controller;

    explicit Fixture(PresentationController::Options options = {})
        : controller(server, ui.get(), registry, configurator, std::move(options))
    {
    }

    NativeWindow window_of(std::string const& name) const
    {
        auto handle = registry.get(name);
        return handle ? handle->id() : NULL_WINDOW;
    }
};

ptrdiff_t index_of(std::vector<std::string> const& calls, std::string const& entry)
{
    auto it = std::find(calls.begin(), calls.end(), entry);
    return it == calls.end() ? -1 : std::distance(calls.begin(), it);
}

ptrdiff_t last_index_of(std::vector<std::string> const& calls, std::string const& entry)
{
    auto it = std::find(calls.rbegin(), calls.rend(), entry);
    return it == calls.rend() ? -1 : std::distance(calls.begin(), it.base()) - 1;
}

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Creation
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("first show creates, hides and configures before presenting", "[presentation]")
{
    Fixture f;
    f.controller.show_widget("settings");

    auto calls = f.server.calls();
    auto create = index_of(calls, "create:settings");
    auto hide = index_of(calls, "hide:settings");
    auto level = index_of(calls, "set_level");
    auto front = index_of(calls, "order_front:settings");

    REQUIRE(create == 0);
    REQUIRE(create < hide);
    REQUIRE(hide < level);
    REQUIRE(level < front);
    REQUIRE(f.controller.state("settings") == WidgetState::Visible);

    auto w = f.server.window(f.window_of("settings"));
    REQUIRE(w.visible);
    REQUIRE(w.focused);
    REQUIRE(w.level == stacking::STATUS);
    REQUIRE(w.spec.title == "Settings");
    REQUIRE(w.geometry.width == 800);
    REQUIRE(w.geometry.height == 600);
}

TEST_CASE("the registry holds the only reference after creation", "[presentation]")
{
    Fixture f;
    f.controller.show_widget("clipboard");
    REQUIRE(f.server.refs(f.window_of("clipboard")) == 1);
}

TEST_CASE("showing twice reuses the window", "[presentation]")
{
    Fixture f;
    f.controller.show_widget("translator");
    f.controller.hide_widget("translator");
    f.controller.show_widget("translator");

    REQUIRE(f.server.created() == 1);
    REQUIRE(f.registry.size() == 1);

    auto calls = f.server.calls();
    REQUIRE(std::count(calls.begin(), calls.end(), "order_front:translator") == 2);
    REQUIRE(f.controller.state("translator") == WidgetState::Visible);
}

TEST_CASE("showing a visible widget again re-presents the same window", "[presentation]")
{
    Fixture f;
    f.controller.show_widget("settings");
    auto window = f.window_of("settings");
    f.server.clear_calls();

    f.controller.show_widget("settings");

    REQUIRE(f.window_of("settings") == window);
    REQUIRE(f.server.created() == 1);
    auto calls = f.server.calls();
    REQUIRE(index_of(calls, "create:settings") == -1);
    REQUIRE(index_of(calls, "order_front:settings") >= 0);
}

TEST_CASE("concurrent first shows create one window", "[presentation]")
{
    Fixture f;
    std::thread a([&]() { f.controller.show_widget("currency"); });
    std::thread b([&]() { f.controller.show_widget("currency"); });
    a.join();
    b.join();

    REQUIRE(f.server.created() == 1);
    REQUIRE(f.controller.state("currency") == WidgetState::Visible);
}

TEST_CASE("unknown widget names get the default geometry", "[presentation]")
{
    Fixture f;
    f.controller.show_widget("weather");

    auto w = f.server.window(f.window_of("weather"));
    REQUIRE(w.spec.title == "Widget");
    REQUIRE(w.geometry.width == 600);
    REQUIRE(w.geometry.height == 400);
}

// ─────────────────────────────────────────────────────────────────────────────
// Hiding
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("hide is a no-op for widgets that are not visible", "[presentation]")
{
    Fixture f;
    f.controller.hide_widget("settings");
    REQUIRE(f.server.calls().empty());
    REQUIRE(f.controller.state("settings") == WidgetState::Uncreated);

    f.controller.show_widget("settings");
    f.controller.hide_widget("settings");
    f.server.clear_calls();
    f.controller.hide_widget("settings");
    REQUIRE(f.server.calls().empty());
}

TEST_CASE("focus loss hides widgets but not the palette", "[presentation]")
{
    Fixture f;
    f.controller.show_widget("palette");
    f.controller.on_focus_lost(f.window_of("palette"));
    REQUIRE(f.controller.state("palette") == WidgetState::Visible);

    f.controller.show_widget("clipboard");
    f.controller.on_focus_lost(f.window_of("clipboard"));
    REQUIRE(f.controller.state("clipboard") == WidgetState::Hidden);
    REQUIRE_FALSE(f.server.window(f.window_of("clipboard")).visible);
}

TEST_CASE("close requests hide without destroying", "[presentation]")
{
    Fixture f;
    f.controller.show_widget("settings");
    auto window = f.window_of("settings");

    f.controller.on_close_requested(window);

    REQUIRE(f.controller.state("settings") == WidgetState::Hidden);
    REQUIRE(f.server.is_alive(window));
    REQUIRE(f.server.destroyed() == 0);
}

TEST_CASE("events for foreign windows are ignored", "[presentation]")
{
    Fixture f;
    f.controller.show_widget("settings");
    f.server.clear_calls();

    f.controller.on_focus_lost(0xdead);
    f.controller.on_close_requested(0xdead);
    f.controller.on_destroyed(0xdead);

    REQUIRE(f.server.calls().empty());
    REQUIRE(f.controller.state("settings") == WidgetState::Visible);
}

// ─────────────────────────────────────────────────────────────────────────────
// Palette handoff
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("the palette hides only after the next widget is presented", "[presentation]")
{
    Fixture f;
    f.controller.show_widget("palette");
    f.controller.show_widget("translator");

    auto calls = f.server.calls();
    REQUIRE(index_of(calls, "order_front:translator") < last_index_of(calls, "hide:palette"));
    REQUIRE(f.controller.state("palette") == WidgetState::Hidden);
    REQUIRE(f.controller.state("translator") == WidgetState::Visible);

    auto history = f.server.visible_history();
    auto first_visible = std::find_if(history.begin(), history.end(), [](size_t n) { return n > 0; });
    REQUIRE(first_visible != history.end());
    REQUIRE(std::find(first_visible, history.end(), 0u) == history.end());
}

TEST_CASE("the palette is non-activating and only activated when it takes the keyboard", "[presentation]")
{
    SECTION("takes keyboard")
    {
        Fixture f;
        f.controller.show_widget("palette");
        REQUIRE(index_of(f.server.calls(), "activate:palette") >= 0);
        REQUIRE(f.server.window(f.window_of("palette")).non_activating);
    }

    SECTION("keyboard disabled")
    {
        PresentationController::Options options;
        options.palette_takes_keyboard = false;
        Fixture f(options);
        f.controller.show_widget("palette");
        REQUIRE(index_of(f.server.calls(), "activate:palette") == -1);
        REQUIRE(f.server.window(f.window_of("palette")).visible);
    }
}

TEST_CASE("the palette follows the pointer only with a selection", "[presentation]")
{
    Fixture f;
    f.server.pointer = Point{ 100, 200 };

    f.controller.show_widget("palette", true);
    auto geometry = f.server.window(f.window_of("palette")).geometry;
    REQUIRE(geometry.x == 100);
    REQUIRE(geometry.y == 200);

    f.controller.hide_widget("palette");
    f.controller.show_widget("palette", false);
    geometry = f.server.window(f.window_of("palette")).geometry;
    REQUIRE(geometry.x == (1920 - 550) / 2);
    REQUIRE(geometry.y == (1080 - 328) / 2);
}

TEST_CASE("the basic strategy uses a floating level and activates", "[presentation]")
{
    PresentationController::Options options;
    options.strategy = OverlayStrategy::Basic;
    Fixture f(options);

    f.controller.show_widget("palette");

    auto w = f.server.window(f.window_of("palette"));
    REQUIRE(w.level == stacking::FLOATING);
    REQUIRE_FALSE(w.non_activating);
    REQUIRE(w.spaces == SpaceFlags{});
    REQUIRE(w.focused);
}

TEST_CASE("widget overrides change the created geometry", "[presentation]")
{
    PresentationController::Options options;
    WidgetOverride o;
    o.width = 900;
    o.title = "Prefs";
    options.widget_overrides["settings"] = o;
    Fixture f(options);

    f.controller.show_widget("settings");
    auto w = f.server.window(f.window_of("settings"));
    REQUIRE(w.spec.title == "Prefs");
    REQUIRE(w.geometry.width == 900);
    REQUIRE(w.geometry.height == 600);
}

// ─────────────────────────────────────────────────────────────────────────────
// Out-of-band destruction
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("a destroyed window is recreated on the next show", "[presentation]")
{
    Fixture f;
    f.controller.show_widget("settings");
    auto first = f.window_of("settings");

    f.server.kill(first);
    f.controller.on_destroyed(first);
    REQUIRE(f.controller.state("settings") == WidgetState::Uncreated);
    REQUIRE(f.registry.size() == 0);

    f.controller.show_widget("settings");
    REQUIRE(f.server.created() == 2);
    REQUIRE(f.window_of("settings") != first);
    REQUIRE(f.controller.state("settings") == WidgetState::Visible);
}

TEST_CASE("presenting an unnoticed dead window raises HandleInvalid", "[presentation]")
{
    Fixture f;
    f.controller.show_widget("settings");
    f.controller.hide_widget("settings");
    f.server.kill(f.window_of("settings"));

    try
    {
        f.controller.show_widget("settings");
        FAIL("expected HandleInvalid");
    }
    catch (Error const& e)
    {
        REQUIRE(e.kind() == ErrorKind::HandleInvalid);
    }
    REQUIRE(f.controller.state("settings") == WidgetState::Uncreated);
    REQUIRE(f.registry.size() == 0);

    f.controller.show_widget("settings");
    REQUIRE(f.server.created() == 2);
}
