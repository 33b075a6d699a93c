#include "fakes.hpp"
#include "lpal/capture/auto_paste.hpp"
#include "lpal/core/error.hpp"
#include "lpal/core/shared_state.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>

using namespace lpal;
using namespace std::chrono_literals;

namespace {

struct Fixture
{
    test::DispatcherThread ui;
    test::FakeClipboard clipboard;
    test::FakeAutomation automation{ clipboard };
    SharedState state;
    AutoPaste paste{ automation, clipboard, ui.get(), state.ghost, state.paste_failures, 1ms };
};

ErrorKind kind_of_failure(AutoPaste& paste, AppId app)
{
    try
    {
        paste.auto_paste_flow(app);
    }
    catch (Error const& e)
    {
        return e.kind();
    }
    FAIL("auto_paste_flow did not throw");
    return ErrorKind::Backend;
}

} // namespace

TEST_CASE("a successful paste restores focus then pastes", "[paste]")
{
    Fixture f;
    f.paste.auto_paste_flow(0x77);

    REQUIRE(f.automation.active_app == AppId{ 0x77 });
    REQUIRE(f.automation.restore_calls == 1);
    REQUIRE(f.automation.paste_calls == 1);
    REQUIRE(f.state.paste_failures.failures() == 0);
}

TEST_CASE("focus restore failure skips the paste", "[paste]")
{
    Fixture f;
    f.automation.restore_ok = false;

    REQUIRE(kind_of_failure(f.paste, 0x77) == ErrorKind::Backend);
    REQUIRE(f.automation.paste_calls == 0);
    REQUIRE(f.state.paste_failures.failures() == 1);
}

TEST_CASE("the circuit opens at the failure ceiling", "[paste]")
{
    Fixture f;
    f.automation.paste_ok = false;

    for (uint32_t i = 0; i < PasteFailureCounter::DEFAULT_CEILING; ++i)
        REQUIRE(kind_of_failure(f.paste, 0x77) == ErrorKind::Backend);

    REQUIRE(f.state.paste_failures.is_open());
    int calls_before = f.automation.os_calls();

    REQUIRE(kind_of_failure(f.paste, 0x77) == ErrorKind::CircuitOpen);
    REQUIRE(f.automation.os_calls() == calls_before);
    REQUIRE(f.state.paste_failures.failures() == PasteFailureCounter::DEFAULT_CEILING);
}

TEST_CASE("a success resets the failure count", "[paste]")
{
    Fixture f;
    f.automation.paste_ok = false;
    for (int i = 0; i < 3; ++i)
        REQUIRE(kind_of_failure(f.paste, 0x77) == ErrorKind::Backend);
    REQUIRE(f.state.paste_failures.failures() == 3);

    f.automation.paste_ok = true;
    f.paste.auto_paste_flow(0x77);
    REQUIRE(f.state.paste_failures.failures() == 0);
    REQUIRE_FALSE(f.state.paste_failures.is_open());
}

TEST_CASE("a smaller ceiling opens sooner", "[paste]")
{
    test::DispatcherThread ui;
    test::FakeClipboard clipboard;
    test::FakeAutomation automation{ clipboard };
    SharedState state(2);
    AutoPaste paste{ automation, clipboard, ui.get(), state.ghost, state.paste_failures, 1ms };
    automation.restore_ok = false;

    REQUIRE(kind_of_failure(paste, 1) == ErrorKind::Backend);
    REQUIRE(kind_of_failure(paste, 1) == ErrorKind::Backend);
    REQUIRE(kind_of_failure(paste, 1) == ErrorKind::CircuitOpen);
}

TEST_CASE("publish writes the clipboard as a ghost write", "[paste]")
{
    Fixture f;
    REQUIRE(f.paste.publish("result"));
    REQUIRE(f.state.ghost.armed());
    REQUIRE(f.clipboard.text() == "result");
    REQUIRE(f.automation.os_calls() == 0);
}
