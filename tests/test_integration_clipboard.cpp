#include "lpal/core/error.hpp"
#include "lpal/x11/x11_clipboard.hpp"
#include "x11_test_harness.hpp"
#include <catch2/catch_test_macros.hpp>
#include <future>
#include <memory>
#include <thread>

using namespace lpal;

namespace {

bool ensure_x11_environment()
{
    auto& env = lpal::test::X11TestEnvironment::instance();
    if (!env.available())
    {
        WARN("X11 not available; set LPAL_TEST_ALLOW_EXISTING_DISPLAY=1 to use an existing DISPLAY.");
        return false;
    }
    return true;
}

std::optional<xcb_selection_request_event_t>
wait_for_selection_request(test::X11Connection& conn, xcb_atom_t selection, std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        while (auto* event = xcb_poll_for_event(conn.get()))
        {
            std::unique_ptr<xcb_generic_event_t, decltype(&free)> guard(event, free);
            if ((event->response_type & ~0x80) != XCB_SELECTION_REQUEST)
                continue;
            auto const& request = *reinterpret_cast<xcb_selection_request_event_t const*>(event);
            if (request.selection == selection)
                return request;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return std::nullopt;
}

void answer_selection_request(test::X11Connection& conn, xcb_selection_request_event_t const& request, std::string const& text)
{
    xcb_change_property(
        conn.get(),
        XCB_PROP_MODE_REPLACE,
        request.requestor,
        request.property,
        request.target,
        8,
        static_cast<uint32_t>(text.size()),
        text.data()
    );

    xcb_selection_notify_event_t notify = {};
    notify.response_type = XCB_SELECTION_NOTIFY;
    notify.time = request.time;
    notify.requestor = request.requestor;
    notify.selection = request.selection;
    notify.target = request.target;
    notify.property = request.property;
    xcb_send_event(conn.get(), 0, request.requestor, XCB_EVENT_MASK_NO_EVENT, reinterpret_cast<char const*>(&notify));
    xcb_flush(conn.get());
}

void own_selection(test::X11Connection& conn, xcb_window_t window, xcb_atom_t selection)
{
    xcb_set_selection_owner(conn.get(), window, selection, XCB_CURRENT_TIME);
    auto* reply = xcb_get_selection_owner_reply(conn.get(), xcb_get_selection_owner(conn.get(), selection), nullptr);
    free(reply);
}

} // namespace

TEST_CASE("Integration: clipboard text crosses connections", "[integration][clipboard]")
{
    if (!ensure_x11_environment())
        return;

    X11Clipboard writer;
    X11Clipboard reader;

    REQUIRE(writer.write_text("hello from lpal"));
    REQUIRE(writer.read_text() == "hello from lpal");
    REQUIRE(reader.read_text() == "hello from lpal");

    REQUIRE(reader.write_text("and back"));
    REQUIRE(test::wait_for_condition(
        [&]() { return writer.read_text() == "and back"; },
        std::chrono::milliseconds(1000)
    ));
}

TEST_CASE("Integration: clipboard changes are counted", "[integration][clipboard]")
{
    if (!ensure_x11_environment())
        return;

    X11Clipboard watcher;
    X11Clipboard writer;
    if (!watcher.has_xfixes())
    {
        WARN("XFIXES not available; skipping change count test.");
        return;
    }

    uint64_t before = watcher.change_count();
    REQUIRE(writer.write_text("first"));
    REQUIRE(test::wait_for_condition(
        [&]() { return watcher.change_count() > before; },
        std::chrono::milliseconds(1000)
    ));

    uint64_t after_first = watcher.change_count();
    REQUIRE(writer.write_text("second"));
    REQUIRE(test::wait_for_condition(
        [&]() { return watcher.change_count() > after_first; },
        std::chrono::milliseconds(1000)
    ));
}

TEST_CASE("Integration: PRIMARY is only read from its owner", "[integration][clipboard]")
{
    if (!ensure_x11_environment())
        return;

    X11Clipboard clipboard;
    test::X11Connection other;
    REQUIRE(other.ok());

    xcb_window_t window = test::create_window(other, 0, 0, 10, 10);
    xcb_flush(other.get());

    REQUIRE_FALSE(clipboard.read_primary_owned_by(XCB_NONE));
    REQUIRE_FALSE(clipboard.read_primary_owned_by(window));

    test::destroy_window(other, window);
}

TEST_CASE("Integration: a late PRIMARY reply is not taken as CLIPBOARD content", "[integration][clipboard]")
{
    if (!ensure_x11_environment())
        return;

    test::X11Connection owner;
    REQUIRE(owner.ok());
    xcb_window_t window = test::create_window(owner, 0, 0, 10, 10);
    xcb_atom_t clipboard_atom = test::intern_atom(owner.get(), "CLIPBOARD");
    own_selection(owner, window, XCB_ATOM_PRIMARY);
    own_selection(owner, window, clipboard_atom);

    X11Clipboard reader;

    // The owner sits on the PRIMARY request until the reader has given up.
    REQUIRE_THROWS_AS(reader.read_primary_owned_by(window), Error);
    auto primary_request = wait_for_selection_request(owner, XCB_ATOM_PRIMARY, std::chrono::milliseconds(1000));
    REQUIRE(primary_request);

    auto clipboard_read = std::async(std::launch::async, [&]() { return reader.read_text(); });
    auto clipboard_request = wait_for_selection_request(owner, clipboard_atom, std::chrono::milliseconds(1000));
    REQUIRE(clipboard_request);

    answer_selection_request(owner, *primary_request, "stale primary");
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    answer_selection_request(owner, *clipboard_request, "fresh clipboard");

    REQUIRE(clipboard_read.wait_for(std::chrono::milliseconds(2000)) == std::future_status::ready);
    REQUIRE(clipboard_read.get() == std::optional<std::string>("fresh clipboard"));

    test::destroy_window(owner, window);
}
