#include "connection.hpp"
#include <cstdlib>
#include <stdexcept>
#include <xcb/xfixes.h>
#include <xcb/xtest.h>

namespace lpal {

Connection::Connection()
    : conn_(xcb_connect(nullptr, nullptr), xcb_disconnect)
    , screen_(nullptr)
    , keysyms_(nullptr, xcb_key_symbols_free)
{
    if (xcb_connection_has_error(conn_.get()))
    {
        throw std::runtime_error("Failed to connect to X server");
    }

    screen_ = xcb_setup_roots_iterator(xcb_get_setup(conn_.get())).data;
    if (!screen_)
    {
        throw std::runtime_error("Failed to get screen");
    }

    keysyms_.reset(xcb_key_symbols_alloc(conn_.get()));
    if (!keysyms_)
    {
        throw std::runtime_error("Failed to allocate key symbols");
    }

    init_randr();
    init_xtest();
    init_xfixes();
}

xcb_atom_t Connection::intern_atom(std::string const& name) const
{
    auto cookie = xcb_intern_atom(conn_.get(), 0, static_cast<uint16_t>(name.size()), name.c_str());
    auto* reply = xcb_intern_atom_reply(conn_.get(), cookie, nullptr);
    if (!reply)
        return XCB_NONE;
    xcb_atom_t atom = reply->atom;
    free(reply);
    return atom;
}

void Connection::init_randr()
{
    auto cookie = xcb_randr_query_version(conn_.get(), XCB_RANDR_MAJOR_VERSION, XCB_RANDR_MINOR_VERSION);
    auto* reply = xcb_randr_query_version_reply(conn_.get(), cookie, nullptr);
    if (!reply)
        return;

    free(reply);
    randr_available_ = true;
}

void Connection::init_xtest()
{
    auto const* ext = xcb_get_extension_data(conn_.get(), &xcb_test_id);
    if (!ext || !ext->present)
        return;

    auto cookie = xcb_test_get_version(conn_.get(), XCB_TEST_MAJOR_VERSION, XCB_TEST_MINOR_VERSION);
    auto* reply = xcb_test_get_version_reply(conn_.get(), cookie, nullptr);
    if (!reply)
        return;

    free(reply);
    xtest_available_ = true;
}

void Connection::init_xfixes()
{
    auto const* ext = xcb_get_extension_data(conn_.get(), &xcb_xfixes_id);
    if (!ext || !ext->present)
        return;

    // The version handshake is mandatory before any other XFIXES request.
    auto cookie = xcb_xfixes_query_version(conn_.get(), XCB_XFIXES_MAJOR_VERSION, XCB_XFIXES_MINOR_VERSION);
    auto* reply = xcb_xfixes_query_version_reply(conn_.get(), cookie, nullptr);
    if (!reply)
        return;

    free(reply);
    xfixes_event_base_ = ext->first_event;
    xfixes_available_ = true;
}

} // namespace lpal
