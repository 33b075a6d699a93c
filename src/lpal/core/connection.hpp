#pragma once

#include <memory>
#include <string>
#include <xcb/randr.h>
#include <xcb/xcb.h>
#include <xcb/xcb_keysyms.h>

namespace lpal {

class Connection
{
public:
    Connection();
    ~Connection() = default;

    Connection(Connection const&) = delete;
    Connection& operator=(Connection const&) = delete;
    Connection(Connection&&) = default;
    Connection& operator=(Connection&&) = default;

    xcb_connection_t* get() const { return conn_.get(); }
    xcb_screen_t* screen() const { return screen_; }
    xcb_window_t root() const { return screen_->root; }
    xcb_key_symbols_t* keysyms() const { return keysyms_.get(); }

    bool has_randr() const { return randr_available_; }
    bool has_xtest() const { return xtest_available_; }
    bool has_xfixes() const { return xfixes_available_; }
    uint8_t xfixes_event_base() const { return xfixes_event_base_; }

    xcb_atom_t intern_atom(std::string const& name) const;

    void flush() { xcb_flush(conn_.get()); }

private:
    std::unique_ptr<xcb_connection_t, decltype(&xcb_disconnect)> conn_;
    xcb_screen_t* screen_;
    std::unique_ptr<xcb_key_symbols_t, decltype(&xcb_key_symbols_free)> keysyms_;

    bool randr_available_ = false;
    bool xtest_available_ = false;
    bool xfixes_available_ = false;
    uint8_t xfixes_event_base_ = 0;

    void init_randr();
    void init_xtest();
    void init_xfixes();
};

} // namespace lpal
