#include "lpal/x11/x11_clipboard.hpp"
#include "lpal/core/error.hpp"
#include "lpal/core/log.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <poll.h>
#include <stdexcept>
#include <sys/eventfd.h>
#include <unistd.h>
#include <xcb/xfixes.h>

namespace lpal {

namespace {

// In 32-bit units; 4 MiB covers anything a palette is useful for.
constexpr uint32_t MAX_TRANSFER_LONGS = 1u << 20;

}

X11Clipboard::X11Clipboard()
{
    clipboard_ = conn_.intern_atom("CLIPBOARD");
    utf8_string_ = conn_.intern_atom("UTF8_STRING");
    targets_ = conn_.intern_atom("TARGETS");
    text_ = conn_.intern_atom("TEXT");
    for (size_t i = 0; i < transfer_properties_.size(); ++i)
        transfer_properties_[i] = conn_.intern_atom("LPAL_SELECTION_" + std::to_string(i));

    window_ = xcb_generate_id(conn_.get());
    uint32_t values[] = { XCB_EVENT_MASK_PROPERTY_CHANGE };
    xcb_create_window(
        conn_.get(),
        XCB_COPY_FROM_PARENT,
        window_,
        conn_.root(),
        -1,
        -1,
        1,
        1,
        0,
        XCB_WINDOW_CLASS_INPUT_ONLY,
        XCB_COPY_FROM_PARENT,
        XCB_CW_EVENT_MASK,
        values
    );

    if (conn_.has_xfixes())
    {
        xcb_xfixes_select_selection_input(
            conn_.get(),
            window_,
            clipboard_,
            XCB_XFIXES_SELECTION_EVENT_MASK_SET_SELECTION_OWNER | XCB_XFIXES_SELECTION_EVENT_MASK_SELECTION_WINDOW_DESTROY
                | XCB_XFIXES_SELECTION_EVENT_MASK_SELECTION_CLIENT_CLOSE
        );
    }
    else
    {
        LOG_WARN("X11Clipboard: XFIXES unavailable, clipboard changes by other clients are not counted");
    }
    conn_.flush();

    stop_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (stop_fd_ < 0)
        throw std::runtime_error(std::string("eventfd failed: ") + std::strerror(errno));

    thread_ = std::thread([this]() { run(); });
}

X11Clipboard::~X11Clipboard()
{
    uint64_t one = 1;
    if (write(stop_fd_, &one, sizeof(one)) < 0)
        LOG_WARN("X11Clipboard: failed to signal event thread: {}", std::strerror(errno));
    if (thread_.joinable())
        thread_.join();
    close(stop_fd_);

    xcb_destroy_window(conn_.get(), window_);
    conn_.flush();
}

// ─────────────────────────────────────────────────────────────────────────────
// Reading
// ─────────────────────────────────────────────────────────────────────────────

xcb_window_t X11Clipboard::selection_owner(xcb_atom_t selection) const
{
    auto* reply = xcb_get_selection_owner_reply(conn_.get(), xcb_get_selection_owner(conn_.get(), selection), nullptr);
    if (!reply)
        return XCB_NONE;
    xcb_window_t owner = reply->owner;
    free(reply);
    return owner;
}

std::optional<std::string> X11Clipboard::read_text()
{
    {
        std::lock_guard lock(mutex_);
        if (owned_text_)
            return owned_text_;
    }
    return read_selection(clipboard_);
}

std::optional<std::string> X11Clipboard::read_primary_owned_by(xcb_window_t owner)
{
    if (owner == XCB_NONE || selection_owner(XCB_ATOM_PRIMARY) != owner)
        return std::nullopt;
    return read_selection(XCB_ATOM_PRIMARY);
}

std::optional<std::string> X11Clipboard::read_selection(xcb_atom_t selection)
{
    std::lock_guard serial(read_mutex_);

    if (selection_owner(selection) == XCB_NONE)
        return std::nullopt;

    // A late reply to an earlier read of the same selection names a different property.
    xcb_atom_t property = transfer_properties_[next_property_++ % transfer_properties_.size()];
    {
        std::lock_guard lock(mutex_);
        pending_ = PendingRead{};
        pending_.active = true;
        pending_.selection = selection;
        pending_.target = utf8_string_;
        pending_.property = property;
    }

    xcb_convert_selection(conn_.get(), window_, selection, utf8_string_, property, XCB_CURRENT_TIME);
    conn_.flush();

    std::unique_lock lock(mutex_);
    bool completed = cv_.wait_for(lock, READ_TIMEOUT, [this]() { return pending_.done; });
    pending_.active = false;
    if (!completed)
        throw Error(ErrorKind::Backend, "selection conversion timed out");
    if (!pending_.ok)
        return std::nullopt;
    return std::move(pending_.data);
}

// ─────────────────────────────────────────────────────────────────────────────
// Writing
// ─────────────────────────────────────────────────────────────────────────────

bool X11Clipboard::write_text(std::string const& text)
{
    {
        std::lock_guard lock(mutex_);
        owned_text_ = text;
    }

    xcb_set_selection_owner(conn_.get(), window_, clipboard_, XCB_CURRENT_TIME);
    conn_.flush();

    if (selection_owner(clipboard_) != window_)
    {
        std::lock_guard lock(mutex_);
        owned_text_.reset();
        LOG_WARN("X11Clipboard: failed to take CLIPBOARD ownership");
        return false;
    }

    if (!conn_.has_xfixes())
        ++change_count_;
    LOG_DEBUG("X11Clipboard: wrote {} bytes", text.size());
    return true;
}

// ─────────────────────────────────────────────────────────────────────────────
// Event thread
// ─────────────────────────────────────────────────────────────────────────────

void X11Clipboard::run()
{
    pollfd fds[2] = {};
    fds[0].fd = xcb_get_file_descriptor(conn_.get());
    fds[0].events = POLLIN;
    fds[1].fd = stop_fd_;
    fds[1].events = POLLIN;

    while (true)
    {
        if (poll(fds, 2, -1) < 0)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("X11Clipboard: poll failed: {}", std::strerror(errno));
            break;
        }

        if (fds[1].revents & POLLIN)
            break;

        while (auto event = xcb_poll_for_event(conn_.get()))
        {
            std::unique_ptr<xcb_generic_event_t, decltype(&free)> eventPtr(event, free);
            handle_event(*eventPtr);
        }

        if (xcb_connection_has_error(conn_.get()))
        {
            LOG_ERROR("X11Clipboard: connection lost");
            break;
        }
    }
}

void X11Clipboard::handle_event(xcb_generic_event_t const& event)
{
    uint8_t type = event.response_type & ~0x80;

    if (conn_.has_xfixes() && type == conn_.xfixes_event_base() + XCB_XFIXES_SELECTION_NOTIFY)
    {
        auto const& ev = reinterpret_cast<xcb_xfixes_selection_notify_event_t const&>(event);
        if (ev.selection == clipboard_)
        {
            uint64_t count = ++change_count_;
            LOG_TRACE("X11Clipboard: CLIPBOARD owner now {:#x} (change {})", ev.owner, count);
        }
        return;
    }

    switch (type)
    {
        case XCB_SELECTION_REQUEST:
            handle_selection_request(reinterpret_cast<xcb_selection_request_event_t const&>(event));
            break;
        case XCB_SELECTION_NOTIFY:
            handle_selection_notify(reinterpret_cast<xcb_selection_notify_event_t const&>(event));
            break;
        case XCB_SELECTION_CLEAR:
            handle_selection_clear(reinterpret_cast<xcb_selection_clear_event_t const&>(event));
            break;
        default:
            break;
    }
}

void X11Clipboard::handle_selection_request(xcb_selection_request_event_t const& ev)
{
    xcb_selection_notify_event_t reply;
    std::memset(&reply, 0, sizeof(reply));
    reply.response_type = XCB_SELECTION_NOTIFY;
    reply.time = ev.time;
    reply.requestor = ev.requestor;
    reply.selection = ev.selection;
    reply.target = ev.target;
    reply.property = XCB_NONE;

    // Obsolete clients leave the property unset and expect the target name.
    xcb_atom_t property = ev.property == XCB_NONE ? ev.target : ev.property;

    std::optional<std::string> text;
    {
        std::lock_guard lock(mutex_);
        text = owned_text_;
    }

    if (text && ev.selection == clipboard_)
    {
        if (ev.target == targets_)
        {
            xcb_atom_t supported[] = { targets_, utf8_string_, XCB_ATOM_STRING, text_ };
            xcb_change_property(
                conn_.get(),
                XCB_PROP_MODE_REPLACE,
                ev.requestor,
                property,
                XCB_ATOM_ATOM,
                32,
                sizeof(supported) / sizeof(supported[0]),
                supported
            );
            reply.property = property;
        }
        else if (ev.target == utf8_string_ || ev.target == XCB_ATOM_STRING || ev.target == text_)
        {
            xcb_atom_t type = ev.target == XCB_ATOM_STRING ? XCB_ATOM_STRING : utf8_string_;
            xcb_change_property(
                conn_.get(),
                XCB_PROP_MODE_REPLACE,
                ev.requestor,
                property,
                type,
                8,
                static_cast<uint32_t>(text->size()),
                text->data()
            );
            reply.property = property;
        }
    }

    xcb_send_event(conn_.get(), 0, ev.requestor, XCB_EVENT_MASK_NO_EVENT, reinterpret_cast<char const*>(&reply));
    conn_.flush();
}

void X11Clipboard::handle_selection_notify(xcb_selection_notify_event_t const& ev)
{
    bool expected = false;
    {
        std::lock_guard lock(mutex_);
        expected = pending_.active && !pending_.done && ev.requestor == window_ && ev.selection == pending_.selection
            && ev.target == pending_.target && (ev.property == XCB_NONE || ev.property == pending_.property);
    }

    if (!expected)
    {
        LOG_DEBUG("X11Clipboard: dropping stale SelectionNotify (selection={} property={})", ev.selection, ev.property);
        if (ev.property != XCB_NONE && ev.requestor == window_)
        {
            xcb_delete_property(conn_.get(), window_, ev.property);
            conn_.flush();
        }
        return;
    }

    PendingRead result;
    result.done = true;

    if (ev.property != XCB_NONE)
    {
        auto cookie = xcb_get_property(conn_.get(), 1, window_, ev.property, XCB_GET_PROPERTY_TYPE_ANY, 0, MAX_TRANSFER_LONGS);
        auto* reply = xcb_get_property_reply(conn_.get(), cookie, nullptr);
        if (reply)
        {
            int len = xcb_get_property_value_length(reply);
            auto const* data = static_cast<char const*>(xcb_get_property_value(reply));
            result.ok = reply->format == 8;
            if (result.ok)
                result.data.assign(data, static_cast<size_t>(len));
            if (reply->bytes_after > 0)
                LOG_WARN("X11Clipboard: selection truncated, {} bytes not read", reply->bytes_after);
            free(reply);
        }
    }

    {
        std::lock_guard lock(mutex_);
        // The reader may have timed out while the property was fetched.
        if (!pending_.active || pending_.done || pending_.selection != ev.selection)
            return;
        if (ev.property != XCB_NONE && ev.property != pending_.property)
            return;
        result.active = true;
        result.selection = pending_.selection;
        result.target = pending_.target;
        result.property = pending_.property;
        pending_ = std::move(result);
    }
    cv_.notify_all();
}

void X11Clipboard::handle_selection_clear(xcb_selection_clear_event_t const& ev)
{
    if (ev.selection != clipboard_)
        return;
    std::lock_guard lock(mutex_);
    owned_text_.reset();
    LOG_DEBUG("X11Clipboard: lost CLIPBOARD ownership");
}

} // namespace lpal
