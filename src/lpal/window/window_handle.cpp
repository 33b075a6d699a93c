#include "lpal/window/window_handle.hpp"
#include "lpal/core/error.hpp"
#include "lpal/core/log.hpp"
#include "lpal/window/window_server.hpp"

namespace lpal {

WindowHandle::WindowHandle(WindowServer& server, NativeWindow window)
    : server_(server)
    , window_(window)
{
    if (window_ == NULL_WINDOW)
    {
        throw Error(ErrorKind::HandleInvalid, "cannot wrap a null window");
    }
    server_.retain(window_);
    LOG_TRACE("WindowHandle: retained {:#x}", window_);
}

WindowHandle::WindowHandle(WindowHandle const& other)
    : server_(other.server_)
    , window_(other.window_)
{
    server_.retain(window_);
    LOG_TRACE("WindowHandle: retained copy of {:#x}", window_);
}

WindowHandle::~WindowHandle()
{
    server_.release(window_);
    LOG_TRACE("WindowHandle: released {:#x}", window_);
}

} // namespace lpal
