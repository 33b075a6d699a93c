#pragma once

#include "lpal/core/types.hpp"

namespace lpal {

class WindowServer;

/// One retain on construction, one release on destruction. Copies retain again.
class WindowHandle
{
public:
    /// @throws Error(HandleInvalid) if window is NULL_WINDOW.
    WindowHandle(WindowServer& server, NativeWindow window);
    ~WindowHandle();

    WindowHandle(WindowHandle const& other);
    WindowHandle& operator=(WindowHandle const&) = delete;

    NativeWindow id() const { return window_; }
    WindowServer& server() const { return server_; }

private:
    WindowServer& server_;
    NativeWindow window_;
};

} // namespace lpal
