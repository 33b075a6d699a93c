#pragma once

#include "lpal/core/types.hpp"
#include "lpal/window/window_handle.hpp"
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace lpal {

// At most one live handle per name. A replaced handle is released by its
// last shared owner, never under the registry lock.
class WindowHandleRegistry
{
public:
    explicit WindowHandleRegistry(WindowServer& server);

    WindowHandleRegistry(WindowHandleRegistry const&) = delete;
    WindowHandleRegistry& operator=(WindowHandleRegistry const&) = delete;

    /// @throws Error(HandleInvalid) if window is NULL_WINDOW.
    std::shared_ptr<WindowHandle> register_window(std::string const& name, NativeWindow window);

    std::shared_ptr<WindowHandle> get(std::string const& name) const;

    std::optional<std::string> name_of(NativeWindow window) const;

    bool remove(std::string const& name);

    size_t size() const;

private:
    WindowServer& server_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<WindowHandle>> handles_;
};

} // namespace lpal
