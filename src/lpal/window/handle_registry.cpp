#include "lpal/window/handle_registry.hpp"
#include "lpal/core/log.hpp"

namespace lpal {

WindowHandleRegistry::WindowHandleRegistry(WindowServer& server)
    : server_(server)
{
}

std::shared_ptr<WindowHandle> WindowHandleRegistry::register_window(std::string const& name, NativeWindow window)
{
    auto handle = std::make_shared<WindowHandle>(server_, window);

    std::shared_ptr<WindowHandle> replaced;
    {
        std::lock_guard lock(mutex_);
        auto& slot = handles_[name];
        replaced = std::move(slot);
        slot = handle;
    }

    if (replaced)
    {
        LOG_DEBUG("Registry: replaced handle for '{}' ({:#x} -> {:#x})", name, replaced->id(), window);
    }
    else
    {
        LOG_DEBUG("Registry: registered handle for '{}' ({:#x})", name, window);
    }
    return handle;
}

std::shared_ptr<WindowHandle> WindowHandleRegistry::get(std::string const& name) const
{
    std::lock_guard lock(mutex_);
    auto it = handles_.find(name);
    if (it == handles_.end())
        return nullptr;
    return it->second;
}

std::optional<std::string> WindowHandleRegistry::name_of(NativeWindow window) const
{
    std::lock_guard lock(mutex_);
    for (auto const& [name, handle] : handles_)
    {
        if (handle->id() == window)
            return name;
    }
    return std::nullopt;
}

bool WindowHandleRegistry::remove(std::string const& name)
{
    std::shared_ptr<WindowHandle> removed;
    {
        std::lock_guard lock(mutex_);
        auto it = handles_.find(name);
        if (it == handles_.end())
            return false;
        removed = std::move(it->second);
        handles_.erase(it);
    }
    LOG_DEBUG("Registry: removed handle for '{}' ({:#x})", name, removed->id());
    return true;
}

size_t WindowHandleRegistry::size() const
{
    std::lock_guard lock(mutex_);
    return handles_.size();
}

} // namespace lpal
