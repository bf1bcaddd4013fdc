#include <algorithm>
#include <quay/invalid_panel.hpp>
#include <quay/logger.hpp>
#include <quay/panel_registry.hpp>

namespace quay
{

PanelRegistry& PanelRegistry::instance()
{
    static PanelRegistry registry;
    return registry;
}

void PanelRegistry::register_panel(const std::string& name, Factory factory)
{
    std::lock_guard lock(mutex_);
    auto [it, inserted] = factories_.insert_or_assign(name, std::move(factory));
    if (inserted)
        order_.push_back(name);
    else
        QUAY_LOG_DEBUG("dock.registry", "factory for '{}' replaced", name);
}

bool PanelRegistry::unregister_panel(const std::string& name)
{
    std::lock_guard lock(mutex_);
    if (factories_.erase(name) == 0)
        return false;
    order_.erase(std::remove(order_.begin(), order_.end(), name), order_.end());
    return true;
}

bool PanelRegistry::contains(const std::string& name) const
{
    std::lock_guard lock(mutex_);
    return factories_.count(name) > 0;
}

size_t PanelRegistry::count() const
{
    std::lock_guard lock(mutex_);
    return factories_.size();
}

std::vector<std::string> PanelRegistry::names() const
{
    std::lock_guard lock(mutex_);
    return order_;
}

void PanelRegistry::clear()
{
    std::lock_guard lock(mutex_);
    factories_.clear();
    order_.clear();
}

PanelView PanelRegistry::build(std::weak_ptr<DockArea> dock_area, const DockItemState& state) const
{
    Factory factory;
    {
        std::lock_guard lock(mutex_);
        auto            it = factories_.find(state.panel_name);
        if (it != factories_.end())
            factory = it->second;
    }

    if (!factory)
    {
        QUAY_LOG_WARN("dock.registry", "panel '{}' is not registered", state.panel_name);
        return PanelView(std::make_shared<InvalidPanel>(state.panel_name, state.info));
    }

    try
    {
        PanelView view = factory(std::move(dock_area), state, state.info);
        if (view)
            return view;
        QUAY_LOG_WARN("dock.registry", "factory for '{}' returned no panel", state.panel_name);
    }
    catch (const std::exception& e)
    {
        QUAY_LOG_ERROR("dock.registry", "factory for '{}' failed: {}", state.panel_name, e.what());
    }
    return PanelView(std::make_shared<InvalidPanel>(state.panel_name, state.info));
}

// ─── InvalidPanel ───────────────────────────────────────────────────────────

DockItemState InvalidPanel::dump() const
{
    DockItemState state = DockItemState::panel(missing_name_);
    state.info          = info_;
    return state;
}

std::string InvalidPanel::message() const
{
    return "The `" + missing_name_ + "` panel type is not registered in PanelRegistry.";
}

}   // namespace quay
