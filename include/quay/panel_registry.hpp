#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <quay/dock_state.hpp>
#include <quay/panel.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace quay
{

class DockArea;

/**
 * PanelRegistry: process-wide map from panel_name to a factory that rebuilds
 * a live panel from its saved state.
 *
 * Filled once at startup and read during DockArea::load. All public methods
 * lock an internal mutex; factories run without the lock held.
 */
class PanelRegistry
{
   public:
    using Factory = std::function<PanelView(std::weak_ptr<DockArea> dock_area,
                                            const DockItemState&    state,
                                            const DockItemInfo&     info)>;

    static PanelRegistry& instance();

    // Re-registering a name replaces the previous factory.
    void register_panel(const std::string& name, Factory factory);
    bool unregister_panel(const std::string& name);

    bool                     contains(const std::string& name) const;
    size_t                   count() const;
    std::vector<std::string> names() const;   // registration order
    void                     clear();

    // Never returns an empty view: a missing name, a factory that throws or
    // one that returns nothing all yield an InvalidPanel.
    PanelView build(std::weak_ptr<DockArea> dock_area, const DockItemState& state) const;

   private:
    PanelRegistry()                                = default;
    PanelRegistry(const PanelRegistry&)            = delete;
    PanelRegistry& operator=(const PanelRegistry&) = delete;

    mutable std::mutex                       mutex_;
    std::unordered_map<std::string, Factory> factories_;
    std::vector<std::string>                 order_;
};

inline void register_panel(const std::string& name, PanelRegistry::Factory factory)
{
    PanelRegistry::instance().register_panel(name, std::move(factory));
}

}   // namespace quay
