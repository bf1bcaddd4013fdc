#pragma once

#include <functional>
#include <memory>
#include <quay/dock_state.hpp>
#include <quay/geometry.hpp>
#include <quay/panel_id.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace quay
{

// Context menu contributed by a panel; the host renders it.
class PopupMenu
{
   public:
    struct Item
    {
        std::string           label;
        std::function<void()> action;
        bool                  enabled   = true;
        bool                  separator = false;
    };

    PopupMenu& item(std::string label, std::function<void()> action, bool enabled = true)
    {
        items_.push_back({std::move(label), std::move(action), enabled, false});
        return *this;
    }

    PopupMenu& separator()
    {
        if (!items_.empty() && !items_.back().separator)
            items_.push_back({.separator = true});
        return *this;
    }

    const std::vector<Item>& items() const { return items_; }
    bool                     empty() const { return items_.empty(); }

    // Runs the action of the first enabled item with this label.
    bool trigger(std::string_view label) const
    {
        for (const auto& it : items_)
        {
            if (!it.separator && it.enabled && it.label == label && it.action)
            {
                it.action();
                return true;
            }
        }
        return false;
    }

   private:
    std::vector<Item> items_;
};

struct ToolbarButton
{
    std::string           id;
    std::string           label;
    std::string           tooltip;
    std::function<void()> on_click;
};

/**
 * Panel: a rectangular piece of content hosted by the dock.
 *
 * Content panels override panel_name() (the registry key used when a layout
 * is reloaded) and dump(). TabPanel and StackPanel are Panels too, which is
 * how they nest inside each other.
 */
class Panel : public std::enable_shared_from_this<Panel>
{
   public:
    Panel() : id_(PanelId::generate()), focus_(next_focus_handle()) {}
    virtual ~Panel() = default;

    Panel(const Panel&)            = delete;
    Panel& operator=(const Panel&) = delete;

    virtual std::string panel_name() const = 0;
    virtual std::string title() const { return "Unnamed"; }
    virtual bool        closeable() const { return true; }
    virtual bool        zoomable() const { return true; }
    virtual bool        collapsible() const { return false; }

    virtual void                       popup_menu(PopupMenu& /*menu*/) {}
    virtual std::vector<ToolbarButton> toolbar_buttons() { return {}; }

    // Default snapshot carries the name and a null state.
    virtual DockItemState dump() const { return DockItemState::panel(panel_name()); }

    virtual void layout(const Rect& bounds) { bounds_ = bounds; }
    virtual void draw(const Rect& /*bounds*/) {}

    const PanelId& panel_id() const { return id_; }
    FocusHandle    focus_handle() const { return focus_; }
    const Rect&    bounds() const { return bounds_; }

   protected:
    Rect bounds_;

   private:
    PanelId     id_;
    FocusHandle focus_;
};

/**
 * PanelView: shared handle to a Panel with identity equality.
 *
 * Containers store PanelViews; two views compare equal only when they point
 * at the same Panel object.
 */
class PanelView
{
   public:
    PanelView() = default;
    PanelView(std::shared_ptr<Panel> panel) : panel_(std::move(panel)) {}

    template <typename P>
    PanelView(std::shared_ptr<P> panel) : panel_(std::static_pointer_cast<Panel>(std::move(panel)))
    {
    }

    explicit operator bool() const { return panel_ != nullptr; }

    std::string panel_name() const { return panel_ ? panel_->panel_name() : std::string(); }
    std::string title() const { return panel_ ? panel_->title() : std::string(); }
    bool        closeable() const { return panel_ && panel_->closeable(); }
    bool        zoomable() const { return panel_ && panel_->zoomable(); }
    bool        collapsible() const { return panel_ && panel_->collapsible(); }
    PanelId     panel_id() const { return panel_ ? panel_->panel_id() : PanelId{}; }
    FocusHandle focus_handle() const { return panel_ ? panel_->focus_handle() : 0; }

    void popup_menu(PopupMenu& menu) const
    {
        if (panel_)
            panel_->popup_menu(menu);
    }

    std::vector<ToolbarButton> toolbar_buttons() const
    {
        return panel_ ? panel_->toolbar_buttons() : std::vector<ToolbarButton>{};
    }

    DockItemState dump() const { return panel_ ? panel_->dump() : DockItemState::tabs({}); }

    void layout(const Rect& bounds) const
    {
        if (panel_)
            panel_->layout(bounds);
    }

    void draw(const Rect& bounds) const
    {
        if (panel_)
            panel_->draw(bounds);
    }

    const std::shared_ptr<Panel>& view() const { return panel_; }
    Panel*                        get() const { return panel_.get(); }
    std::weak_ptr<Panel>          downgrade() const { return panel_; }

    // nullptr when the panel is not a P.
    template <typename P>
    std::shared_ptr<P> downcast() const
    {
        return std::dynamic_pointer_cast<P>(panel_);
    }

    bool operator==(const PanelView& other) const { return panel_ == other.panel_; }
    bool operator==(const Panel* other) const { return panel_.get() == other; }

   private:
    std::shared_ptr<Panel> panel_;
};

}   // namespace quay
