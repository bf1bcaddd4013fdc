#include <algorithm>
#include <quay/dock.hpp>
#include <quay/dock_area.hpp>
#include <quay/logger.hpp>
#include <quay/resizable_panel_group.hpp>
#include <quay/stack_panel.hpp>
#include <quay/tab_panel.hpp>

namespace quay
{

Dock::Dock(DockPlacement placement, std::weak_ptr<DockArea> dock_area)
    : placement_(placement), dock_area_(std::move(dock_area))
{
    panel_ = StackPanel::create(axis(), dock_area_);
}

Axis Dock::axis() const
{
    return placement_ == DockPlacement::Bottom ? Axis::Horizontal : Axis::Vertical;
}

void Dock::set_size(float size)
{
    float clamped = std::max(size, ResizablePanelGroup::PANEL_MIN_SIZE);
    if (clamped == size_)
        return;
    size_ = clamped;
    if (auto area = dock_area_.lock())
        area->notify_layout_changed();
}

void Dock::set_open(bool open)
{
    if (!open && !collapsible_)
        return;
    if (open_ != open)
    {
        open_ = open;
        if (auto area = dock_area_.lock())
            area->notify_layout_changed();
    }
    apply_collapsed();
}

void Dock::set_collapsible(bool collapsible)
{
    collapsible_ = collapsible;
    if (!collapsible)
        set_open(true);
}

void Dock::set_panel(PanelView item)
{
    if (auto stack = item.downcast<StackPanel>())
    {
        stack->set_parent({});
        stack->set_dock_area(dock_area_);
        panel_ = std::move(stack);
    }
    else
    {
        panel_ = StackPanel::create(axis(), dock_area_);
        if (item)
        {
            auto tabs = item.downcast<TabPanel>();
            if (!tabs)
            {
                tabs = TabPanel::create(dock_area_);
                tabs->add_panel(std::move(item));
            }
            panel_->add_panel(PanelView(tabs));
        }
    }
    apply_collapsed();
}

void Dock::add_panel(PanelView panel)
{
    if (auto tabs = panel_->left_top_tab_panel())
    {
        tabs->add_panel(std::move(panel));
    }
    else
    {
        auto new_tabs = TabPanel::create(dock_area_);
        new_tabs->add_panel(std::move(panel));
        panel_->add_panel(PanelView(new_tabs));
    }
    apply_collapsed();
}

float Dock::extent() const
{
    if (open_)
        return size_;
    return placement_ == DockPlacement::Bottom ? COLLAPSED_BOTTOM_SIZE : 0.0f;
}

void Dock::layout(const Rect& bounds)
{
    bounds_ = bounds;
    panel_->layout(bounds);
}

void Dock::draw() const
{
    if (extent() > 0.0f)
        panel_->draw(bounds_);
}

Rect Dock::handle_rect() const
{
    const float h = HANDLE_SIZE * 0.5f;
    switch (placement_)
    {
        case DockPlacement::Left:
            return {bounds_.right() - h, bounds_.y, HANDLE_SIZE, bounds_.h};
        case DockPlacement::Right:
            return {bounds_.x - h, bounds_.y, HANDLE_SIZE, bounds_.h};
        case DockPlacement::Bottom:
            return {bounds_.x, bounds_.y - h, bounds_.w, HANDLE_SIZE};
        case DockPlacement::Center:
            break;
    }
    return {};
}

bool Dock::resize(float mouse_x, float mouse_y, const Rect& area, float left_extent, float right_extent)
{
    const float min_size = ResizablePanelGroup::PANEL_MIN_SIZE;
    float       wanted   = size_;
    float       max_size = min_size;

    switch (placement_)
    {
        case DockPlacement::Left:
            wanted   = mouse_x - area.x;
            max_size = area.w - min_size - right_extent;
            break;
        case DockPlacement::Right:
            wanted   = area.right() - mouse_x;
            max_size = area.w - min_size - left_extent;
            break;
        case DockPlacement::Bottom:
            wanted   = area.bottom() - mouse_y;
            max_size = area.h - min_size;
            break;
        case DockPlacement::Center:
            return false;
    }

    float next = std::clamp(wanted, min_size, std::max(max_size, min_size));
    if (next == size_)
        return false;
    set_size(next);
    return true;
}

DockState Dock::dump() const
{
    return DockState{.placement = placement_, .size = size_, .open = open_, .panel = panel_->dump()};
}

// Closed docks collapse their tab panels so only the tab strips remain.
void Dock::apply_collapsed()
{
    std::function<void(const std::shared_ptr<StackPanel>&)> walk =
        [&](const std::shared_ptr<StackPanel>& stack)
    {
        for (const auto& p : stack->panels())
        {
            if (auto tabs = p.downcast<TabPanel>())
                tabs->set_collapsed(!open_);
            else if (auto child = p.downcast<StackPanel>())
                walk(child);
        }
    };
    walk(panel_);
}

}   // namespace quay
