#pragma once

#include <memory>
#include <quay/dock_state.hpp>
#include <quay/geometry.hpp>
#include <quay/panel.hpp>

namespace quay
{

class DockArea;
class StackPanel;

/**
 * Dock: fixed side region (left, bottom or right) of a DockArea.
 *
 * Content always sits in a StackPanel laid out across the dock (vertical for
 * the side docks, horizontal for the bottom one). A closed bottom dock keeps
 * its tab strip visible; closed side docks take no space.
 */
class Dock
{
   public:
    static constexpr float DEFAULT_SIZE          = 200.0f;
    static constexpr float COLLAPSED_BOTTOM_SIZE = 29.0f;
    static constexpr float HANDLE_SIZE           = 6.0f;

    Dock(DockPlacement placement, std::weak_ptr<DockArea> dock_area);

    DockPlacement placement() const { return placement_; }
    Axis          axis() const;

    // Width for side docks, height for the bottom dock.
    float size() const { return size_; }
    void  set_size(float size);

    bool is_open() const { return open_; }
    void set_open(bool open);
    void toggle_open() { set_open(!open_); }

    bool collapsible() const { return collapsible_; }
    // A dock that cannot collapse is forced open.
    void set_collapsible(bool collapsible);

    const std::shared_ptr<StackPanel>& panel() const { return panel_; }
    // Non-stack items are wrapped in a StackPanel (and a TabPanel if needed).
    void set_panel(PanelView item);
    void add_panel(PanelView panel);

    // Space taken from the area along the docked edge.
    float extent() const;

    void        layout(const Rect& bounds);
    void        draw() const;
    const Rect& bounds() const { return bounds_; }

    // Strip on the edge facing the center.
    Rect handle_rect() const;

    // Sizes the dock so its inner edge follows the pointer, leaving at least
    // PANEL_MIN_SIZE for the center. left_extent/right_extent are the other
    // side docks' extents. Returns false when the size did not change.
    bool resize(float mouse_x, float mouse_y, const Rect& area_bounds, float left_extent, float right_extent);

    DockState dump() const;

   private:
    void apply_collapsed();

    DockPlacement               placement_;
    float                       size_        = DEFAULT_SIZE;
    bool                        open_        = true;
    bool                        collapsible_ = true;
    std::shared_ptr<StackPanel> panel_;
    std::weak_ptr<DockArea>     dock_area_;
    Rect                        bounds_;
};

}   // namespace quay
