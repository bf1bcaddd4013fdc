#pragma once

#ifdef QUAY_USE_IMGUI

#include <memory>
#include <optional>
#include <quay/dock_area.hpp>
#include <quay/geometry.hpp>
#include <quay/panel.hpp>

namespace quay
{

class StackPanel;
class TabPanel;

/**
 * DockRenderer: draws a DockArea with Dear ImGui and feeds pointer input
 * (splitter and dock-edge drags, tab clicks, tab drag and drop, the tab
 * context menu) back into it.
 *
 * Must be driven from inside an ImGui frame. Panels draw themselves from
 * Panel::draw() inside a child window covering their content rectangle.
 */
class DockRenderer
{
   public:
    explicit DockRenderer(std::shared_ptr<DockArea> area);

    DockRenderer(const DockRenderer&)            = delete;
    DockRenderer& operator=(const DockRenderer&) = delete;

    // Lays the area out over `bounds` (screen coordinates) and draws it.
    void draw(const Rect& bounds);

    bool is_tab_hovered() const { return tab_hovered_; }
    bool is_dragging() const;

   private:
    struct TabDrag
    {
        std::weak_ptr<TabPanel> source;
        std::weak_ptr<Panel>    panel;
        float                   start_x = 0.0f;
        float                   start_y = 0.0f;
        bool                    active  = false;
    };

    void draw_item(const PanelView& item, const Rect& bounds);
    void draw_stack(const std::shared_ptr<StackPanel>& stack);
    void draw_stack_handles(const std::shared_ptr<StackPanel>& stack);
    void draw_tab_panel(const std::shared_ptr<TabPanel>& tabs);
    void draw_tab_strip(const std::shared_ptr<TabPanel>& tabs);
    void draw_toolbar(const PanelView& panel, const Rect& bar, float min_x);
    void draw_content(const PanelView& panel, const Rect& bounds);
    void draw_dock_handles(DockArea& area);
    void update_tab_drag(DockArea& area);
    void draw_context_menu();

    std::weak_ptr<DockArea>      area_;
    std::weak_ptr<StackPanel>    drag_stack_;
    std::optional<DockPlacement> drag_dock_;
    std::optional<TabDrag>       tab_drag_;
    std::weak_ptr<TabPanel>      menu_tabs_;
    std::weak_ptr<Panel>         menu_panel_;
    bool                         open_menu_   = false;
    bool                         tab_hovered_ = false;
};

}   // namespace quay

#endif   // QUAY_USE_IMGUI
