#ifdef QUAY_USE_IMGUI

#include "dock_renderer.hpp"

#include <algorithm>
#include <cmath>
#include <imgui.h>
#include <quay/invalid_panel.hpp>
#include <quay/logger.hpp>
#include <quay/stack_panel.hpp>
#include <quay/tab_panel.hpp>
#include <string>
#include <vector>

namespace quay
{

namespace
{

constexpr float TAB_PAD        = 8.0f;
constexpr float TAB_MIN_W      = 60.0f;
constexpr float TAB_MAX_W      = 150.0f;
constexpr float CLOSE_SZ       = 12.0f;
constexpr float DRAG_THRESHOLD = 5.0f;

ImVec2 top_left(const Rect& r)
{
    return ImVec2(r.x, r.y);
}

ImVec2 bottom_right(const Rect& r)
{
    return ImVec2(r.right(), r.bottom());
}

// Part of `r` a drop with `placement` would take.
Rect drop_highlight(const Rect& r, std::optional<Placement> placement)
{
    if (!placement)
        return r;
    switch (*placement)
    {
        case Placement::Left:
            return {r.x, r.y, r.w * 0.5f, r.h};
        case Placement::Right:
            return {r.x + r.w * 0.5f, r.y, r.w * 0.5f, r.h};
        case Placement::Top:
            return {r.x, r.y, r.w, r.h * 0.5f};
        case Placement::Bottom:
            return {r.x, r.y + r.h * 0.5f, r.w, r.h * 0.5f};
    }
    return r;
}

}   // namespace

DockRenderer::DockRenderer(std::shared_ptr<DockArea> area) : area_(std::move(area)) {}

bool DockRenderer::is_dragging() const
{
    return drag_dock_.has_value() || !drag_stack_.expired() || (tab_drag_ && tab_drag_->active);
}

void DockRenderer::draw(const Rect& bounds)
{
    auto area = area_.lock();
    if (!area)
        return;

    area->layout(bounds);
    tab_hovered_ = false;

    // Host window for the child windows and the popup.
    ImGui::SetNextWindowPos(top_left(bounds));
    ImGui::SetNextWindowSize(ImVec2(bounds.w, bounds.h));
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(0, 0));
    ImGuiWindowFlags host_flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove
                                  | ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoBringToFrontOnFocus
                                  | ImGuiWindowFlags_NoScrollWithMouse | ImGuiWindowFlags_NoNav;
    ImGui::Begin("##quay_dock_area", nullptr, host_flags);
    ImGui::PopStyleVar();

    if (PanelView zoomed = area->zoomed_panel())
    {
        draw_item(zoomed, bounds);
    }
    else
    {
        draw_stack(area->root());
        for (DockPlacement p : {DockPlacement::Left, DockPlacement::Bottom, DockPlacement::Right})
        {
            Dock* d = area->dock(p);
            if (d && d->extent() > 0.0f)
                draw_stack(d->panel());
        }
        draw_dock_handles(*area);
    }

    update_tab_drag(*area);
    draw_context_menu();

    ImGui::End();
}

void DockRenderer::draw_item(const PanelView& item, const Rect& bounds)
{
    if (auto tabs = item.downcast<TabPanel>())
        draw_tab_panel(tabs);
    else if (auto stack = item.downcast<StackPanel>())
        draw_stack(stack);
    else
        draw_content(item, bounds);
}

// ─── Stacks ─────────────────────────────────────────────────────────────────

void DockRenderer::draw_stack(const std::shared_ptr<StackPanel>& stack)
{
    if (!stack)
        return;
    // Copy: a drop or close below may restructure the stack mid-frame.
    const std::vector<ResizablePanelGroup::Slot> slots = stack->group().children();
    for (const auto& slot : slots)
        draw_item(slot.content, slot.bounds);
    draw_stack_handles(stack);
}

void DockRenderer::draw_stack_handles(const std::shared_ptr<StackPanel>& stack)
{
    auto& group = stack->group();
    if (group.count() < 2)
        return;

    ImDrawList*      dl     = ImGui::GetWindowDrawList();
    ImVec2           mouse  = ImGui::GetMousePos();
    ImGuiMouseCursor cursor = group.axis() == Axis::Horizontal ? ImGuiMouseCursor_ResizeEW : ImGuiMouseCursor_ResizeNS;

    const bool idle = drag_stack_.expired() && !drag_dock_ && !(tab_drag_ && tab_drag_->active);
    if (idle && !tab_hovered_)
    {
        if (group.handle_at_point(mouse.x, mouse.y))
        {
            ImGui::SetMouseCursor(cursor);
            if (ImGui::IsMouseClicked(ImGuiMouseButton_Left) && group.begin_drag(mouse.x, mouse.y))
                drag_stack_ = stack;
        }
    }

    if (drag_stack_.lock() == stack && group.is_dragging())
    {
        ImGui::SetMouseCursor(cursor);
        group.update_drag(mouse.x, mouse.y);
        if (ImGui::IsMouseReleased(ImGuiMouseButton_Left))
        {
            group.end_drag();
            drag_stack_.reset();
        }
    }

    for (size_t i = 0; i + 1 < group.count(); ++i)
    {
        Rect r        = group.handle_rect(i);
        bool dragging = group.dragging_handle() == i;
        bool hovered  = r.contains(mouse.x, mouse.y);
        ImU32 color   = ImGui::GetColorU32(dragging  ? ImGuiCol_SeparatorActive
                                           : hovered ? ImGuiCol_SeparatorHovered
                                                     : ImGuiCol_Separator);
        // Thin line centered in the hit area.
        if (group.axis() == Axis::Horizontal)
        {
            float cx = r.x + r.w * 0.5f;
            dl->AddRectFilled(ImVec2(cx - 0.5f, r.y), ImVec2(cx + 0.5f, r.bottom()), color);
        }
        else
        {
            float cy = r.y + r.h * 0.5f;
            dl->AddRectFilled(ImVec2(r.x, cy - 0.5f), ImVec2(r.right(), cy + 0.5f), color);
        }
    }
}

// ─── Tabs ───────────────────────────────────────────────────────────────────

void DockRenderer::draw_tab_panel(const std::shared_ptr<TabPanel>& tabs)
{
    draw_tab_strip(tabs);
    if (tabs->is_collapsed())
        return;
    if (PanelView active = tabs->active_panel())
        draw_content(active, tabs->content_bounds());
}

void DockRenderer::draw_tab_strip(const std::shared_ptr<TabPanel>& tabs)
{
    ImDrawList* dl    = ImGui::GetWindowDrawList();
    ImVec2      mouse = ImGui::GetMousePos();
    Rect        bar   = tabs->tab_bar_bounds();
    if (bar.w <= 0.0f || bar.h <= 0.0f)
        return;

    dl->AddRectFilled(top_left(bar), bottom_right(bar), ImGui::GetColorU32(ImGuiCol_TitleBg));

    const std::vector<PanelView> panels = tabs->panels();
    const size_t                 active = tabs->active_ix();

    dl->PushClipRect(top_left(bar), bottom_right(bar), true);
    float x = bar.x;
    for (size_t i = 0; i < panels.size(); ++i)
    {
        const PanelView& panel   = panels[i];
        std::string      title   = panel.title();
        ImVec2           text_sz = ImGui::CalcTextSize(title.c_str());
        const bool       can_close = panel.closeable();
        float w = std::clamp(text_sz.x + TAB_PAD * 2 + (can_close ? CLOSE_SZ : 0.0f), TAB_MIN_W, TAB_MAX_W);

        Rect tr{x, bar.y, w, bar.h};
        x += w + 1.0f;

        const bool is_active  = i == active;
        const bool is_hovered = tr.contains(mouse.x, mouse.y) && ImGui::IsWindowHovered(ImGuiHoveredFlags_ChildWindows);

        ImU32 bg = ImGui::GetColorU32(is_active ? ImGuiCol_TabHovered : is_hovered ? ImGuiCol_Tab : ImGuiCol_TitleBg);
        dl->AddRectFilled(ImVec2(tr.x, tr.y + 3.0f), bottom_right(tr), bg, 4.0f, ImDrawFlags_RoundCornersTop);
        if (is_active)
        {
            dl->AddLine(ImVec2(tr.x + 3, tr.bottom() - 1),
                        ImVec2(tr.right() - 3, tr.bottom() - 1),
                        ImGui::GetColorU32(ImGuiCol_SeparatorActive),
                        2.0f);
        }

        ImVec2 text_pos(tr.x + TAB_PAD, tr.y + (tr.h - text_sz.y) * 0.5f);
        dl->PushClipRect(top_left(tr), ImVec2(tr.right() - (can_close ? CLOSE_SZ + 2 : 0.0f), tr.bottom()), true);
        dl->AddText(text_pos,
                    ImGui::GetColorU32(is_active ? ImGuiCol_Text : ImGuiCol_TextDisabled),
                    title.c_str());
        dl->PopClipRect();

        if (can_close && (is_active || is_hovered))
        {
            float cx = tr.right() - CLOSE_SZ * 0.5f - 4.0f;
            float cy = tr.y + tr.h * 0.5f;
            float sz = 3.5f;

            bool close_hovered =
                std::abs(mouse.x - cx) < CLOSE_SZ * 0.5f && std::abs(mouse.y - cy) < CLOSE_SZ * 0.5f;
            ImU32 x_col = ImGui::GetColorU32(close_hovered ? ImGuiCol_Text : ImGuiCol_TextDisabled);
            dl->AddLine(ImVec2(cx - sz, cy - sz), ImVec2(cx + sz, cy + sz), x_col, 1.5f);
            dl->AddLine(ImVec2(cx - sz, cy + sz), ImVec2(cx + sz, cy - sz), x_col, 1.5f);

            if (close_hovered && is_hovered && ImGui::IsMouseClicked(ImGuiMouseButton_Left))
            {
                tab_hovered_ = true;
                tabs->close_panel(panel);
                break;
            }
        }

        if (!is_hovered)
            continue;

        tab_hovered_ = true;
        if (ImGui::IsMouseDoubleClicked(ImGuiMouseButton_Left))
        {
            tabs->set_active_ix(i);
            tabs->toggle_zoom();
        }
        else if (ImGui::IsMouseClicked(ImGuiMouseButton_Left))
        {
            tabs->set_active_ix(i);
            if (auto area = area_.lock())
                area->focus_panel(panel);
            tab_drag_ = TabDrag{tabs, panel.downgrade(), mouse.x, mouse.y, false};
        }
        else if (ImGui::IsMouseClicked(ImGuiMouseButton_Right))
        {
            menu_tabs_  = tabs;
            menu_panel_ = panel.downgrade();
            open_menu_  = true;
        }
    }
    dl->PopClipRect();

    if (PanelView current = tabs->active_panel())
        draw_toolbar(current, bar, x);
}

// Right-aligned buttons contributed by the active panel.
void DockRenderer::draw_toolbar(const PanelView& panel, const Rect& bar, float min_x)
{
    std::vector<ToolbarButton> buttons = panel.toolbar_buttons();
    if (buttons.empty())
        return;

    const ImGuiStyle& style = ImGui::GetStyle();
    float             right = bar.right() - 4.0f;

    ImGui::PushID(static_cast<int>(panel.focus_handle()));
    for (auto it = buttons.rbegin(); it != buttons.rend(); ++it)
    {
        ImVec2 label_sz = ImGui::CalcTextSize(it->label.c_str());
        float  w        = label_sz.x + style.FramePadding.x * 2.0f;
        if (right - w < min_x)
            break;
        right -= w;
        ImGui::SetCursorScreenPos(ImVec2(right, bar.y + (bar.h - ImGui::GetFrameHeight()) * 0.5f));
        ImGui::PushID(it->id.c_str());
        if (ImGui::SmallButton(it->label.c_str()) && it->on_click)
            it->on_click();
        if (!it->tooltip.empty() && ImGui::IsItemHovered())
            ImGui::SetTooltip("%s", it->tooltip.c_str());
        ImGui::PopID();
        right -= 2.0f;
    }
    ImGui::PopID();
}

void DockRenderer::draw_content(const PanelView& panel, const Rect& bounds)
{
    if (!panel || bounds.w <= 0.0f || bounds.h <= 0.0f)
        return;

    std::string id = "##quay_panel_" + panel.panel_id().to_string();
    ImGui::SetCursorScreenPos(top_left(bounds));
    if (ImGui::BeginChild(id.c_str(), ImVec2(bounds.w, bounds.h), false))
    {
        if (auto invalid = panel.downcast<InvalidPanel>())
        {
            std::string message = invalid->message();
            ImVec2      sz      = ImGui::CalcTextSize(message.c_str());
            ImGui::SetCursorScreenPos(ImVec2(bounds.x + std::max(0.0f, (bounds.w - sz.x) * 0.5f),
                                             bounds.y + std::max(0.0f, (bounds.h - sz.y) * 0.5f)));
            ImGui::TextDisabled("%s", message.c_str());
        }
        else
        {
            panel.draw(bounds);
        }
    }
    ImGui::EndChild();
}

// ─── Docks ──────────────────────────────────────────────────────────────────

void DockRenderer::draw_dock_handles(DockArea& area)
{
    ImDrawList* dl    = ImGui::GetWindowDrawList();
    ImVec2      mouse = ImGui::GetMousePos();

    for (DockPlacement p : {DockPlacement::Left, DockPlacement::Bottom, DockPlacement::Right})
    {
        Dock* d = area.dock(p);
        if (!d || !d->is_open())
            continue;

        Rect             hr      = d->handle_rect();
        ImGuiMouseCursor cursor  = p == DockPlacement::Bottom ? ImGuiMouseCursor_ResizeNS : ImGuiMouseCursor_ResizeEW;
        bool             hovered = hr.contains(mouse.x, mouse.y);
        bool             mine    = drag_dock_ == p;

        if (hovered && !drag_dock_ && drag_stack_.expired() && !tab_hovered_)
        {
            ImGui::SetMouseCursor(cursor);
            if (ImGui::IsMouseClicked(ImGuiMouseButton_Left))
            {
                drag_dock_ = p;
                mine       = true;
            }
        }

        if (mine)
        {
            ImGui::SetMouseCursor(cursor);
            area.resize_dock(p, mouse.x, mouse.y);
            if (ImGui::IsMouseReleased(ImGuiMouseButton_Left))
                drag_dock_.reset();
            hr = d->handle_rect();
        }

        ImU32 color = ImGui::GetColorU32(mine      ? ImGuiCol_SeparatorActive
                                         : hovered ? ImGuiCol_SeparatorHovered
                                                   : ImGuiCol_Separator);
        if (p == DockPlacement::Bottom)
        {
            float cy = hr.y + hr.h * 0.5f;
            dl->AddRectFilled(ImVec2(hr.x, cy - 0.5f), ImVec2(hr.right(), cy + 0.5f), color);
        }
        else
        {
            float cx = hr.x + hr.w * 0.5f;
            dl->AddRectFilled(ImVec2(cx - 0.5f, hr.y), ImVec2(cx + 0.5f, hr.bottom()), color);
        }
    }
}

// ─── Drag and drop ──────────────────────────────────────────────────────────

void DockRenderer::update_tab_drag(DockArea& area)
{
    if (!tab_drag_)
        return;

    auto source = tab_drag_->source.lock();
    auto panel  = tab_drag_->panel.lock();
    if (!source || !panel)
    {
        tab_drag_.reset();
        return;
    }

    ImVec2 mouse = ImGui::GetMousePos();
    if (!tab_drag_->active && ImGui::IsMouseDragging(ImGuiMouseButton_Left, DRAG_THRESHOLD) && !area.is_locked())
        tab_drag_->active = true;

    std::shared_ptr<TabPanel> target;
    std::optional<Placement>  placement;
    if (tab_drag_->active)
    {
        target = area.find_panel(
                         [&](const PanelView& v)
                         {
                             auto t = v.downcast<TabPanel>();
                             return t && !t->is_collapsed() && t->bounds().contains(mouse.x, mouse.y);
                         })
                     .downcast<TabPanel>();

        ImDrawList* fg = ImGui::GetForegroundDrawList();
        if (target)
        {
            placement = target->drop_placement_at(mouse.x, mouse.y);
            Rect hr   = drop_highlight(target->bounds(), placement);
            ImVec4 accent = ImGui::GetStyleColorVec4(ImGuiCol_SeparatorActive);
            fg->AddRectFilled(top_left(hr), bottom_right(hr), ImGui::GetColorU32(ImVec4(accent.x, accent.y, accent.z, 0.15f)), 4.0f);
            fg->AddRect(top_left(hr), bottom_right(hr), ImGui::GetColorU32(ImVec4(accent.x, accent.y, accent.z, 0.6f)), 4.0f, 0, 2.0f);
        }

        std::string title = PanelView(panel).title();
        ImVec2      sz    = ImGui::CalcTextSize(title.c_str());
        ImVec2      ghost(mouse.x + 12.0f, mouse.y + 8.0f);
        fg->AddRectFilled(ghost,
                          ImVec2(ghost.x + sz.x + TAB_PAD * 2, ghost.y + sz.y + 8.0f),
                          ImGui::GetColorU32(ImGuiCol_PopupBg),
                          4.0f);
        fg->AddText(ImVec2(ghost.x + TAB_PAD, ghost.y + 4.0f), ImGui::GetColorU32(ImGuiCol_Text), title.c_str());
    }

    if (!ImGui::IsMouseReleased(ImGuiMouseButton_Left))
        return;

    if (tab_drag_->active && target)
    {
        PanelView view(panel);
        if (target->drop_panel(view, source, placement))
            QUAY_LOG_DEBUG("dock.imgui", "dropped '{}' ({})", view.title(), placement ? "split" : "tab");
    }
    tab_drag_.reset();
}

// ─── Context menu ───────────────────────────────────────────────────────────

void DockRenderer::draw_context_menu()
{
    if (open_menu_)
    {
        ImGui::OpenPopup("##quay_tab_menu");
        open_menu_ = false;
    }
    if (!ImGui::BeginPopup("##quay_tab_menu"))
        return;

    auto tabs  = menu_tabs_.lock();
    auto panel = menu_panel_.lock();
    if (!tabs || !panel)
    {
        ImGui::CloseCurrentPopup();
        ImGui::EndPopup();
        return;
    }

    PanelView view(panel);
    PopupMenu menu;
    view.popup_menu(menu);
    for (const auto& item : menu.items())
    {
        if (item.separator)
            ImGui::Separator();
        else if (ImGui::MenuItem(item.label.c_str(), nullptr, false, item.enabled) && item.action)
            item.action();
    }
    if (!menu.empty())
        ImGui::Separator();

    if (ImGui::MenuItem(tabs->is_zoomed() ? "Restore" : "Zoom", nullptr, false, view.zoomable()))
    {
        tabs->set_active_panel(view);
        tabs->toggle_zoom();
    }
    if (ImGui::MenuItem("Close", nullptr, false, view.closeable()))
        tabs->close_panel(view);

    ImGui::EndPopup();
}

}   // namespace quay

#endif   // QUAY_USE_IMGUI
