#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <optional>
#include <quay/geometry.hpp>
#include <quay/panel.hpp>
#include <vector>

namespace quay
{

/**
 * ResizablePanelGroup: a row or column of slots separated by drag handles.
 *
 * A slot either has an explicit size or grows to share what is left. Handles
 * are overlays on the boundary between two slots and take no space.
 */
class ResizablePanelGroup
{
   public:
    static constexpr float PANEL_MIN_SIZE = 100.0f;
    static constexpr float HANDLE_SIZE    = 6.0f;

    struct Slot
    {
        PanelView            content;
        std::optional<float> size;   // nullopt: grow
        float                min_size = PANEL_MIN_SIZE;
        std::optional<float> max_size;
        // Share of the group length restored from a snapshot; turned into an
        // explicit size on the first layout that has a length to work with.
        std::optional<float> initial_fraction;

        float resolved = 0.0f;
        Rect  bounds;

        bool  grow() const { return !size.has_value(); }
        float clamp(float v) const
        {
            v = std::max(v, min_size);
            return max_size ? std::min(v, *max_size) : v;
        }
    };

    using ResizeCallback = std::function<void()>;

    explicit ResizablePanelGroup(Axis axis = Axis::Horizontal) : axis_(axis) {}

    Axis axis() const { return axis_; }
    void set_axis(Axis axis);

    size_t                   count() const { return slots_.size(); }
    bool                     empty() const { return slots_.empty(); }
    const std::vector<Slot>& children() const { return slots_; }
    const Slot&              child(size_t ix) const { return slots_.at(ix); }

    // ix is clamped to the slot count.
    void      insert_child(PanelView content, size_t ix, std::optional<float> size = std::nullopt);
    void      add_child(PanelView content, std::optional<float> size = std::nullopt);
    PanelView remove_child(size_t ix);
    // Swaps content only; the slot keeps its sizing.
    bool replace_child(size_t ix, PanelView content);
    void remove_all_children();

    bool set_size(size_t ix, std::optional<float> size);
    bool set_min_size(size_t ix, float min_size);
    bool set_max_size(size_t ix, std::optional<float> max_size);
    bool set_initial_fraction(size_t ix, float fraction);

    // Distributes the axis length of `bounds` over the slots and lays out
    // each slot's content in its rectangle.
    void        layout(const Rect& bounds);
    const Rect& bounds() const { return bounds_; }

    std::vector<float> sizes() const;       // resolved, in pixels
    std::vector<float> fractions() const;   // resolved / total; hints before first layout

    // Moves the boundary between slot ix and ix+1 by delta pixels. Only those
    // two slots change and both become explicit. Returns false when nothing
    // moved.
    bool resize_handle(size_t ix, float delta);

    // Handle between slot ix and ix+1.
    Rect                  handle_rect(size_t ix) const;
    std::optional<size_t> handle_at_point(float x, float y) const;

    bool                  begin_drag(float x, float y);
    void                  update_drag(float x, float y);
    void                  end_drag();
    bool                  is_dragging() const { return drag_handle_.has_value(); }
    std::optional<size_t> dragging_handle() const { return drag_handle_; }

    void set_on_resize(ResizeCallback cb) { on_resize_ = std::move(cb); }

   private:
    void apply_initial_fractions(float length);
    void rescale_explicit(float length);
    bool make_room(std::optional<float> size);
    void rehint_without(size_t removed_ix);
    void resolve(float length);
    void place();

    Axis                  axis_;
    std::vector<Slot>     slots_;
    Rect                  bounds_;
    float                 last_length_ = 0.0f;
    std::optional<size_t> drag_handle_;
    float                 drag_offset_ = 0.0f;
    ResizeCallback        on_resize_;
};

}   // namespace quay
