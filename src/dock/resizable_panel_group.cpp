#include <algorithm>
#include <cmath>
#include <quay/logger.hpp>
#include <quay/resizable_panel_group.hpp>

namespace quay
{

namespace
{
Rect slot_rect(const Rect& bounds, Axis axis, float offset, float length)
{
    if (axis == Axis::Horizontal)
        return {bounds.x + offset, bounds.y, length, bounds.h};
    return {bounds.x, bounds.y + offset, bounds.w, length};
}
}   // namespace

void ResizablePanelGroup::set_axis(Axis axis)
{
    if (axis == axis_)
        return;
    axis_ = axis;

    // Pixel sizes along the old axis mean nothing on the new one; keep the
    // proportions instead. Before the first layout there are none to keep.
    if (last_length_ <= 0.0f)
    {
        for (auto& s : slots_)
            s.size.reset();
        return;
    }
    auto shares = fractions();
    for (size_t i = 0; i < slots_.size(); ++i)
    {
        slots_[i].size.reset();
        slots_[i].initial_fraction = shares[i];
    }
    last_length_ = axis_length(bounds_, axis_);
}

// ─── Children ───────────────────────────────────────────────────────────────

void ResizablePanelGroup::insert_child(PanelView content, size_t ix, std::optional<float> size)
{
    ix          = std::min(ix, slots_.size());
    bool hinted = make_room(size);

    Slot slot;
    slot.content = std::move(content);
    slot.size    = size;
    if (!size && hinted)
        slot.initial_fraction = 1.0f / static_cast<float>(slots_.size() + 1);
    slots_.insert(slots_.begin() + static_cast<std::ptrdiff_t>(ix), std::move(slot));
}

void ResizablePanelGroup::add_child(PanelView content, std::optional<float> size)
{
    insert_child(std::move(content), slots_.size(), size);
}

PanelView ResizablePanelGroup::remove_child(size_t ix)
{
    if (ix >= slots_.size())
        return {};
    rehint_without(ix);
    PanelView removed = std::move(slots_[ix].content);
    slots_.erase(slots_.begin() + static_cast<std::ptrdiff_t>(ix));
    if (drag_handle_ && *drag_handle_ + 1 >= slots_.size())
        drag_handle_.reset();
    return removed;
}

bool ResizablePanelGroup::replace_child(size_t ix, PanelView content)
{
    if (ix >= slots_.size())
        return false;
    slots_[ix].content = std::move(content);
    return true;
}

void ResizablePanelGroup::remove_all_children()
{
    slots_.clear();
    drag_handle_.reset();
}

bool ResizablePanelGroup::set_size(size_t ix, std::optional<float> size)
{
    if (ix >= slots_.size())
        return false;
    slots_[ix].size = size;
    slots_[ix].initial_fraction.reset();
    return true;
}

bool ResizablePanelGroup::set_min_size(size_t ix, float min_size)
{
    if (ix >= slots_.size() || min_size < 0.0f)
        return false;
    slots_[ix].min_size = min_size;
    return true;
}

bool ResizablePanelGroup::set_max_size(size_t ix, std::optional<float> max_size)
{
    if (ix >= slots_.size())
        return false;
    slots_[ix].max_size = max_size;
    return true;
}

bool ResizablePanelGroup::set_initial_fraction(size_t ix, float fraction)
{
    if (ix >= slots_.size() || !(fraction >= 0.0f && fraction <= 1.0f))
        return false;
    slots_[ix].size.reset();
    slots_[ix].initial_fraction = fraction;
    return true;
}

// Existing slots shrink proportionally to leave room for a new one. Before
// the first layout only fraction hints can shrink. Returns true when the
// existing slots now carry hints.
bool ResizablePanelGroup::make_room(std::optional<float> size)
{
    if (slots_.empty())
        return false;

    if (last_length_ <= 0.0f)
    {
        bool any_hint = std::any_of(slots_.begin(),
                                    slots_.end(),
                                    [](const Slot& s) { return s.initial_fraction.has_value(); });
        if (!any_hint || size)
            return false;
        float keep = 1.0f - 1.0f / static_cast<float>(slots_.size() + 1);
        for (auto& s : slots_)
        {
            if (s.initial_fraction)
                s.initial_fraction = *s.initial_fraction * keep;
        }
        return true;
    }

    float share = size ? std::clamp(*size / last_length_, 0.0f, 1.0f)
                       : 1.0f / static_cast<float>(slots_.size() + 1);
    float keep  = 1.0f - share;
    for (auto& s : slots_)
    {
        float current = s.initial_fraction ? *s.initial_fraction : s.resolved / last_length_;
        s.size.reset();
        s.initial_fraction = current * keep;
    }
    return true;
}

// The slots that remain split the removed slot's space proportionally.
void ResizablePanelGroup::rehint_without(size_t removed_ix)
{
    if (last_length_ <= 0.0f)
        return;

    float total = 0.0f;
    for (size_t i = 0; i < slots_.size(); ++i)
    {
        if (i == removed_ix)
            continue;
        total += slots_[i].initial_fraction ? *slots_[i].initial_fraction * last_length_
                                            : slots_[i].resolved;
    }
    if (total <= 0.0f)
        return;

    for (size_t i = 0; i < slots_.size(); ++i)
    {
        if (i == removed_ix)
            continue;
        auto& s       = slots_[i];
        float current = s.initial_fraction ? *s.initial_fraction * last_length_ : s.resolved;
        s.size.reset();
        s.initial_fraction = current / total;
    }
}

// ─── Layout ─────────────────────────────────────────────────────────────────

void ResizablePanelGroup::layout(const Rect& bounds)
{
    bounds_      = bounds;
    float length = axis_length(bounds, axis_);

    if (length > 0.0f)
    {
        apply_initial_fractions(length);
        if (last_length_ > 0.0f && length != last_length_)
            rescale_explicit(length);
    }

    resolve(length);
    place();

    if (length > 0.0f)
        last_length_ = length;
}

// Hinted slots become explicit; the last slot stays growable so rounding
// never leaves a gap at the end.
void ResizablePanelGroup::apply_initial_fractions(float length)
{
    for (size_t i = 0; i < slots_.size(); ++i)
    {
        auto& s = slots_[i];
        if (!s.initial_fraction)
            continue;
        if (i + 1 == slots_.size())
            s.size.reset();
        else
            s.size = *s.initial_fraction * length;
        s.initial_fraction.reset();
    }
}

// When nothing can grow, a change in the group length is spread over the
// explicit slots in proportion to their size.
void ResizablePanelGroup::rescale_explicit(float length)
{
    bool any_grow = std::any_of(slots_.begin(), slots_.end(), [](const Slot& s) { return s.grow(); });
    if (any_grow)
        return;
    float scale = length / last_length_;
    for (auto& s : slots_)
        s.size = *s.size * scale;
}

void ResizablePanelGroup::resolve(float length)
{
    float               remaining = length;
    std::vector<size_t> growing;

    for (size_t i = 0; i < slots_.size(); ++i)
    {
        auto& s = slots_[i];
        if (s.grow())
        {
            growing.push_back(i);
            continue;
        }
        s.resolved = s.clamp(*s.size);
        remaining -= s.resolved;
    }

    // Grow slots pinned by their limits drop out and the rest share again.
    while (!growing.empty())
    {
        float               share = remaining / static_cast<float>(growing.size());
        std::vector<size_t> free_slots;
        for (size_t g : growing)
        {
            float c = slots_[g].clamp(share);
            if (c != share)
            {
                slots_[g].resolved = c;
                remaining -= c;
            }
            else
            {
                free_slots.push_back(g);
            }
        }
        if (free_slots.size() == growing.size())
        {
            for (size_t g : free_slots)
                slots_[g].resolved = share;
            remaining -= share * static_cast<float>(free_slots.size());
            break;
        }
        growing = std::move(free_slots);
    }

    if (remaining < -0.5f && length > 0.0f)
        QUAY_LOG_TRACE("dock.resize", "group overflows by {} px", -remaining);
}

void ResizablePanelGroup::place()
{
    float offset = 0.0f;
    for (auto& s : slots_)
    {
        s.bounds = slot_rect(bounds_, axis_, offset, s.resolved);
        offset += s.resolved;
        s.content.layout(s.bounds);
    }
}

std::vector<float> ResizablePanelGroup::sizes() const
{
    std::vector<float> out;
    out.reserve(slots_.size());
    for (const auto& s : slots_)
        out.push_back(s.resolved);
    return out;
}

std::vector<float> ResizablePanelGroup::fractions() const
{
    std::vector<float> out(slots_.size(), 0.0f);
    if (slots_.empty())
        return out;

    float total = 0.0f;
    for (const auto& s : slots_)
        total += s.resolved;

    if (total > 0.0f)
    {
        for (size_t i = 0; i < slots_.size(); ++i)
            out[i] = slots_[i].resolved / total;
        return out;
    }

    // Not laid out yet: report the hints, sharing what they leave evenly.
    float  hinted = 0.0f;
    size_t rest   = 0;
    for (const auto& s : slots_)
    {
        if (s.initial_fraction)
            hinted += *s.initial_fraction;
        else
            ++rest;
    }
    float each = rest > 0 ? std::max(0.0f, 1.0f - hinted) / static_cast<float>(rest) : 0.0f;
    for (size_t i = 0; i < slots_.size(); ++i)
        out[i] = slots_[i].initial_fraction ? *slots_[i].initial_fraction : each;
    return out;
}

// ─── Handles ────────────────────────────────────────────────────────────────

bool ResizablePanelGroup::resize_handle(size_t ix, float delta)
{
    if (ix + 1 >= slots_.size() || !std::isfinite(delta))
        return false;

    Slot& a  = slots_[ix];
    Slot& b  = slots_[ix + 1];
    float sa = a.resolved;
    float sb = b.resolved;

    // Range of deltas that keeps both slots inside their limits while their
    // sum stays fixed.
    float lo = a.min_size - sa;
    float hi = sb - b.min_size;
    if (a.max_size)
        hi = std::min(hi, *a.max_size - sa);
    if (b.max_size)
        lo = std::max(lo, sb - *b.max_size);

    float d  = lo <= hi ? std::clamp(delta, lo, hi) : 0.0f;
    float na = a.clamp(sa + d);
    float nb = b.clamp(sb - d);
    if (na == sa && nb == sb && !a.grow() && !b.grow())
        return false;

    a.size = na;
    b.size = nb;
    a.initial_fraction.reset();
    b.initial_fraction.reset();

    resolve(axis_length(bounds_, axis_));
    place();
    if (on_resize_)
        on_resize_();
    return true;
}

Rect ResizablePanelGroup::handle_rect(size_t ix) const
{
    if (ix + 1 >= slots_.size())
        return {};
    const Rect& r   = slots_[ix].bounds;
    float       end = axis_origin(r, axis_) + axis_length(r, axis_);
    float       h   = HANDLE_SIZE * 0.5f;
    if (axis_ == Axis::Horizontal)
        return {end - h, bounds_.y, HANDLE_SIZE, bounds_.h};
    return {bounds_.x, end - h, bounds_.w, HANDLE_SIZE};
}

std::optional<size_t> ResizablePanelGroup::handle_at_point(float x, float y) const
{
    for (size_t i = 0; i + 1 < slots_.size(); ++i)
    {
        if (handle_rect(i).contains(x, y))
            return i;
    }
    return std::nullopt;
}

bool ResizablePanelGroup::begin_drag(float x, float y)
{
    auto hit = handle_at_point(x, y);
    if (!hit)
        return false;
    const Rect& r = slots_[*hit].bounds;
    float boundary = axis_origin(r, axis_) + axis_length(r, axis_);
    drag_handle_   = hit;
    drag_offset_   = (axis_ == Axis::Horizontal ? x : y) - boundary;
    return true;
}

void ResizablePanelGroup::update_drag(float x, float y)
{
    if (!drag_handle_ || *drag_handle_ + 1 >= slots_.size())
        return;
    const Rect& r        = slots_[*drag_handle_].bounds;
    float       boundary = axis_origin(r, axis_) + axis_length(r, axis_);
    float       target   = (axis_ == Axis::Horizontal ? x : y) - drag_offset_;
    resize_handle(*drag_handle_, target - boundary);
}

void ResizablePanelGroup::end_drag()
{
    drag_handle_.reset();
    drag_offset_ = 0.0f;
}

}   // namespace quay
