#pragma once

#include <string_view>

namespace quay
{

struct Rect
{
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;

    float right() const { return x + w; }
    float bottom() const { return y + h; }

    bool contains(float px, float py) const
    {
        return px >= x && px < x + w && py >= y && py < y + h;
    }

    bool operator==(const Rect&) const = default;
};

enum class Axis
{
    Horizontal,   // children laid out left to right
    Vertical,     // children laid out top to bottom
};

// Side of a reference panel a new panel is inserted on.
enum class Placement
{
    Top,
    Bottom,
    Left,
    Right,
};

// Region of a DockArea a panel is added to.
enum class DockPlacement
{
    Center,
    Left,
    Bottom,
    Right,
};

inline Axis placement_axis(Placement p)
{
    return (p == Placement::Left || p == Placement::Right) ? Axis::Horizontal : Axis::Vertical;
}

// Top and Left go before the reference, Right and Bottom after it.
inline bool placement_is_before(Placement p)
{
    return p == Placement::Top || p == Placement::Left;
}

inline float axis_length(const Rect& r, Axis axis)
{
    return axis == Axis::Horizontal ? r.w : r.h;
}

inline float axis_origin(const Rect& r, Axis axis)
{
    return axis == Axis::Horizontal ? r.x : r.y;
}

inline std::string_view axis_name(Axis axis)
{
    return axis == Axis::Horizontal ? "horizontal" : "vertical";
}

inline std::string_view dock_placement_name(DockPlacement p)
{
    switch (p)
    {
        case DockPlacement::Center:
            return "center";
        case DockPlacement::Left:
            return "left";
        case DockPlacement::Bottom:
            return "bottom";
        case DockPlacement::Right:
            return "right";
    }
    return "center";
}

}   // namespace quay
