#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace quay
{

// 128-bit random identity assigned when a panel is created.
struct PanelId
{
    uint64_t hi = 0;
    uint64_t lo = 0;

    static PanelId generate();

    bool        is_nil() const { return hi == 0 && lo == 0; }
    std::string to_string() const;   // 32 lowercase hex digits

    bool operator==(const PanelId&) const = default;
};

// Monotonic focus token; 0 is never handed out.
using FocusHandle = uint64_t;

FocusHandle next_focus_handle();

}   // namespace quay

template <>
struct std::hash<quay::PanelId>
{
    size_t operator()(const quay::PanelId& id) const noexcept
    {
        return std::hash<uint64_t>{}(id.hi) ^ (std::hash<uint64_t>{}(id.lo) << 1);
    }
};
