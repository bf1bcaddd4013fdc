#pragma once

#include <quay/panel.hpp>
#include <string>

namespace quay
{

// Stand-in for a saved panel whose name has no registered factory. It keeps
// the original name and state so that dumping the layout loses nothing.
class InvalidPanel : public Panel
{
   public:
    static constexpr const char* PANEL_NAME = "InvalidPanel";

    InvalidPanel(std::string missing_name, DockItemInfo info)
        : missing_name_(std::move(missing_name)), info_(std::move(info))
    {
    }

    std::string panel_name() const override { return PANEL_NAME; }
    std::string title() const override { return missing_name_; }
    bool        zoomable() const override { return false; }

    DockItemState dump() const override;

    const std::string&  missing_name() const { return missing_name_; }
    const DockItemInfo& info() const { return info_; }

    // Text shown in place of the panel content.
    std::string message() const;

   private:
    std::string  missing_name_;
    DockItemInfo info_;
};

}   // namespace quay
