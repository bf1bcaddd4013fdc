#pragma once

// Umbrella header.

#include <quay/dock.hpp>
#include <quay/dock_area.hpp>
#include <quay/dock_state.hpp>
#include <quay/geometry.hpp>
#include <quay/invalid_panel.hpp>
#include <quay/layout_persistence.hpp>
#include <quay/layout_tree.hpp>
#include <quay/logger.hpp>
#include <quay/panel.hpp>
#include <quay/panel_id.hpp>
#include <quay/panel_registry.hpp>
#include <quay/resizable_panel_group.hpp>
#include <quay/stack_panel.hpp>
#include <quay/tab_panel.hpp>
#include <quay/task_scheduler.hpp>
#include <quay/tree.hpp>
