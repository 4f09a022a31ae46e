#pragma once

#include <cstdint>
#include <vector>
#include "Milestone.h"

namespace milestones {

// Shifts that keep sibling orders dense after item_id moves from old_order to new_order.
// siblings is the timeline's non-deleted order set; the moved item itself is ignored.
// Empty when the orders are equal or no other sibling occupies new_order.
std::vector<OrderShift> resolve_reorder(const std::vector<OrderSlot>& siblings, int64_t item_id, int old_order, int new_order);

}
