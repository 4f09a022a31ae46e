#include "ReorderResolver.h"
#include <algorithm>

namespace milestones {

std::vector<OrderShift> resolve_reorder(const std::vector<OrderSlot>& siblings, int64_t item_id, int old_order, int new_order) {
    std::vector<OrderShift> out;
    if (old_order == new_order) return out;

    bool occupied = std::any_of(siblings.begin(), siblings.end(), [&](const OrderSlot& s) {
        return s.id != item_id && s.order == new_order;
    });
    if (!occupied) return out;

    for (const auto& s : siblings) {
        if (s.id == item_id) continue;
        if (old_order < new_order) {
            // higher target: (old, new] each give up one slot
            if (s.order > old_order && s.order <= new_order) out.push_back(OrderShift{s.id, s.order - 1});
        } else {
            // lower target: [new, old) each move one slot back
            if (s.order >= new_order && s.order < old_order) out.push_back(OrderShift{s.id, s.order + 1});
        }
    }
    std::sort(out.begin(), out.end(), [](const OrderShift& a, const OrderShift& b) { return a.new_order < b.new_order; });
    return out;
}

}
