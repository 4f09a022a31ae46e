#include "CascadeScheduler.h"

namespace milestones {

std::vector<ScheduleWrite> cascade_schedule(const Milestone& updated, const std::vector<Milestone>& following) {
    std::vector<ScheduleWrite> writes;
    day_t cursor = add_days(effective_end(updated), 1);
    for (const auto& sibling : following) {
        if (sibling.start_date == cursor) {
            cursor = add_days(effective_end(sibling), 1);
            continue;
        }
        Milestone moved = sibling;
        moved.start_date = cursor;
        moved.end_date = end_for(cursor, sibling.duration);
        writes.push_back(ScheduleWrite{moved.id, moved.start_date, moved.end_date});
        cursor = add_days(effective_end(moved), 1);
    }
    return writes;
}

}
