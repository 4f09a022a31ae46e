#pragma once

#include <vector>
#include "Milestone.h"

namespace milestones {

// Recomputes the schedule of every milestone after `updated`.
// following must hold the non-deleted siblings with a greater order, ascending.
// A sibling whose start already matches is not written, but the walk still
// continues through it using its existing effective end.
std::vector<ScheduleWrite> cascade_schedule(const Milestone& updated, const std::vector<Milestone>& following);

}
