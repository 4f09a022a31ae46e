#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include "Milestone.h"
#include "MilestoneTx.h"

namespace milestones {

enum class UpdateStatus { Ok, NotFound, ValidationConflict, PersistenceFailure };

const char* to_string(UpdateStatus s);

struct UpdateOutcome {
    UpdateStatus status = UpdateStatus::Ok;
    std::string message;
    std::optional<Milestone> original;
    std::optional<Milestone> updated;
    size_t order_shifts = 0;
    size_t schedule_writes = 0;
    bool ok() const { return status == UpdateStatus::Ok; }
};

// Applies patch to one milestone and restores ordering and schedule consistency of
// its timeline. Everything runs on tx; the caller commits only when the outcome is ok.
UpdateOutcome apply_milestone_update(MilestoneTx& tx, int64_t timeline_id, int64_t milestone_id, const MilestonePatch& patch);

}
