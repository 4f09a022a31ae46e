#include "UpdateEngine.h"
#include "ReorderResolver.h"
#include "CascadeScheduler.h"
#include "../net/MiniJson.h"

namespace milestones {

const char* to_string(UpdateStatus s) {
    switch (s) {
        case UpdateStatus::Ok: return "ok";
        case UpdateStatus::NotFound: return "not_found";
        case UpdateStatus::ValidationConflict: return "validation_conflict";
        case UpdateStatus::PersistenceFailure: return "persistence_failure";
    }
    return "unknown";
}

static UpdateOutcome fail(UpdateStatus st, std::string msg) {
    UpdateOutcome o;
    o.status = st;
    o.message = std::move(msg);
    return o;
}

static bool same_completion(const Milestone& a, const Milestone& b) {
    return a.completion_date == b.completion_date;
}

static Milestone merge_patch(const Milestone& current, const MilestonePatch& patch) {
    Milestone m = current;
    if (patch.name) m.name = *patch.name;
    if (patch.description) m.description = *patch.description;
    if (patch.duration) m.duration = *patch.duration;
    if (patch.completion_date_present) m.completion_date = patch.completion_date;
    if (patch.status) m.status = *patch.status;
    if (patch.type) m.type = *patch.type;
    if (patch.details) m.details = json_merge_objects(current.details, *patch.details);
    if (patch.order) m.order = *patch.order;
    if (patch.planned_text) m.planned_text = *patch.planned_text;
    if (patch.active_text) m.active_text = *patch.active_text;
    if (patch.completed_text) m.completed_text = *patch.completed_text;
    if (patch.blocked_text) m.blocked_text = *patch.blocked_text;
    if (patch.hidden) m.hidden = *patch.hidden;
    m.updated_by = patch.updated_by;
    return m;
}

UpdateOutcome apply_milestone_update(MilestoneTx& tx, int64_t timeline_id, int64_t milestone_id, const MilestonePatch& patch) {
    try {
        if (!tx.lock_timeline(timeline_id)) {
            return fail(UpdateStatus::NotFound, "Timeline not found for timeline id " + std::to_string(timeline_id));
        }
        auto current = tx.find_milestone(timeline_id, milestone_id);
        if (!current) {
            return fail(UpdateStatus::NotFound, "Milestone not found for milestone id " + std::to_string(milestone_id));
        }

        if (patch.completion_date_present && patch.completion_date && *patch.completion_date < current->start_date) {
            return fail(UpdateStatus::ValidationConflict, "The milestone completionDate should be greater or equal than the startDate.");
        }

        Milestone next;
        try {
            next = merge_patch(*current, patch);
        } catch (const std::runtime_error& e) {
            // the patch side was checked by the request gate, so the stored document is bad
            return fail(UpdateStatus::PersistenceFailure, std::string("stored details unreadable: ") + e.what());
        }
        const bool duration_changed = next.duration != current->duration;
        if (duration_changed) next.end_date = end_for(next.start_date, next.duration);

        UpdateOutcome out;
        out.original = *current;
        Milestone saved = tx.save_milestone(next);

        if (saved.order != current->order) {
            auto shifts = resolve_reorder(tx.list_order_slots(timeline_id), saved.id, current->order, saved.order);
            if (!shifts.empty()) tx.apply_order_shifts(timeline_id, shifts);
            out.order_shifts = shifts.size();
        }

        // an order move alone never reschedules
        if (duration_changed || !same_completion(*current, saved)) {
            auto writes = cascade_schedule(saved, tx.list_following(timeline_id, saved.order));
            if (!writes.empty()) tx.apply_schedule_writes(timeline_id, writes);
            out.schedule_writes = writes.size();
        }

        out.updated = std::move(saved);
        return out;
    } catch (const StoreError& e) {
        return fail(UpdateStatus::PersistenceFailure, e.what());
    }
}

}
