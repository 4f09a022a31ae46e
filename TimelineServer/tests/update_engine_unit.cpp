#include <iostream>
#include <string>
#include "milestones/UpdateEngine.h"
#include "memory_tx.h"

using namespace milestones;

// Runs one update the way the service does: commit only when the outcome is ok.
static UpdateOutcome run(MemoryStore& store, int64_t tid, int64_t mid, const MilestonePatch& patch, const std::string& fail_on = std::string()) {
    MemoryTx tx(store);
    tx.fail_on = fail_on;
    UpdateOutcome out = apply_milestone_update(tx, tid, mid, patch);
    if (out.ok()) tx.commit(); else tx.rollback();
    return out;
}

static MilestonePatch by_user(int64_t user) {
    MilestonePatch p;
    p.updated_by = user;
    return p;
}

int main() {
    // unknown timeline, then unknown milestone
    {
        MemoryStore store;
        seed_timeline(store, 1, 3, day("2024-01-10"));
        auto out = run(store, 9, 101, by_user(7));
        if (out.status != UpdateStatus::NotFound || out.message != "Timeline not found for timeline id 9") { std::cerr << "timeline not found: " << out.message << "\n"; return 1; }
        out = run(store, 1, 999, by_user(7));
        if (out.status != UpdateStatus::NotFound || out.message != "Milestone not found for milestone id 999") { std::cerr << "milestone not found: " << out.message << "\n"; return 1; }
        // a milestone of another timeline is not found either
        seed_timeline(store, 2, 1, day("2024-01-10"));
        out = run(store, 1, 201, by_user(7));
        if (out.status != UpdateStatus::NotFound) { std::cerr << "cross-timeline lookup succeeded\n"; return 1; }
        if (store.commits != 0) { std::cerr << "not found must not commit\n"; return 1; }
    }

    // soft-deleted milestones are invisible
    {
        MemoryStore store;
        seed_timeline(store, 1, 3, day("2024-01-10"));
        store.rows[102].deleted_at = std::string("2024-01-05T00:00:00.000Z");
        auto out = run(store, 1, 102, by_user(7));
        if (out.status != UpdateStatus::NotFound) { std::cerr << "deleted milestone was found\n"; return 1; }
    }

    // completion before the current start is rejected with no writes
    {
        MemoryStore store;
        seed_timeline(store, 1, 3, day("2024-01-10"));
        auto before = store.rows;
        MilestonePatch p = by_user(7);
        p.completion_date_present = true;
        p.completion_date = day("2024-01-09");
        p.duration = 9;
        auto out = run(store, 1, 101, p);
        if (out.status != UpdateStatus::ValidationConflict) { std::cerr << "expected validation conflict\n"; return 1; }
        if (out.message != "The milestone completionDate should be greater or equal than the startDate.") { std::cerr << "conflict message: " << out.message << "\n"; return 1; }
        if (store.rows.at(101).duration != before.at(101).duration || store.commits != 0) { std::cerr << "rejected update wrote\n"; return 1; }
    }

    // completion on the start day is fine
    {
        MemoryStore store;
        seed_timeline(store, 1, 3, day("2024-01-10"));
        MilestonePatch p = by_user(7);
        p.completion_date_present = true;
        p.completion_date = day("2024-01-10");
        auto out = run(store, 1, 101, p);
        if (!out.ok()) { std::cerr << "completion on start day rejected: " << out.message << "\n"; return 1; }
        if (store.rows.at(102).start_date != day("2024-01-11")) { std::cerr << "early completion did not pull next sibling\n"; return 1; }
        auto broken = check_invariants(store, 1);
        if (!broken.empty()) { std::cerr << "after completion: " << broken << "\n"; return 1; }
    }

    // duration 5 -> 10 recomputes the end and ripples to the rest of the timeline
    {
        MemoryStore store;
        seed_timeline(store, 1, 4, day("2024-01-10"));
        MilestonePatch p = by_user(7);
        p.duration = 10;
        auto out = run(store, 1, 101, p);
        if (!out.ok()) { std::cerr << "duration update failed: " << out.message << "\n"; return 1; }
        if (format_day(out.updated->end_date) != "2024-01-19") { std::cerr << "own end not recomputed\n"; return 1; }
        if (format_day(store.rows.at(102).start_date) != "2024-01-20") { std::cerr << "next sibling start: " << format_day(store.rows.at(102).start_date) << "\n"; return 1; }
        if (format_day(store.rows.at(102).end_date) != "2024-01-24") { std::cerr << "next sibling end not shifted\n"; return 1; }
        if (out.schedule_writes != 3) { std::cerr << "expected 3 cascade writes got " << out.schedule_writes << "\n"; return 1; }
        if (out.updated->updated_by != 7) { std::cerr << "updated_by not applied\n"; return 1; }
        if (out.original->duration != 5) { std::cerr << "original snapshot lost\n"; return 1; }
        auto broken = check_invariants(store, 1);
        if (!broken.empty()) { std::cerr << "after duration: " << broken << "\n"; return 1; }
    }

    // moving 5 -> 2 shifts 2,3,4 and does not reschedule
    {
        MemoryStore store;
        seed_timeline(store, 1, 6, day("2024-01-10"));
        auto starts_before = store.rows;
        MilestonePatch p = by_user(7);
        p.order = 2;
        auto out = run(store, 1, 105, p);
        if (!out.ok()) { std::cerr << "reorder failed: " << out.message << "\n"; return 1; }
        if (out.order_shifts != 3) { std::cerr << "expected 3 shifts got " << out.order_shifts << "\n"; return 1; }
        if (store.rows.at(105).order != 2 || store.rows.at(102).order != 3 || store.rows.at(103).order != 4 || store.rows.at(104).order != 5) {
            std::cerr << "wrong orders after move\n"; return 1;
        }
        if (store.rows.at(101).order != 1 || store.rows.at(106).order != 6) { std::cerr << "items outside the range moved\n"; return 1; }
        if (out.schedule_writes != 0) { std::cerr << "order move alone must not cascade\n"; return 1; }
        for (const auto& p2 : store.rows) {
            if (p2.second.start_date != starts_before.at(p2.first).start_date) { std::cerr << "dates changed on a pure reorder\n"; return 1; }
        }
    }

    // same order or an unoccupied order: no shifts, requested order kept
    {
        MemoryStore store;
        seed_timeline(store, 1, 3, day("2024-01-10"));
        MilestonePatch p = by_user(7);
        p.order = 2;
        auto out = run(store, 1, 102, p);
        if (!out.ok() || out.order_shifts != 0) { std::cerr << "same order produced shifts\n"; return 1; }
        p.order = 8;
        out = run(store, 1, 102, p);
        if (!out.ok() || out.order_shifts != 0 || store.rows.at(102).order != 8) { std::cerr << "unoccupied order handling wrong\n"; return 1; }
    }

    // details are deep merged, other fields only when present
    {
        MemoryStore store;
        seed_timeline(store, 1, 1, day("2024-01-10"));
        store.rows[101].details = "{\"a\":{\"x\":1,\"y\":2},\"keep\":true}";
        store.rows[101].description = std::string("old");
        MilestonePatch p = by_user(7);
        p.details = std::string("{\"a\":{\"y\":3},\"b\":[1]}");
        p.name = std::string("Renamed");
        auto out = run(store, 1, 101, p);
        if (!out.ok()) { std::cerr << "details update failed\n"; return 1; }
        if (out.updated->details != "{\"a\":{\"x\":1,\"y\":3},\"keep\":true,\"b\":[1]}") { std::cerr << "details merge: " << out.updated->details << "\n"; return 1; }
        if (out.updated->name != "Renamed" || out.updated->description != std::string("old")) { std::cerr << "field merge wrong\n"; return 1; }
    }

    // clearing the completion date falls back to the planned end
    {
        MemoryStore store;
        seed_timeline(store, 1, 2, day("2024-01-10"));
        MilestonePatch set = by_user(7);
        set.completion_date_present = true;
        set.completion_date = day("2024-01-12");
        if (!run(store, 1, 101, set).ok()) { std::cerr << "set completion failed\n"; return 1; }
        MilestonePatch clear = by_user(7);
        clear.completion_date_present = true;
        auto out = run(store, 1, 101, clear);
        if (!out.ok() || out.updated->completion_date.has_value()) { std::cerr << "completion not cleared\n"; return 1; }
        if (store.rows.at(102).start_date != day("2024-01-15")) { std::cerr << "clearing completion did not restore schedule\n"; return 1; }
    }

    // a store failure anywhere rolls the whole update back
    for (const char* op : {"save_milestone", "apply_order_shifts", "list_following", "apply_schedule_writes"}) {
        MemoryStore store;
        seed_timeline(store, 1, 5, day("2024-01-10"));
        auto before = store.rows;
        MilestonePatch p = by_user(7);
        p.order = 1;
        p.duration = 2;
        auto out = run(store, 1, 104, p, op);
        if (out.status != UpdateStatus::PersistenceFailure) { std::cerr << "expected persistence failure for " << op << "\n"; return 1; }
        if (store.commits != 0 || store.rollbacks != 1) { std::cerr << "failure in " << op << " was committed\n"; return 1; }
        for (const auto& r : store.rows) {
            const auto& b = before.at(r.first);
            if (r.second.order != b.order || r.second.start_date != b.start_date || r.second.duration != b.duration) {
                std::cerr << "partial write survived failure in " << op << "\n"; return 1;
            }
        }
    }

    // soft-deleted siblings are skipped by the cascade
    {
        MemoryStore store;
        seed_timeline(store, 1, 4, day("2024-01-10"));
        store.rows[103].deleted_at = std::string("2024-01-05T00:00:00.000Z");
        auto deleted_before = store.rows.at(103);
        MilestonePatch p = by_user(7);
        p.duration = 7;
        auto out = run(store, 1, 102, p);
        if (!out.ok()) { std::cerr << "update next to deleted row failed\n"; return 1; }
        if (store.rows.at(103).start_date != deleted_before.start_date) { std::cerr << "deleted sibling rescheduled\n"; return 1; }
        if (store.rows.at(104).start_date != store.rows.at(102).end_date + 1) { std::cerr << "cascade did not skip deleted sibling\n"; return 1; }
    }

    // a soft-deleted row holding the target order does not count as occupied
    {
        MemoryStore store;
        seed_timeline(store, 1, 5, day("2024-01-10"));
        store.rows[105].deleted_at = std::string("2024-01-05T00:00:00.000Z");
        MilestonePatch p = by_user(7);
        p.order = 5;
        auto out = run(store, 1, 102, p);
        if (!out.ok() || out.order_shifts != 0) { std::cerr << "deleted occupant caused shifts: " << out.order_shifts << "\n"; return 1; }
        if (store.rows.at(105).order != 5 || store.rows.at(102).order != 5) { std::cerr << "orders wrong after move onto deleted slot\n"; return 1; }
        if (store.rows.at(103).order != 3 || store.rows.at(104).order != 4) { std::cerr << "live rows moved without an occupant\n"; return 1; }
    }

    // moving across a soft-deleted row shifts only the live ones
    {
        MemoryStore store;
        seed_timeline(store, 1, 5, day("2024-01-10"));
        store.rows[103].deleted_at = std::string("2024-01-05T00:00:00.000Z");
        MilestonePatch p = by_user(7);
        p.order = 2;
        auto out = run(store, 1, 105, p);
        if (!out.ok() || out.order_shifts != 2) { std::cerr << "expected 2 live shifts got " << out.order_shifts << "\n"; return 1; }
        if (store.rows.at(105).order != 2 || store.rows.at(102).order != 3 || store.rows.at(104).order != 5) { std::cerr << "live orders wrong after crossing deleted row\n"; return 1; }
        if (store.rows.at(103).order != 3) { std::cerr << "deleted row was shifted\n"; return 1; }
    }

    // unreadable stored details are a store problem, not a caller error
    {
        MemoryStore store;
        seed_timeline(store, 1, 2, day("2024-01-10"));
        store.rows[101].details = "[1,2]";
        MilestonePatch p = by_user(7);
        p.details = std::string("{\"a\":1}");
        p.duration = 8;
        auto out = run(store, 1, 101, p);
        if (out.status != UpdateStatus::PersistenceFailure) { std::cerr << "corrupt stored details gave " << to_string(out.status) << "\n"; return 1; }
        if (store.commits != 0 || store.rows.at(101).duration != 5) { std::cerr << "corrupt details update wrote\n"; return 1; }
    }

    std::cout << "update_engine_unit ok\n";
    return 0;
}
