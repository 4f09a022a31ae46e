#pragma once

#include <libpq-fe.h>
#include "DbPool.h"
#include "../milestones/MilestoneTx.h"

namespace db {

// MilestoneTx over a libpq connection that already has a transaction open.
// Only valid inside a DbPool::async_transaction body.
class PgMilestoneTx : public milestones::MilestoneTx {
public:
    explicit PgMilestoneTx(PGconn* conn) : conn_(conn) {}

    bool lock_timeline(int64_t timeline_id) override;
    std::optional<milestones::Milestone> find_milestone(int64_t timeline_id, int64_t milestone_id) override;
    milestones::Milestone save_milestone(const milestones::Milestone& m) override;
    std::vector<milestones::OrderSlot> list_order_slots(int64_t timeline_id) override;
    std::vector<milestones::Milestone> list_following(int64_t timeline_id, int after_order) override;
    void apply_order_shifts(int64_t timeline_id, const std::vector<milestones::OrderShift>& shifts) override;
    void apply_schedule_writes(int64_t timeline_id, const std::vector<milestones::ScheduleWrite>& writes) override;

private:
    DbResult run(const char* what, const std::string& sql, const std::vector<std::optional<std::string>>& params);

    PGconn* conn_;
};

// Select list for one milestone row; timestamps come back as ISO strings in UTC.
const std::string& milestone_columns();

// Maps one row selected with milestone_columns(). Throws StoreError on malformed values.
milestones::Milestone milestone_from_row(const std::vector<std::optional<std::string>>& row);

// "{1,2,3}"
std::string build_pg_int_array(const std::vector<int64_t>& vals);

// Each run borrows one pool connection for the whole transaction.
milestones::TxRunner make_pg_tx_runner(std::shared_ptr<DbPool> pool);

}
