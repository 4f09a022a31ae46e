#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/system/error_code.hpp>
#include "Milestone.h"

namespace milestones {

// Raised by a store when a read or write is rejected. Aborts the surrounding transaction.
class StoreError : public std::runtime_error {
public:
    StoreError(const std::string& msg, std::string sqlstate = std::string())
        : std::runtime_error(msg), sqlstate_(std::move(sqlstate)) {}
    const std::string& sqlstate() const { return sqlstate_; }
private:
    std::string sqlstate_;
};

// One open transaction on the milestone collection. Every call happens inside the
// same transaction; the owner decides whether it commits. Sibling queries never
// return soft-deleted rows.
class MilestoneTx {
public:
    virtual ~MilestoneTx() = default;

    // Takes the timeline's write lock. false when the timeline does not exist.
    virtual bool lock_timeline(int64_t timeline_id) = 0;

    virtual std::optional<Milestone> find_milestone(int64_t timeline_id, int64_t milestone_id) = 0;

    // Persists every field of m and returns the stored row.
    virtual Milestone save_milestone(const Milestone& m) = 0;

    virtual std::vector<OrderSlot> list_order_slots(int64_t timeline_id) = 0;

    // Siblings with order strictly greater than after_order, ascending by order.
    virtual std::vector<Milestone> list_following(int64_t timeline_id, int after_order) = 0;

    virtual void apply_order_shifts(int64_t timeline_id, const std::vector<OrderShift>& shifts) = 0;
    virtual void apply_schedule_writes(int64_t timeline_id, const std::vector<ScheduleWrite>& writes) = 0;
};

// Runs body inside one store transaction and commits only when body returns true.
// done reports whether the commit happened; ec is set when the store was unreachable.
using TxBody = std::function<bool(MilestoneTx&)>;
using TxDone = std::function<void(const boost::system::error_code& ec, bool committed)>;
using TxRunner = std::function<void(TxBody body, TxDone done)>;

}
