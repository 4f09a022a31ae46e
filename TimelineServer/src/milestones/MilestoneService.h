#pragma once

#include <functional>
#include <memory>
#include <string>
#include "MilestoneTx.h"
#include "UpdateEngine.h"

namespace events { class EventPublisher; }

namespace milestones {

// Async boundary around apply_milestone_update: one store transaction per call,
// then exactly one milestone.updated event once the transaction has committed.
class MilestoneService {
public:
    using UpdateCb = std::function<void(UpdateOutcome)>;

    MilestoneService(TxRunner runner, std::shared_ptr<events::EventPublisher> publisher);

    // cb runs on the thread that delivers the runner's completion.
    void async_update(int64_t timeline_id, int64_t milestone_id, MilestonePatch patch, std::string correlation_id, UpdateCb cb);

private:
    TxRunner runner_;
    std::shared_ptr<events::EventPublisher> publisher_;
};

// {"original":<milestone>,"updated":<milestone>}
std::string build_update_event_payload(const Milestone& original, const Milestone& updated);

}
