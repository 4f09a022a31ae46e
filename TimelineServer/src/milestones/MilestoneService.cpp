#include "MilestoneService.h"
#include "MilestoneJson.h"
#include "../events/EventPublisher.h"
#include "../observability/Logging.h"
#include "../observability/Metrics.h"

namespace milestones {

std::string build_update_event_payload(const Milestone& original, const Milestone& updated) {
    return "{\"original\":" + milestone_to_json(original) + ",\"updated\":" + milestone_to_json(updated) + "}";
}

MilestoneService::MilestoneService(TxRunner runner, std::shared_ptr<events::EventPublisher> publisher)
    : runner_(std::move(runner)), publisher_(std::move(publisher)) {}

void MilestoneService::async_update(int64_t timeline_id, int64_t milestone_id, MilestonePatch patch, std::string correlation_id, UpdateCb cb) {
    // written on the store thread, read after the runner hands completion back
    auto outcome = std::make_shared<UpdateOutcome>();
    auto ran = std::make_shared<bool>(false);

    TxBody body = [outcome, ran, timeline_id, milestone_id, patch = std::move(patch)](MilestoneTx& tx) {
        *ran = true;
        *outcome = apply_milestone_update(tx, timeline_id, milestone_id, patch);
        return outcome->ok();
    };

    auto publisher = publisher_;
    TxDone done = [outcome, ran, publisher, timeline_id, milestone_id, correlation_id = std::move(correlation_id), cb = std::move(cb)](const boost::system::error_code& ec, bool committed) {
        UpdateOutcome out = std::move(*outcome);
        if (out.ok() && (ec || !committed || !*ran)) {
            // the engine succeeded (or never ran) but nothing reached the store
            UpdateOutcome failed;
            failed.status = UpdateStatus::PersistenceFailure;
            failed.message = ec ? "store unavailable: " + ec.message() : std::string("transaction was not committed");
            out = std::move(failed);
        }

        auto& metrics = observability::Metrics::instance();
        metrics.add("milestone_updates_total", "outcome", to_string(out.status), 1);
        if (out.ok()) {
            metrics.add("milestone_reorder_shifts_total", out.order_shifts);
            metrics.add("milestone_cascade_writes_total", out.schedule_writes);
        }

        observability::Fields f{
            {"timeline_id", timeline_id},
            {"milestone_id", milestone_id},
            {"outcome", std::string(to_string(out.status))},
            {"order_shifts", int64_t(out.order_shifts)},
            {"schedule_writes", int64_t(out.schedule_writes)},
            {"request_id", correlation_id}};
        if (out.ok()) {
            observability::log_info("milestone.update", f);
        } else {
            f["message"] = out.message;
            if (out.status == UpdateStatus::PersistenceFailure) observability::log_error("milestone.update", f);
            else observability::log_info("milestone.update", f);
        }

        if (out.ok() && publisher && out.original && out.updated) {
            publisher->publish(events::MILESTONE_UPDATED, build_update_event_payload(*out.original, *out.updated), correlation_id);
        }
        cb(std::move(out));
    };

    runner_(std::move(body), std::move(done));
}

}
