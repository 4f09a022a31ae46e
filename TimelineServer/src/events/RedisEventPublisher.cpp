#include "RedisEventPublisher.h"
#include "../redis/RedisClient.h"
#include "../observability/Logging.h"
#include "../observability/Metrics.h"

namespace events {

RedisEventPublisher::RedisEventPublisher(std::shared_ptr<redis::RedisClient> client)
    : client_(std::move(client)) {}

void RedisEventPublisher::publish(const std::string& routing_key, const std::string& payload_json, const std::string& correlation_id, DoneCb done) {
    std::string envelope = build_envelope(routing_key, payload_json, correlation_id);
    client_->async_publish(routing_key, envelope, [routing_key, correlation_id, done](boost::system::error_code ec, int64_t receivers) {
        if (ec) {
            observability::Metrics::instance().add("milestone_events_failed_total", "routing_key", routing_key, 1);
            observability::log_warn("events.publish_failed", {{"routing_key", routing_key}, {"correlation_id", correlation_id}, {"err", ec.message()}});
        } else {
            observability::log_info("events.published", {{"routing_key", routing_key}, {"correlation_id", correlation_id}, {"receivers", receivers}});
        }
        if (done) done(ec);
    });
}

}
