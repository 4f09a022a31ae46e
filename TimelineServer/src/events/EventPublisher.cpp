#include "EventPublisher.h"
#include "../net/MiniJson.h"
#include "../observability/Logging.h"

namespace events {

std::string build_envelope(const std::string& routing_key, const std::string& payload_json, const std::string& correlation_id) {
    std::string out;
    out.reserve(payload_json.size() + routing_key.size() + correlation_id.size() + 64);
    out += "{\"routingKey\":\"";
    out += json_escape_resp(routing_key);
    out += "\",\"correlationId\":\"";
    out += json_escape_resp(correlation_id);
    out += "\",\"payload\":";
    out += payload_json;
    out += '}';
    return out;
}

void LogOnlyPublisher::publish(const std::string& routing_key, const std::string& payload_json, const std::string& correlation_id, DoneCb done) {
    observability::log_info("events.publish_skipped", {{"routing_key", routing_key}, {"correlation_id", correlation_id}, {"bytes", int64_t(payload_json.size())}});
    if (done) done({});
}

}
