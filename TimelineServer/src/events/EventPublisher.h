#pragma once

#include <functional>
#include <string>
#include <boost/system/error_code.hpp>

namespace events {

inline constexpr const char* MILESTONE_UPDATED = "milestone.updated";

// Fire-and-forget change notifications. done, when given, only reports delivery to
// the bus; it never influences the mutation that produced the event.
class EventPublisher {
public:
    using DoneCb = std::function<void(const boost::system::error_code&)>;
    virtual ~EventPublisher() = default;
    virtual void publish(const std::string& routing_key, const std::string& payload_json, const std::string& correlation_id, DoneCb done = nullptr) = 0;
};

// {"routingKey":..,"correlationId":..,"payload":<payload_json>}
std::string build_envelope(const std::string& routing_key, const std::string& payload_json, const std::string& correlation_id);

// Used when no bus is configured: the event is only logged.
class LogOnlyPublisher : public EventPublisher {
public:
    void publish(const std::string& routing_key, const std::string& payload_json, const std::string& correlation_id, DoneCb done = nullptr) override;
};

}
