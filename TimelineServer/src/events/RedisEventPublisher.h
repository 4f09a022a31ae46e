#pragma once

#include <memory>
#include "EventPublisher.h"

namespace redis { class RedisClient; }

namespace events {

// Publishes each event envelope on the Redis channel named by its routing key.
class RedisEventPublisher : public EventPublisher {
public:
    explicit RedisEventPublisher(std::shared_ptr<redis::RedisClient> client);
    void publish(const std::string& routing_key, const std::string& payload_json, const std::string& correlation_id, DoneCb done = nullptr) override;
private:
    std::shared_ptr<redis::RedisClient> client_;
};

}
