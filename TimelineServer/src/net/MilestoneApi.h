#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "Request.h"
#include "Response.h"
#include "../milestones/UpdateEngine.h"

namespace milestones { class MilestoneService; }

struct MilestonePath {
    int64_t timeline_id = 0;
    int64_t milestone_id = 0;
};

// Shape of "/v4/timelines/{tid}/milestones/{mid}". Returns the raw id segments when
// the path has that shape, without judging the ids.
std::optional<std::pair<std::string, std::string>> match_milestone_path(const std::string& path);

// Positive decimal id, no sign, no leading zeros.
std::optional<int64_t> parse_positive_id(const std::string& s);

int http_status_for(milestones::UpdateStatus s);

// {"id":<request_id>,"version":"v4","result":{"success":..,"status":..,"content":<content_json>}}
std::string api_envelope(const std::string& request_id, int status, const std::string& content_json);

// X-Request-Id when the caller sent a usable one, otherwise 32 random hex chars.
std::string request_id_for(const Request& req);
std::string random_request_id();

// PATCH /v4/timelines/{tid}/milestones/{mid}
class MilestoneApi {
public:
    using Reply = std::function<void(Response)>;

    MilestoneApi(std::shared_ptr<milestones::MilestoneService> service, std::string jwt_secret);

    // false when path is not a milestone route. Otherwise reply is called exactly once,
    // possibly later from the io_context.
    bool handle(const Request& req, const std::string& path, Reply reply) const;

private:
    std::shared_ptr<milestones::MilestoneService> service_;
    std::string jwt_secret_;
};
