#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "Dates.h"

namespace milestones {

struct Milestone {
    int64_t id = 0;
    int64_t timeline_id = 0;
    std::string name;
    std::optional<std::string> description;
    int duration = 1;
    day_t start_date = 0;
    day_t end_date = 0;
    std::optional<day_t> completion_date;
    std::string status;
    std::string type;
    std::string details = "{}";
    int order = 1;
    std::optional<std::string> planned_text;
    std::optional<std::string> active_text;
    std::optional<std::string> completed_text;
    std::optional<std::string> blocked_text;
    bool hidden = false;
    int64_t created_by = 0;
    int64_t updated_by = 0;
    std::string created_at;
    std::string updated_at;
    // internal, never leaves the service
    std::optional<std::string> deleted_at;
    std::optional<int64_t> deleted_by;
};

inline day_t effective_end(const Milestone& m) {
    return m.completion_date.has_value() ? *m.completion_date : m.end_date;
}

// Caller-supplied partial mutation. start/end dates are derived and cannot be set.
struct MilestonePatch {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<int> duration;
    bool completion_date_present = false;   // explicit null clears the completion date
    std::optional<day_t> completion_date;
    std::optional<std::string> status;
    std::optional<std::string> type;
    std::optional<std::string> details;     // JSON object, deep-merged over the stored one
    std::optional<int> order;
    std::optional<std::string> planned_text;
    std::optional<std::string> active_text;
    std::optional<std::string> completed_text;
    std::optional<std::string> blocked_text;
    std::optional<bool> hidden;
    int64_t updated_by = 0;
};

struct OrderSlot {
    int64_t id = 0;
    int order = 0;
};

struct OrderShift {
    int64_t id = 0;
    int new_order = 0;
};

struct ScheduleWrite {
    int64_t id = 0;
    day_t start_date = 0;
    day_t end_date = 0;
};

}
