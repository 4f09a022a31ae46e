#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace milestones {

// Whole UTC days since 1970-01-01. All schedule arithmetic happens at this granularity.
using day_t = int64_t;

// Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS[.fff]Z" and the postgres text forms
// "YYYY-MM-DD HH:MM:SS[.fff]+00[:00]". Time of day is truncated to the UTC day.
std::optional<day_t> parse_day(const std::string& s);

// "YYYY-MM-DD"
std::string format_day(day_t d);

// "YYYY-MM-DDT00:00:00.000Z"
std::string format_day_iso(day_t d);

inline day_t add_days(day_t d, int64_t n) { return d + n; }

inline day_t end_for(day_t start, int duration) { return start + duration - 1; }

}
