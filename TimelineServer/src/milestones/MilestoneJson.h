#pragma once

#include <optional>
#include <string>
#include "Milestone.h"

namespace milestones {

// camelCase wire form; soft-delete fields are never emitted.
std::string milestone_to_json(const Milestone& m);

// Validates a PATCH body of the form {"param": {...}} and maps it onto a patch.
// On rejection returns nullopt and sets error to a client-facing message.
std::optional<MilestonePatch> parse_milestone_patch(const std::string& body, std::string& error);

// "2024-01-10 09:15:00.123+00" -> "2024-01-10T09:15:00.123Z"
std::string normalize_timestamp(const std::string& pg_ts);

}
