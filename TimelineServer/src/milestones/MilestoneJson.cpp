#include "MilestoneJson.h"
#include "../net/MiniJson.h"
#include <sstream>
#include <stdexcept>

namespace milestones {

std::string normalize_timestamp(const std::string& s_in) {
    std::string s = s_in;
    if (s.empty()) return s;
    if (s.size() > 10 && s[10] == ' ') s[10] = 'T';
    if (s.size() >= 6 && s.compare(s.size() - 6, 6, "+00:00") == 0) { s.erase(s.size() - 6); s.push_back('Z'); }
    else if (s.size() >= 5 && s.compare(s.size() - 5, 5, "+0000") == 0) { s.erase(s.size() - 5); s.push_back('Z'); }
    else if (s.size() >= 3 && s.compare(s.size() - 3, 3, "+00") == 0) { s.erase(s.size() - 3); s.push_back('Z'); }
    return s;
}

static void emit_opt_string(std::ostringstream& ss, const char* key, const std::optional<std::string>& v) {
    ss << ",\"" << key << "\":";
    if (v.has_value()) ss << '"' << json_escape_resp(*v) << '"'; else ss << "null";
}

std::string milestone_to_json(const Milestone& m) {
    std::ostringstream ss;
    ss << '{';
    ss << "\"id\":" << m.id;
    ss << ",\"timelineId\":" << m.timeline_id;
    ss << ",\"name\":\"" << json_escape_resp(m.name) << '"';
    emit_opt_string(ss, "description", m.description);
    ss << ",\"duration\":" << m.duration;
    ss << ",\"startDate\":\"" << format_day_iso(m.start_date) << '"';
    ss << ",\"endDate\":\"" << format_day_iso(m.end_date) << '"';
    ss << ",\"completionDate\":";
    if (m.completion_date.has_value()) ss << '"' << format_day_iso(*m.completion_date) << '"'; else ss << "null";
    ss << ",\"status\":\"" << json_escape_resp(m.status) << '"';
    ss << ",\"type\":\"" << json_escape_resp(m.type) << '"';
    ss << ",\"details\":" << (m.details.empty() ? std::string("{}") : m.details);
    ss << ",\"order\":" << m.order;
    emit_opt_string(ss, "plannedText", m.planned_text);
    emit_opt_string(ss, "activeText", m.active_text);
    emit_opt_string(ss, "completedText", m.completed_text);
    emit_opt_string(ss, "blockedText", m.blocked_text);
    ss << ",\"hidden\":" << (m.hidden ? "true" : "false");
    ss << ",\"createdBy\":" << m.created_by;
    ss << ",\"updatedBy\":" << m.updated_by;
    ss << ",\"createdAt\":\"" << json_escape_resp(normalize_timestamp(m.created_at)) << '"';
    ss << ",\"updatedAt\":\"" << json_escape_resp(normalize_timestamp(m.updated_at)) << '"';
    ss << '}';
    return ss.str();
}

namespace {

struct StringRule { const char* key; size_t max_len; std::optional<std::string> MilestonePatch::* field; };

const StringRule STRING_RULES[] = {
    {"name", 255, &MilestonePatch::name},
    {"description", 255, &MilestonePatch::description},
    {"status", 45, &MilestonePatch::status},
    {"type", 45, &MilestonePatch::type},
    {"plannedText", 512, &MilestonePatch::planned_text},
    {"activeText", 512, &MilestonePatch::active_text},
    {"completedText", 512, &MilestonePatch::completed_text},
    {"blockedText", 512, &MilestonePatch::blocked_text},
};

const char* const STRIPPED_KEYS[] = {"id", "createdAt", "updatedAt", "deletedAt", "createdBy", "updatedBy", "deletedBy"};

const char* const FORBIDDEN_KEYS[] = {"startDate", "endDate"};

// counts UTF-8 code points, not bytes
size_t text_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) if ((c & 0xc0) != 0x80) ++n;
    return n;
}

template <typename T, size_t N>
bool contains(const T (&arr)[N], const std::string& key) {
    for (const auto& a : arr) if (key == a) return true;
    return false;
}

}

std::optional<MilestonePatch> parse_milestone_patch(const std::string& body, std::string& error) {
    JsonValue doc;
    try {
        doc = json_parse(body);
    } catch (const std::exception& e) {
        error = std::string("invalid json: ") + e.what();
        return std::nullopt;
    }
    if (!doc.is_object()) { error = "body must be a json object"; return std::nullopt; }
    const JsonValue* param = doc.find("param");
    if (!param) { error = "\"param\" is required"; return std::nullopt; }
    if (!param->is_object()) { error = "\"param\" must be an object"; return std::nullopt; }

    MilestonePatch patch;
    for (const auto& kv : param->obj) {
        const std::string& key = kv.first;
        const JsonValue& v = kv.second;

        if (contains(STRIPPED_KEYS, key)) continue;
        if (contains(FORBIDDEN_KEYS, key)) { error = "\"" + key + "\" is not allowed"; return std::nullopt; }

        bool handled = false;
        for (const auto& rule : STRING_RULES) {
            if (key != rule.key) continue;
            handled = true;
            if (v.type != JsonValue::Type::String) { error = "\"" + key + "\" must be a string"; return std::nullopt; }
            if (text_length(v.str) > rule.max_len) {
                error = "\"" + key + "\" length must be less than or equal to " + std::to_string(rule.max_len) + " characters long";
                return std::nullopt;
            }
            patch.*(rule.field) = v.str;
        }
        if (handled) continue;

        if (key == "duration" || key == "order") {
            auto n = json_number_as_int(v);
            if (!n.has_value()) { error = "\"" + key + "\" must be an integer"; return std::nullopt; }
            if (*n < 1) { error = "\"" + key + "\" must be larger than or equal to 1"; return std::nullopt; }
            if (key == "duration") patch.duration = *n; else patch.order = *n;
        } else if (key == "completionDate") {
            patch.completion_date_present = true;
            if (v.type == JsonValue::Type::Null) continue;
            if (v.type != JsonValue::Type::String) { error = "\"completionDate\" must be a date"; return std::nullopt; }
            auto d = parse_day(v.str);
            if (!d.has_value()) { error = "\"completionDate\" must be a date"; return std::nullopt; }
            patch.completion_date = *d;
        } else if (key == "details") {
            if (!v.is_object()) { error = "\"details\" must be an object"; return std::nullopt; }
            patch.details = json_serialize(v);
        } else if (key == "hidden") {
            if (v.type != JsonValue::Type::Bool) { error = "\"hidden\" must be a boolean"; return std::nullopt; }
            patch.hidden = v.boolean;
        } else {
            error = "\"" + key + "\" is not allowed";
            return std::nullopt;
        }
    }
    return patch;
}

}
