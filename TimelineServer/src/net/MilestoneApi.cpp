#include "MilestoneApi.h"
#include "MiniJson.h"
#include "../auth/Jwt.h"
#include "../milestones/MilestoneJson.h"
#include "../milestones/MilestoneService.h"
#include <openssl/rand.h>
#include <cctype>
#include <stdexcept>

namespace http = boost::beast::http;

static const std::string MILESTONE_PREFIX = "/v4/timelines/";
static const std::string MILESTONE_MIDDLE = "/milestones/";

std::optional<std::pair<std::string, std::string>> match_milestone_path(const std::string& path) {
    if (path.compare(0, MILESTONE_PREFIX.size(), MILESTONE_PREFIX) != 0) return std::nullopt;
    size_t tid_start = MILESTONE_PREFIX.size();
    size_t tid_end = path.find('/', tid_start);
    if (tid_end == std::string::npos || tid_end == tid_start) return std::nullopt;
    if (path.compare(tid_end, MILESTONE_MIDDLE.size(), MILESTONE_MIDDLE) != 0) return std::nullopt;
    size_t mid_start = tid_end + MILESTONE_MIDDLE.size();
    if (mid_start >= path.size()) return std::nullopt;
    std::string mid = path.substr(mid_start);
    if (mid.find('/') != std::string::npos) return std::nullopt;
    return std::make_pair(path.substr(tid_start, tid_end - tid_start), mid);
}

std::optional<int64_t> parse_positive_id(const std::string& s) {
    if (s.empty() || s[0] < '1' || s[0] > '9') return std::nullopt;
    auto v = parse_int64_strict_sv(s);
    if (!v.has_value() || *v <= 0) return std::nullopt;
    return v;
}

int http_status_for(milestones::UpdateStatus s) {
    switch (s) {
        case milestones::UpdateStatus::Ok: return 200;
        case milestones::UpdateStatus::NotFound: return 404;
        case milestones::UpdateStatus::ValidationConflict: return 422;
        case milestones::UpdateStatus::PersistenceFailure: return 500;
    }
    return 500;
}

std::string api_envelope(const std::string& request_id, int status, const std::string& content_json) {
    std::string out = "{\"id\":\"" + json_escape_resp(request_id) + "\",\"version\":\"v4\",\"result\":{";
    out += "\"success\":";
    out += (status >= 200 && status < 300) ? "true" : "false";
    out += ",\"status\":" + std::to_string(status);
    out += ",\"content\":" + content_json + "}}";
    return out;
}

static std::string message_content(const std::string& message) {
    return "{\"message\":\"" + json_escape_resp(message) + "\"}";
}

std::string random_request_id() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) throw std::runtime_error("RAND_bytes failed");
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(32);
    for (unsigned char b : bytes) { out.push_back(hex[b >> 4]); out.push_back(hex[b & 0xf]); }
    return out;
}

static bool usable_request_id(const std::string& v) {
    if (v.empty() || v.size() > 128) return false;
    for (unsigned char c : v) {
        if (!(isalnum(c) || c == '-' || c == '_' || c == '.')) return false;
    }
    return true;
}

std::string request_id_for(const Request& req) {
    auto it = req.find("X-Request-Id");
    if (it != req.end()) {
        std::string v(it->value());
        if (usable_request_id(v)) return v;
    }
    return random_request_id();
}

static Response make_api_response(unsigned version, bool keep_alive, const std::string& request_id, int status, const std::string& content_json) {
    Response res{static_cast<http::status>(status), version};
    res.set(http::field::content_type, "application/json; charset=utf-8");
    res.set("X-Request-Id", request_id);
    res.keep_alive(keep_alive);
    res.body() = api_envelope(request_id, status, content_json);
    res.prepare_payload();
    return res;
}

MilestoneApi::MilestoneApi(std::shared_ptr<milestones::MilestoneService> service, std::string jwt_secret)
    : service_(std::move(service)), jwt_secret_(std::move(jwt_secret)) {}

bool MilestoneApi::handle(const Request& req, const std::string& path, Reply reply) const {
    auto segments = match_milestone_path(path);
    if (!segments) return false;

    std::string request_id = request_id_for(req);
    auto error = [&](int status, const std::string& message) {
        reply(make_api_response(req.version(), req.keep_alive(), request_id, status, message_content(message)));
    };

    if (req.method() != http::verb::patch) { error(405, "method not allowed"); return true; }

    auto timeline_id = parse_positive_id(segments->first);
    if (!timeline_id) { error(400, "\"timelineId\" must be a positive integer"); return true; }
    auto milestone_id = parse_positive_id(segments->second);
    if (!milestone_id) { error(400, "\"milestoneId\" must be a positive integer"); return true; }

    auto auth_it = req.find(http::field::authorization);
    std::optional<auth::Claims> claims;
    if (auth_it != req.end()) {
        if (auto token = auth::bearer_token(std::string(auth_it->value()))) claims = auth::verify_jwt(*token, jwt_secret_);
    }
    std::optional<int64_t> user_id = claims ? auth::subject_user_id(*claims) : std::nullopt;
    if (!user_id) { error(401, "unauthorized"); return true; }

    std::string parse_error;
    auto patch = milestones::parse_milestone_patch(req.body(), parse_error);
    if (!patch) { error(400, parse_error); return true; }
    patch->updated_by = *user_id;

    // the request is gone by the time the service answers
    unsigned version = req.version();
    bool keep_alive = req.keep_alive();
    service_->async_update(*timeline_id, *milestone_id, std::move(*patch), request_id,
        [reply, request_id, version, keep_alive](milestones::UpdateOutcome out) {
            int status = http_status_for(out.status);
            std::string content = out.ok() && out.updated ? milestones::milestone_to_json(*out.updated) : message_content(out.message);
            reply(make_api_response(version, keep_alive, request_id, status, content));
        });
    return true;
}
