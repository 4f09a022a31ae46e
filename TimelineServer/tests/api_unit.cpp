#include <ctime>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <boost/beast/http.hpp>
#include "auth/Jwt.h"
#include "events/EventPublisher.h"
#include "milestones/MilestoneService.h"
#include "net/MilestoneApi.h"
#include "net/MiniJson.h"
#include "memory_tx.h"

using namespace boost::beast::http;

static const std::string SECRET = "api-secret";

static std::string token_for(const std::string& sub) {
    auth::Claims c;
    c.sub = sub;
    c.email = "u@example.com";
    c.iat = std::time(nullptr) - 5;
    c.exp = std::time(nullptr) + 600;
    return auth::create_jwt(c, SECRET);
}

static Request make_request(verb m, const std::string& target, const std::string& body, const std::string& sub = "7") {
    Request req{m, target, 11};
    req.set(field::host, "localhost");
    if (!sub.empty()) req.set(field::authorization, "Bearer " + token_for(sub));
    req.body() = body;
    req.prepare_payload();
    return req;
}

struct Harness {
    MemoryStore store;
    std::shared_ptr<MilestoneApi> api;
    Harness() {
        seed_timeline(store, 1, 3, day("2024-01-10"));
        auto service = std::make_shared<milestones::MilestoneService>(memory_runner(store), std::make_shared<events::LogOnlyPublisher>());
        api = std::make_shared<MilestoneApi>(service, SECRET);
    }
    // reply is synchronous with the in-memory runner
    std::optional<Response> call(const Request& req) {
        std::optional<Response> got;
        std::string path(req.target());
        if (!api->handle(req, path, [&](Response r) { got = std::move(r); })) return std::nullopt;
        return got;
    }
};

static bool expect(const std::optional<Response>& res, int status, const char* what) {
    if (!res) { std::cerr << what << ": no reply\n"; return false; }
    if (res->result_int() != unsigned(status)) { std::cerr << what << ": expected " << status << " got " << res->result_int() << " " << res->body() << "\n"; return false; }
    JsonValue env = json_parse(res->body());
    const JsonValue* result = env.find("result");
    if (!result || result->find("status")->str != std::to_string(status)) { std::cerr << what << ": envelope status mismatch\n"; return false; }
    bool success = result->find("success")->boolean;
    if (success != (status == 200)) { std::cerr << what << ": success flag wrong\n"; return false; }
    if (env.find("version")->str != "v4") { std::cerr << what << ": version\n"; return false; }
    if (res->find("X-Request-Id") == res->end() || std::string((*res)["X-Request-Id"]) != env.find("id")->str) { std::cerr << what << ": request id header\n"; return false; }
    return true;
}

static std::string message_of(const Response& res) {
    return json_parse(res.body()).find("result")->find("content")->find("message")->str;
}

int main() {
    if (match_milestone_path("/v4/timelines/1/milestones/2") != std::make_pair(std::string("1"), std::string("2"))) { std::cerr << "path match\n"; return 1; }
    for (const char* p : {"/v4/timelines/1/milestones/", "/v4/timelines//milestones/2", "/v4/timelines/1/milestones/2/x", "/v3/timelines/1/milestones/2", "/health"}) {
        if (match_milestone_path(p)) { std::cerr << "matched non-route " << p << "\n"; return 1; }
    }
    for (const char* bad : {"0", "01", "-1", "+1", "1.5", "abc", "99999999999999999999"}) {
        if (parse_positive_id(bad)) { std::cerr << "bad id accepted " << bad << "\n"; return 1; }
    }
    if (random_request_id().size() != 32 || random_request_id() == random_request_id()) { std::cerr << "random request id\n"; return 1; }

    Harness h;
    const std::string target = "/v4/timelines/1/milestones/101";

    if (h.call(make_request(verb::get, "/health", ""))) { std::cerr << "non-milestone path was handled\n"; return 1; }

    if (!expect(h.call(make_request(verb::get, target, "")), 405, "GET")) return 1;
    if (!expect(h.call(make_request(verb::patch, "/v4/timelines/x/milestones/101", "{\"param\":{}}")), 400, "bad timeline id")) return 1;
    if (!expect(h.call(make_request(verb::patch, "/v4/timelines/1/milestones/0", "{\"param\":{}}")), 400, "bad milestone id")) return 1;

    if (!expect(h.call(make_request(verb::patch, target, "{\"param\":{}}", "")), 401, "no token")) return 1;
    if (!expect(h.call(make_request(verb::patch, target, "{\"param\":{}}", "alice")), 401, "non-numeric sub")) return 1;
    {
        Request req = make_request(verb::patch, target, "{\"param\":{}}", "");
        req.set(field::authorization, "Bearer " + token_for("7") + "x");
        if (!expect(h.call(req), 401, "tampered token")) return 1;
    }

    {
        auto res = h.call(make_request(verb::patch, target, "{\"param\":{\"duration\":0}}"));
        if (!expect(res, 400, "validation")) return 1;
        if (message_of(*res).find("duration") == std::string::npos) { std::cerr << "validation message: " << message_of(*res) << "\n"; return 1; }
        if (!expect(h.call(make_request(verb::patch, target, "not json")), 400, "malformed body")) return 1;
    }

    // success returns the updated milestone and echoes the caller's request id
    {
        Request req = make_request(verb::patch, target, "{\"param\":{\"duration\":10,\"name\":\"Kickoff\"}}");
        req.set("X-Request-Id", "trace-abc.1");
        auto res = h.call(req);
        if (!expect(res, 200, "update")) return 1;
        if (std::string((*res)["X-Request-Id"]) != "trace-abc.1") { std::cerr << "request id not echoed\n"; return 1; }
        const JsonValue* content = json_parse(res->body()).find("result")->find("content");
        if (content->find("name")->str != "Kickoff" || content->find("duration")->str != "10") { std::cerr << "content not the updated milestone\n"; return 1; }
        if (content->find("updatedBy")->str != "7") { std::cerr << "updatedBy not taken from token\n"; return 1; }
        if (h.store.rows.at(102).start_date != day("2024-01-20")) { std::cerr << "cascade did not run behind the api\n"; return 1; }
    }

    // unusable request ids are replaced
    {
        Request req = make_request(verb::patch, target, "{\"param\":{}}");
        req.set("X-Request-Id", "has space");
        auto res = h.call(req);
        if (!expect(res, 200, "empty patch")) return 1;
        if (std::string((*res)["X-Request-Id"]).size() != 32) { std::cerr << "bad request id kept\n"; return 1; }
    }

    {
        auto res = h.call(make_request(verb::patch, "/v4/timelines/1/milestones/999", "{\"param\":{}}"));
        if (!expect(res, 404, "unknown milestone")) return 1;
        if (message_of(*res) != "Milestone not found for milestone id 999") { std::cerr << "404 message\n"; return 1; }
    }

    {
        auto res = h.call(make_request(verb::patch, target, "{\"param\":{\"completionDate\":\"2020-01-01\"}}"));
        if (!expect(res, 422, "completion before start")) return 1;
    }

    std::cout << "api_unit ok\n";
    return 0;
}
