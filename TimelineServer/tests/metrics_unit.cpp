#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <cmath>
#include "observability/Metrics.h"

using namespace observability;

static const std::string MILESTONE_ROUTE = "/v4/timelines/:timelineId/milestones/:milestoneId";

static uint64_t request_count(const std::string& scrape, const std::string& path, const std::string& method, int code) {
    std::string needle = "http_requests_total{path=\"" + path + "\",method=\"" + method + "\",code=\"" + std::to_string(code) + "\"} ";
    auto pos = scrape.find(needle);
    if (pos == std::string::npos) return 0;
    return std::stoull(scrape.substr(pos + needle.size()));
}

static uint64_t bucket(const std::string& scrape, const std::string& path, const std::string& le) {
    std::string needle = "http_request_duration_ms_bucket{path=\"" + path + "\",method=\"PATCH\",le=\"" + le + "\"} ";
    auto pos = scrape.find(needle);
    if (pos == std::string::npos) return 0;
    return std::stoull(scrape.substr(pos + needle.size()));
}

static size_t occurrences(const std::string& hay, const std::string& needle) {
    size_t n = 0;
    for (auto pos = hay.find(needle); pos != std::string::npos; pos = hay.find(needle, pos + 1)) ++n;
    return n;
}

int main() {
    auto& m = Metrics::instance();

    m.inc(MILESTONE_ROUTE, "PATCH", 200);
    m.inc(MILESTONE_ROUTE, "PATCH", 200);
    m.inc(MILESTONE_ROUTE, "PATCH", 422);

    std::string s = m.scrape();
    if (request_count(s, MILESTONE_ROUTE, "PATCH", 200) != 2) { std::cerr << "200 counter wrong\n"; return 1; }
    if (request_count(s, MILESTONE_ROUTE, "PATCH", 422) != 1) { std::cerr << "422 counter wrong\n"; return 1; }

    for (double v : {3.0, 12.0, 40.0, 250.0, 4000.0}) m.observe_latency(MILESTONE_ROUTE, "PATCH", v);
    s = m.scrape();
    if (bucket(s, MILESTONE_ROUTE, "2") != 0 || bucket(s, MILESTONE_ROUTE, "5") != 1) { std::cerr << "low buckets wrong\n"; return 1; }
    if (bucket(s, MILESTONE_ROUTE, "50") != 3) { std::cerr << "le=50 expected 3\n"; return 1; }
    if (bucket(s, MILESTONE_ROUTE, "500") != 4 || bucket(s, MILESTONE_ROUTE, "5000") != 5) { std::cerr << "high buckets wrong\n"; return 1; }
    if (bucket(s, MILESTONE_ROUTE, "+Inf") != 5) { std::cerr << "+Inf must equal count\n"; return 1; }
    auto sum_pos = s.find("http_request_duration_ms_sum{path=\"" + MILESTONE_ROUTE + "\",method=\"PATCH\"} ");
    if (sum_pos == std::string::npos) { std::cerr << "sum missing\n"; return 1; }
    double sum = std::stod(s.substr(s.find("} ", sum_pos) + 2));
    if (std::abs(sum - 4305.0) > 1e-6) { std::cerr << "sum expected 4305 got " << sum << "\n"; return 1; }

    // labelled domain counters
    m.add("milestone_updates_total", "outcome", "ok", 1);
    m.add("milestone_updates_total", "outcome", "ok", 2);
    m.add("milestone_updates_total", "outcome", "not_found", 1);
    m.add("milestone_cascade_writes_total", 7);
    s = m.scrape();
    if (s.find("milestone_updates_total{outcome=\"ok\"} 3\n") == std::string::npos) { std::cerr << "labelled counter wrong\n"; return 1; }
    if (s.find("milestone_updates_total{outcome=\"not_found\"} 1\n") == std::string::npos) { std::cerr << "second label missing\n"; return 1; }
    if (s.find("milestone_cascade_writes_total 7\n") == std::string::npos) { std::cerr << "unlabelled counter wrong\n"; return 1; }
    if (occurrences(s, "# TYPE milestone_updates_total counter") != 1) { std::cerr << "one TYPE line per counter name\n"; return 1; }

    const int threads = 4;
    const int iters = 10000;
    std::vector<std::thread> th;
    for (int t = 0; t < threads; ++t) {
        th.emplace_back([&]() {
            for (int i = 0; i < iters; ++i) {
                m.inc("/par", "PATCH", 200);
                m.add("milestone_reorder_shifts_total", 1);
            }
        });
    }
    for (auto& t : th) t.join();

    s = m.scrape();
    uint64_t expected = uint64_t(threads) * uint64_t(iters);
    if (request_count(s, "/par", "PATCH", 200) != expected) { std::cerr << "parallel request counter lost updates\n"; return 1; }
    if (s.find("milestone_reorder_shifts_total " + std::to_string(expected) + "\n") == std::string::npos) { std::cerr << "parallel add lost updates\n"; return 1; }

    std::cout << "metrics_unit ok\n";
    return 0;
}
