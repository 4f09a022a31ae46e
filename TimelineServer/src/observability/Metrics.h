#pragma once

#include <string>
#include <cstdint>
#include <vector>
#include <unordered_map>
#include <map>
#include <tuple>
#include <mutex>
#include <sstream>

namespace observability {

struct MetricsKey {
    std::string path;
    std::string method;
    int code;
    bool operator==(MetricsKey const& o) const noexcept {
        return path == o.path && method == o.method && code == o.code;
    }
};

struct MetricsKeyHash {
    size_t operator()(MetricsKey const& k) const noexcept {
        size_t seed = 0;
        auto mix = [&](size_t v){ seed ^= v + 0x9e3779b97f4a7c15ULL + (seed<<6) + (seed>>2); };
        mix(std::hash<std::string>()(k.path));
        mix(std::hash<std::string>()(k.method));
        mix(std::hash<int>()(k.code));
        return seed;
    }
};

// Named counter with at most one label. An empty label name renders without braces.
struct CounterKey {
    std::string name;
    std::string label_name;
    std::string label_value;
    bool operator<(CounterKey const& o) const noexcept {
        return std::tie(name, label_name, label_value) < std::tie(o.name, o.label_name, o.label_value);
    }
};

class Metrics {
public:
    static Metrics& instance();
    void inc(const std::string& path, const std::string& method, int code);
    void observe_latency(const std::string& path, const std::string& method, double latency_ms);
    void add(const std::string& name, const std::string& label_name, const std::string& label_value, uint64_t n);
    void add(const std::string& name, uint64_t n) { add(name, std::string(), std::string(), n); }
    std::string scrape() const;
private:
    Metrics();
    std::unordered_map<MetricsKey, uint64_t, MetricsKeyHash> map_;
    struct HistData {
        std::vector<uint64_t> buckets;
        double sum = 0.0;
        uint64_t count = 0;
    };
    std::unordered_map<MetricsKey, HistData, MetricsKeyHash> hist_;
    std::map<CounterKey, uint64_t> counters_;   // ordered so one name scrapes as one block
    mutable std::mutex mu_;
};

} 
