#include "Config.h"
#include <cstdlib>
#include <string>
#include <algorithm>
#include <optional>

namespace config {

static std::string getenv_or(const char* name, const char* def) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string(def);
}

static Config::LogLevel parse_level(const std::string& s) {
    std::string u = s;
    std::transform(u.begin(), u.end(), u.begin(), ::toupper);
    if (u == "DEBUG") return Config::LogLevel::DEBUG;
    if (u == "WARN") return Config::LogLevel::WARN;
    if (u == "ERROR") return Config::LogLevel::ERROR;
    return Config::LogLevel::INFO;
}

// Whole-string decimal parse; anything else leaves the default in place.
static std::optional<long> parse_long(const std::string& s) {
    if (s.empty()) return std::nullopt;
    try {
        size_t used = 0;
        long v = std::stol(s, &used);
        if (used != s.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

static std::optional<uint16_t> parse_port(const std::string& s) {
    auto v = parse_long(s);
    if (!v || *v < 1 || *v > 65535) return std::nullopt;
    return static_cast<uint16_t>(*v);
}

Config Config::from_env(int argc, char** argv) {
    Config c;
    if (auto p = parse_port(getenv_or("PORT", ""))) c.port = *p;
    // the command line wins over the environment
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--port" && i+1 < argc) {
            if (auto p = parse_port(argv[i+1])) c.port = *p;
        }
    }
    c.log_level = parse_level(getenv_or("LOG_LEVEL", "INFO"));
    c.metrics_enabled = getenv_or("METRICS_ENABLED", "1") != "0";
    c.access_log = getenv_or("ACCESS_LOG", "1") != "0";
    c.database_url = getenv_or("DATABASE_URL", "");

    auto w = getenv_or("DB_WORKERS", "");
    if (w.empty()) w = getenv_or("DB_POOL_SIZE", "");
    if (auto n = parse_long(w)) c.db_workers = static_cast<int>(std::clamp<long>(*n, 1, 256));

    c.jwt_secret = getenv_or("JWT_SECRET", "");
    c.events_enabled = getenv_or("EVENTS_ENABLED", "1") != "0";
    c.redis_host = getenv_or("REDIS_HOST", "127.0.0.1");
    if (auto p = parse_port(getenv_or("REDIS_PORT", ""))) c.redis_port = *p;
    c.redis_pass = getenv_or("REDIS_PASS", "");
    return c;
}

int log_level_number(Config::LogLevel l) {
    switch (l) {
        case Config::LogLevel::DEBUG: return 1;
        case Config::LogLevel::INFO: return 2;
        case Config::LogLevel::WARN: return 3;
        case Config::LogLevel::ERROR: return 4;
    }
    return 2;
}

}
