#pragma once

#include <cstdint>
#include <string>

namespace config {

struct Config {
    enum class LogLevel { DEBUG, INFO, WARN, ERROR };
    uint16_t port = 8080;
    LogLevel log_level = LogLevel::INFO;
    bool metrics_enabled = true;
    bool access_log = true;
    std::string database_url;
    int db_workers = 16;
    std::string jwt_secret;
    // events go to redis when enabled and a host is set, otherwise they are only logged
    bool events_enabled = true;
    std::string redis_host = "127.0.0.1";
    uint16_t redis_port = 6379;
    std::string redis_pass;
    static Config from_env(int argc, char** argv);
};

// 1 DEBUG .. 4 ERROR, as understood by observability::set_log_level
int log_level_number(Config::LogLevel l);

}
