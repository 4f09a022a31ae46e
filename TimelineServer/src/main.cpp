#include <boost/asio.hpp>
#include <iostream>
#include <string>
#include <memory>
#include <csignal>
#include "net/Router.h"
#include "net/HttpServer.h"
#include "net/MilestoneApi.h"
#include "observability/Metrics.h"
#include "observability/Logging.h"
#include "config/Config.h"
#include "db/DbPool.h"
#include "db/PgMilestoneTx.h"
#include "events/EventPublisher.h"
#include "events/RedisEventPublisher.h"
#include "milestones/MilestoneService.h"
#include "redis/RedisClient.h"

using config::Config;
using observability::log_info;
using observability::log_warn;
using observability::set_log_level;

int main(int argc, char** argv) {
    auto cfg = Config::from_env(argc, argv);
    set_log_level(config::log_level_number(cfg.log_level));

    if (cfg.jwt_secret.empty()) {
        std::cerr << "fatal: JWT_SECRET environment variable is not set\n";
        return 2;
    }

    try {
        boost::asio::io_context io;

        Router router;
        router.add_route("GET", "/health", [](const Request& req) {
            return json_reply(req, boost::beast::http::status::ok, "{\"status\":\"ok\"}");
        });
        if (cfg.metrics_enabled) {
            router.add_route("GET", "/metrics", [](const Request& req) {
                return text_reply(req, boost::beast::http::status::ok, "text/plain; version=0.0.4", observability::Metrics::instance().scrape());
            });
        }

        std::shared_ptr<db::DbPool> dbpool;
        milestones::TxRunner runner;
        if (!cfg.database_url.empty()) {
            dbpool = std::make_shared<db::DbPool>(io, cfg.database_url, cfg.db_workers);
            runner = db::make_pg_tx_runner(dbpool);
        } else {
            log_warn("db_not_configured", {});
            runner = [&io](milestones::TxBody, milestones::TxDone done) {
                boost::asio::post(io, [done]() { done(boost::asio::error::not_connected, false); });
            };
        }

        std::shared_ptr<events::EventPublisher> publisher;
        if (cfg.events_enabled && !cfg.redis_host.empty()) {
            auto redis_client = std::make_shared<redis::RedisClient>(io, cfg.redis_host, cfg.redis_port, cfg.redis_pass);
            redis_client->start();
            publisher = std::make_shared<events::RedisEventPublisher>(redis_client);
            log_info("events_enabled", {{"redis_host", cfg.redis_host}, {"redis_port", int64_t(cfg.redis_port)}});
        } else {
            publisher = std::make_shared<events::LogOnlyPublisher>();
            log_info("events_log_only", {});
        }

        auto service = std::make_shared<milestones::MilestoneService>(std::move(runner), publisher);
        auto api = std::make_shared<MilestoneApi>(service, cfg.jwt_secret);

        HttpServer server(io, cfg.port, router, cfg.metrics_enabled, cfg.access_log, api, dbpool);

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&io](const boost::system::error_code& ec, int sig) {
            if (ec) return;
            log_info("server_stop", {{"signal", int64_t(sig)}});
            io.stop();
        });

        log_info("server_start", {{"port", int64_t(server.port())}, {"db_workers", int64_t(cfg.db_workers)}});
        server.run();
        io.run();
    } catch (const std::exception& e) {
        std::cerr << "server error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
