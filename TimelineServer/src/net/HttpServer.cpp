#include "HttpServer.h"
#include "Request.h"
#include "Response.h"
#include "observability/Metrics.h"
#include "observability/Logging.h"
#include <optional>
#include <boost/beast/http.hpp>
#include <chrono>
#include <algorithm>
#include <array>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;

// Collapses ids so per-path metrics stay bounded.
static std::string metrics_path(const std::string& cleaned_target) {
    if (match_milestone_path(cleaned_target)) return "/v4/timelines/:timelineId/milestones/:milestoneId";
    return cleaned_target;
}

struct Session : std::enable_shared_from_this<Session> {
    net::ip::tcp::socket socket;
    beast::flat_buffer buffer;
    net::steady_timer read_timer;
    Router& router;
    unsigned http_version = 11;
    Request req;
    bool draining_ = false;
    std::array<char, 4096> drain_buf_{};
    int drain_seconds_ = 5;
    std::chrono::steady_clock::time_point start_ts;
    bool metrics_enabled;
    bool access_log;
    std::shared_ptr<MilestoneApi> api;
    std::shared_ptr<db::DbPool> db;

    static constexpr std::size_t MAX_BODY = 1 * 1024 * 1024;

    Session(net::ip::tcp::socket&& s, Router& r, bool me, bool al, std::shared_ptr<MilestoneApi> a, std::shared_ptr<db::DbPool> dbp)
        : socket(std::move(s)), buffer(), read_timer(socket.get_executor()), router(r), metrics_enabled(me), access_log(al), api(std::move(a)), db(std::move(dbp)) {}
    void run() { do_read(); }
    void do_read() {
        auto self = shared_from_this();
        req = {};
        http_version = 11;

        auto parser = std::make_shared<http::request_parser<http::string_body>>();
        parser->header_limit(8 * 1024);
        parser->body_limit(MAX_BODY);

        self->read_timer.expires_after(std::chrono::seconds(5));
        self->read_timer.async_wait([self](const boost::system::error_code& ec) {
            if (!ec) self->close_socket();
        });

        http::async_read_header(socket, buffer, *parser, [self, parser](beast::error_code ec, std::size_t) {
            self->read_timer.cancel();

            if (ec) {
                if (ec == http::error::end_of_stream) {
                    self->close_socket();
                    return;
                }
                if (ec == http::error::header_limit) {
                    self->reply_json_error(http::status::request_header_fields_too_large, "{\"error\":\"header_too_large\"}", true, "(header)");
                    return;
                }
                // an oversized Content-Length is rejected while the header is parsed
                if (ec == http::error::body_limit) {
                    std::size_t content_len = 0;
                    if (auto len = parser->content_length()) content_len = static_cast<std::size_t>(*len);
                    observability::log_info("oversized_body_header", {{"path", std::string("(header)")}, {"len", int64_t(content_len)}});
                    self->drain_seconds_ = std::min(10, std::max(5, int(content_len / (256 * 1024))));
                    self->reply_json_error(http::status::payload_too_large, "{\"error\":\"body_too_large\"}", true, "(body)");
                    return;
                }
                if (ec == http::error::bad_target || ec == http::error::bad_method || ec == http::error::bad_version ||
                    ec == http::error::bad_field) {
                    self->reply_json_error(http::status::bad_request, "{\"error\":\"bad_request\"}", true, "(parse)");
                    return;
                }
                self->close_socket();
                return;
            }

            auto& hdr_req = parser->get();
            self->http_version = hdr_req.version();

            std::size_t content_len = 0;
            if (auto len = parser->content_length()) content_len = static_cast<std::size_t>(*len);

            if (content_len == 0) self->read_timer.expires_after(std::chrono::seconds(10));
            else if (content_len <= 128*1024) self->read_timer.expires_after(std::chrono::seconds(20));
            else self->read_timer.expires_after(std::chrono::seconds(60));
            self->read_timer.async_wait([self](const boost::system::error_code& ec) {
                if (!ec) self->close_socket();
            });

            http::async_read(self->socket, self->buffer, *parser, [self, parser](beast::error_code ec2, std::size_t) {
                self->read_timer.cancel();

                if (ec2) {
                    if (ec2 == http::error::end_of_stream) { self->close_socket(); return; }
                    if (ec2 == http::error::body_limit) {
                        self->reply_json_error(http::status::payload_too_large, "{\"error\":\"payload_too_large\"}", true, "(body)");
                        return;
                    }
                    self->close_socket();
                    return;
                }

                self->req = parser->release();
                self->start_ts = std::chrono::steady_clock::now();
                self->handle_request();
            });
        });
    }

    void handle_request() {
        std::string target = std::string(req.target());
        auto qpos = target.find('?');
        if (qpos != std::string::npos) target.erase(qpos);
        std::string cleaned_target = target;
        auto self = shared_from_this();

        if (req.method() == http::verb::options) {
            auto res = std::make_shared<Response>(http::status::no_content, req.version());
            res->set("Access-Control-Allow-Methods", "GET, PATCH, OPTIONS");
            res->set("Access-Control-Allow-Headers", "Content-Type, Authorization, X-Request-Id");
            res->keep_alive(req.keep_alive());
            res->prepare_payload();
            send_response(res, cleaned_target);
            return;
        }

        if (cleaned_target == "/db/health") {
            if (!db) {
                auto res = std::make_shared<Response>(http::status::internal_server_error, req.version());
                res->set(http::field::content_type, "application/json");
                res->keep_alive(req.keep_alive());
                res->body() = "{\"db\":\"down\"}";
                res->prepare_payload();
                send_response(res, cleaned_target);
                return;
            }
            db->async_scalar_int("SELECT 1", [self, cleaned_target](const boost::system::error_code& ec, int v) {
                auto res = std::make_shared<Response>(http::status::ok, self->req.version());
                res->set(http::field::content_type, "application/json");
                res->keep_alive(self->req.keep_alive());
                if (ec || v != 1) {
                    res->result(http::status::internal_server_error);
                    res->body() = "{\"db\":\"down\"}";
                } else {
                    res->body() = "{\"db\":\"ok\"}";
                }
                res->prepare_payload();
                self->send_response(res, cleaned_target);
            });
            return;
        }

        if (api) {
            bool handled = false;
            try {
                handled = api->handle(req, cleaned_target, [self, cleaned_target](Response res) {
                    self->send_response(std::make_shared<Response>(std::move(res)), cleaned_target);
                });
            } catch (const std::exception& e) {
                observability::log_error("request_failed", {{"path", metrics_path(cleaned_target)}, {"err", std::string(e.what())}});
                reply_json_error(http::status::internal_server_error, "{\"error\":\"internal\"}", false, cleaned_target);
                return;
            }
            if (handled) return;
        }

        auto res = std::make_shared<Response>(router.route(req));
        send_response(res, cleaned_target);
    }

    void record(const Response& res, const std::string& cleaned_target) {
        auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_ts).count();
        std::string path = metrics_path(cleaned_target);
        std::string method(req.method_string());
        if (metrics_enabled) {
            observability::Metrics::instance().inc(path, method, res.result_int());
            observability::Metrics::instance().observe_latency(path, method, elapsed);
        }
        if (access_log) {
            observability::Fields f{{"method", method}, {"path", path}, {"status", int64_t(res.result_int())}, {"latency_ms", elapsed}};
            auto rid = res.find("X-Request-Id");
            if (rid != res.end()) f["request_id"] = std::string(rid->value());
            observability::log_info("access", f);
        }
    }

    void send_response(std::shared_ptr<Response> res, const std::string& cleaned_target) {
        auto self = shared_from_this();
        auto sp = std::move(res);

        if (sp->find(http::field::connection) == sp->end()) {
            sp->keep_alive(self->req.keep_alive());
        }
        auto it = self->req.find(http::field::origin);
        if (it != self->req.end()) sp->set("Access-Control-Allow-Origin", std::string(it->value())); else sp->set("Access-Control-Allow-Origin", "*");
        sp->set("Access-Control-Allow-Credentials", "true");
        record(*sp, cleaned_target);

        http::async_write(socket, *sp, [self, sp, cleaned_target](boost::system::error_code ec, std::size_t) {
            if (ec) {
                observability::log_warn("write_error", {{"path", cleaned_target}, {"err", int64_t(ec.value())}});
                self->close_socket();
                return;
            }
            if (sp->keep_alive()) self->do_read();
            else self->graceful_close_after_write();
        });
    }

    void close_socket(bool hard_shutdown = true) {
        boost::system::error_code ignored;
        read_timer.cancel();
        socket.cancel(ignored);
        if (hard_shutdown) socket.shutdown(net::ip::tcp::socket::shutdown_both, ignored);
        socket.close(ignored);
    }

    // Reads and discards whatever the peer still sends so it sees our reply before the close.
    void start_drain_timer() {
        auto self = shared_from_this();
        read_timer.cancel();
        read_timer.expires_after(std::chrono::seconds(drain_seconds_));
        read_timer.async_wait([self](const boost::system::error_code& ec) {
            if (ec) return;
            self->close_socket(false);
        });
    }

    void do_drain_read() {
        auto self = shared_from_this();
        socket.async_read_some(net::buffer(drain_buf_), [self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                if (ec == boost::asio::error::operation_aborted) return;
                self->read_timer.cancel();
                self->close_socket(false);
                return;
            }
            self->do_drain_read();
        });
    }

    void graceful_close_after_write() {
        if (draining_) return;
        draining_ = true;
        boost::system::error_code ignored;
        socket.shutdown(net::ip::tcp::socket::shutdown_send, ignored);
        start_drain_timer();
        do_drain_read();
    }

    void reply_json_error(http::status st, const std::string& body, bool close_conn, const std::string& cleaned_target) {
        auto res = std::make_shared<Response>(st, http_version);
        res->set(http::field::content_type, "application/json");
        res->keep_alive(!close_conn && req.keep_alive());
        res->body() = body;
        res->prepare_payload();
        if (!close_conn) {
            send_response(res, cleaned_target);
            return;
        }
        res->set(http::field::connection, "close");
        auto it = req.find(http::field::origin);
        if (it != req.end()) res->set("Access-Control-Allow-Origin", std::string(it->value())); else res->set("Access-Control-Allow-Origin", "*");
        http::async_write(socket, *res, [self=shared_from_this(), res, cleaned_target](boost::system::error_code ec, std::size_t) {
            if (ec) {
                observability::log_warn("write_error", {{"path", cleaned_target}, {"err", int64_t(ec.value())}});
                self->close_socket();
                return;
            }
            self->graceful_close_after_write();
        });
    }
};

HttpServer::HttpServer(net::io_context& ioc, unsigned short port, Router& router, bool metrics_enabled, bool access_log, std::shared_ptr<MilestoneApi> api, std::shared_ptr<db::DbPool> db)
    : ioc_(ioc), acceptor_(ioc, net::ip::tcp::endpoint(net::ip::address_v4::any(), port)), router_(router), metrics_enabled_(metrics_enabled), access_log_(access_log), api_(std::move(api)), db_(std::move(db)) {}

void HttpServer::run() { do_accept(); }

void HttpServer::do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, net::ip::tcp::socket socket) {
        if (!ec) {
            auto s = std::make_shared<Session>(std::move(socket), router_, metrics_enabled_, access_log_, api_, db_);
            s->run();
        } else observability::log_warn("accept error", {{"err", int64_t(ec.value())}});

        do_accept();
    });
}
