#include "RedisClient.h"
#include "Resp.h"
#include "../observability/Logging.h"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <istream>

namespace redis {

RedisClient::RedisClient(IoContext& ioc, std::string host, uint16_t port, std::string pass)
    : ioc_(ioc), host_(std::move(host)), port_(port), redis_pass_(std::move(pass)), socket_(ioc) {}

void RedisClient::start() {
    do_connect();
}

void RedisClient::do_connect() {
    if (connecting_) return;
    connecting_ = true;
    auto resolver = std::make_shared<boost::asio::ip::tcp::resolver>(ioc_);
    resolver->async_resolve(host_, std::to_string(port_), [self = shared_from_this(), resolver](const boost::system::error_code& ec, boost::asio::ip::tcp::resolver::results_type eps) {
        if (ec) {
            self->connecting_ = false; self->connected_ = false;
            observability::log_warn("redis.resolve_failed", {{"host", self->host_}, {"err", ec.message()}});
            return;
        }
        
        boost::system::error_code ig; self->socket_.close(ig);
        boost::asio::async_connect(self->socket_, eps, [self](const boost::system::error_code& ec2, const boost::asio::ip::tcp::endpoint&) {
            if (ec2) {
                self->connecting_ = false; self->connected_ = false;
                observability::log_warn("redis.connect_failed", {{"host", self->host_}, {"err", ec2.message()}});
                return;
            }
            
            if (self->redis_pass_.empty()) {
                self->connecting_ = false;
                self->connected_ = true;
                self->do_write_next();
                return;
            }
            
            auto auth_cmd = std::make_shared<std::string>(resp_encode({"AUTH", self->redis_pass_}));
            boost::asio::async_write(self->socket_, boost::asio::buffer(*auth_cmd), [self, auth_cmd](const boost::system::error_code& ecw, std::size_t) {
                if (ecw) {
                    self->connecting_ = false; self->connected_ = false;
                    observability::log_warn("redis.auth_write_failed", {{"err", ecw.message()}});
                    boost::system::error_code ig2; self->socket_.close(ig2);
                    return;
                }
                
                boost::asio::async_read_until(self->socket_, self->read_buf_, "\r\n", [self](const boost::system::error_code& ecr, std::size_t) {
                    self->connecting_ = false;
                    if (ecr) {
                        self->connected_ = false;
                        observability::log_warn("redis.auth_read_failed", {{"err", ecr.message()}});
                        boost::system::error_code ig3; self->socket_.close(ig3);
                        return;
                    }
                    std::istream is(&self->read_buf_);
                    std::string line; std::getline(is, line); if (!line.empty() && line.back() == '\r') line.pop_back();
                    if (!line.empty() && line[0] == '+') {
                        
                        self->connected_ = true;
                        self->do_write_next();
                        return;
                    }
                    
                    observability::log_error("redis.auth_rejected", {{"reply", line}});
                    self->connected_ = false;
                    boost::system::error_code ig4; self->socket_.close(ig4);
                });
            });
        });
    });
}

void RedisClient::enqueue(Pending p) {
    if (!connected_) {
        do_connect();
        boost::asio::post(ioc_, [p = std::move(p)]() mutable { complete(p, boost::asio::error::not_connected, 0); });
        return;
    }
    if (queue_.size() >= MAX_QUEUE) {
        boost::asio::post(ioc_, [p = std::move(p)]() mutable { complete(p, boost::asio::error::no_buffer_space, 0); });
        return;
    }
    queue_.push_back(std::move(p));
    do_write_next();
}

void RedisClient::async_publish(const std::string& channel, const std::string& message, IntCb cb) {
    Pending p;
    p.type = Pending::Type::Integer;
    p.int_cb = std::move(cb);
    p.cmd = resp_encode({"PUBLISH", channel, message});
    enqueue(std::move(p));
}

void RedisClient::async_ping(StatusCb cb) {
    Pending p;
    p.type = Pending::Type::Status;
    p.status_cb = std::move(cb);
    p.cmd = resp_encode({"PING"});
    enqueue(std::move(p));
}

void RedisClient::complete(Pending& p, const boost::system::error_code& ec, int64_t value) {
    if (p.type == Pending::Type::Integer && p.int_cb) p.int_cb(ec, value);
    if (p.type == Pending::Type::Status && p.status_cb) p.status_cb(ec, !ec);
}

void RedisClient::fail_all(const boost::system::error_code& ec) {
    if (current_.has_value()) {
        auto p = std::move(*current_);
        current_.reset();
        complete(p, ec, 0);
    }
    while (!queue_.empty()) {
        auto qp = std::move(queue_.front()); queue_.pop_front();
        complete(qp, boost::asio::error::not_connected, 0);
    }
    busy_ = false;
    connected_ = false;
    boost::system::error_code ig; socket_.close(ig);
    do_connect();
}

void RedisClient::do_write_next() {
    if (busy_ || !connected_ || queue_.empty()) return;
    busy_ = true; 
    
    current_ = std::move(queue_.front());
    queue_.pop_front();
    boost::asio::async_write(socket_, boost::asio::buffer(current_->cmd), [self=shared_from_this()](const boost::system::error_code& ec, std::size_t bytes) {
        self->on_write(ec, bytes);
    });
}

void RedisClient::on_write(const boost::system::error_code& ec, std::size_t) {
    if (ec) { fail_all(ec); return; }
    do_read();
}

void RedisClient::do_read() {
    boost::asio::async_read_until(socket_, read_buf_, "\r\n", [self=shared_from_this()](const boost::system::error_code& ec, std::size_t bytes) {
        self->on_read_line(ec, bytes);
    });
}

void RedisClient::on_read_line(const boost::system::error_code& ec, std::size_t) {
    if (ec) { fail_all(ec); return; }

    std::istream is(&read_buf_);
    std::string line;
    std::getline(is, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    if (!current_.has_value()) {
        busy_ = false;
        do_write_next();
        return;
    }
    auto p = std::move(*current_);
    current_.reset();

    // PUBLISH and PING only ever answer with single-line replies
    auto reply = resp_parse(line + "\r\n");
    if (!reply.has_value()) {
        complete(p, boost::asio::error::fault, 0);
        busy_ = false;
        fail_all(boost::asio::error::fault);
        return;
    }
    if (reply->type == RespType::Error) {
        observability::log_warn("redis.error_reply", {{"reply", reply->str}});
        complete(p, boost::asio::error::fault, 0);
    } else if (reply->type == RespType::Integer) {
        complete(p, {}, reply->integer);
    } else {
        complete(p, {}, 0);
    }
    busy_ = false;
    do_write_next();
}

}
