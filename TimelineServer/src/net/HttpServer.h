#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include "Router.h"
#include "MilestoneApi.h"
#include "../db/DbPool.h"
#include <memory>
#include <string>

class HttpServer {
public:
    HttpServer(boost::asio::io_context& ioc, unsigned short port, Router& router, bool metrics_enabled, bool access_log, std::shared_ptr<MilestoneApi> api, std::shared_ptr<db::DbPool> db = nullptr);
    void run();
    unsigned short port() const { return acceptor_.local_endpoint().port(); }
private:
    void do_accept();
    boost::asio::io_context& ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    Router& router_;
    bool metrics_enabled_;
    bool access_log_;
    std::shared_ptr<MilestoneApi> api_;
    std::shared_ptr<db::DbPool> db_;
};
