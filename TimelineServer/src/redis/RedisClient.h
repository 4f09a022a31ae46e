#pragma once

#include <boost/asio.hpp>
#include <functional>
#include <string>
#include <vector>
#include <deque>
#include <memory>
#include <optional>

namespace redis {

// Single-connection pipelined RESP client. All calls must come from the io_context thread.
class RedisClient : public std::enable_shared_from_this<RedisClient> {
public:
    using IoContext = boost::asio::io_context;
    using IntCb = std::function<void(boost::system::error_code, int64_t)>;
    using StatusCb = std::function<void(boost::system::error_code, bool)>;

    RedisClient(IoContext& ioc, std::string host, uint16_t port, std::string pass = std::string());
    void start();
    bool connected() const { return connected_; }

    // Reports the number of subscribers that received the message.
    void async_publish(const std::string& channel, const std::string& message, IntCb cb);
    void async_ping(StatusCb cb);
private:
    struct Pending {
        std::string cmd;
        enum class Type { Integer, Status } type;
        IntCb int_cb;
        StatusCb status_cb;
    };

    void enqueue(Pending p);
    void do_connect();
    void do_write_next();
    void on_write(const boost::system::error_code& ec, std::size_t);
    void do_read();
    void on_read_line(const boost::system::error_code& ec, std::size_t bytes);
    void fail_all(const boost::system::error_code& ec);
    static void complete(Pending& p, const boost::system::error_code& ec, int64_t value);

    IoContext& ioc_;
    std::string host_;
    uint16_t port_;
    std::string redis_pass_;
    boost::asio::ip::tcp::socket socket_;
    boost::asio::streambuf read_buf_;
    std::deque<Pending> queue_;
    
    std::optional<Pending> current_;
    bool busy_ = false; 
    bool connected_ = false;
    bool connecting_ = false;
    
    static constexpr std::size_t MAX_QUEUE = 10000;
};

}
