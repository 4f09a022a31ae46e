#pragma once

#include <libpq-fe.h>
#include <optional>
#include <string>
#include <functional>
#include <vector>
#include <memory>
#include <boost/asio.hpp>

namespace db {


struct DbResult {
    bool ok = false;
    std::string sqlstate;
    std::string message;
    std::vector<std::string> columns;
    std::vector<std::vector<std::optional<std::string>>> rows;
    int affected_rows = 0;
};

using DbResultCb = std::function<void(const boost::system::error_code&, DbResult)>;

// Runs on a pool thread between BEGIN and COMMIT. Return false to roll back.
using TxBody = std::function<bool(PGconn*)>;
// committed is false when the body declined, threw, or COMMIT itself failed.
using TxDoneCb = std::function<void(const boost::system::error_code&, bool committed)>;


// Synchronous helpers for code already running on a pool thread.
DbResult exec_sync(PGconn* conn, const std::string& sql);
DbResult exec_params_sync(PGconn* conn, const std::string& sql, const std::vector<std::optional<std::string>>& params);


class DbPool {
public:

    DbPool(boost::asio::io_context& app_ioc, const std::string& conninfo, int workers = 4);
    ~DbPool();


    void async_exec(const std::string& sql, DbResultCb cb);


    void async_exec_params(const std::string& sql, std::vector<std::optional<std::string>> params, DbResultCb cb);


    using ScalarIntCb = std::function<void(const boost::system::error_code&, int)>;
    void async_scalar_int(const std::string& sql, ScalarIntCb cb);

    // All statements issued by body share one connection and one transaction.
    // Callbacks are delivered on the application io_context.
    void async_transaction(TxBody body, TxDoneCb cb);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
