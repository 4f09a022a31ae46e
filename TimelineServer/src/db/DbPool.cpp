#include "DbPool.h"
#include <stdexcept>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <cstdlib>
#include "../observability/Logging.h"
#include <vector>

namespace db {


static DbResult to_db_result(PGresult* pr) {
    DbResult r;
    ExecStatusType st = PQresultStatus(pr);
    r.ok = (st == PGRES_TUPLES_OK || st == PGRES_COMMAND_OK);
    const char* ss = PQresultErrorField(pr, PG_DIAG_SQLSTATE);
    r.sqlstate = ss ? ss : std::string();
    const char* msg = PQresultErrorMessage(pr);
    r.message = msg ? msg : std::string();
    int nfields = PQnfields(pr);
    for (int i = 0; i < nfields; ++i) r.columns.emplace_back(PQfname(pr, i) ? PQfname(pr, i) : "");
    int ntuples = PQntuples(pr);
    r.rows.reserve(ntuples);
    for (int i = 0; i < ntuples; ++i) {
        std::vector<std::optional<std::string>> row; row.reserve(nfields);
        for (int j = 0; j < nfields; ++j) {
            if (PQgetisnull(pr, i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                char* v = PQgetvalue(pr, i, j);
                row.emplace_back(v ? std::optional<std::string>(std::string(v)) : std::nullopt);
            }
        }
        r.rows.emplace_back(std::move(row));
    }
    if (st == PGRES_COMMAND_OK) {
        char* ct = PQcmdTuples(pr);
        r.affected_rows = ct ? atoi(ct) : 0;
    } else {
        r.affected_rows = ntuples;
    }
    if (!r.ok) {
        observability::log_warn("dbpool.exec_result_non_ok", {{"status", std::string(PQresStatus(st))}, {"sqlstate", r.sqlstate}, {"msg", r.message}});
    }
    return r;
}

DbResult exec_sync(PGconn* conn, const std::string& sql) {
    PGresult* res = PQexec(conn, sql.c_str());
    if (!res) {
        DbResult r;
        r.message = PQerrorMessage(conn) ? PQerrorMessage(conn) : "no result";
        return r;
    }
    DbResult r = to_db_result(res);
    PQclear(res);
    return r;
}

DbResult exec_params_sync(PGconn* conn, const std::string& sql, const std::vector<std::optional<std::string>>& params) {
    std::vector<const char*> cparams; cparams.reserve(params.size());
    for (const auto& p : params) cparams.push_back(p.has_value() ? p->c_str() : nullptr);
    PGresult* res = PQexecParams(conn, sql.c_str(), int(cparams.size()), nullptr, cparams.data(), nullptr, nullptr, 0);
    if (!res) {
        DbResult r;
        r.message = PQerrorMessage(conn) ? PQerrorMessage(conn) : "no result";
        return r;
    }
    DbResult r = to_db_result(res);
    PQclear(res);
    return r;
}

struct DbPool::Impl {
    boost::asio::io_context& app_ioc;
    std::string conninfo;
    int workers = 2;

    struct Task { std::function<void(PGconn*&)> fn; };
    std::queue<Task> tasks;
    std::mutex mu_tasks;
    std::condition_variable cv_tasks;
    bool stopping = false;

    std::vector<std::thread> threads;

    Impl(boost::asio::io_context& ioc, const std::string& ci, int workers_)
        : app_ioc(ioc), conninfo(ci), workers(workers_) {
        for (int i = 0; i < workers; ++i) threads.emplace_back([this]{ this->worker_loop(); });
    }

    ~Impl() {
        { std::lock_guard<std::mutex> lk(mu_tasks); stopping = true; }
        cv_tasks.notify_all();
        for (auto &t : threads) if (t.joinable()) t.join();
    }

    PGconn* connect_one() {
        PGconn* c = PQconnectdb(conninfo.c_str());
        if (c == nullptr) return nullptr;
        if (PQstatus(c) != CONNECTION_OK) {
            observability::log_warn("dbpool.connect_failed", {{"err", std::string(PQerrorMessage(c) ? PQerrorMessage(c) : "")}});
            PQfinish(c);
            return nullptr;
        }
        return c;
    }

    // Drops a connection that libpq reports as broken so the next task reconnects.
    void check_conn(PGconn*& conn) {
        if (conn && PQstatus(conn) != CONNECTION_OK) { PQfinish(conn); conn = nullptr; }
    }

    void worker_loop() {
        PGconn* local_conn = connect_one();
        observability::log_info("dbpool.worker_started", {{"local_conn", local_conn ? std::string("ok") : std::string("null")}});
        while (true) {
            Task task;
            {
                std::unique_lock<std::mutex> lk(mu_tasks);
                cv_tasks.wait(lk, [this]{ return stopping || !tasks.empty(); });
                if (stopping && tasks.empty()) {
                    if (local_conn) { PQfinish(local_conn); local_conn = nullptr; }
                    return;
                }
                task = std::move(tasks.front()); tasks.pop();
            }
            try {
                task.fn(local_conn);
            } catch (const std::exception& e) {
                observability::log_error("dbpool.task_exception", {{"err", std::string(e.what())}});
            }
            check_conn(local_conn);
        }
    }

    void post_task(std::function<void(PGconn*&)> f) {
        {
            std::lock_guard<std::mutex> lk(mu_tasks);
            tasks.push(Task{std::move(f)});
        }
        cv_tasks.notify_one();
    }
};

DbPool::DbPool(boost::asio::io_context& app_ioc, const std::string& conninfo, int workers) {
    impl_ = std::make_unique<Impl>(app_ioc, conninfo, workers);
}

DbPool::~DbPool() = default;

void DbPool::async_exec(const std::string& sql, DbResultCb cb) {
    auto impl = impl_.get();
    impl->post_task([impl, sql, cb](PGconn*& local_conn) mutable {
        boost::system::error_code ec;
        DbResult r;
        if (!local_conn) local_conn = impl->connect_one();
        if (!local_conn) ec = boost::system::errc::make_error_code(boost::system::errc::host_unreachable);
        else r = exec_sync(local_conn, sql);
        boost::asio::post(impl->app_ioc, [cb, ec, r = std::move(r)]() mutable { cb(ec, std::move(r)); });
    });
}

void DbPool::async_exec_params(const std::string& sql, std::vector<std::optional<std::string>> params, DbResultCb cb) {
    auto impl = impl_.get();
    impl->post_task([impl, sql, params = std::move(params), cb](PGconn*& local_conn) mutable {
        boost::system::error_code ec;
        DbResult r;
        if (!local_conn) local_conn = impl->connect_one();
        if (!local_conn) ec = boost::system::errc::make_error_code(boost::system::errc::host_unreachable);
        else r = exec_params_sync(local_conn, sql, params);
        boost::asio::post(impl->app_ioc, [cb, ec, r = std::move(r)]() mutable { cb(ec, std::move(r)); });
    });
}

void DbPool::async_scalar_int(const std::string& sql, ScalarIntCb cb) {
    async_exec(sql, [cb](const boost::system::error_code& ec, const DbResult& r) {
        if (ec) { cb(ec, 0); return; }
        if (!r.ok || r.rows.empty() || r.rows[0].empty()) { cb(boost::asio::error::operation_aborted, 0); return; }
        if (!r.rows[0][0].has_value()) { cb(boost::asio::error::invalid_argument, 0); return; }
        try {
            cb({}, std::stoi(r.rows[0][0].value()));
        } catch (const std::exception&) {
            cb(boost::asio::error::invalid_argument, 0);
        }
    });
}

void DbPool::async_transaction(TxBody body, TxDoneCb cb) {
    auto impl = impl_.get();
    impl->post_task([impl, body = std::move(body), cb](PGconn*& local_conn) mutable {
        auto finish = [impl, cb](boost::system::error_code ec, bool committed) {
            boost::asio::post(impl->app_ioc, [cb, ec, committed]() { cb(ec, committed); });
        };
        if (!local_conn) local_conn = impl->connect_one();
        if (!local_conn) { finish(boost::system::errc::make_error_code(boost::system::errc::host_unreachable), false); return; }

        DbResult begin = exec_sync(local_conn, "BEGIN");
        if (!begin.ok) { finish(boost::system::errc::make_error_code(boost::system::errc::io_error), false); return; }

        bool commit = false;
        try {
            commit = body(local_conn);
        } catch (const std::exception& e) {
            observability::log_error("dbpool.tx_body_exception", {{"err", std::string(e.what())}});
            commit = false;
        }
        if (!commit) {
            DbResult rb = exec_sync(local_conn, "ROLLBACK");
            if (!rb.ok) observability::log_warn("dbpool.rollback_failed", {{"msg", rb.message}});
            finish({}, false);
            return;
        }
        DbResult c = exec_sync(local_conn, "COMMIT");
        if (!c.ok) {
            observability::log_warn("dbpool.commit_failed", {{"sqlstate", c.sqlstate}, {"msg", c.message}});
            // a failed COMMIT already ended the transaction server-side
            finish(boost::system::errc::make_error_code(boost::system::errc::io_error), false);
            return;
        }
        finish({}, true);
    });
}

}
