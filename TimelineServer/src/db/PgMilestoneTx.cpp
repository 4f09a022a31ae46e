#include "PgMilestoneTx.h"
#include <initializer_list>
#include "../net/MiniJson.h"
#include "../observability/Logging.h"

namespace db {

using milestones::Milestone;
using milestones::StoreError;

namespace {

constexpr size_t MILESTONE_COLUMN_COUNT = 23;

std::optional<std::string> opt_day(const std::optional<milestones::day_t>& d) {
    if (!d.has_value()) return std::nullopt;
    return milestones::format_day(*d);
}

int64_t req_int64(const std::optional<std::string>& v, const char* col) {
    if (!v.has_value()) throw StoreError(std::string("null value in column ") + col);
    auto n = parse_int64_strict_sv(*v);
    if (!n.has_value()) throw StoreError(std::string("bad integer in column ") + col);
    return *n;
}

int req_int(const std::optional<std::string>& v, const char* col) {
    if (!v.has_value()) throw StoreError(std::string("null value in column ") + col);
    auto n = parse_int_strict_sv(*v);
    if (!n.has_value()) throw StoreError(std::string("bad integer in column ") + col);
    return *n;
}

milestones::day_t req_day(const std::optional<std::string>& v, const char* col) {
    if (!v.has_value()) throw StoreError(std::string("null value in column ") + col);
    auto d = milestones::parse_day(*v);
    if (!d.has_value()) throw StoreError(std::string("bad date in column ") + col);
    return *d;
}

std::string req_str(const std::optional<std::string>& v, const char* col) {
    if (!v.has_value()) throw StoreError(std::string("null value in column ") + col);
    return *v;
}

}

std::string build_pg_int_array(const std::vector<int64_t>& vals) {
    std::string out = "{";
    for (size_t i = 0; i < vals.size(); ++i) {
        if (i) out += ",";
        out += std::to_string(vals[i]);
    }
    out += "}";
    return out;
}

const std::string& milestone_columns() {
    static const std::string cols = [] {
        std::string out =
            "id, timeline_id, name, description, duration, "
            "start_date::text, end_date::text, completion_date::text, "
            "status, type, details::text, \"order\", "
            "planned_text, active_text, completed_text, blocked_text, hidden, "
            "created_by, updated_by";
        for (const char* ts : {"created_at", "updated_at", "deleted_at"}) {
            out += ", to_char(";
            out += ts;
            out += " AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS.MS\"Z\"')";
        }
        out += ", deleted_by";
        return out;
    }();
    return cols;
}

Milestone milestone_from_row(const std::vector<std::optional<std::string>>& row) {
    if (row.size() < MILESTONE_COLUMN_COUNT) throw StoreError("unexpected milestone column count");
    Milestone m;
    m.id = req_int64(row[0], "id");
    m.timeline_id = req_int64(row[1], "timeline_id");
    m.name = req_str(row[2], "name");
    m.description = row[3];
    m.duration = req_int(row[4], "duration");
    m.start_date = req_day(row[5], "start_date");
    m.end_date = req_day(row[6], "end_date");
    if (row[7].has_value()) m.completion_date = req_day(row[7], "completion_date");
    m.status = req_str(row[8], "status");
    m.type = req_str(row[9], "type");
    m.details = row[10].value_or("{}");
    m.order = req_int(row[11], "order");
    m.planned_text = row[12];
    m.active_text = row[13];
    m.completed_text = row[14];
    m.blocked_text = row[15];
    m.hidden = row[16].has_value() && (*row[16] == "t" || *row[16] == "true");
    m.created_by = req_int64(row[17], "created_by");
    m.updated_by = req_int64(row[18], "updated_by");
    m.created_at = row[19].value_or(std::string());
    m.updated_at = row[20].value_or(std::string());
    m.deleted_at = row[21];
    if (row[22].has_value()) m.deleted_by = req_int64(row[22], "deleted_by");
    return m;
}

DbResult PgMilestoneTx::run(const char* what, const std::string& sql, const std::vector<std::optional<std::string>>& params) {
    DbResult r = exec_params_sync(conn_, sql, params);
    if (!r.ok) {
        observability::log_warn("milestone_tx.query_failed", {{"op", std::string(what)}, {"sqlstate", r.sqlstate}});
        throw StoreError(std::string(what) + ": " + r.message, r.sqlstate);
    }
    return r;
}

bool PgMilestoneTx::lock_timeline(int64_t timeline_id) {
    DbResult r = run("lock_timeline",
        "SELECT id FROM timelines WHERE id = $1 AND deleted_at IS NULL FOR UPDATE",
        {std::to_string(timeline_id)});
    return !r.rows.empty();
}

std::optional<Milestone> PgMilestoneTx::find_milestone(int64_t timeline_id, int64_t milestone_id) {
    std::string sql = "SELECT " + milestone_columns() +
        " FROM milestones WHERE id = $1 AND timeline_id = $2 AND deleted_at IS NULL FOR UPDATE";
    DbResult r = run("find_milestone", sql, {std::to_string(milestone_id), std::to_string(timeline_id)});
    if (r.rows.empty()) return std::nullopt;
    return milestone_from_row(r.rows[0]);
}

Milestone PgMilestoneTx::save_milestone(const Milestone& m) {
    std::string sql = std::string(
        "UPDATE milestones SET name = $3, description = $4, duration = $5::int, "
        "start_date = $6::date, end_date = $7::date, completion_date = $8::date, "
        "status = $9, type = $10, details = $11::jsonb, \"order\" = $12::int, "
        "planned_text = $13, active_text = $14, completed_text = $15, blocked_text = $16, "
        "hidden = $17::boolean, updated_by = $18::bigint, updated_at = now() "
        "WHERE id = $1 AND timeline_id = $2 AND deleted_at IS NULL RETURNING ") + milestone_columns();
    DbResult r = run("save_milestone", sql, {
        std::to_string(m.id), std::to_string(m.timeline_id),
        m.name, m.description, std::to_string(m.duration),
        milestones::format_day(m.start_date), milestones::format_day(m.end_date), opt_day(m.completion_date),
        m.status, m.type, m.details.empty() ? std::string("{}") : m.details, std::to_string(m.order),
        m.planned_text, m.active_text, m.completed_text, m.blocked_text,
        std::string(m.hidden ? "true" : "false"), std::to_string(m.updated_by)});
    if (r.rows.size() != 1) throw StoreError("save_milestone: row vanished for milestone id " + std::to_string(m.id));
    return milestone_from_row(r.rows[0]);
}

std::vector<milestones::OrderSlot> PgMilestoneTx::list_order_slots(int64_t timeline_id) {
    DbResult r = run("list_order_slots",
        "SELECT id, \"order\" FROM milestones WHERE timeline_id = $1 AND deleted_at IS NULL ORDER BY \"order\", id",
        {std::to_string(timeline_id)});
    std::vector<milestones::OrderSlot> out;
    out.reserve(r.rows.size());
    for (const auto& row : r.rows) {
        if (row.size() < 2) throw StoreError("list_order_slots: unexpected column count");
        out.push_back({req_int64(row[0], "id"), req_int(row[1], "order")});
    }
    return out;
}

std::vector<Milestone> PgMilestoneTx::list_following(int64_t timeline_id, int after_order) {
    std::string sql = "SELECT " + milestone_columns() +
        " FROM milestones WHERE timeline_id = $1 AND \"order\" > $2::int AND deleted_at IS NULL ORDER BY \"order\", id";
    DbResult r = run("list_following", sql, {std::to_string(timeline_id), std::to_string(after_order)});
    std::vector<Milestone> out;
    out.reserve(r.rows.size());
    for (const auto& row : r.rows) out.push_back(milestone_from_row(row));
    return out;
}

void PgMilestoneTx::apply_order_shifts(int64_t timeline_id, const std::vector<milestones::OrderShift>& shifts) {
    if (shifts.empty()) return;
    std::vector<int64_t> ids, orders;
    for (const auto& s : shifts) { ids.push_back(s.id); orders.push_back(s.new_order); }
    DbResult r = run("apply_order_shifts",
        "UPDATE milestones AS m SET \"order\" = t.new_order, updated_at = now() "
        "FROM UNNEST($2::bigint[], $3::int[]) AS t(id, new_order) "
        "WHERE m.id = t.id AND m.timeline_id = $1 AND m.deleted_at IS NULL",
        {std::to_string(timeline_id), build_pg_int_array(ids), build_pg_int_array(orders)});
    if (r.affected_rows != int(shifts.size())) {
        throw StoreError("apply_order_shifts: expected " + std::to_string(shifts.size()) + " rows, updated " + std::to_string(r.affected_rows));
    }
}

void PgMilestoneTx::apply_schedule_writes(int64_t timeline_id, const std::vector<milestones::ScheduleWrite>& writes) {
    if (writes.empty()) return;
    std::vector<int64_t> ids, starts, ends;
    for (const auto& w : writes) { ids.push_back(w.id); starts.push_back(w.start_date); ends.push_back(w.end_date); }
    // day numbers travel as integers and become dates server side
    DbResult r = run("apply_schedule_writes",
        "UPDATE milestones AS m SET start_date = DATE '1970-01-01' + t.s::int, end_date = DATE '1970-01-01' + t.e::int, updated_at = now() "
        "FROM UNNEST($2::bigint[], $3::bigint[], $4::bigint[]) AS t(id, s, e) "
        "WHERE m.id = t.id AND m.timeline_id = $1 AND m.deleted_at IS NULL",
        {std::to_string(timeline_id), build_pg_int_array(ids), build_pg_int_array(starts), build_pg_int_array(ends)});
    if (r.affected_rows != int(writes.size())) {
        throw StoreError("apply_schedule_writes: expected " + std::to_string(writes.size()) + " rows, updated " + std::to_string(r.affected_rows));
    }
}

milestones::TxRunner make_pg_tx_runner(std::shared_ptr<DbPool> pool) {
    return [pool](milestones::TxBody body, milestones::TxDone done) {
        pool->async_transaction([body = std::move(body)](PGconn* conn) {
            PgMilestoneTx tx(conn);
            return body(tx);
        }, std::move(done));
    };
}

}
