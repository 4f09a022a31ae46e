#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "db/PgMilestoneTx.h"

using Row = std::vector<std::optional<std::string>>;

static Row sample_row() {
    return Row{
        std::string("12"), std::string("3"), std::string("Design"), std::nullopt, std::string("5"),
        std::string("2024-01-10"), std::string("2024-01-14"), std::nullopt,
        std::string("planned"), std::string("default"), std::string("{\"k\": 1}"), std::string("2"),
        std::string("p"), std::nullopt, std::nullopt, std::nullopt, std::string("f"),
        std::string("1"), std::string("4"), std::string("2024-01-01T08:30:00.000Z"), std::string("2024-01-02T09:00:00.000Z"),
        std::nullopt, std::nullopt};
}

// Commas outside parentheses and quotes separate select items.
static size_t select_items(const std::string& cols) {
    size_t items = 1;
    int depth = 0;
    bool quoted = false;
    for (char c : cols) {
        if (c == '\'') quoted = !quoted;
        if (quoted) continue;
        if (c == '(') ++depth;
        else if (c == ')') --depth;
        else if (c == ',' && depth == 0) ++items;
    }
    return items;
}

int main() {
    {
        const std::string& cols = db::milestone_columns();
        if (select_items(cols) != sample_row().size()) { std::cerr << "select list has " << select_items(cols) << " items\n"; return 1; }
        for (const char* ts : {"created_at", "updated_at", "deleted_at"}) {
            std::string want = std::string("to_char(") + ts + " AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS.MS\"Z\"')";
            if (cols.find(want) == std::string::npos) { std::cerr << "timestamp projection missing for " << ts << "\n"; return 1; }
        }
        if (cols.compare(0, 4, "id, ") != 0 || cols.substr(cols.size() - 10) != "deleted_by") { std::cerr << "column order\n"; return 1; }
    }

    if (db::build_pg_int_array({}) != "{}") { std::cerr << "empty array\n"; return 1; }
    if (db::build_pg_int_array({7, -1, 19724}) != "{7,-1,19724}") { std::cerr << "int array\n"; return 1; }

    {
        auto m = db::milestone_from_row(sample_row());
        if (m.id != 12 || m.timeline_id != 3 || m.name != "Design" || m.description) { std::cerr << "identity columns\n"; return 1; }
        if (milestones::format_day(m.start_date) != "2024-01-10" || milestones::format_day(m.end_date) != "2024-01-14") { std::cerr << "dates\n"; return 1; }
        if (m.completion_date || m.order != 2 || m.hidden) { std::cerr << "optional columns\n"; return 1; }
        if (m.details != "{\"k\": 1}" || *m.planned_text != "p") { std::cerr << "text columns\n"; return 1; }
        if (m.created_by != 1 || m.updated_by != 4 || m.updated_at != "2024-01-02T09:00:00.000Z") { std::cerr << "audit columns\n"; return 1; }
        if (m.deleted_at || m.deleted_by) { std::cerr << "soft delete columns\n"; return 1; }
    }

    {
        Row r = sample_row();
        r[7] = std::string("2024-01-12");
        r[16] = std::string("t");
        r[21] = std::string("2024-01-05T00:00:00.000Z");
        r[22] = std::string("9");
        auto m = db::milestone_from_row(r);
        if (!m.completion_date || milestones::format_day(*m.completion_date) != "2024-01-12") { std::cerr << "completion date\n"; return 1; }
        if (!m.hidden || *m.deleted_by != 9 || !m.deleted_at) { std::cerr << "flags\n"; return 1; }
    }

    // malformed rows become store errors, not crashes
    auto rejects = [](Row r, const char* what) {
        try {
            db::milestone_from_row(r);
        } catch (const milestones::StoreError&) {
            return true;
        }
        std::cerr << "accepted " << what << "\n";
        return false;
    };
    Row short_row = sample_row();
    short_row.pop_back();
    if (!rejects(short_row, "short row")) return 1;
    Row null_id = sample_row();
    null_id[0] = std::nullopt;
    if (!rejects(null_id, "null id")) return 1;
    Row bad_date = sample_row();
    bad_date[5] = std::string("2024-13-01");
    if (!rejects(bad_date, "bad date")) return 1;
    Row bad_order = sample_row();
    bad_order[11] = std::string("two");
    if (!rejects(bad_order, "bad order")) return 1;

    std::cout << "pg_mapping_unit ok\n";
    return 0;
}
