/**
 * TexFill — Usage statistics implementation (SQLite backend)
 */

#include "stats.h"
#include <sqlite3.h>

// ─── Globals ───────────────────────────────────────────────────────────

static mutex    g_stats_mutex;
static sqlite3* g_db = nullptr;

// ─── DB init ───────────────────────────────────────────────────────────

bool stat_init_db(const string& db_path) {
    lock_guard<mutex> lk(g_stats_mutex);

    if (g_db) {
        sqlite3_close(g_db);
        g_db = nullptr;
    }

    if (sqlite3_open(db_path.c_str(), &g_db) != SQLITE_OK) {
        cerr << TEXFILL_LOG "[stats] Failed to open " << db_path << ": " << sqlite3_errmsg(g_db) << endl;
        sqlite3_close(g_db);
        g_db = nullptr;
        return false;
    }

    // WAL keeps concurrent request threads from blocking each other on writes
    sqlite3_exec(g_db, "PRAGMA journal_mode=WAL", nullptr, nullptr, nullptr);
    sqlite3_exec(g_db, "PRAGMA synchronous=NORMAL", nullptr, nullptr, nullptr);

    const char* schema = R"(
        CREATE TABLE IF NOT EXISTS stats (
            id   INTEGER PRIMARY KEY AUTOINCREMENT,
            ts   INTEGER NOT NULL,
            kind TEXT    NOT NULL,
            name TEXT    NOT NULL,
            ok   INTEGER NOT NULL DEFAULT 1
        );
        CREATE INDEX IF NOT EXISTS idx_stats_ts      ON stats(ts);
        CREATE INDEX IF NOT EXISTS idx_stats_ts_kind ON stats(ts, kind);
    )";
    char* errmsg = nullptr;

    if (sqlite3_exec(g_db, schema, nullptr, nullptr, &errmsg) != SQLITE_OK) {
        cerr << TEXFILL_LOG "[stats] Schema error: " << (errmsg ? errmsg : "unknown") << endl;
        sqlite3_free(errmsg);
        sqlite3_close(g_db);
        g_db = nullptr;
        return false;
    }

    cout << TEXFILL_LOG "[stats] Recording to " << db_path << endl;
    return true;
}

void stat_close_db() {
    lock_guard<mutex> lk(g_stats_mutex);

    if (g_db) sqlite3_close(g_db);
    g_db = nullptr;
}

// ─── Record ───────────────────────────────────────────────────────────

void stat_record(const string& kind, const string& name, bool ok) {
    lock_guard<mutex> lk(g_stats_mutex);
    if (!g_db) return;

    sqlite3_stmt* stmt = nullptr;
    const char* sql = "INSERT INTO stats (ts, kind, name, ok) VALUES (?,?,?,?)";

    if (sqlite3_prepare_v2(g_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        cerr << TEXFILL_LOG "[stats] Prepare failed: " << sqlite3_errmsg(g_db) << endl;
        return;
    }

    sqlite3_bind_int64(stmt, 1, stat_now());
    sqlite3_bind_text(stmt,  2, kind.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt,  3, name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt,   4, ok ? 1 : 0);

    if (sqlite3_step(stmt) != SQLITE_DONE) {
        cerr << TEXFILL_LOG "[stats] Insert failed: " << sqlite3_errmsg(g_db) << endl;
    }

    sqlite3_finalize(stmt);
}

// ─── Query ───────────────────────────────────────────────────────────

StatSummary stat_query(int64_t from_unix, int64_t to_unix, const string& kind) {
    StatSummary s;
    map<string, int> counts;
    lock_guard<mutex> lk(g_stats_mutex);
    if (!g_db) return s;

    string sql = "SELECT name, ok FROM stats WHERE ts >= ? AND ts <= ?";
    if (!kind.empty()) sql += " AND kind = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(g_db, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_int64(stmt, 1, from_unix);
        sqlite3_bind_int64(stmt, 2, to_unix);
        if (!kind.empty()) sqlite3_bind_text(stmt, 3, kind.c_str(), -1, SQLITE_TRANSIENT);

        while (sqlite3_step(stmt) == SQLITE_ROW) {
            auto nm_ptr = sqlite3_column_text(stmt, 0);
            string nm = nm_ptr ? reinterpret_cast<const char*>(nm_ptr) : "";
            int    ok = sqlite3_column_int(stmt, 1);
            s.total++;
            if (ok) s.successes++; else s.failures++;
            counts[nm]++;
        }
        sqlite3_finalize(stmt);
    } else {
        cerr << TEXFILL_LOG "[stats] Query failed: " << sqlite3_errmsg(g_db) << endl;
    }

    s.by_name.assign(counts.begin(), counts.end());
    std::sort(s.by_name.begin(), s.by_name.end(),
        [](const pair<string,int>& a, const pair<string,int>& b) { return a.second > b.second; });
    return s;
}

json stat_summary_to_json(const StatSummary& s) {
    json by_name = json::array();
    for (const auto& [name, count] : s.by_name) by_name.push_back({{"name", name}, {"count", count}});

    return {
        {"total", s.total},
        {"successes", s.successes},
        {"failures", s.failures},
        {"by_name", by_name}
    };
}

// ─── Time helpers ───────────────────────────────────────────────────────────

int64_t stat_now() {
    return (int64_t)std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

int64_t stat_days_ago(int n) {
    return stat_now() - (int64_t)n * 86400;
}
