#pragma once
/**
 * TexFill - Usage statistics
 *
 * One SQLite row per finished request. Nothing about the request content is kept.
 *
 * Record shape:
 *   { ts:<unix>, kind:"extract"|"generate", name:"<model or engine or error kind>", ok:bool }
 */

#include "common.h"

// ─── Database init (call once at startup before any other stat functions) ───

bool stat_init_db(const string& db_path);
void stat_close_db();

// ─── Record stat events ───

void stat_record(const string& kind, const string& name, bool ok = true);

// ─── Query types ───

struct StatSummary {
    int  total     = 0;
    int  successes = 0;
    int  failures  = 0;
    vector<pair<string, int>> by_name;
};

StatSummary stat_query(int64_t from_unix, int64_t to_unix, const string& kind = "");
json stat_summary_to_json(const StatSummary& s);

// ─── Time helpers ───

int64_t stat_now();
int64_t stat_days_ago(int n);
