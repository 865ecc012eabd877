#pragma once
/**
 * Handfont - Statistics ledger
 *
 * Records every generation job and artifact download in a SQLite table.
 * Client addresses are stored only as a truncated hash.
 *
 * Row shape:
 *   { ts:<unix>, kind:"job"|"download", name:<outcome>, ok:0|1, vh:<ip_hash> }
 *
 * The default database is ":memory:", so nothing outlives the process unless
 * a file path is configured.
 */

#include "common.h"

struct sqlite3;

enum class StatKind {
    Job,
    Download
};

const char* stat_kind_name(StatKind kind);

struct StatSummary {
    int  total     = 0;
    int  successes = 0;
    int  failures  = 0;
    vector<pair<string, int>> by_name;   // outcome -> count, most frequent first
};

struct DayBucket {
    string date;     // YYYY-MM-DD (UTC)
    int    count = 0;
};

class StatsLedger {
public:
    // Opens (or creates) the database. On failure the ledger stays usable but
    // records nothing; check is_open().
    explicit StatsLedger(const string& db_path);
    ~StatsLedger();

    StatsLedger(const StatsLedger&) = delete;
    StatsLedger& operator=(const StatsLedger&) = delete;

    bool is_open() const { return db_ != nullptr; }
    const string& path() const { return path_; }

    void record(StatKind kind, const string& outcome, bool ok, const string& client_ip = "");

    StatSummary       summarize(StatKind kind, int64_t from_unix, int64_t to_unix) const;
    vector<DayBucket> per_day(StatKind kind, int64_t from_unix, int64_t to_unix) const;

private:
    using RowFn = function<void(int64_t ts, const string& name, bool ok)>;
    void for_each_row(StatKind kind, int64_t from_unix, int64_t to_unix, const RowFn& fn) const;

    string        path_;
    sqlite3*      db_ = nullptr;
    mutable mutex mutex_;
};

// UTC day boundaries
int64_t stats_today_start();
int64_t stats_days_ago(int n);
