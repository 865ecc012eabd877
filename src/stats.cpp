/**
 * Handfont - Statistics ledger implementation (SQLite backend)
 */

#include "stats.h"
#include <sqlite3.h>

static constexpr int64_t SECONDS_PER_DAY = 86400;
static constexpr size_t  MAX_DAY_BUCKETS = 366;

namespace {

// Owns one prepared statement; finalized on scope exit.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            fprintf(stderr, "[stats] Prepare failed: %s\n", sqlite3_errmsg(db));
            sqlite3_finalize(stmt_);
            stmt_ = nullptr;
        }
    }

    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    explicit operator bool() const { return stmt_ != nullptr; }
    sqlite3_stmt* get() const { return stmt_; }

    void bind(int idx, int64_t v) { sqlite3_bind_int64(stmt_, idx, v); }
    void bind(int idx, const string& v) {
        if (v.empty()) sqlite3_bind_null(stmt_, idx);
        else sqlite3_bind_text(stmt_, idx, v.c_str(), -1, SQLITE_TRANSIENT);
    }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

int64_t unix_now() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

int64_t day_floor(int64_t ts) {
    int64_t r = ts % SECONDS_PER_DAY;
    return r < 0 ? ts - r - SECONDS_PER_DAY : ts - r;
}

string utc_date(int64_t ts) {
    time_t t = static_cast<time_t>(ts);
    struct tm parts {};
    gmtime_r(&t, &parts);

    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &parts);
    return buf;
}

// Visitor hash: FNV-1a over the address, first 40 bits as hex.
string visitor_hash(const string& ip) {
    if (ip.empty()) return "";

    uint64_t h = 0xcbf29ce484222325ULL;
    for (unsigned char c : ip) h = (h ^ c) * 0x100000001b3ULL;

    char buf[11];
    snprintf(buf, sizeof(buf), "%010llx", static_cast<unsigned long long>(h >> 24));
    return buf;
}

} // namespace

const char* stat_kind_name(StatKind kind) {
    switch (kind) {
        case StatKind::Job:      return "job";
        case StatKind::Download: return "download";
    }
    return "unknown";
}

// ─── Lifecycle ──────────────────────────────────────────────────────────────

StatsLedger::StatsLedger(const string& db_path) : path_(db_path) {
    sqlite3* db = nullptr;

    if (sqlite3_open(db_path.c_str(), &db) != SQLITE_OK) {
        fprintf(stderr, "[stats] Failed to open %s: %s\n", db_path.c_str(), db ? sqlite3_errmsg(db) : "out of memory");
        sqlite3_close(db);
        return;
    }

    const char* setup = R"(
        PRAGMA journal_mode=WAL;
        PRAGMA synchronous=NORMAL;
        CREATE TABLE IF NOT EXISTS stats (
            id   INTEGER PRIMARY KEY AUTOINCREMENT,
            ts   INTEGER NOT NULL,
            kind TEXT    NOT NULL,
            name TEXT    NOT NULL,
            ok   INTEGER NOT NULL DEFAULT 1,
            vh   TEXT
        );
        CREATE INDEX IF NOT EXISTS idx_stats_kind_ts ON stats(kind, ts);
    )";

    char* err = nullptr;
    if (sqlite3_exec(db, setup, nullptr, nullptr, &err) != SQLITE_OK) {
        fprintf(stderr, "[stats] Schema setup failed for %s: %s\n", db_path.c_str(), err ? err : "unknown");
        sqlite3_free(err);
        sqlite3_close(db);
        return;
    }

    db_ = db;
    fprintf(stdout, "[stats] Ledger open: %s\n", db_path.c_str());
}

StatsLedger::~StatsLedger() {
    lock_guard<mutex> lk(mutex_);
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
}

// ─── Writes ─────────────────────────────────────────────────────────────────

void StatsLedger::record(StatKind kind, const string& outcome, bool ok, const string& client_ip) {
    string vh = visitor_hash(client_ip);

    lock_guard<mutex> lk(mutex_);
    if (!db_) return;

    Statement insert(db_, "INSERT INTO stats (ts, kind, name, ok, vh) VALUES (?, ?, ?, ?, ?)");
    if (!insert) return;

    insert.bind(1, unix_now());
    insert.bind(2, string(stat_kind_name(kind)));
    insert.bind(3, outcome);
    insert.bind(4, static_cast<int64_t>(ok ? 1 : 0));
    insert.bind(5, vh);

    if (sqlite3_step(insert.get()) != SQLITE_DONE) {
        fprintf(stderr, "[stats] Insert failed: %s\n", sqlite3_errmsg(db_));
    }
}

// ─── Reads ──────────────────────────────────────────────────────────────────

void StatsLedger::for_each_row(StatKind kind, int64_t from_unix, int64_t to_unix, const RowFn& fn) const {
    lock_guard<mutex> lk(mutex_);
    if (!db_) return;

    Statement select(db_, "SELECT ts, name, ok FROM stats WHERE kind = ? AND ts BETWEEN ? AND ?");
    if (!select) return;

    select.bind(1, string(stat_kind_name(kind)));
    select.bind(2, from_unix);
    select.bind(3, to_unix);

    while (sqlite3_step(select.get()) == SQLITE_ROW) {
        const auto* name = reinterpret_cast<const char*>(sqlite3_column_text(select.get(), 1));
        fn(sqlite3_column_int64(select.get(), 0), name ? name : "", sqlite3_column_int(select.get(), 2) != 0);
    }
}

StatSummary StatsLedger::summarize(StatKind kind, int64_t from_unix, int64_t to_unix) const {
    StatSummary summary;
    map<string, int> outcomes;

    for_each_row(kind, from_unix, to_unix, [&](int64_t, const string& name, bool ok) {
        summary.total++;
        (ok ? summary.successes : summary.failures)++;
        outcomes[name]++;
    });

    summary.by_name.assign(outcomes.begin(), outcomes.end());
    std::stable_sort(summary.by_name.begin(), summary.by_name.end(),
                     [](const pair<string, int>& a, const pair<string, int>& b) { return a.second > b.second; });
    return summary;
}

vector<DayBucket> StatsLedger::per_day(StatKind kind, int64_t from_unix, int64_t to_unix) const {
    vector<DayBucket> days;
    if (to_unix < from_unix) return days;

    int64_t first_day = day_floor(from_unix);
    int64_t last_day = std::min(day_floor(to_unix), day_floor(unix_now()));
    if (last_day < first_day) return days;

    size_t span = static_cast<size_t>((last_day - first_day) / SECONDS_PER_DAY) + 1;
    span = std::min(span, MAX_DAY_BUCKETS);

    for (size_t i = 0; i < span; i++) {
        days.push_back(DayBucket{utc_date(first_day + static_cast<int64_t>(i) * SECONDS_PER_DAY), 0});
    }

    for_each_row(kind, from_unix, to_unix, [&](int64_t ts, const string&, bool) {
        auto idx = static_cast<size_t>((day_floor(ts) - first_day) / SECONDS_PER_DAY);
        if (idx < days.size()) days[idx].count++;
    });

    return days;
}

// ─── Day boundaries ─────────────────────────────────────────────────────────

int64_t stats_today_start() {
    return day_floor(unix_now());
}

int64_t stats_days_ago(int n) {
    return stats_today_start() - static_cast<int64_t>(n) * SECONDS_PER_DAY;
}
