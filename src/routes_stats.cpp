/**
 * Handfont - Health and statistics routes
 *
 * GET /api/health   -> service status, tool availability, today's counts
 * GET /api/stats    -> job/download summary for ?range=today|week|month
 */

#include "common.h"
#include "stats.h"
#include "routes.h"

static json summary_json(const StatSummary& s) {
    json by_name = json::object();
    for (const auto& [name, count] : s.by_name) by_name[name] = count;

    return {
        {"total",     s.total},
        {"successes", s.successes},
        {"failures",  s.failures},
        {"by_outcome", by_name}
    };
}

static pair<int64_t, int64_t> parse_range(const string& range) {
    int64_t today = stats_today_start();
    if (range == "week")  return {stats_days_ago(7),  today + 86399};
    if (range == "month") return {stats_days_ago(30), today + 86399};
    return {today, today + 86399};
}

void register_stats_routes(httplib::Server& svr, const ServerConfig& cfg, const StatsLedger& ledger) {
    string tool = cfg.tool;
    int timeout_sec = cfg.tool_timeout_sec;
    size_t max_upload = cfg.max_upload_bytes;

    svr.Get("/api/health", [&ledger, tool, timeout_sec, max_upload](const httplib::Request&, httplib::Response& res) {
        int64_t day_start = stats_today_start();
        int64_t day_end   = day_start + 86399;
        string tool_path  = find_executable(tool);

        json response = {
            {"status", "ok"},
            {"tool", {
                {"name",        tool},
                {"path",        tool_path},
                {"available",   !tool_path.empty()},
                {"timeout_sec", timeout_sec}
            }},
            {"max_upload_bytes", max_upload},
            {"today", {
                {"jobs",      summary_json(ledger.summarize(StatKind::Job, day_start, day_end))},
                {"downloads", summary_json(ledger.summarize(StatKind::Download, day_start, day_end))}
            }}
        };

        res.set_header("Cache-Control", "no-store");
        res.set_content(response.dump(), "application/json");
    });

    svr.Get("/api/stats", [&ledger](const httplib::Request& req, httplib::Response& res) {
        string range = req.has_param("range") ? req.get_param_value("range") : "today";

        if (range != "today" && range != "week" && range != "month") {
            res.status = 400;
            res.set_content(json({{"error", "range must be today, week or month"}}).dump(), "application/json");
            return;
        }

        auto [from, to] = parse_range(range);
        json series = json::array();
        for (const auto& b : ledger.per_day(StatKind::Job, from, to)) {
            series.push_back({{"date", b.date}, {"count", b.count}});
        }

        json response = {
            {"range",     range},
            {"jobs",      summary_json(ledger.summarize(StatKind::Job, from, to))},
            {"downloads", summary_json(ledger.summarize(StatKind::Download, from, to))},
            {"jobs_per_day", series}
        };

        res.set_header("Cache-Control", "no-store");
        res.set_content(response.dump(), "application/json");
    });
}
