/**
 * Handfont - Handwriting to font server
 * C++ backend using cpp-httplib + handwrite
 */

#include "common.h"
#include "config.h"
#include "font_tool.h"
#include "jobs.h"
#include "routes.h"
#include "stats.h"

#include <atomic>
#include <csignal>
#include <stdexcept>

namespace {
    std::atomic_bool shutdown_requested{false};
    httplib::Server* active_server = nullptr;

    void handle_shutdown_signal(int) {
        if (shutdown_requested.exchange(true)) return;
        if (active_server) active_server->stop();
    }
} // namespace

int main(int argc, char* argv[]) {
    ServerConfig cfg;

    try {
        cfg = load_config(argc > 1 ? argv[1] : "");
        prepare_directories(cfg);
    } catch (const std::exception& e) {
        cerr << "[Handfont] ERROR: " << e.what() << endl;
        return 1;
    }

    cout << "[Handfont] Upload directory: " << fs::absolute(cfg.upload_dir) << endl;
    cout << "[Handfont] Output directory: " << fs::absolute(cfg.output_dir) << endl;

    // ── Find the font tool ──────────────────────────────────────────────────
    string tool_path = find_executable(cfg.tool);
    if (tool_path.empty()) {
        cerr << "[Handfont] WARNING: " << cfg.tool << " not found! Font generation will fail." << endl;
        cerr << "[Handfont] Install it: pip install handwrite" << endl;
    } else {
        cout << "[Handfont] " << cfg.tool << " found: " << tool_path
             << " (timeout " << cfg.tool_timeout_sec << "s)" << endl;
    }

    if (!fs::exists(cfg.template_path)) {
        cerr << "[Handfont] WARNING: template " << cfg.template_path << " not found; /download-template will 404" << endl;
    }

    StatsLedger ledger(cfg.stats_db);
    if (!ledger.is_open()) {
        cerr << "[Handfont] WARNING: statistics disabled" << endl;
    }

    HandwriteTool tool(cfg.tool, std::chrono::seconds(cfg.tool_timeout_sec));
    FontJobService jobs(cfg, tool);

    size_t stale = jobs.sweep_stale_claims();
    if (stale > 0) cout << "[Handfont] Removed " << stale << " abandoned download(s)" << endl;

    httplib::Server svr;
    configure_server(svr, jobs, ledger);

    active_server = &svr;
    std::signal(SIGINT, handle_shutdown_signal);
    std::signal(SIGTERM, handle_shutdown_signal);

    cout << "[Handfont] Listening on http://" << cfg.host << ":" << cfg.port << endl;

    bool ok = svr.listen(cfg.host, cfg.port);
    active_server = nullptr;

    if (!ok && !shutdown_requested) {
        cerr << "[Handfont] ERROR: could not listen on " << cfg.host << ":" << cfg.port << endl;
        return 1;
    }

    cout << "[Handfont] Server stopped" << endl;
    return 0;
}
