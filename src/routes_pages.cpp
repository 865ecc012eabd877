/**
 * Handfont — Page routes and server setup
 *
 * GET /                   -> informational page
 * GET /download-template  -> template image as attachment (404 if missing)
 * GET /generate           -> upload form
 */

#include "common.h"
#include "pages.h"
#include "routes.h"

static string default_error_message(int status) {
    switch (status) {
        case 400: return "Bad request.";
        case 404: return "Not found.";
        case 405: return "Method not allowed.";
        case 413: return "The upload is too large.";
        case 500: return "Internal server error.";
        case 503: return "Service unavailable.";
        case 504: return "The request timed out.";
    }
    return "Request failed.";
}

void register_page_routes(httplib::Server& svr, const ServerConfig& cfg) {
    svr.Get("/", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(index_html(), "text/html; charset=utf-8");
    });

    fs::path template_path = cfg.template_path;

    svr.Get("/download-template", [template_path](const httplib::Request&, httplib::Response& res) {
        string name = template_path.filename().string();
        std::error_code ec;

        if (!fs::is_regular_file(template_path, ec)) {
            res.status = 404;
            res.set_content(error_html(404, name + " not found on this server."), "text/html; charset=utf-8");
            return;
        }

        if (!send_file_response(res, template_path.string(), name)) {
            res.status = 500;
            res.set_content(error_html(500, "Failed to read " + name + "."), "text/html; charset=utf-8");
        }
    });

    svr.Get("/generate", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(generate_html(), "text/html; charset=utf-8");
    });
}

void configure_server(httplib::Server& svr, FontJobService& jobs, StatsLedger& ledger) {
    const ServerConfig& cfg = jobs.config();

    // Room for the multipart envelope and text fields around the image itself.
    svr.set_payload_max_length(cfg.max_upload_bytes + 64 * 1024);

    // A generation request can legitimately hold the connection for the full tool timeout.
    svr.set_read_timeout(60, 0);
    svr.set_write_timeout(cfg.tool_timeout_sec + 30, 0);

    svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (!res.body.empty()) return;
        res.set_content(error_html(res.status, default_error_message(res.status)), "text/html; charset=utf-8");
    });

    register_page_routes(svr, cfg);
    register_font_routes(svr, jobs, ledger);
    register_stats_routes(svr, cfg, ledger);
}
