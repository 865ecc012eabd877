/**
 * Handfont — Font generation and retrieval routes
 *
 * POST /generate          -> run a job; re-render the form on failure,
 *                            redirect to /font/<key> on success
 * GET  /font/<key>        -> download landing page
 * GET  /font/<key>/file   -> stream the font once, then delete it
 */

#include "common.h"
#include "artifact.h"
#include "pages.h"
#include "routes.h"
#include "stats.h"

static const char* HTML_TYPE = "text/html; charset=utf-8";

// Multipart text fields arrive as file parts without a filename.
static string form_field(const httplib::Request& req, const string& name) {
    if (req.has_file(name)) return req.get_file_value(name).content;
    if (req.has_param(name)) return req.get_param_value(name);
    return "";
}

static int status_for(JobError error) {
    switch (error) {
        case JobError::None:             return 200;
        case JobError::InvalidUpload:    return 400;
        case JobError::UploadTooLarge:   return 413;
        case JobError::ToolUnavailable:  return 503;
        case JobError::ToolTimeout:      return 504;
        case JobError::ToolFailed:       return 500;
        case JobError::ArtifactNotFound: return 404;
        case JobError::BadKey:           return 400;
    }
    return 500;
}

static void lookup_failed(httplib::Response& res, const ArtifactLookup& lookup) {
    res.status = status_for(lookup.error);
    string msg = lookup.error == JobError::BadKey
        ? "Invalid font name."
        : "Font not found. It may have already been downloaded.";
    res.set_content(error_html(res.status, msg), HTML_TYPE);
}

// Streams a claimed artifact and deletes it once the transfer is over,
// whether it completed or the client went away.
static void stream_claimed(httplib::Response& res, FontJobService& jobs, StatsLedger& ledger,
                           const ArtifactLookup& claimed, const string& client_ip) {
    std::error_code ec;
    auto size = fs::file_size(claimed.path, ec);
    auto file = std::make_shared<ifstream>(claimed.path, std::ios::binary);

    if (ec || !file->is_open()) {
        cerr << "[Handfont] ERROR: cannot open claimed artifact " << claimed.path << endl;
        jobs.release_artifact(claimed);
        res.status = 500;
        res.set_content(error_html(500, "Failed to read the font file."), HTML_TYPE);
        return;
    }

    res.set_header("Content-Disposition", artifact_content_disposition(claimed.key));

    res.set_content_provider(
        static_cast<size_t>(size), mime_from_ext(ARTIFACT_EXTENSION),
        [file](size_t offset, size_t length, httplib::DataSink& sink) {
            if (length == 0) return true;
            if (!file->good()) file->clear();

            file->seekg(static_cast<std::streamoff>(offset), std::ios::beg);
            if (!file->good()) return false;

            array<char, 64 * 1024> buffer;
            size_t remaining = length;

            while (remaining > 0) {
                size_t chunk = std::min(remaining, buffer.size());
                file->read(buffer.data(), static_cast<std::streamsize>(chunk));
                auto got = static_cast<size_t>(file->gcount());
                if (got == 0) return false;
                if (!sink.write(buffer.data(), got)) return false;
                remaining -= got;
            }

            return true;
        },
        [&jobs, &ledger, claimed, client_ip](bool success) {
            jobs.release_artifact(claimed);
            ledger.record(StatKind::Download, success ? "served" : "aborted", success, client_ip);
            if (!success) cerr << "[Handfont] Download of " << claimed.key << " aborted; font discarded" << endl;
        });
}

void register_font_routes(httplib::Server& svr, FontJobService& jobs, StatsLedger& ledger) {

    // ── POST /generate ──────────────────────────────────────────────────────
    svr.Post("/generate", [&jobs, &ledger](const httplib::Request& req, httplib::Response& res) {
        try {
            UploadedFile upload;
            bool has_upload = req.has_file("pngfile");

            if (has_upload) {
                auto part = req.get_file_value("pngfile");
                upload.filename = part.filename;
                upload.content_type = part.content_type;
                upload.content = std::move(part.content);
            }

            GenerateRequest request;
            request.upload = has_upload ? &upload : nullptr;
            request.family = form_field(req, "family");
            request.style = form_field(req, "style");
            request.filename = form_field(req, "filename");

            GenerateResult result = jobs.generate(request);
            ledger.record(StatKind::Job, result.ok() ? "succeeded" : job_error_name(result.error), result.ok(), req.remote_addr);

            if (!result.ok()) {
                res.status = status_for(result.error);
                res.set_content(generate_html(result.message), HTML_TYPE);
                return;
            }

            res.set_redirect(result.redirect_url);
        } catch (const std::exception& e) {
            cerr << "[Handfont] ERROR: generate failed: " << e.what() << endl;
            ledger.record(StatKind::Job, "internal-error", false, req.remote_addr);
            res.status = 500;
            res.set_content(generate_html("Something went wrong while generating your font."), HTML_TYPE);
        }
    });

    // ── GET /font/<key> ─────────────────────────────────────────────────────
    svr.Get(R"(/font/([^/]+))", [&jobs](const httplib::Request& req, httplib::Response& res) {
        string key = req.matches[1];
        ArtifactLookup lookup = jobs.check_artifact(key);

        if (!lookup.ok()) {
            lookup_failed(res, lookup);
            return;
        }

        res.set_header("Cache-Control", "no-store");
        res.set_content(download_html(lookup.key), HTML_TYPE);
    });

    // ── GET /font/<key>/file ────────────────────────────────────────────────
    svr.Get(R"(/font/([^/]+)/file)", [&jobs, &ledger](const httplib::Request& req, httplib::Response& res) {
        string key = req.matches[1];

        try {
            ArtifactLookup claimed = jobs.claim_artifact(key);

            if (!claimed.ok()) {
                lookup_failed(res, claimed);
                return;
            }

            res.set_header("Cache-Control", "no-store");
            stream_claimed(res, jobs, ledger, claimed, req.remote_addr);
        } catch (const std::exception& e) {
            cerr << "[Handfont] ERROR: download of " << key << " failed: " << e.what() << endl;
            res.status = 500;
            res.set_content(error_html(500, "Failed to send the font file."), HTML_TYPE);
        }
    });
}
