/**
 * Handfont — Font job lifecycle implementation
 */

#include "jobs.h"
#include "artifact.h"
#include "sanitize.h"

const char* job_status_name(JobStatus status) {
    switch (status) {
        case JobStatus::Validating: return "validating";
        case JobStatus::Running:    return "running";
        case JobStatus::Succeeded:  return "succeeded";
        case JobStatus::Failed:     return "failed";
        case JobStatus::TimedOut:   return "timed-out";
    }
    return "unknown";
}

const char* job_error_name(JobError error) {
    switch (error) {
        case JobError::None:             return "none";
        case JobError::InvalidUpload:    return "invalid-upload";
        case JobError::UploadTooLarge:   return "upload-too-large";
        case JobError::ToolUnavailable:  return "tool-unavailable";
        case JobError::ToolTimeout:      return "tool-timeout";
        case JobError::ToolFailed:       return "tool-failed";
        case JobError::ArtifactNotFound: return "artifact-not-found";
        case JobError::BadKey:           return "bad-key";
    }
    return "unknown";
}

FontJobService::FontJobService(ServerConfig config, FontTool& tool)
    : config_(std::move(config)), tool_(tool) {}

static GenerateResult fail(GenerateResult result, JobError error, const string& message) {
    result.error = error;
    result.message = message;
    if (result.job.status != JobStatus::TimedOut) result.job.status = JobStatus::Failed;
    return result;
}

GenerateResult FontJobService::generate(const GenerateRequest& request) {
    GenerateResult result;
    Job& job = result.job;

    // ── 1. Upload ────────────────────────────────────────────────────────────
    UploadPolicy policy{config_.allowed_extensions, config_.max_upload_bytes};
    UploadCheck check = validate_upload(request.upload, policy);

    if (!check.ok()) {
        JobError kind = check.error == UploadError::TooLarge ? JobError::UploadTooLarge : JobError::InvalidUpload;
        return fail(std::move(result), kind, upload_error_message(check.error));
    }

    // ── 2. Text fields ───────────────────────────────────────────────────────
    job.family = sanitize_text(request.family);
    job.style = sanitize_text(request.style);
    job.artifact_key = sanitize_text(request.filename);

    if (job.family.empty()) return fail(std::move(result), JobError::InvalidUpload, "Font family name is required.");
    if (job.style.empty()) return fail(std::move(result), JobError::InvalidUpload, "Font style is required.");
    if (job.artifact_key.empty()) return fail(std::move(result), JobError::InvalidUpload, "File name is required.");

    // ── 3. Store the input; it is removed on every path out of here ─────────
    StoredUpload stored = store_upload(*request.upload, check.extension, config_.upload_dir);

    if (!stored.ok()) {
        return fail(std::move(result), JobError::InvalidUpload, upload_error_message(stored.error));
    }

    ScopedFile input(stored.path);
    job.job_id = stored.job_id;
    job.image_path = stored.path;
    job.status = JobStatus::Running;

    cout << "[Handfont] Job " << job.job_id << ": family=\"" << job.family << "\" style=\"" << job.style
         << "\" key=\"" << job.artifact_key << "\"" << endl;

    // ── 4. Run the tool ──────────────────────────────────────────────────────
    ToolRequest tool_request{stored.path, config_.output_dir, job.family, job.style, job.artifact_key};
    ToolOutcome outcome = tool_.run(tool_request);

    input.reset();

    job.exit_code = outcome.exit_code;
    job.diagnostic_text = outcome.diagnostic;
    string tool_name = fs::path(tool_.name()).filename().string();

    switch (outcome.status) {
        case ToolStatus::Unavailable:
            cerr << "[Handfont] Job " << job.job_id << ": " << tool_name << " not available" << endl;
            return fail(std::move(result), JobError::ToolUnavailable,
                        tool_name + " is not installed. Run: pip install handwrite");

        case ToolStatus::TimedOut:
            cerr << "[Handfont] Job " << job.job_id << ": timed out after " << config_.tool_timeout_sec << "s" << endl;
            job.status = JobStatus::TimedOut;
            return fail(std::move(result), JobError::ToolTimeout, "Font generation timed out. Please try again.");

        case ToolStatus::Failed: {
            cerr << "[Handfont] Job " << job.job_id << ": " << tool_name << " failed (code "
                 << outcome.exit_code << "): " << outcome.diagnostic << endl;
            string detail = outcome.diagnostic.empty() ? "exit code " + to_string(outcome.exit_code) : outcome.diagnostic;
            return fail(std::move(result), JobError::ToolFailed, tool_name + " failed: " + detail);
        }

        case ToolStatus::Succeeded:
            break;
    }

    // ── 5. A zero exit status does not prove the font was written ───────────
    fs::path ttf = artifact_path(config_.output_dir, job.artifact_key);
    std::error_code ec;

    if (!is_within_dir(ttf, config_.output_dir) || !fs::is_regular_file(ttf, ec)) {
        cerr << "[Handfont] Job " << job.job_id << ": no output at " << ttf << endl;
        return fail(std::move(result), JobError::ToolFailed, tool_name + " ran but produced no output file.");
    }

    job.status = JobStatus::Succeeded;
    result.redirect_url = artifact_page_url(job.artifact_key);
    cout << "[Handfont] Job " << job.job_id << ": wrote " << ttf << endl;
    return result;
}

ArtifactLookup FontJobService::check_artifact(const string& raw_key) const {
    ArtifactLookup lookup;

    if (!is_sanitized_key(raw_key)) {
        lookup.error = JobError::BadKey;
        return lookup;
    }

    lookup.key = raw_key;
    lookup.path = artifact_path(config_.output_dir, raw_key);

    if (!is_within_dir(lookup.path, config_.output_dir)) {
        lookup.error = JobError::BadKey;
        return lookup;
    }

    std::error_code ec;
    if (!fs::is_regular_file(lookup.path, ec)) lookup.error = JobError::ArtifactNotFound;
    return lookup;
}

ArtifactLookup FontJobService::claim_artifact(const string& raw_key) const {
    ArtifactLookup lookup = check_artifact(raw_key);
    if (!lookup.ok()) return lookup;

    fs::path claimed = serving_path(config_.output_dir, lookup.key);
    std::error_code ec;
    fs::rename(lookup.path, claimed, ec);

    if (ec) {
        // Another download got there first, or the file vanished.
        lookup.error = JobError::ArtifactNotFound;
        return lookup;
    }

    lookup.path = claimed;
    cout << "[Handfont] Claimed " << artifact_filename(lookup.key) << " for download" << endl;
    return lookup;
}

void FontJobService::release_artifact(const ArtifactLookup& claimed) const {
    if (!claimed.ok() || !is_serving_file(claimed.path)) return;
    if (remove_file_quietly(claimed.path)) {
        cout << "[Handfont] Removed " << artifact_filename(claimed.key) << " after download" << endl;
    }
}

size_t FontJobService::sweep_stale_claims() const {
    size_t removed = 0;
    std::error_code ec;

    for (fs::directory_iterator it(config_.output_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (is_serving_file(it->path()) && remove_file_quietly(it->path())) removed++;
    }

    if (ec) cerr << "[Handfont] WARNING: could not scan " << config_.output_dir << ": " << ec.message() << endl;
    return removed;
}
