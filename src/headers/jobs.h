#pragma once
/**
 * Handfont — Font job lifecycle
 *
 * FontJobService runs one generation request end to end (validate, sanitize,
 * store, run the tool, verify the artifact) and owns the retrieval rules for
 * finished artifacts. The uploaded image is always deleted before generate()
 * returns; an artifact is deleted by whoever downloads it.
 *
 * Artifacts are keyed by the caller-chosen file name. Two jobs using the same
 * name share one slot and the later one overwrites the earlier artifact.
 */

#include "common.h"
#include "config.h"
#include "font_tool.h"
#include "upload.h"

enum class JobStatus {
    Validating,
    Running,
    Succeeded,
    Failed,
    TimedOut
};

enum class JobError {
    None,
    InvalidUpload,
    UploadTooLarge,
    ToolUnavailable,
    ToolTimeout,
    ToolFailed,
    ArtifactNotFound,
    BadKey
};

struct Job {
    string    job_id;
    fs::path  image_path;
    string    family;
    string    style;
    string    artifact_key;
    JobStatus status    = JobStatus::Validating;
    int       exit_code = -1;
    string    diagnostic_text;
};

struct GenerateRequest {
    const UploadedFile* upload = nullptr;   // null: no file part
    string family;
    string style;
    string filename;
};

struct GenerateResult {
    Job      job;
    JobError error = JobError::None;
    string   message;          // user-facing, set on failure
    string   redirect_url;     // retrieval page, set on success
    bool ok() const { return error == JobError::None; }
};

struct ArtifactLookup {
    JobError error = JobError::None;
    string   key;
    fs::path path;             // artifact, or the private serving copy once claimed
    bool ok() const { return error == JobError::None; }
};

class FontJobService {
public:
    FontJobService(ServerConfig config, FontTool& tool);

    GenerateResult generate(const GenerateRequest& request);

    // Validates the key and checks that the artifact exists. Does not modify anything.
    ArtifactLookup check_artifact(const string& raw_key) const;

    // Takes exclusive ownership of the artifact for one download by renaming
    // it out of the lookup namespace. At most one concurrent caller succeeds.
    ArtifactLookup claim_artifact(const string& raw_key) const;

    // Deletes a claimed artifact. Safe to call more than once.
    void release_artifact(const ArtifactLookup& claimed) const;

    // Removes serving copies abandoned by a previous process. Startup only.
    size_t sweep_stale_claims() const;

    const ServerConfig& config() const { return config_; }

private:
    ServerConfig config_;
    FontTool&    tool_;
};

const char* job_status_name(JobStatus status);
const char* job_error_name(JobError error);
