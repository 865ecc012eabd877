#pragma once
/**
 * Handfont — Upload validation and storage
 *
 * validate_upload() only inspects the claimed file name and size. Nothing is
 * written until store_upload(), which names the file after a fresh job id so
 * no client text reaches the file system except the allow-listed extension.
 */

#include "common.h"

struct UploadedFile {
    string filename;
    string content_type;
    string content;
};

enum class UploadError {
    None,
    MissingFile,
    EmptyFilename,
    UnsupportedType,
    TooLarge,
    WriteFailed
};

struct UploadPolicy {
    set<string> allowed_extensions;   // lowercase, without the dot
    size_t      max_bytes = 0;        // 0 = unlimited
};

struct UploadCheck {
    UploadError error = UploadError::None;
    string      extension;            // validated, lowercase
    bool ok() const { return error == UploadError::None; }
};

struct StoredUpload {
    UploadError error = UploadError::None;
    string      job_id;
    fs::path    path;
    bool ok() const { return error == UploadError::None; }
};

// `file` is null when the request carried no file part at all.
UploadCheck  validate_upload(const UploadedFile* file, const UploadPolicy& policy);
StoredUpload store_upload(const UploadedFile& file, const string& extension, const fs::path& upload_dir);

string upload_error_message(UploadError error);
string generate_job_id();
