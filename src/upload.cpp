/**
 * Handfont — Upload validation and storage implementation
 */

#include "upload.h"

string generate_job_id() {
    return random_hex(16);
}

string upload_error_message(UploadError error) {
    switch (error) {
        case UploadError::None:            return "";
        case UploadError::MissingFile:     return "No file part in the request.";
        case UploadError::EmptyFilename:   return "No file selected.";
        case UploadError::UnsupportedType: return "Only JPG or PNG files are accepted.";
        case UploadError::TooLarge:        return "The uploaded file is too large.";
        case UploadError::WriteFailed:     return "Could not store the uploaded file.";
    }
    return "Invalid upload.";
}

UploadCheck validate_upload(const UploadedFile* file, const UploadPolicy& policy) {
    UploadCheck check;

    if (!file) {
        check.error = UploadError::MissingFile;
        return check;
    }

    if (file->filename.empty()) {
        check.error = UploadError::EmptyFilename;
        return check;
    }

    auto dot = file->filename.rfind('.');

    if (dot == string::npos) {
        check.error = UploadError::UnsupportedType;
        return check;
    }

    string ext = to_lower(file->filename.substr(dot + 1));

    if (!policy.allowed_extensions.count(ext)) {
        check.error = UploadError::UnsupportedType;
        return check;
    }

    if (policy.max_bytes > 0 && file->content.size() > policy.max_bytes) {
        check.error = UploadError::TooLarge;
        return check;
    }

    check.extension = ext;
    return check;
}

StoredUpload store_upload(const UploadedFile& file, const string& extension, const fs::path& upload_dir) {
    StoredUpload stored;

    // 128 random bits make a clash practically impossible, but never
    // overwrite another job's input if one happens.
    for (int attempt = 0; attempt < 4; attempt++) {
        string id = generate_job_id();
        fs::path candidate = upload_dir / (id + "." + extension);
        std::error_code ec;
        if (fs::exists(candidate, ec)) continue;
        stored.job_id = id;
        stored.path = candidate;
        break;
    }

    if (stored.job_id.empty()) {
        stored.error = UploadError::WriteFailed;
        return stored;
    }

    {
        ofstream out(stored.path, std::ios::binary | std::ios::trunc);
        if (out) out.write(file.content.data(), static_cast<std::streamsize>(file.content.size()));

        if (!out) {
            cerr << "[Handfont] ERROR: failed to write upload " << stored.path << endl;
            out.close();
            remove_file_quietly(stored.path);
            stored.error = UploadError::WriteFailed;
            stored.path.clear();
            return stored;
        }
    }

    return stored;
}
