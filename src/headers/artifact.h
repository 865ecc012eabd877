#pragma once
/**
 * Handfont — Artifact naming
 *
 * An artifact lives at <output_dir>/<key>.ttf where <key> is the sanitized
 * "filename" form field. While a download is in flight the file is renamed to
 * a private serving name (.<key>.<token>.serving) so a second request can no
 * longer see it.
 */

#include "common.h"

extern const char* const ARTIFACT_EXTENSION;   // ".ttf"

string   artifact_filename(const string& key);
fs::path artifact_path(const fs::path& output_dir, const string& key);
fs::path serving_path(const fs::path& output_dir, const string& key);
bool     is_serving_file(const fs::path& path);

// Retrieval URLs with the key percent-encoded for use in Location / href.
string artifact_page_url(const string& key);
string artifact_file_url(const string& key);

// Content-Disposition value for the download. Non-ASCII keys get an RFC 5987
// filename* parameter with an ASCII fallback name.
string artifact_content_disposition(const string& key);
