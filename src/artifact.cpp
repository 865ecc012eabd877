/**
 * Handfont — Artifact naming implementation
 */

#include "artifact.h"

const char* const ARTIFACT_EXTENSION = ".ttf";

static const string SERVING_SUFFIX = ".serving";

string artifact_filename(const string& key) {
    return key + ARTIFACT_EXTENSION;
}

fs::path artifact_path(const fs::path& output_dir, const string& key) {
    return output_dir / artifact_filename(key);
}

fs::path serving_path(const fs::path& output_dir, const string& key) {
    // Sanitized keys never contain '.', so these names cannot clash with an artifact.
    return output_dir / ("." + key + "." + random_hex(8) + SERVING_SUFFIX);
}

bool is_serving_file(const fs::path& path) {
    string name = path.filename().string();
    if (name.size() <= SERVING_SUFFIX.size() || name[0] != '.') return false;
    return name.compare(name.size() - SERVING_SUFFIX.size(), SERVING_SUFFIX.size(), SERVING_SUFFIX) == 0;
}

static string encode_key(const string& key) {
    static const char digits[] = "0123456789ABCDEF";
    string out;

    for (unsigned char c : key) {
        if (std::isalnum(c) || c == '-' || c == '_') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += digits[(c >> 4) & 0xF];
            out += digits[c & 0xF];
        }
    }

    return out;
}

string artifact_page_url(const string& key) {
    return "/font/" + encode_key(key);
}

string artifact_file_url(const string& key) {
    return artifact_page_url(key) + "/file";
}

string artifact_content_disposition(const string& key) {
    string name = artifact_filename(key);
    bool ascii = std::all_of(name.begin(), name.end(), [](unsigned char c) { return c < 0x80; });

    if (ascii) return "attachment; filename=\"" + name + "\"";
    return "attachment; filename=\"font" + string(ARTIFACT_EXTENSION) + "\"; filename*=UTF-8''" + encode_key(name);
}
