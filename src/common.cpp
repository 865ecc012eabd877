/**
 * Handfont — Common utilities implementation
 */

#include "common.h"
#include <cctype>
#include <unistd.h>
#include <sys/stat.h>

// ─── JSON helpers ───────────────────────────────────────────────────────────

string json_str(const json& j, const string& key, const string& def) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<string>();
    return def;
}

// ─── String utilities ───────────────────────────────────────────────────────

string trim(const string& s) {
    auto is_ws = [](unsigned char c) { return std::isspace(c) != 0; };
    size_t start = 0;
    size_t end = s.size();

    while (start < end && is_ws(s[start])) start++;
    while (end > start && is_ws(s[end - 1])) end--;
    return s.substr(start, end - start);
}

string to_lower(string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

string html_escape(const string& s) {
    string out;
    out.reserve(s.size());

    for (char c : s) {
        switch (c) {
            case '&':  out += "&amp;";  break;
            case '<':  out += "&lt;";   break;
            case '>':  out += "&gt;";   break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#39;";  break;
            default:   out += c;
        }
    }

    return out;
}

string random_hex(size_t bytes) {
    static const char digits[] = "0123456789abcdef";
    thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<int> dist(0, 255);

    string out;
    out.reserve(bytes * 2);

    for (size_t i = 0; i < bytes; i++) {
        int b = dist(rng);
        out += digits[(b >> 4) & 0xF];
        out += digits[b & 0xF];
    }

    return out;
}

// ─── File utilities ─────────────────────────────────────────────────────────

string read_file_binary(const string& path) {
    ifstream f(path, std::ios::binary);
    return string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

string mime_from_ext(const string& ext) {
    string e = to_lower(ext);

    if (e == ".jpg" || e == ".jpeg") return "image/jpeg";
    if (e == ".png") return "image/png";
    if (e == ".ttf") return "font/ttf";
    if (e == ".otf") return "font/otf";
    if (e == ".html") return "text/html";
    return "application/octet-stream";
}

bool send_file_response(httplib::Response& res, const string& path, const string& filename) {
    auto data = read_file_binary(path);
    if (data.empty()) return false;

    string ext = fs::path(filename).extension().string();
    res.set_content(data, mime_from_ext(ext));
    res.set_header("Content-Disposition", "attachment; filename=\"" + filename + "\"");
    return true;
}

bool remove_file_quietly(const fs::path& path) {
    std::error_code ec;
    bool removed = fs::remove(path, ec);

    if (ec && ec != std::errc::no_such_file_or_directory) {
        cerr << "[Handfont] WARNING: could not remove " << path << ": " << ec.message() << endl;
    }

    return removed;
}

bool is_within_dir(const fs::path& candidate, const fs::path& base) {
    std::error_code ec;
    auto canonical_base = fs::weakly_canonical(base, ec);
    if (ec) return false;
    auto canonical_candidate = fs::weakly_canonical(candidate, ec);
    if (ec) return false;

    auto rel = canonical_candidate.lexically_relative(canonical_base);
    if (rel.empty()) return false;

    for (const auto& part : rel) {
        if (part == "..") return false;
    }

    return true;
}

// ─── Executable lookup (PATH scan, no shell) ────────────────────────────────

static bool is_executable_file(const fs::path& p) {
    struct stat st {};
    if (::stat(p.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode) && ::access(p.c_str(), X_OK) == 0;
}

string find_executable(const string& name) {
    if (name.empty()) return "";
    if (name.find('/') != string::npos) return is_executable_file(name) ? name : "";

    const char* env_path = std::getenv("PATH");
    if (!env_path) return "";

    std::istringstream dirs(env_path);
    string dir;

    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        fs::path candidate = fs::path(dir) / name;
        if (is_executable_file(candidate)) return candidate.string();
    }

    return "";
}

// ─── Scoped file ────────────────────────────────────────────────────────────

fs::path ScopedFile::release() {
    fs::path p = std::move(path_);
    path_.clear();
    return p;
}

void ScopedFile::reset() {
    if (path_.empty()) return;
    remove_file_quietly(path_);
    path_.clear();
}
