#pragma once
/**
 * Handfont — Common header
 * Shared includes, using declarations, and utility declarations
 */

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <array>
#include <memory>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cstdio>
#include <mutex>
#include <chrono>
#include <thread>
#include <algorithm>
#include <random>
#include <vector>
#include <map>
#include <set>
#include <functional>
#include <ctime>
#include <cctype>
#include <cstdint>

// ─── Type aliases & namespace shortcuts ─────────────────────────────────────

using json = nlohmann::json;
namespace fs = std::filesystem;

using std::string;
using std::vector;
using std::map;
using std::set;
using std::mutex;
using std::thread;
using std::cout;
using std::cerr;
using std::endl;
using std::array;
using std::unique_ptr;
using std::lock_guard;
using std::function;
using std::ofstream;
using std::ifstream;
using std::pair;
using std::to_string;

// ─── Safe JSON accessors (handles null values) ──────────────────────────────

template<typename T>
T json_num(const json& j, const string& key, T def) {
    if (j.contains(key) && j[key].is_number()) return j[key].get<T>();
    return def;
}

string json_str(const json& j, const string& key, const string& def = "");

// ─── String utilities ───────────────────────────────────────────────────────

string trim(const string& s);
string to_lower(string s);
string html_escape(const string& s);
string random_hex(size_t bytes);

// ─── File utilities ─────────────────────────────────────────────────────────

string read_file_binary(const string& path);
string mime_from_ext(const string& ext);
bool   remove_file_quietly(const fs::path& path);
bool   is_within_dir(const fs::path& candidate, const fs::path& base);
bool   send_file_response(httplib::Response& res, const string& path, const string& filename);

// ─── Path and executable finding ────────────────────────────────────────────

string find_executable(const string& name);

// ─── Scoped file ────────────────────────────────────────────────────────────

// Owns a path on disk and removes it on destruction. A file that is already
// gone is not an error.
class ScopedFile {
public:
    ScopedFile() = default;
    explicit ScopedFile(fs::path path) : path_(std::move(path)) {}
    ~ScopedFile() { reset(); }

    ScopedFile(const ScopedFile&) = delete;
    ScopedFile& operator=(const ScopedFile&) = delete;

    ScopedFile(ScopedFile&& other) noexcept : path_(std::move(other.path_)) { other.path_.clear(); }
    ScopedFile& operator=(ScopedFile&& other) noexcept {
        if (this != &other) {
            reset();
            path_ = std::move(other.path_);
            other.path_.clear();
        }
        return *this;
    }

    const fs::path& path() const { return path_; }
    fs::path release();
    void reset();

private:
    fs::path path_;
};
