/**
 * Handfont — Server configuration implementation
 */

#include "config.h"
#include <stdexcept>
#include <cstring>
#include <limits>

static string env_or(const char* name, const string& def) {
    const char* env = std::getenv(name);
    return (env && *env) ? string(env) : def;
}

static long long env_number(const char* name, long long def) {
    const char* env = std::getenv(name);
    if (!env || !*env) return def;

    try {
        size_t used = 0;
        long long v = std::stoll(env, &used);
        if (used != std::strlen(env)) throw std::invalid_argument(name);
        return v;
    } catch (const std::exception&) {
        throw std::runtime_error(string("invalid numeric value for ") + name + ": " + env);
    }
}

static int to_int(long long v, const string& what) {
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        throw std::runtime_error(what + " out of range: " + to_string(v));
    }
    return static_cast<int>(v);
}

void apply_config_json(ServerConfig& cfg, const json& j) {
    if (!j.is_object()) throw std::runtime_error("config root must be a JSON object");

    cfg.host          = json_str(j, "host", cfg.host);
    cfg.port          = to_int(json_num<long long>(j, "port", cfg.port), "port");
    cfg.upload_dir    = json_str(j, "upload_dir", cfg.upload_dir.string());
    cfg.output_dir    = json_str(j, "output_dir", cfg.output_dir.string());
    cfg.template_path = json_str(j, "template_path", cfg.template_path.string());
    cfg.tool          = json_str(j, "tool", cfg.tool);
    cfg.stats_db      = json_str(j, "stats_db", cfg.stats_db);
    cfg.tool_timeout_sec = to_int(json_num<long long>(j, "tool_timeout_sec", cfg.tool_timeout_sec), "tool_timeout_sec");

    long long max_bytes = json_num<long long>(j, "max_upload_bytes", static_cast<long long>(cfg.max_upload_bytes));
    if (max_bytes <= 0) throw std::runtime_error("max_upload_bytes must be positive");
    cfg.max_upload_bytes = static_cast<size_t>(max_bytes);

    if (j.contains("allowed_extensions")) {
        const auto& exts = j["allowed_extensions"];
        if (!exts.is_array()) throw std::runtime_error("allowed_extensions must be an array");

        set<string> parsed;
        for (const auto& e : exts) {
            if (!e.is_string()) throw std::runtime_error("allowed_extensions entries must be strings");
            string ext = to_lower(e.get<string>());
            if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);
            if (!ext.empty()) parsed.insert(ext);
        }
        cfg.allowed_extensions = parsed;
    }
}

void apply_config_env(ServerConfig& cfg) {
    cfg.host          = env_or("HANDFONT_HOST", cfg.host);
    cfg.upload_dir    = env_or("HANDFONT_UPLOAD_DIR", cfg.upload_dir.string());
    cfg.output_dir    = env_or("HANDFONT_OUTPUT_DIR", cfg.output_dir.string());
    cfg.template_path = env_or("HANDFONT_TEMPLATE", cfg.template_path.string());
    cfg.tool          = env_or("HANDFONT_TOOL", cfg.tool);
    cfg.stats_db      = env_or("HANDFONT_STATS_DB", cfg.stats_db);

    cfg.port             = to_int(env_number("HANDFONT_PORT", cfg.port), "HANDFONT_PORT");
    cfg.tool_timeout_sec = to_int(env_number("HANDFONT_TOOL_TIMEOUT", cfg.tool_timeout_sec), "HANDFONT_TOOL_TIMEOUT");

    long long max_bytes = env_number("HANDFONT_MAX_UPLOAD_BYTES", static_cast<long long>(cfg.max_upload_bytes));
    if (max_bytes <= 0) throw std::runtime_error("HANDFONT_MAX_UPLOAD_BYTES must be positive");
    cfg.max_upload_bytes = static_cast<size_t>(max_bytes);
}

void validate_config(const ServerConfig& cfg) {
    if (cfg.port <= 0 || cfg.port > 65535) throw std::runtime_error("port out of range: " + to_string(cfg.port));
    if (cfg.tool_timeout_sec <= 0) throw std::runtime_error("tool timeout must be positive");
    if (cfg.max_upload_bytes == 0) throw std::runtime_error("max upload size must be positive");
    if (cfg.allowed_extensions.empty()) throw std::runtime_error("no upload extensions allowed");
    if (cfg.tool.empty()) throw std::runtime_error("tool executable not set");
    if (cfg.upload_dir.empty() || cfg.output_dir.empty()) throw std::runtime_error("upload/output directory not set");
}

ServerConfig load_config(const string& config_file) {
    ServerConfig cfg;

    string path = config_file.empty() ? env_or("HANDFONT_CONFIG", "") : config_file;

    if (!path.empty()) {
        ifstream f(path);
        if (!f) throw std::runtime_error("cannot open config file: " + path);

        try {
            apply_config_json(cfg, json::parse(f));
        } catch (const json::exception& e) {
            throw std::runtime_error("invalid config file " + path + ": " + e.what());
        }

        cout << "[Handfont] Loaded config from " << path << endl;
    }

    apply_config_env(cfg);
    validate_config(cfg);
    return cfg;
}

void prepare_directories(const ServerConfig& cfg) {
    for (const auto& dir : {cfg.upload_dir, cfg.output_dir}) {
        std::error_code ec;
        fs::create_directories(dir, ec);

        if (ec || !fs::is_directory(dir)) {
            throw std::runtime_error("cannot create directory " + dir.string() + ": " + ec.message());
        }
    }
}
