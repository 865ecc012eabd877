#pragma once
/**
 * Handfont — Server configuration
 *
 * Built once at startup: defaults, then an optional JSON file, then HANDFONT_*
 * environment variables. The resulting value is passed to everything that
 * needs it; there is no global configuration.
 */

#include "common.h"

struct ServerConfig {
    string   host               = "0.0.0.0";
    int      port               = 5000;
    fs::path upload_dir         = "uploads";
    fs::path output_dir         = "outputs";
    fs::path template_path      = "template.jpg";
    string   tool               = "handwrite";
    int      tool_timeout_sec   = 120;
    size_t   max_upload_bytes   = 5 * 1024 * 1024;
    set<string> allowed_extensions = {"png", "jpg", "jpeg"};
    string   stats_db           = ":memory:";
};

// Throws std::runtime_error on an unreadable file or invalid values.
ServerConfig load_config(const string& config_file = "");

void apply_config_json(ServerConfig& cfg, const json& j);
void apply_config_env(ServerConfig& cfg);
void validate_config(const ServerConfig& cfg);

// Creates the upload and output directories. Throws std::runtime_error.
void prepare_directories(const ServerConfig& cfg);
