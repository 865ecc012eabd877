#include <gtest/gtest.h>

#include "config.h"
#include "test_helpers.h"

namespace {

const char* const ENV_VARS[] = {
    "HANDFONT_CONFIG", "HANDFONT_HOST", "HANDFONT_PORT", "HANDFONT_UPLOAD_DIR", "HANDFONT_OUTPUT_DIR",
    "HANDFONT_TEMPLATE", "HANDFONT_TOOL", "HANDFONT_TOOL_TIMEOUT", "HANDFONT_MAX_UPLOAD_BYTES",
    "HANDFONT_STATS_DB",
};

} // namespace

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear_env(); }
    void TearDown() override { clear_env(); }

    static void clear_env() {
        for (const char* name : ENV_VARS) ::unsetenv(name);
    }

    TempDir dir;
};

TEST_F(ConfigTest, DefaultsAreValid) {
    ServerConfig cfg = load_config();

    EXPECT_EQ(cfg.host, "0.0.0.0");
    EXPECT_EQ(cfg.port, 5000);
    EXPECT_EQ(cfg.upload_dir, fs::path("uploads"));
    EXPECT_EQ(cfg.output_dir, fs::path("outputs"));
    EXPECT_EQ(cfg.tool, "handwrite");
    EXPECT_EQ(cfg.tool_timeout_sec, 120);
    EXPECT_EQ(cfg.max_upload_bytes, 5u * 1024 * 1024);
    EXPECT_EQ(cfg.allowed_extensions, (set<string>{"png", "jpg", "jpeg"}));
    EXPECT_EQ(cfg.stats_db, ":memory:");
}

TEST_F(ConfigTest, JsonOverridesDefaults) {
    ServerConfig cfg;
    apply_config_json(cfg, json{
        {"port", 8080},
        {"output_dir", "/srv/fonts"},
        {"tool_timeout_sec", 30},
        {"max_upload_bytes", 2048},
        {"allowed_extensions", {".PNG", "jpg", ""}},
    });

    EXPECT_EQ(cfg.port, 8080);
    EXPECT_EQ(cfg.output_dir, fs::path("/srv/fonts"));
    EXPECT_EQ(cfg.upload_dir, fs::path("uploads"));
    EXPECT_EQ(cfg.tool_timeout_sec, 30);
    EXPECT_EQ(cfg.max_upload_bytes, 2048u);
    EXPECT_EQ(cfg.allowed_extensions, (set<string>{"png", "jpg"}));
}

TEST_F(ConfigTest, JsonRejectsBadShapes) {
    ServerConfig cfg;
    EXPECT_THROW(apply_config_json(cfg, json::array()), std::runtime_error);
    EXPECT_THROW(apply_config_json(cfg, json{{"allowed_extensions", "png"}}), std::runtime_error);
    EXPECT_THROW(apply_config_json(cfg, json{{"allowed_extensions", {1, 2}}}), std::runtime_error);
    EXPECT_THROW(apply_config_json(cfg, json{{"max_upload_bytes", 0}}), std::runtime_error);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    fs::path file = dir / "handfont.json";
    write_file(file, R"({"port": 7000, "tool": "/opt/handwrite"})");

    ::setenv("HANDFONT_PORT", "9000", 1);
    ::setenv("HANDFONT_TOOL_TIMEOUT", "45", 1);

    ServerConfig cfg = load_config(file.string());
    EXPECT_EQ(cfg.port, 9000);
    EXPECT_EQ(cfg.tool, "/opt/handwrite");
    EXPECT_EQ(cfg.tool_timeout_sec, 45);
}

TEST_F(ConfigTest, ConfigPathFromEnvironment) {
    fs::path file = dir / "handfont.json";
    write_file(file, R"({"host": "127.0.0.1"})");
    ::setenv("HANDFONT_CONFIG", file.c_str(), 1);

    EXPECT_EQ(load_config().host, "127.0.0.1");
}

TEST_F(ConfigTest, BadInputsThrow) {
    EXPECT_THROW(load_config((dir / "missing.json").string()), std::runtime_error);

    fs::path broken = dir / "broken.json";
    write_file(broken, "{ not json");
    EXPECT_THROW(load_config(broken.string()), std::runtime_error);

    ::setenv("HANDFONT_TOOL_TIMEOUT", "soon", 1);
    EXPECT_THROW(load_config(), std::runtime_error);

    ::setenv("HANDFONT_TOOL_TIMEOUT", "0", 1);
    EXPECT_THROW(load_config(), std::runtime_error);

    ::unsetenv("HANDFONT_TOOL_TIMEOUT");
    ::setenv("HANDFONT_PORT", "70000", 1);
    EXPECT_THROW(load_config(), std::runtime_error);
}

TEST_F(ConfigTest, OutOfRangeNumbersAreNotTruncated) {
    // 4294972296 is 2^32 + 5000: narrowed to int it would look like a valid port
    ::setenv("HANDFONT_PORT", "4294972296", 1);
    EXPECT_THROW(load_config(), std::runtime_error);
    ::unsetenv("HANDFONT_PORT");

    ::setenv("HANDFONT_TOOL_TIMEOUT", "4294967416", 1);
    EXPECT_THROW(load_config(), std::runtime_error);
    ::unsetenv("HANDFONT_TOOL_TIMEOUT");

    ::setenv("HANDFONT_PORT", "99999999999999999999999", 1);
    EXPECT_THROW(load_config(), std::runtime_error);
    ::unsetenv("HANDFONT_PORT");

    ServerConfig cfg;
    EXPECT_THROW(apply_config_json(cfg, json{{"port", 4294972296LL}}), std::runtime_error);
    EXPECT_THROW(apply_config_json(cfg, json{{"tool_timeout_sec", -4294967176LL}}), std::runtime_error);
    EXPECT_EQ(cfg.port, 5000);
}

TEST_F(ConfigTest, ValidateRejectsEmptyExtensionSet) {
    ServerConfig cfg;
    cfg.allowed_extensions.clear();
    EXPECT_THROW(validate_config(cfg), std::runtime_error);
}

TEST_F(ConfigTest, PrepareDirectoriesCreatesBoth) {
    ServerConfig cfg;
    cfg.upload_dir = dir / "nested" / "uploads";
    cfg.output_dir = dir / "outputs";

    prepare_directories(cfg);
    EXPECT_TRUE(fs::is_directory(cfg.upload_dir));
    EXPECT_TRUE(fs::is_directory(cfg.output_dir));

    write_file(dir / "blocker", "x");
    cfg.output_dir = dir / "blocker";
    EXPECT_THROW(prepare_directories(cfg), std::runtime_error);
}
