// =============================================================================
// Unit tests for config_loader.hpp
// Tests: defaults, file loading, display entries, error reporting
// =============================================================================
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include "config_loader.hpp"

using namespace smartscreen;
using namespace smartscreen::config;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
static void writeTmpJson(const char* path, const char* content) {
    std::ofstream f(path);
    f << content;
}

static Result<AppConfig> parseText(const char* text) {
    return parseConfig(nlohmann::json::parse(text));
}

// ---------------------------------------------------------------------------
// C-1: defaults
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, DefaultValues) {
    AppConfig cfg;
    EXPECT_EQ(cfg.usb.open_attempts,            5);
    EXPECT_EQ(cfg.usb.open_retry_delay_ms,      200);
    EXPECT_EQ(cfg.usb.read_timeout_ms,          2000);
    EXPECT_EQ(cfg.orchestrator.open_delay_ms,   500);
    EXPECT_EQ(cfg.log.level,                    "warn");
    EXPECT_TRUE(cfg.log.log_path.empty());
    EXPECT_TRUE(cfg.displays.empty());
}

TEST(ConfigLoaderTest, SessionOptionsFromUsbSection) {
    AppConfig cfg;
    cfg.usb.open_attempts = 3;
    cfg.usb.open_retry_delay_ms = 50;
    cfg.usb.read_timeout_ms = 900;
    SessionOptions opts = cfg.session_options();
    EXPECT_EQ(opts.open_retry.max_attempts, 3);
    EXPECT_EQ(opts.open_retry.delay.count(), 50);
    EXPECT_EQ(opts.read_timeout_ms, 900u);
}

// ---------------------------------------------------------------------------
// C-2: missing file
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, MissingOptionalFileReturnsDefaults) {
    auto cfg = loadConfig("__nonexistent_smartscreen_xyz.json", false);
    ASSERT_TRUE(cfg.is_ok());
    EXPECT_EQ(cfg.value().usb.open_attempts, 5);
}

TEST(ConfigLoaderTest, MissingRequiredFileIsConfigError) {
    auto cfg = loadConfig("__nonexistent_smartscreen_xyz.json", true);
    ASSERT_TRUE(cfg.is_err());
    EXPECT_EQ(cfg.error().kind, ErrorKind::Config);
}

// ---------------------------------------------------------------------------
// C-3: file loading
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, LoadsFullFile) {
    const char* path = "__test_smartscreen_full.json";
    writeTmpJson(path, R"({
        "usb": { "open_attempts": 7, "open_retry_delay_ms": 100 },
        "orchestrator": { "open_delay_ms": 250 },
        "log": { "level": "debug", "log_path": "panel.log" },
        "displays": [
            { "device": 0, "mode": "image", "brightness": 80, "image": "panel0.png" },
            { "device": "A1B2", "mode": "video", "video": "clip.h264", "rotation": 2 },
            { "device": "1" }
        ]
    })");

    auto cfg = loadConfig(path, true);
    std::remove(path);
    ASSERT_TRUE(cfg.is_ok()) << cfg.error().describe();

    const AppConfig& c = cfg.value();
    EXPECT_EQ(c.usb.open_attempts, 7);
    EXPECT_EQ(c.usb.open_retry_delay_ms, 100);
    EXPECT_EQ(c.usb.read_timeout_ms, 2000);          // default kept
    EXPECT_EQ(c.orchestrator.open_delay_ms, 250);
    EXPECT_EQ(c.orchestrator.sync_delay_ms, 200);
    EXPECT_EQ(c.log.level, "debug");
    EXPECT_EQ(c.log.log_path, "panel.log");

    ASSERT_EQ(c.displays.size(), 3u);
    EXPECT_EQ(c.displays[0].device, "0");
    EXPECT_TRUE(std::holds_alternative<ImageMode>(c.displays[0].mode));
    EXPECT_EQ(c.displays[0].settings.brightness, 80);
    EXPECT_EQ(c.displays[0].image, "panel0.png");

    EXPECT_EQ(c.displays[1].device, "A1B2");
    EXPECT_TRUE(std::holds_alternative<VideoMode>(c.displays[1].mode));
    EXPECT_EQ(c.displays[1].settings.rotation, 2);
    EXPECT_EQ(c.displays[1].video, "clip.h264");

    EXPECT_TRUE(std::holds_alternative<StatsMode>(c.displays[2].mode));
    EXPECT_EQ(c.displays[2].settings.brightness, 102);
}

TEST(ConfigLoaderTest, MalformedJsonIsConfigError) {
    const char* path = "__test_smartscreen_bad.json";
    writeTmpJson(path, R"({"usb": { "open_attempts": 3, })");
    auto cfg = loadConfig(path, true);
    std::remove(path);
    ASSERT_TRUE(cfg.is_err());
    EXPECT_EQ(cfg.error().kind, ErrorKind::Config);
}

// ---------------------------------------------------------------------------
// C-4: validation
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, UnknownModeRejected) {
    auto cfg = parseText(R"({"displays": [ { "device": "0", "mode": "slideshow" } ]})");
    ASSERT_TRUE(cfg.is_err());
    EXPECT_EQ(cfg.error().kind, ErrorKind::Config);
    EXPECT_NE(cfg.error().message.find("displays[0]"), std::string::npos);
}

TEST(ConfigLoaderTest, OutOfRangeBrightnessRejected) {
    auto cfg = parseText(R"({"displays": [ { "device": "0", "brightness": 150 } ]})");
    ASSERT_TRUE(cfg.is_err());
    EXPECT_EQ(cfg.error().kind, ErrorKind::Config);
}

TEST(ConfigLoaderTest, BadRotationRejected) {
    auto cfg = parseText(R"({"displays": [ { "device": "0", "rotation": 1 } ]})");
    ASSERT_TRUE(cfg.is_err());
    EXPECT_EQ(cfg.error().kind, ErrorKind::Config);
}

TEST(ConfigLoaderTest, WrongValueTypeRejected) {
    auto cfg = parseText(R"({"usb": { "open_attempts": "many" }})");
    ASSERT_TRUE(cfg.is_err());
    EXPECT_EQ(cfg.error().kind, ErrorKind::Config);
    EXPECT_NE(cfg.error().message.find("usb.open_attempts"), std::string::npos);
}

TEST(ConfigLoaderTest, ZeroOpenAttemptsRejected) {
    auto cfg = parseText(R"({"usb": { "open_attempts": 0 }})");
    ASSERT_TRUE(cfg.is_err());
}

TEST(ConfigLoaderTest, VideoAssetNeedsVideoMode) {
    auto cfg = parseText(R"({"displays": [ { "device": "0", "mode": "image", "video": "a.h264" } ]})");
    ASSERT_TRUE(cfg.is_err());
    EXPECT_EQ(cfg.error().kind, ErrorKind::Config);
}

TEST(ConfigLoaderTest, DisplaysMustBeArray) {
    auto cfg = parseText(R"({"displays": { "device": "0" }})");
    ASSERT_TRUE(cfg.is_err());
}
