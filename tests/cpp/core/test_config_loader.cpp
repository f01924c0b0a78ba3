/**
 * @file test_config_loader.cpp
 * @brief Unit tests for the relay JSON configuration loader
 */

#include "core/config_loader.h"

#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <unistd.h>

using namespace middle_server;
namespace fs = std::filesystem;

class ConfigLoaderTest : public ::testing::Test {
   protected:
    fs::path tempDir;
    fs::path testConfigPath;

    void SetUp() override {
        // Unique temp directory per test so parallel ctest runs do not collide.
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "unknown_test";
        if (info) {
            name = std::string(info->test_suite_name()) + "_" + std::string(info->name());
        }
        for (char& c : name) {
            if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-')) {
                c = '_';
            }
        }
        tempDir = fs::temp_directory_path() /
                  ("middle_server_test_" + name + "_" + std::to_string(getpid()));
        fs::create_directories(tempDir);
        testConfigPath = tempDir / "test_config.json";
    }

    void TearDown() override {
        fs::remove_all(tempDir);
    }

    void writeConfig(const std::string& content) {
        std::ofstream file(testConfigPath);
        file << content;
        file.close();
    }
};

// ============================================================
// loadAppConfig tests
// ============================================================

TEST_F(ConfigLoaderTest, LoadNonExistentFileReportsNotFoundAndKeepsDefaults) {
    AppConfig config;
    config.delay.threshold = 99;
    auto result = loadAppConfig("/nonexistent/path/config.json", config, false);
    EXPECT_EQ(result.code, ErrorCode::CONFIG_FILE_NOT_FOUND);

    EXPECT_EQ(config.delay.threshold, 10);
    EXPECT_EQ(config.delay.compensationMs, 0);
    EXPECT_EQ(config.relay.chunkFrames, 4800u);
    EXPECT_FALSE(config.relay.realtimePacing);
    EXPECT_EQ(config.audio.channels, 2);
    EXPECT_EQ(config.audio.sampleRate, 48000u);
    EXPECT_EQ(config.audio.pcmFormat, "s16le");
}

TEST_F(ConfigLoaderTest, LoadEmptyJsonSucceeds) {
    writeConfig("{}");
    AppConfig config;
    EXPECT_TRUE(loadAppConfig(testConfigPath, config, false).ok());
    EXPECT_EQ(config.delay.threshold, 10);
}

TEST_F(ConfigLoaderTest, LoadsAllSections) {
    writeConfig(R"({
        "delay": {"threshold": 25, "compensationMs": 120},
        "audio": {"channels": 1, "sampleRate": 44100, "bitsPerSample": 32, "pcmFormat": "f32le"},
        "relay": {"chunkFrames": 1024, "realtimePacing": true, "statusIntervalMs": 2000},
        "logging": {"level": "debug", "consoleTarget": "stdout", "filePath": "/tmp/relay.log"}
    })");

    AppConfig config;
    auto result = loadAppConfig(testConfigPath, config, false);
    ASSERT_TRUE(result.ok()) << result.reason;

    EXPECT_EQ(config.delay.threshold, 25);
    EXPECT_EQ(config.delay.compensationMs, 120);
    EXPECT_EQ(config.audio.channels, 1);
    EXPECT_EQ(config.audio.sampleRate, 44100u);
    EXPECT_EQ(config.audio.bitsPerSample, 32);
    EXPECT_EQ(config.audio.pcmFormat, "f32le");
    EXPECT_EQ(config.relay.chunkFrames, 1024u);
    EXPECT_TRUE(config.relay.realtimePacing);
    EXPECT_EQ(config.relay.statusIntervalMs, 2000);
    EXPECT_EQ(config.logging.level, logging::LogLevel::Debug);
    EXPECT_EQ(config.logging.consoleTarget, logging::ConsoleTarget::Stdout);
    EXPECT_EQ(config.logging.filePath, "/tmp/relay.log");
}

TEST_F(ConfigLoaderTest, NegativeThresholdIsLoadedForValidationToReject) {
    writeConfig(R"({"delay": {"threshold": -4}})");
    AppConfig config;
    ASSERT_TRUE(loadAppConfig(testConfigPath, config, false).ok());
    EXPECT_EQ(config.delay.threshold, -4);

    auto validation = validateAppConfig(config);
    EXPECT_FALSE(validation.ok());
    EXPECT_EQ(validation.code, ErrorCode::CONFIG_INVALID_DELAY_THRESHOLD);
}

TEST_F(ConfigLoaderTest, StringThresholdIsRejected) {
    writeConfig(R"({"delay": {"threshold": "abc"}})");
    AppConfig config;
    auto result = loadAppConfig(testConfigPath, config, false);
    EXPECT_EQ(result.code, ErrorCode::CONFIG_INVALID_DELAY_THRESHOLD);
    EXPECT_NE(result.reason.find("abc"), std::string::npos);
}

TEST_F(ConfigLoaderTest, FractionalThresholdIsRejected) {
    writeConfig(R"({"delay": {"threshold": 3.9}})");
    AppConfig config;
    auto result = loadAppConfig(testConfigPath, config, false);
    EXPECT_EQ(result.code, ErrorCode::CONFIG_INVALID_DELAY_THRESHOLD);
    EXPECT_EQ(config.delay.threshold, 10);
}

TEST_F(ConfigLoaderTest, NonIntegerCompensationIsRejected) {
    writeConfig(R"({"delay": {"threshold": 2, "compensationMs": 1.5}})");
    AppConfig config;
    EXPECT_EQ(loadAppConfig(testConfigPath, config, false).code, ErrorCode::CONFIG_INVALID_VALUE);
}

TEST_F(ConfigLoaderTest, NegativeChunkFramesIsRejected) {
    writeConfig(R"({"relay": {"chunkFrames": -1}})");
    AppConfig config;
    auto result = loadAppConfig(testConfigPath, config, false);
    EXPECT_EQ(result.code, ErrorCode::CONFIG_INVALID_VALUE);
    EXPECT_EQ(config.relay.chunkFrames, 4800u);
}

TEST_F(ConfigLoaderTest, StringChunkFramesIsRejected) {
    writeConfig(R"({"relay": {"chunkFrames": "4800"}})");
    AppConfig config;
    EXPECT_EQ(loadAppConfig(testConfigPath, config, false).code, ErrorCode::CONFIG_INVALID_VALUE);
}

TEST_F(ConfigLoaderTest, InvalidLoggingSectionFallsBackToDefaults) {
    writeConfig(R"({
        "logging": {"consoleOutput": "sometimes"},
        "relay": {"chunkFrames": 256}
    })");
    AppConfig config;
    ASSERT_TRUE(loadAppConfig(testConfigPath, config, false).ok());
    EXPECT_TRUE(config.logging.consoleOutput);
    EXPECT_EQ(config.relay.chunkFrames, 256u);
}

TEST_F(ConfigLoaderTest, MalformedJsonReportsParseFailure) {
    writeConfig(R"({"delay": {"threshold": 1})");
    AppConfig config;
    auto result = loadAppConfig(testConfigPath, config, false);
    EXPECT_EQ(result.code, ErrorCode::CONFIG_PARSE_FAILED);
    EXPECT_FALSE(result.reason.empty());
    EXPECT_EQ(config.delay.threshold, 10);
}

TEST_F(ConfigLoaderTest, NonObjectTopLevelReportsParseFailure) {
    writeConfig("[1, 2, 3]");
    AppConfig config;
    EXPECT_EQ(loadAppConfig(testConfigPath, config, false).code, ErrorCode::CONFIG_PARSE_FAILED);
}

// ============================================================
// validateAppConfig tests
// ============================================================

TEST(ConfigValidation, DefaultsAreValid) {
    AppConfig config;
    EXPECT_TRUE(validateAppConfig(config).ok());
}

TEST(ConfigValidation, ZeroThresholdIsValid) {
    AppConfig config;
    config.delay.threshold = 0;
    EXPECT_TRUE(validateAppConfig(config).ok());
}

TEST(ConfigValidation, RejectsZeroChunkFrames) {
    AppConfig config;
    config.relay.chunkFrames = 0;
    EXPECT_EQ(validateAppConfig(config).code, ErrorCode::CONFIG_INVALID_VALUE);
}

TEST(ConfigValidation, RejectsOversizedChunkFrames) {
    AppConfig config;
    config.relay.chunkFrames = MAX_CHUNK_FRAMES;
    EXPECT_TRUE(validateAppConfig(config).ok());

    config.relay.chunkFrames = MAX_CHUNK_FRAMES + 1;
    EXPECT_EQ(validateAppConfig(config).code, ErrorCode::CONFIG_INVALID_VALUE);

    config.relay.chunkFrames = SIZE_MAX;
    EXPECT_EQ(validateAppConfig(config).code, ErrorCode::CONFIG_INVALID_VALUE);
}

TEST(ConfigValidation, RejectsNegativeCompensation) {
    AppConfig config;
    config.delay.compensationMs = -1;
    EXPECT_EQ(validateAppConfig(config).code, ErrorCode::CONFIG_INVALID_VALUE);
}

TEST(ConfigValidation, RejectsMismatchedAudioFormat) {
    AppConfig config;
    config.audio.pcmFormat = "f32le";
    config.audio.bitsPerSample = 16;
    auto validation = validateAppConfig(config);
    EXPECT_EQ(validation.code, ErrorCode::RELAY_INVALID_AUDIO_INFO);
    EXPECT_FALSE(validation.reason.empty());
}
