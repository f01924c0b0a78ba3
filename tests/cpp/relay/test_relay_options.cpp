#include "relay/relay_options.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <unistd.h>
#include <string>
#include <vector>

using namespace middle_server;
using namespace middle_server::relay;
namespace fs = std::filesystem;

namespace {

const char *kEnvNames[] = {
    "DELAY_THRESHOLD",
    "MIDDLE_SERVER_CONFIG",
    "MIDDLE_SERVER_DELAY_COMPENSATION_MS",
    "MIDDLE_SERVER_CHUNK_FRAMES",
    "MIDDLE_SERVER_CHANNELS",
    "MIDDLE_SERVER_SAMPLE_RATE",
    "MIDDLE_SERVER_BITS_PER_SAMPLE",
    "MIDDLE_SERVER_PCM_FORMAT",
    "MIDDLE_SERVER_REALTIME",
    "MIDDLE_SERVER_STATUS_INTERVAL_MS",
    "MIDDLE_SERVER_LOG_LEVEL",
    "MIDDLE_SERVER_LOG_FILE",
    "MIDDLE_SERVER_INPUT",
    "MIDDLE_SERVER_OUTPUT",
};

class Argv {
   public:
    explicit Argv(std::vector<std::string> args) : storage_(std::move(args)) {
        for (auto &arg : storage_) {
            pointers_.push_back(arg.data());
        }
        pointers_.push_back(nullptr);
    }

    int argc() const {
        return static_cast<int>(storage_.size());
    }
    char **argv() {
        return pointers_.data();
    }

   private:
    std::vector<std::string> storage_;
    std::vector<char *> pointers_;
};

}  // namespace

class RelayOptionsTest : public ::testing::Test {
   protected:
    void SetUp() override {
        clearEnv();
    }
    void TearDown() override {
        clearEnv();
    }

    static void clearEnv() {
        for (const char *name : kEnvNames) {
            unsetenv(name);
        }
    }
};

TEST_F(RelayOptionsTest, DefaultsWithoutEnvironment) {
    auto options = makeDefaultOptions();
    std::string error;
    ASSERT_TRUE(applyEnvOverrides(options, error)) << error;

    EXPECT_EQ(options.configPath, DEFAULT_CONFIG_FILE);
    EXPECT_EQ(options.inputPath, "-");
    EXPECT_EQ(options.outputPath, "-");
    EXPECT_EQ(options.config.delay.threshold, 10);
}

TEST_F(RelayOptionsTest, DelayThresholdFromEnvironment) {
    setenv("DELAY_THRESHOLD", "3", 1);
    auto options = makeDefaultOptions();
    std::string error;
    ASSERT_TRUE(applyEnvOverrides(options, error)) << error;
    EXPECT_EQ(options.config.delay.threshold, 3);
}

TEST_F(RelayOptionsTest, DelayThresholdZeroIsAccepted) {
    setenv("DELAY_THRESHOLD", "0", 1);
    auto options = makeDefaultOptions();
    std::string error;
    ASSERT_TRUE(applyEnvOverrides(options, error)) << error;
    EXPECT_EQ(options.config.delay.threshold, 0);
}

TEST_F(RelayOptionsTest, NegativeDelayThresholdIsConfigurationError) {
    setenv("DELAY_THRESHOLD", "-1", 1);
    auto options = makeDefaultOptions();
    std::string error;
    EXPECT_FALSE(applyEnvOverrides(options, error));
    EXPECT_NE(error.find("DELAY_THRESHOLD must be >= 0"), std::string::npos);
    EXPECT_EQ(options.config.delay.threshold, 10);
}

TEST_F(RelayOptionsTest, NonNumericDelayThresholdIsRejected) {
    setenv("DELAY_THRESHOLD", "ten", 1);
    auto options = makeDefaultOptions();
    std::string error;
    EXPECT_FALSE(applyEnvOverrides(options, error));
    EXPECT_NE(error.find("not an integer"), std::string::npos);
}

TEST_F(RelayOptionsTest, EnvironmentOverridesRelaySettings) {
    setenv("MIDDLE_SERVER_CHUNK_FRAMES", "960", 1);
    setenv("MIDDLE_SERVER_SAMPLE_RATE", "96000", 1);
    setenv("MIDDLE_SERVER_PCM_FORMAT", "f32le", 1);
    setenv("MIDDLE_SERVER_BITS_PER_SAMPLE", "32", 1);
    setenv("MIDDLE_SERVER_REALTIME", "yes", 1);
    setenv("MIDDLE_SERVER_LOG_LEVEL", "debug", 1);
    setenv("MIDDLE_SERVER_OUTPUT", "null", 1);

    auto options = makeDefaultOptions();
    std::string error;
    ASSERT_TRUE(applyEnvOverrides(options, error)) << error;
    EXPECT_EQ(options.config.relay.chunkFrames, 960u);
    EXPECT_EQ(options.config.audio.sampleRate, 96000u);
    EXPECT_EQ(options.config.audio.pcmFormat, "f32le");
    EXPECT_EQ(options.config.audio.bitsPerSample, 32);
    EXPECT_TRUE(options.config.relay.realtimePacing);
    EXPECT_EQ(options.config.logging.level, logging::LogLevel::Debug);
    EXPECT_EQ(options.outputPath, "null");
}

TEST_F(RelayOptionsTest, InvalidEnvironmentValueNamesVariable) {
    setenv("MIDDLE_SERVER_CHANNELS", "70000", 1);
    auto options = makeDefaultOptions();
    std::string error;
    EXPECT_FALSE(applyEnvOverrides(options, error));
    EXPECT_NE(error.find("MIDDLE_SERVER_CHANNELS"), std::string::npos);
}

TEST_F(RelayOptionsTest, InvalidRealtimeFlagIsRejected) {
    setenv("MIDDLE_SERVER_REALTIME", "maybe", 1);
    auto options = makeDefaultOptions();
    std::string error;
    EXPECT_FALSE(applyEnvOverrides(options, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(RelayOptionsTest, ParsesCommandLine) {
    Argv args({"middle_server_relay", "-i", "in.pcm", "-o", "out.pcm", "-t", "4",
               "--delay-compensation-ms", "250", "--chunk-frames", "480", "--channels", "1",
               "--realtime", "--status-interval-ms", "1000", "-l", "warn"});
    auto options = makeDefaultOptions();
    bool showHelp = false;
    std::string error;
    ASSERT_TRUE(parseArgs(args.argc(), args.argv(), options, showHelp, error)) << error;

    EXPECT_FALSE(showHelp);
    EXPECT_EQ(options.inputPath, "in.pcm");
    EXPECT_EQ(options.outputPath, "out.pcm");
    EXPECT_EQ(options.config.delay.threshold, 4);
    EXPECT_EQ(options.config.delay.compensationMs, 250);
    EXPECT_EQ(options.config.relay.chunkFrames, 480u);
    EXPECT_EQ(options.config.audio.channels, 1);
    EXPECT_TRUE(options.config.relay.realtimePacing);
    EXPECT_EQ(options.config.relay.statusIntervalMs, 1000);
    EXPECT_EQ(options.config.logging.level, logging::LogLevel::Warn);
}

TEST_F(RelayOptionsTest, CommandLineWinsOverEnvironment) {
    setenv("DELAY_THRESHOLD", "8", 1);
    auto options = makeDefaultOptions();
    std::string error;
    ASSERT_TRUE(applyEnvOverrides(options, error)) << error;

    Argv args({"middle_server_relay", "--delay-threshold", "2", "--no-realtime"});
    bool showHelp = false;
    ASSERT_TRUE(parseArgs(args.argc(), args.argv(), options, showHelp, error)) << error;
    EXPECT_EQ(options.config.delay.threshold, 2);
    EXPECT_FALSE(options.config.relay.realtimePacing);
}

TEST_F(RelayOptionsTest, NegativeThresholdArgumentIsRejected) {
    Argv args({"middle_server_relay", "-t", "-5"});
    auto options = makeDefaultOptions();
    bool showHelp = false;
    std::string error;
    EXPECT_FALSE(parseArgs(args.argc(), args.argv(), options, showHelp, error));
    EXPECT_FALSE(showHelp);
    EXPECT_NE(error.find("must be >= 0"), std::string::npos);
}

TEST_F(RelayOptionsTest, InvalidNumericArgument) {
    Argv args({"middle_server_relay", "--chunk-frames", "lots"});
    auto options = makeDefaultOptions();
    bool showHelp = false;
    std::string error;
    EXPECT_FALSE(parseArgs(args.argc(), args.argv(), options, showHelp, error));
    EXPECT_EQ(error, "invalid value for --chunk-frames: lots");
}

TEST_F(RelayOptionsTest, UnknownArgument) {
    Argv args({"middle_server_relay", "--bogus"});
    auto options = makeDefaultOptions();
    bool showHelp = false;
    std::string error;
    EXPECT_FALSE(parseArgs(args.argc(), args.argv(), options, showHelp, error));
    EXPECT_FALSE(showHelp);
    EXPECT_EQ(error, "unknown argument: --bogus");
}

TEST_F(RelayOptionsTest, TrailingFlagWithoutValue) {
    Argv args({"middle_server_relay", "-t"});
    auto options = makeDefaultOptions();
    bool showHelp = false;
    std::string error;
    EXPECT_FALSE(parseArgs(args.argc(), args.argv(), options, showHelp, error));
    EXPECT_FALSE(showHelp);
    EXPECT_EQ(error, "missing value for -t");

    Argv config({"middle_server_relay", "-i", "in.pcm", "--chunk-frames"});
    error.clear();
    EXPECT_FALSE(parseArgs(config.argc(), config.argv(), options, showHelp, error));
    EXPECT_EQ(error, "missing value for --chunk-frames");
}

TEST_F(RelayOptionsTest, HelpFlag) {
    Argv args({"middle_server_relay", "--help"});
    auto options = makeDefaultOptions();
    bool showHelp = false;
    std::string error;
    EXPECT_FALSE(parseArgs(args.argc(), args.argv(), options, showHelp, error));
    EXPECT_TRUE(showHelp);
    EXPECT_TRUE(error.empty());
}

TEST_F(RelayOptionsTest, ResolveConfigPath) {
    Argv plain({"middle_server_relay"});
    EXPECT_EQ(resolveConfigPath(plain.argc(), plain.argv()), DEFAULT_CONFIG_FILE);

    setenv("MIDDLE_SERVER_CONFIG", "/etc/middle_server.json", 1);
    EXPECT_EQ(resolveConfigPath(plain.argc(), plain.argv()), "/etc/middle_server.json");

    Argv explicitPath({"middle_server_relay", "--config", "local.json"});
    EXPECT_EQ(resolveConfigPath(explicitPath.argc(), explicitPath.argv()), "local.json");
}

// ============================================================
// loadConfigFile
// ============================================================

class RelayConfigFileTest : public RelayOptionsTest {
   protected:
    fs::path tempDir;

    void SetUp() override {
        RelayOptionsTest::SetUp();
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        tempDir = fs::temp_directory_path() /
                  ("middle_server_options_" + std::string(info->name()) + "_" +
                   std::to_string(getpid()));
        fs::create_directories(tempDir);
    }

    void TearDown() override {
        fs::remove_all(tempDir);
        RelayOptionsTest::TearDown();
    }

    std::string writeConfig(const std::string &content) {
        const auto path = tempDir / "relay.json";
        std::ofstream file(path);
        file << content;
        return path.string();
    }
};

TEST_F(RelayConfigFileTest, MissingDefaultConfigUsesDefaults) {
    auto options = makeDefaultOptions();
    ASSERT_EQ(options.configPath, DEFAULT_CONFIG_FILE);
    const auto cwd = fs::current_path();
    fs::current_path(tempDir);
    auto result = loadConfigFile(options);
    fs::current_path(cwd);

    EXPECT_TRUE(result.ok()) << result.reason;
    EXPECT_EQ(options.config.delay.threshold, 10);
}

TEST_F(RelayConfigFileTest, MissingExplicitConfigIsError) {
    auto options = makeDefaultOptions();
    options.configPath = (tempDir / "absent.json").string();
    EXPECT_EQ(loadConfigFile(options).code, ErrorCode::CONFIG_FILE_NOT_FOUND);
}

TEST_F(RelayConfigFileTest, MalformedConfigIsError) {
    auto options = makeDefaultOptions();
    options.configPath = writeConfig(R"({"delay": {"threshold": 1})");
    EXPECT_EQ(loadConfigFile(options).code, ErrorCode::CONFIG_PARSE_FAILED);
}

TEST_F(RelayConfigFileTest, NonIntegerThresholdIsError) {
    auto options = makeDefaultOptions();
    options.configPath = writeConfig(R"({"delay": {"threshold": "abc"}})");
    EXPECT_EQ(loadConfigFile(options).code, ErrorCode::CONFIG_INVALID_DELAY_THRESHOLD);
}

TEST_F(RelayConfigFileTest, LoadsExplicitConfig) {
    auto options = makeDefaultOptions();
    options.configPath = writeConfig(R"({"delay": {"threshold": 7}})");
    auto result = loadConfigFile(options);
    ASSERT_TRUE(result.ok()) << result.reason;
    EXPECT_EQ(options.config.delay.threshold, 7);
}
