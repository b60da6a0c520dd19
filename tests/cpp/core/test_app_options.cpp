#include "core/app_options.h"
#include "core/config_loader.h"

#include <functional>
#include <gtest/gtest.h>
#include <string>
#include <unordered_map>
#include <vector>

using namespace live_asr;

namespace {

std::vector<char*> makeArgv(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    return argv;
}

using EnvMap = std::unordered_map<std::string, std::string>;

std::function<const char*(const char*)> makeGetEnv(const EnvMap& env) {
    return [&env](const char* name) -> const char* {
        auto it = env.find(name ? std::string{name} : std::string{});
        if (it == env.end()) {
            return nullptr;
        }
        return it->second.c_str();
    };
}

ParseOptionsResult parse(const std::vector<std::string>& args, const EnvMap& env = {}) {
    auto argv = makeArgv(args);
    return parseOptions(static_cast<int>(argv.size()), argv.data(), "live_asr_bridge",
                        makeGetEnv(env));
}

}  // namespace

TEST(ParseOptions, ReturnsDefaultsWhenNoArgs) {
    auto parsed = parse({"live_asr_bridge"});

    ASSERT_FALSE(parsed.hasError);
    ASSERT_TRUE(parsed.options.has_value());
    EXPECT_EQ(parsed.options->configPath, "config.json");
    EXPECT_FALSE(parsed.options->configPathGiven);
    EXPECT_FALSE(parsed.options->device.has_value());
    EXPECT_FALSE(parsed.options->mode.has_value());
    EXPECT_FALSE(parsed.options->token.has_value());
    EXPECT_FALSE(parsed.options->listDevices);
}

TEST(ParseOptions, ParsesProvidedArguments) {
    auto parsed = parse({"live_asr_bridge", "-c", "/etc/live_asr.json", "-d", "hw:2,0", "-m",
                         "quality", "-r", "48000", "--channels", "2", "--chunk-seconds", "0.5",
                         "--queue", "16", "--control", "tcp://host:1", "--audio", "tcp://host:2",
                         "--results", "tcp://host:3", "--log-level", "debug"});

    ASSERT_FALSE(parsed.hasError) << parsed.errorMessage;
    ASSERT_TRUE(parsed.options.has_value());
    const auto& opt = *parsed.options;
    EXPECT_EQ(opt.configPath, "/etc/live_asr.json");
    EXPECT_TRUE(opt.configPathGiven);
    EXPECT_EQ(opt.device, "hw:2,0");
    EXPECT_EQ(opt.mode, "quality");
    EXPECT_EQ(opt.sampleRate, 48000u);
    EXPECT_EQ(opt.channels, 2u);
    ASSERT_TRUE(opt.chunkDurationSeconds.has_value());
    EXPECT_DOUBLE_EQ(*opt.chunkDurationSeconds, 0.5);
    EXPECT_EQ(opt.queueCapacity, 16u);
    EXPECT_EQ(opt.controlEndpoint, "tcp://host:1");
    EXPECT_EQ(opt.audioEndpoint, "tcp://host:2");
    EXPECT_EQ(opt.resultEndpoint, "tcp://host:3");
    EXPECT_EQ(opt.logLevel, "debug");
}

TEST(ParseOptions, ListDevicesFlag) {
    auto parsed = parse({"live_asr_bridge", "--list-devices"});
    ASSERT_TRUE(parsed.options.has_value());
    EXPECT_TRUE(parsed.options->listDevices);
}

TEST(ParseOptions, HelpAndVersion) {
    auto help = parse({"live_asr_bridge", "--help"});
    EXPECT_TRUE(help.showHelp);
    EXPECT_FALSE(help.options.has_value());

    auto version = parse({"live_asr_bridge", "-V"});
    EXPECT_TRUE(version.showVersion);
}

TEST(ParseOptions, RejectsUnknownMode) {
    auto parsed = parse({"live_asr_bridge", "--mode", "turbo"});
    EXPECT_TRUE(parsed.hasError);
    EXPECT_NE(parsed.errorMessage.find("turbo"), std::string::npos);
}

TEST(ParseOptions, RejectsInvalidNumbers) {
    EXPECT_TRUE(parse({"live_asr_bridge", "--rate", "abc"}).hasError);
    EXPECT_TRUE(parse({"live_asr_bridge", "--rate", "0"}).hasError);
    EXPECT_TRUE(parse({"live_asr_bridge", "--channels", "-2"}).hasError);
    EXPECT_TRUE(parse({"live_asr_bridge", "--chunk-seconds", "0"}).hasError);
    EXPECT_TRUE(parse({"live_asr_bridge", "--queue", "many"}).hasError);
}

TEST(ParseOptions, RejectsUnknownArgument) {
    auto parsed = parse({"live_asr_bridge", "--bogus"});
    EXPECT_TRUE(parsed.hasError);
    EXPECT_EQ(parsed.errorMessage, "Unknown argument: --bogus");
}

TEST(ParseOptions, RejectsInvalidLogLevel) {
    EXPECT_TRUE(parse({"live_asr_bridge", "--log-level", "chatty"}).hasError);
}

TEST(ParseOptions, FlagWithoutValueIsRejected) {
    EXPECT_TRUE(parse({"live_asr_bridge", "--device"}).hasError);
}

TEST(ParseOptions, UsesEnvironmentOverrides) {
    EnvMap env{{"LIVE_ASR_CONFIG", "/tmp/env.json"},
               {"LIVE_ASR_DEVICE", "hw:1,0"},
               {"LIVE_ASR_TOKEN", "secret-token"},
               {"LIVE_ASR_MODE", "quality_v2"},
               {"LIVE_ASR_LOG_LEVEL", "warn"},
               {"LIVE_ASR_CONTROL_ENDPOINT", "ipc:///tmp/ctl"}};
    auto parsed = parse({"live_asr_bridge"}, env);

    ASSERT_FALSE(parsed.hasError) << parsed.errorMessage;
    ASSERT_TRUE(parsed.options.has_value());
    EXPECT_EQ(parsed.options->configPath, "/tmp/env.json");
    EXPECT_TRUE(parsed.options->configPathGiven);
    EXPECT_EQ(parsed.options->device, "hw:1,0");
    EXPECT_EQ(parsed.options->token, "secret-token");
    EXPECT_EQ(parsed.options->mode, "quality_v2");
    EXPECT_EQ(parsed.options->logLevel, "warn");
    EXPECT_EQ(parsed.options->controlEndpoint, "ipc:///tmp/ctl");
}

TEST(ParseOptions, FlagsWinOverEnvironment) {
    EnvMap env{{"LIVE_ASR_DEVICE", "hw:1,0"}, {"LIVE_ASR_MODE", "speed"}};
    auto parsed = parse({"live_asr_bridge", "-d", "hw:3,0", "-m", "quality"}, env);

    ASSERT_TRUE(parsed.options.has_value());
    EXPECT_EQ(parsed.options->device, "hw:3,0");
    EXPECT_EQ(parsed.options->mode, "quality");
}

TEST(ParseOptions, InvalidEnvironmentModeNamesVariable) {
    EnvMap env{{"LIVE_ASR_MODE", "fastest"}};
    auto parsed = parse({"live_asr_bridge"}, env);

    EXPECT_TRUE(parsed.hasError);
    EXPECT_EQ(parsed.errorMessage.rfind("LIVE_ASR_MODE: ", 0), 0u);
}

TEST(ApplyOptions, OverlaysOnlySetFields) {
    AppConfig config;
    config.session.controlEndpoint = "tcp://file:1";

    AppOptions options;
    options.device = "hw:4,0";
    options.sampleRate = 48000u;
    options.token = "tok";
    options.logLevel = "error";
    applyOptions(options, config);

    EXPECT_EQ(config.audio.device, "hw:4,0");
    EXPECT_EQ(config.audio.sampleRate, 48000u);
    EXPECT_EQ(config.session.token, "tok");
    EXPECT_EQ(config.logging.level, logging::LogLevel::Error);
    // Untouched
    EXPECT_EQ(config.session.controlEndpoint, "tcp://file:1");
    EXPECT_EQ(config.audio.channels, 1u);
    EXPECT_EQ(config.session.mode, "speed");
}
