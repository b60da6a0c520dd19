#include "logging/logger.h"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>
#include <unistd.h>

using namespace live_asr::logging;
namespace fs = std::filesystem;

TEST(Logging, ParsesLevelNames) {
    EXPECT_EQ(stringToLevel("info"), LogLevel::Info);
    EXPECT_EQ(stringToLevel("INFO"), LogLevel::Info);
    EXPECT_EQ(stringToLevel("warn"), LogLevel::Warn);
    EXPECT_EQ(stringToLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(stringToLevel("ERROR"), LogLevel::Error);
    EXPECT_EQ(stringToLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(stringToLevel("Fatal"), LogLevel::Critical);
    EXPECT_EQ(stringToLevel("off"), LogLevel::Off);
    EXPECT_EQ(stringToLevel("unknown"), LogLevel::Info);
}

TEST(Logging, ValidLevelNames) {
    EXPECT_TRUE(isValidLevelName("Debug"));
    EXPECT_TRUE(isValidLevelName("none"));
    EXPECT_FALSE(isValidLevelName("chatty"));
    EXPECT_FALSE(isValidLevelName(""));
}

TEST(Logging, HonorsConfiguredLevel) {
    LogConfig config;
    config.coloredOutput = false;
    config.level = LogLevel::Warn;
    ASSERT_TRUE(initialize(config));

    ASSERT_NE(getLogger(), nullptr);
    EXPECT_TRUE(getLogger()->should_log(spdlog::level::err));
    EXPECT_FALSE(getLogger()->should_log(spdlog::level::info));
    shutdown();
}

TEST(Logging, GetLoggerInitializesOnDemand) {
    shutdown();
    EXPECT_NE(getLogger(), nullptr);
    LOG_INFO("logger available after shutdown: {}", true);
    shutdown();
}

TEST(Logging, FileSinkReceivesMessages) {
    const fs::path logPath =
        fs::temp_directory_path() / ("live_asr_logger_" + std::to_string(getpid()) + ".log");
    fs::remove(logPath);

    LogConfig config;
    config.consoleOutput = false;
    config.filePath = logPath.string();
    config.pattern = "%l %v";
    ASSERT_TRUE(initialize(config));

    LOG_WARN("[Test] written to file {}", 42);
    LOG_DEBUG("[Test] below threshold");
    shutdown();

    std::ifstream file(logPath);
    std::stringstream content;
    content << file.rdbuf();
    EXPECT_NE(content.str().find("warning [Test] written to file 42"), std::string::npos);
    EXPECT_EQ(content.str().find("below threshold"), std::string::npos);
    fs::remove(logPath);
}

TEST(Logging, UnwritableFileFailsInitialization) {
    // A regular file cannot be used as the log directory
    const fs::path notADir =
        fs::temp_directory_path() / ("live_asr_logger_file_" + std::to_string(getpid()));
    std::ofstream(notADir) << "x";

    LogConfig config;
    config.consoleOutput = false;
    config.filePath = (notADir / "app.log").string();
    EXPECT_FALSE(initialize(config));
    shutdown();
    fs::remove(notADir);
}

TEST(Logging, EveryNEmitsFirstOfEachGroup) {
    LogConfig config;
    config.consoleOutput = false;
    ASSERT_TRUE(initialize(config));
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    sink->set_pattern("%v");
    getLogger()->sinks().push_back(sink);

    for (int i = 0; i < 25; ++i) {
        LOG_EVERY_N(INFO, 10, "iteration {}", i);
    }
    EXPECT_EQ(out.str(), "iteration 0\niteration 10\niteration 20\n");
    shutdown();
}
