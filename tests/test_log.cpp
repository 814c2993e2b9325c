#include <gtest/gtest.h>
#include "core/Log.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using namespace lintel;

class LogTest : public ::testing::Test {
protected:
    void SetUp() override {
        spdlog::drop_all();
    }

    void TearDown() override {
        spdlog::drop_all();
    }
};

TEST_F(LogTest, LoggersAvailableBeforeInit) {
    EXPECT_NE(Log::getLayoutLogger(), nullptr);
    EXPECT_NE(Log::getPreviewLogger(), nullptr);
    EXPECT_NO_THROW(LOG_ERROR("error before init"));
}

TEST_F(LogTest, InitWithDefaults) {
    ASSERT_NO_THROW(Log::init());
    EXPECT_NE(Log::getLayoutLogger(), nullptr);
    EXPECT_NE(Log::getPreviewLogger(), nullptr);
    EXPECT_EQ(Log::getLayoutLogger()->level(), spdlog::level::info);
}

TEST_F(LogTest, InitWithLogLevel) {
    Log::init("", "warn");
    EXPECT_EQ(Log::getLayoutLogger()->level(), spdlog::level::warn);
    EXPECT_EQ(Log::getPreviewLogger()->level(), spdlog::level::warn);
}

TEST_F(LogTest, LayoutAndPreviewLoggersAreSeparate) {
    Log::init();
    EXPECT_EQ(Log::getLayoutLogger()->name(), "LAYOUT");
    EXPECT_EQ(Log::getPreviewLogger()->name(), "PREVIEW");
}

TEST_F(LogTest, InitTwiceDoesNotThrow) {
    Log::init();
    EXPECT_NO_THROW(Log::init("", "debug"));
    EXPECT_EQ(Log::getLayoutLogger()->level(), spdlog::level::debug);
}

TEST_F(LogTest, ParseLevel) {
    EXPECT_EQ(Log::parseLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(Log::parseLevel("debug"), spdlog::level::debug);
    EXPECT_EQ(Log::parseLevel("info"), spdlog::level::info);
    EXPECT_EQ(Log::parseLevel("warn"), spdlog::level::warn);
    EXPECT_EQ(Log::parseLevel("error"), spdlog::level::err);
    EXPECT_EQ(Log::parseLevel("critical"), spdlog::level::critical);
    EXPECT_EQ(Log::parseLevel("loud"), spdlog::level::info);
}

TEST_F(LogTest, AllLayoutMacroLevels) {
    Log::init("", "trace");
    EXPECT_NO_THROW(LOG_TRACE("trace message"));
    EXPECT_NO_THROW(LOG_DEBUG("debug message"));
    EXPECT_NO_THROW(LOG_INFO("info message"));
    EXPECT_NO_THROW(LOG_WARN("warn message"));
    EXPECT_NO_THROW(LOG_ERROR("error message"));
    EXPECT_NO_THROW(LOG_CRITICAL("critical message"));
}

TEST_F(LogTest, AllPreviewMacroLevels) {
    Log::init("", "trace");
    EXPECT_NO_THROW(PREVIEW_LOG_TRACE("trace message"));
    EXPECT_NO_THROW(PREVIEW_LOG_DEBUG("debug message"));
    EXPECT_NO_THROW(PREVIEW_LOG_INFO("info message"));
    EXPECT_NO_THROW(PREVIEW_LOG_WARN("warn message"));
    EXPECT_NO_THROW(PREVIEW_LOG_ERROR("error message"));
    EXPECT_NO_THROW(PREVIEW_LOG_CRITICAL("critical message"));
}

TEST_F(LogTest, MacrosWithFormatArgs) {
    Log::init();
    EXPECT_NO_THROW(LOG_INFO("{} children in {} rows", 10, 2));
    EXPECT_NO_THROW(PREVIEW_LOG_INFO("Running {} layout", "flow"));
}

TEST_F(LogTest, ShutdownSafe) {
    Log::init();
    EXPECT_NO_THROW(Log::shutdown());
    EXPECT_NE(Log::getLayoutLogger(), nullptr);
}

class LogFileTest : public ::testing::Test {
protected:
    std::string logPath;

    void SetUp() override {
        spdlog::drop_all();
        logPath = (std::filesystem::temp_directory_path() / "lintel_test_log.txt").string();
        std::filesystem::remove(logPath);
    }

    void TearDown() override {
        spdlog::drop_all();
        std::filesystem::remove(logPath);
    }
};

TEST_F(LogFileTest, FileLogging) {
    Log::init(logPath, "debug");
    LOG_INFO("File log test message");
    Log::getLayoutLogger()->flush();

    std::ifstream f(logPath);
    ASSERT_TRUE(f.good()) << "Log file should have been created";

    std::string contents((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    EXPECT_NE(contents.find("File log test message"), std::string::npos);
    EXPECT_NE(contents.find("[LAYOUT]"), std::string::npos);
}
