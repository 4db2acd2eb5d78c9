// test_logger.cpp - Sinks, formatters and levels
// Copyright (c) 2025 Biometric Security Systems

#include <gtest/gtest.h>
#include <sstream>
#include <vector>
#include <nlohmann/json.hpp>

#include "utils/logger.h"
#include "test_helpers.h"

namespace palm_testing {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().clearSinks();
        Logger::getInstance().setLevel(LogLevel::TRACE);
        sink_ = std::make_shared<CallbackSink>([this](const LogRecord& record) {
            entries_.push_back(record);
        });
        Logger::getInstance().addSink(sink_);
    }

    void TearDown() override {
        Logger::getInstance().clearSinks();
        Logger::getInstance().setLevel(LogLevel::INFO);
    }

    std::shared_ptr<CallbackSink> sink_;
    std::vector<LogRecord> entries_;
};

TEST_F(LoggerTest, DeliversMessagesWithCategory) {
    Logger::info("store opened", "store");

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::INFO);
    EXPECT_EQ(entries_[0].message, "store opened");
    EXPECT_EQ(entries_[0].category, "store");
}

TEST_F(LoggerTest, GlobalLevelFiltersLowerLevels) {
    Logger::getInstance().setLevel(LogLevel::WARNING);
    Logger::debug("hidden");
    Logger::info("hidden");
    Logger::warning("shown");
    Logger::error("shown");

    EXPECT_EQ(entries_.size(), 2u);
}

TEST_F(LoggerTest, SinkLevelFiltersIndependently) {
    sink_->setMinLevel(LogLevel::ERROR);
    Logger::warning("hidden");
    Logger::critical("shown");

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::CRITICAL);
}

TEST_F(LoggerTest, MacrosCaptureLocation) {
    LOG_WARNING_CAT("pipeline", "with location");

    ASSERT_EQ(entries_.size(), 1u);
    ASSERT_NE(entries_[0].file, nullptr);
    EXPECT_NE(std::string(entries_[0].file).find("test_logger.cpp"), std::string::npos);
    EXPECT_GT(entries_[0].line, 0);
    EXPECT_EQ(entries_[0].category, "pipeline");
}

TEST_F(LoggerTest, TextFormatterLayout) {
    TextFormatter::Layout layout;
    layout.timestamp = false;
    TextFormatter formatter(layout);
    LogRecord record;
    record.level = LogLevel::ERROR;
    record.message = "disk full";
    record.category = "store";

    EXPECT_EQ(formatter.format(record), "[ERROR   ] [store] disk full");
}

TEST_F(LoggerTest, JsonFormatterEmitsOneObject) {
    JsonLineFormatter formatter;
    LogRecord record;
    record.time = std::chrono::system_clock::now();
    record.level = LogLevel::INFO;
    record.message = "quote \" and newline\n";
    record.fields["identity"] = "555-1111";

    std::string line = formatter.format(record);
    EXPECT_EQ(line.find('\n'), std::string::npos);

    nlohmann::json parsed = nlohmann::json::parse(line);
    EXPECT_EQ(parsed["level"], "INFO");
    EXPECT_EQ(parsed["message"], "quote \" and newline\n");
    EXPECT_EQ(parsed["fields"]["identity"], "555-1111");
}

TEST_F(LoggerTest, StreamSinkWritesToGivenStream) {
    std::ostringstream captured;
    TextFormatter::Layout bare;
    bare.timestamp = false;
    bare.level = false;
    auto console = std::make_shared<StreamSink>(
        std::make_shared<TextFormatter>(bare), &captured);
    Logger::getInstance().addSink(console);

    Logger::info("hello");
    EXPECT_EQ(captured.str(), "hello\n");
}

TEST_F(LoggerTest, FileSinkRotatesBySize) {
    TempDirectory dir;
    std::string path = dir.file("palm.log");
    TextFormatter::Layout bare;
    bare.timestamp = false;
    bare.level = false;
    auto file_sink = std::make_shared<RotatingFileSink>(
        path, std::make_shared<TextFormatter>(bare), 64, 3, false);
    ASSERT_TRUE(file_sink->isEnabled());
    Logger::getInstance().addSink(file_sink);

    for (int i = 0; i < 20; ++i) {
        Logger::info("line number " + std::to_string(i));
    }
    Logger::getInstance().flush();

    EXPECT_TRUE(pathExists(path));
    EXPECT_TRUE(pathExists(path + ".1"));
    EXPECT_TRUE(pathExists(path + ".2"));
    EXPECT_FALSE(pathExists(path + ".3"));
}

TEST_F(LoggerTest, ConfigureReplacesSinks) {
    LoggerOptions options;
    options.level = LogLevel::ERROR;
    ASSERT_TRUE(Logger::getInstance().configure(options));

    EXPECT_EQ(Logger::getInstance().sinkCount(), 1u);
    EXPECT_EQ(Logger::getInstance().level(), LogLevel::ERROR);
    Logger::error("not captured");
    EXPECT_TRUE(entries_.empty());
}

TEST_F(LoggerTest, ParsesLevelNames) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parseLogLevel("Debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parseLogLevel("warn", level));
    EXPECT_EQ(level, LogLevel::WARNING);
    EXPECT_FALSE(parseLogLevel("loud", level));
    EXPECT_EQ(level, LogLevel::WARNING);
}

} // namespace palm_testing
