#include <gtest/gtest.h>
#include "logger.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>

namespace httpload {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        logFile_ = ::testing::TempDir() + "httpload_logger_test.log";
        std::remove(logFile_.c_str());
    }

    void TearDown() override {
        LogConfig quiet;
        quiet.level = LogLevel::ERROR;
        quiet.consoleOutput = false;
        Logger::getInstance().configure(quiet);
        std::remove(logFile_.c_str());
    }

    LogConfig fileOnly(LogLevel level = LogLevel::DEBUG) {
        LogConfig config;
        config.level = level;
        config.consoleOutput = false;
        config.fileOutput = true;
        config.logFile = logFile_;
        config.enableRotation = false;
        return config;
    }

    std::string readLog() {
        Logger::getInstance().flush();
        std::ifstream file(logFile_);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    std::string logFile_;
};

TEST_F(LoggerTest, ParseLevelAndFormat) {
    EXPECT_EQ(Logger::parseLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parseLevel("Warning"), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("FATAL"), LogLevel::FATAL);
    EXPECT_EQ(Logger::parseLevel("nonsense"), LogLevel::INFO);

    EXPECT_EQ(Logger::parseFormat("json"), LogFormat::JSON);
    EXPECT_EQ(Logger::parseFormat("text"), LogFormat::TEXT);
    EXPECT_EQ(Logger::parseFormat("xml"), LogFormat::TEXT);
}

TEST_F(LoggerTest, TextLinesCarryLevelAndComponent) {
    auto& logger = Logger::getInstance();
    logger.configure(fileOnly());

    logger.info("Worker", "worker 3 finished", {{"requests", "25"}});

    std::string content = readLog();
    EXPECT_NE(content.find("[INFO ] [Worker] worker 3 finished"), std::string::npos);
    EXPECT_NE(content.find("| requests=25"), std::string::npos);
}

TEST_F(LoggerTest, LevelFiltering) {
    auto& logger = Logger::getInstance();
    logger.configure(fileOnly(LogLevel::WARN));

    logger.debug("Test", "hidden debug");
    logger.info("Test", "hidden info");
    logger.warn("Test", "visible warning");
    logger.error("Test", "visible error");

    std::string content = readLog();
    EXPECT_EQ(content.find("hidden"), std::string::npos);
    EXPECT_NE(content.find("visible warning"), std::string::npos);
    EXPECT_NE(content.find("visible error"), std::string::npos);
}

TEST_F(LoggerTest, ComponentFilter) {
    auto config = fileOnly();
    config.componentFilter = {"TransportPool"};
    auto& logger = Logger::getInstance();
    logger.configure(config);

    logger.info("TransportPool", "kept");
    logger.info("Worker", "dropped");

    std::string content = readLog();
    EXPECT_NE(content.find("kept"), std::string::npos);
    EXPECT_EQ(content.find("dropped"), std::string::npos);
}

TEST_F(LoggerTest, JsonFormat) {
    auto config = fileOnly();
    config.format = LogFormat::JSON;
    auto& logger = Logger::getInstance();
    logger.configure(config);

    logger.error("Report", "cannot write \"out.json\"", {{"path", "out.json"}});

    std::string content = readLog();
    EXPECT_NE(content.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(content.find("\"component\":\"Report\""), std::string::npos);
    EXPECT_NE(content.find("cannot write \\\"out.json\\\""), std::string::npos);
    EXPECT_NE(content.find("\"context\":{\"path\":\"out.json\"}"), std::string::npos);
}

TEST_F(LoggerTest, ComponentLoggerFormatsPlaceholders) {
    auto& logger = Logger::getInstance();
    logger.configure(fileOnly());

    WORKER_LOG_INFO("Worker {} completed {} requests", 2, 50);
    RUNNER_LOG_WARN("{} placeholders, one value", 1);

    std::string content = readLog();
    EXPECT_NE(content.find("[Worker] Worker 2 completed 50 requests"), std::string::npos);
    EXPECT_NE(content.find("[LoadRunner] 1 placeholders, one value"), std::string::npos);
    EXPECT_EQ(std::string(WorkerLogger::getComponentName()), "Worker");
}

TEST_F(LoggerTest, MetricsCountMessages) {
    auto& logger = Logger::getInstance();
    logger.configure(fileOnly());

    auto before = logger.getMetrics();
    logger.warn("Test", "w");
    logger.error("Test", "e");
    logger.info("Test", "i");
    auto after = logger.getMetrics();

    EXPECT_EQ(after.totalMessages.load() - before.totalMessages.load(), 3u);
    EXPECT_EQ(after.warningCount.load() - before.warningCount.load(), 1u);
    EXPECT_EQ(after.errorCount.load() - before.errorCount.load(), 1u);
}

TEST_F(LoggerTest, AsyncLoggingDrainsOnReconfigure) {
    auto config = fileOnly();
    config.asyncLogging = true;
    auto& logger = Logger::getInstance();
    logger.configure(config);

    for (int i = 0; i < 100; ++i) {
        logger.info("Async", "message " + std::to_string(i));
    }

    config.asyncLogging = false;
    logger.configure(config);

    std::string content = readLog();
    EXPECT_NE(content.find("message 0"), std::string::npos);
    EXPECT_NE(content.find("message 99"), std::string::npos);
}

} // namespace httpload
