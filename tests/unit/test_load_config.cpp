#include <gtest/gtest.h>
#include "config_manager.hpp"
#include "load_config.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cstdio>
#include <fstream>

namespace httpload {

class LoadConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        LogConfig logConfig;
        logConfig.level = LogLevel::FATAL;
        logConfig.consoleOutput = false;
        Logger::getInstance().configure(logConfig);

        config_ = &ConfigManager::getInstance();
        config_->clear();
    }

    void TearDown() override {
        config_->clear();
    }

    static bool contains(const std::vector<std::string>& messages,
                         const std::string& needle) {
        return std::any_of(messages.begin(), messages.end(),
                           [&](const std::string& m) {
                               return m.find(needle) != std::string::npos;
                           });
    }

    ConfigManager* config_ = nullptr;
};

TEST_F(LoadConfigTest, DefaultsWithEmptyConfiguration) {
    auto loadConfig = LoadTestConfig::fromConfig(*config_);

    EXPECT_EQ(loadConfig.url, "http://localhost:8080");
    EXPECT_EQ(loadConfig.method, "POST");
    EXPECT_TRUE(loadConfig.corpusFile.empty());
    EXPECT_EQ(loadConfig.concurrency, 10);
    EXPECT_EQ(loadConfig.totalRequests, 100);
    EXPECT_DOUBLE_EQ(loadConfig.keepAliveRatio, 0.7);
    EXPECT_EQ(loadConfig.reportInterval.count(), 1000);
    EXPECT_FALSE(loadConfig.seed.has_value());
    EXPECT_EQ(loadConfig.transport.requestTimeout.count(), 10000);
    EXPECT_EQ(loadConfig.transport.maxIdleConnections, 100);
    EXPECT_EQ(loadConfig.report.chartHeight, 10);
    EXPECT_TRUE(loadConfig.report.showProgress);

    EXPECT_EQ(loadConfig, LoadTestConfig{});
    EXPECT_TRUE(loadConfig.validate().isValid);
}

TEST_F(LoadConfigTest, ReadsNestedJson) {
    ASSERT_TRUE(config_->loadFromString(R"({
        "target": {"url": "http://api.local/orders", "method": "PUT",
                   "corpus_file": "bodies.json"},
        "load": {"concurrency": 32, "total_requests": 5000,
                 "keepalive_ratio": 0.25, "report_interval_ms": 500, "seed": 9},
        "transport": {"request_timeout_ms": 2500, "user_agent": "bench"},
        "report": {"json_file": "out.json", "chart_height": 6, "progress": false}
    })"));

    auto loadConfig = LoadTestConfig::fromConfig(*config_);
    EXPECT_EQ(loadConfig.url, "http://api.local/orders");
    EXPECT_EQ(loadConfig.method, "PUT");
    EXPECT_EQ(loadConfig.corpusFile, "bodies.json");
    EXPECT_EQ(loadConfig.concurrency, 32);
    EXPECT_EQ(loadConfig.totalRequests, 5000);
    EXPECT_DOUBLE_EQ(loadConfig.keepAliveRatio, 0.25);
    EXPECT_EQ(loadConfig.reportInterval.count(), 500);
    ASSERT_TRUE(loadConfig.seed.has_value());
    EXPECT_EQ(*loadConfig.seed, 9u);
    EXPECT_EQ(loadConfig.transport.requestTimeout.count(), 2500);
    EXPECT_EQ(loadConfig.transport.userAgent, "bench");
    EXPECT_EQ(loadConfig.report.jsonFile, "out.json");
    EXPECT_EQ(loadConfig.report.chartHeight, 6);
    EXPECT_FALSE(loadConfig.report.showProgress);
}

TEST_F(LoadConfigTest, OverridesReplaceFileValues) {
    ASSERT_TRUE(config_->loadFromString(R"({"load": {"concurrency": 4}})"));
    config_->setValue("load.concurrency", "12");

    EXPECT_EQ(LoadTestConfig::fromConfig(*config_).concurrency, 12);
}

TEST_F(LoadConfigTest, RejectsNonObjectRoot) {
    EXPECT_FALSE(config_->loadFromString("[1, 2, 3]"));
    EXPECT_FALSE(config_->loadFromString("{not json"));
}

TEST_F(LoadConfigTest, LoadConfigFromFile) {
    std::string path = ::testing::TempDir() + "httpload_config_test.json";
    {
        std::ofstream file(path);
        file << R"({"target": {"url": "http://file.local"}})";
    }

    ASSERT_TRUE(config_->loadConfig(path));
    EXPECT_EQ(LoadTestConfig::fromConfig(*config_).url, "http://file.local");

    std::remove(path.c_str());
    EXPECT_FALSE(config_->loadConfig(path + ".missing"));
}

TEST_F(LoadConfigTest, MalformedNumbersFallBackToDefaults) {
    config_->setValue("load.concurrency", "12abc");
    config_->setValue("load.keepalive_ratio", "high");

    auto loadConfig = LoadTestConfig::fromConfig(*config_);
    EXPECT_EQ(loadConfig.concurrency, 10);
    EXPECT_DOUBLE_EQ(loadConfig.keepAliveRatio, 0.7);
}

TEST_F(LoadConfigTest, ValidationErrors) {
    LoadTestConfig loadConfig;
    loadConfig.url = "";
    loadConfig.method = "GE T";
    loadConfig.concurrency = 0;
    loadConfig.totalRequests = -1;
    loadConfig.keepAliveRatio = 1.5;
    loadConfig.reportInterval = std::chrono::milliseconds(0);

    auto result = loadConfig.validate();
    EXPECT_FALSE(result.isValid);
    EXPECT_TRUE(contains(result.errors, "target.url"));
    EXPECT_TRUE(contains(result.errors, "target.method"));
    EXPECT_TRUE(contains(result.errors, "load.concurrency"));
    EXPECT_TRUE(contains(result.errors, "load.total_requests"));
    EXPECT_TRUE(contains(result.errors, "load.keepalive_ratio"));
    EXPECT_TRUE(contains(result.errors, "load.report_interval_ms"));
}

TEST_F(LoadConfigTest, ValidationWarnings) {
    LoadTestConfig loadConfig;
    loadConfig.url = "ftp://example.com";
    loadConfig.concurrency = 50;
    loadConfig.totalRequests = 10;
    loadConfig.reportInterval = std::chrono::milliseconds(20);

    auto result = loadConfig.validate();
    EXPECT_TRUE(result.isValid);
    EXPECT_TRUE(contains(result.warnings, "scheme"));
    EXPECT_TRUE(contains(result.warnings, "load.concurrency"));
    EXPECT_TRUE(contains(result.warnings, "load.report_interval_ms"));
}

TEST_F(LoadConfigTest, ZeroRequestsIsValid) {
    LoadTestConfig loadConfig;
    loadConfig.concurrency = 1;
    loadConfig.totalRequests = 0;
    EXPECT_TRUE(loadConfig.validate().isValid);
}

TEST_F(LoadConfigTest, BoundaryRatiosAreValid) {
    LoadTestConfig loadConfig;
    loadConfig.keepAliveRatio = 0.0;
    EXPECT_TRUE(loadConfig.validate().isValid);
    loadConfig.keepAliveRatio = 1.0;
    EXPECT_TRUE(loadConfig.validate().isValid);
}

TEST_F(LoadConfigTest, NestedSettingsValidation) {
    LoadTestConfig loadConfig;
    loadConfig.transport.requestTimeout = std::chrono::milliseconds(0);
    loadConfig.report.chartHeight = 0;

    auto result = loadConfig.validate();
    EXPECT_FALSE(result.isValid);
    EXPECT_TRUE(contains(result.errors, "transport.request_timeout_ms"));
    EXPECT_TRUE(contains(result.errors, "report.chart_height"));
}

TEST_F(LoadConfigTest, LoggingConfiguration) {
    ASSERT_TRUE(config_->loadFromString(R"({
        "logging": {"level": "debug", "format": "json", "console_output": false,
                    "component_filter": ["Worker", "Transport"]}
    })"));

    auto logConfig = config_->getLoggingConfig();
    EXPECT_EQ(logConfig.level, LogLevel::DEBUG);
    EXPECT_EQ(logConfig.format, LogFormat::JSON);
    EXPECT_FALSE(logConfig.consoleOutput);
    EXPECT_FALSE(logConfig.fileOutput);
    EXPECT_EQ(logConfig.componentFilter.size(), 2u);
    EXPECT_EQ(logConfig.componentFilter.count("Worker"), 1u);
}

} // namespace httpload
