#include <gtest/gtest.h>
#include "config_manager.hpp"
#include "logger.hpp"
#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

namespace autoflow {

using namespace std::chrono_literals;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        LogConfig logConfig;
        logConfig.level = LogLevel::FATAL;
        logConfig.consoleOutput = false;
        Logger::getInstance().configure(logConfig);

        config().loadFromString("{}");
    }

    void TearDown() override {
        for (const auto &path : tempFiles) {
            std::remove(path.c_str());
        }
    }

    ConfigManager &config() { return ConfigManager::getInstance(); }

    std::string writeTempFile(const std::string &name,
                              const std::string &contents) {
        std::string path = ::testing::TempDir() + name;
        std::ofstream out(path);
        out << contents;
        tempFiles.push_back(path);
        return path;
    }

    std::vector<std::string> tempFiles;
};

TEST_F(ConfigManagerTest, SchedulerDefaultsWhenSectionMissing) {
    auto schedulerConfig = config().getSchedulerConfig();

    EXPECT_TRUE(schedulerConfig == SchedulerConfig());
    EXPECT_EQ(schedulerConfig.tickInterval, 1000ms);
    EXPECT_EQ(schedulerConfig.errorBackoffMultiplier, 5);
    EXPECT_EQ(schedulerConfig.stopTimeout, 5000ms);
    EXPECT_EQ(schedulerConfig.reenablePolicy, ReenablePolicy::RESUME_SCHEDULE);
}

TEST_F(ConfigManagerTest, LoadsSchedulerSection) {
    ASSERT_TRUE(config().loadFromString(R"({
        "scheduler": {
            "tick_interval_ms": 250,
            "error_backoff_multiplier": 3,
            "stop_timeout_ms": 1500,
            "lock_timeout_ms": 200,
            "reenable_policy": "reschedule"
        }
    })"));

    auto schedulerConfig = config().getSchedulerConfig();
    EXPECT_EQ(schedulerConfig.tickInterval, 250ms);
    EXPECT_EQ(schedulerConfig.errorBackoffMultiplier, 3);
    EXPECT_EQ(schedulerConfig.stopTimeout, 1500ms);
    EXPECT_EQ(schedulerConfig.lockTimeout, 200ms);
    EXPECT_EQ(schedulerConfig.reenablePolicy,
              ReenablePolicy::RESCHEDULE_FROM_NOW);
    EXPECT_TRUE(schedulerConfig.validate().isValid);
}

TEST_F(ConfigManagerTest, InvalidSchedulerValuesAreErrors) {
    ASSERT_TRUE(config().loadFromString(R"({
        "scheduler": {
            "tick_interval_ms": 0,
            "error_backoff_multiplier": 0,
            "stop_timeout_ms": -1,
            "reenable_policy": "sometimes"
        },
        "workflows": [{"type": "lead_ingestion"}]
    })"));

    auto result = config().validateConfiguration();
    EXPECT_FALSE(result.isValid);
    EXPECT_EQ(result.errors.size(), 4u);
}

TEST_F(ConfigManagerTest, SlowTickIsOnlyAWarning) {
    SchedulerConfig schedulerConfig;
    schedulerConfig.tickInterval = 120s;

    auto result = schedulerConfig.validate();
    EXPECT_TRUE(result.isValid);
    EXPECT_EQ(result.warnings.size(), 1u);
}

TEST_F(ConfigManagerTest, WorkflowEntriesAreValidated) {
    ASSERT_TRUE(config().loadFromString(R"({
        "workflows": [
            {"type": "email_processing"},
            {"type": "fax_blast"},
            {"query": "is:unread"},
            "not an object",
            {"type": "lead_ingestion", "enabled": "yes"}
        ]
    })"));

    auto result = config().validateConfiguration();
    EXPECT_FALSE(result.isValid);
    EXPECT_EQ(result.errors.size(), 3u);
    EXPECT_EQ(result.warnings.size(), 1u);
}

TEST_F(ConfigManagerTest, EmptyWorkflowListWarns) {
    auto result = config().validateConfiguration();
    EXPECT_TRUE(result.isValid);
    ASSERT_EQ(result.warnings.size(), 1u);
}

TEST_F(ConfigManagerTest, LoggingSection) {
    ASSERT_TRUE(config().loadFromString(R"({
        "logging": {
            "level": "debug",
            "format": "json",
            "console_output": false,
            "file_output": true,
            "log_file": "logs/test.log",
            "max_backup_files": 3,
            "component_filter": ["JobRegistry", "WorkflowScheduler"]
        }
    })"));

    auto logConfig = config().getLoggingConfig();
    EXPECT_EQ(logConfig.level, LogLevel::DEBUG);
    EXPECT_EQ(logConfig.format, LogFormat::JSON);
    EXPECT_FALSE(logConfig.consoleOutput);
    EXPECT_TRUE(logConfig.fileOutput);
    EXPECT_EQ(logConfig.logFile, "logs/test.log");
    EXPECT_EQ(logConfig.maxBackupFiles, 3);
    EXPECT_EQ(logConfig.componentFilter.size(), 2u);
    EXPECT_EQ(logConfig.componentFilter.count("JobRegistry"), 1u);
}

TEST_F(ConfigManagerTest, FlattensNestedKeys) {
    ASSERT_TRUE(config().loadFromString(R"({
        "a": {"b": {"c": 7, "flag": true, "ratio": 0.5, "name": "x"}}
    })"));

    EXPECT_TRUE(config().hasKey("a.b.c"));
    EXPECT_EQ(config().getInt("a.b.c"), 7);
    EXPECT_TRUE(config().getBool("a.b.flag"));
    EXPECT_DOUBLE_EQ(config().getDouble("a.b.ratio"), 0.5);
    EXPECT_EQ(config().getString("a.b.name"), "x");
    EXPECT_EQ(config().getString("a.b.missing", "fallback"), "fallback");
    EXPECT_EQ(config().getInt("a.b.name", 3), 3);
}

TEST_F(ConfigManagerTest, BooleanStringsAreCaseInsensitive) {
    ASSERT_TRUE(config().loadFromString(
        "{\"flags\": {\"upper\": \"YES\", \"mixed\": \"On\", "
        "\"accented\": \"s\u00ed\", \"latin1\": \"\xc3\xa9t\xc3\xa9\"}}"));

    EXPECT_TRUE(config().getBool("flags.upper"));
    EXPECT_TRUE(config().getBool("flags.mixed"));
    // Bytes above 0x7f pass through untouched
    EXPECT_FALSE(config().getBool("flags.accented", true));
    EXPECT_FALSE(config().getBool("flags.latin1", true));
}

TEST_F(ConfigManagerTest, ValidatedValueFallsBackOnRejection) {
    ASSERT_TRUE(config().loadFromString(R"({"scheduler": {"tick_interval_ms": -5}})"));

    auto tick = config().getValidatedValue<int>(
        "scheduler.tick_interval_ms", 1000,
        [](const int &value) { return value > 0; });
    EXPECT_EQ(tick, 1000);
}

TEST_F(ConfigManagerTest, RawJsonKeepsWorkflowArray) {
    ASSERT_TRUE(config().loadFromString(R"({
        "workflows": [{"type": "lead_ingestion", "source": "form"}]
    })"));

    auto raw = config().getJsonConfig();
    ASSERT_TRUE(raw["workflows"].is_array());
    EXPECT_EQ(raw["workflows"][0]["source"], "form");
}

TEST_F(ConfigManagerTest, RejectsMalformedInput) {
    EXPECT_FALSE(config().loadFromString("{not json"));
    EXPECT_FALSE(config().loadFromString("[1, 2, 3]"));
}

TEST_F(ConfigManagerTest, LoadsAndReloadsFromFile) {
    auto path = writeTempFile("autoflow_config_test.json",
                              R"({"scheduler": {"tick_interval_ms": 500}})");

    ASSERT_TRUE(config().loadConfig(path));
    EXPECT_EQ(config().getSchedulerConfig().tickInterval, 500ms);

    {
        std::ofstream out(path, std::ios::trunc);
        out << R"({"scheduler": {"tick_interval_ms": 750}})";
    }
    ASSERT_TRUE(config().reloadConfiguration());
    EXPECT_EQ(config().getSchedulerConfig().tickInterval, 750ms);
}

TEST_F(ConfigManagerTest, LoadConfigFailures) {
    EXPECT_FALSE(config().loadConfig("/nonexistent/autoflow/config.json"));

    auto path = writeTempFile("autoflow_bad_config.json", "{ \"scheduler\": ");
    EXPECT_FALSE(config().loadConfig(path));
}

} // namespace autoflow
