#include <gtest/gtest.h>
#include <tally/config/config_helpers.h>

#include "common/test_helpers.h"

#include <cstdlib>
#include <filesystem>

using namespace tally;
using namespace tally::config;
namespace fs = std::filesystem;

class ConfigHelpersTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = tests::make_temp_dir("tally_config_test_");
        ::unsetenv("TALLY_DB");
        ::unsetenv("TALLY_CONFIG");
        ::setenv("XDG_CONFIG_HOME", (tempDir_ / "xdg_config").c_str(), 1);
        ::setenv("XDG_DATA_HOME", (tempDir_ / "xdg_data").c_str(), 1);
    }

    void TearDown() override {
        ::unsetenv("TALLY_DB");
        ::unsetenv("TALLY_CONFIG");
        ::unsetenv("XDG_CONFIG_HOME");
        ::unsetenv("XDG_DATA_HOME");
        fs::remove_all(tempDir_);
    }

    fs::path writeConfig(const std::string& body) {
        return tests::write_file(tempDir_ / "config.toml", body);
    }

    fs::path tempDir_;
};

TEST_F(ConfigHelpersTest, TrimAndUnquote) {
    std::string s = "  padded\t ";
    trim(s);
    EXPECT_EQ(s, "padded");
    EXPECT_EQ(unquote(" \"quoted\" "), "quoted");
    EXPECT_EQ(unquote("'single'"), "single");
    EXPECT_EQ(unquote("bare"), "bare");
}

TEST_F(ConfigHelpersTest, ParseIntAndBool) {
    EXPECT_EQ(parse_int(" 42 "), 42);
    EXPECT_EQ(parse_int("-7"), -7);
    EXPECT_FALSE(parse_int("12ms").has_value());
    EXPECT_FALSE(parse_int("").has_value());

    EXPECT_EQ(parse_bool("Yes"), true);
    EXPECT_EQ(parse_bool("off"), false);
    EXPECT_EQ(parse_bool("1"), true);
    EXPECT_FALSE(parse_bool("maybe").has_value());
}

TEST_F(ConfigHelpersTest, ParseConfigValueSectionsAndComments) {
    auto path = writeConfig(R"(
# ledger settings
top = 1

[storage]
path = "/var/lib/tally/ledger.db"
busy_timeout_ms = 2500 # inline comment

[ledger]
include_overrides_in_archive = true
storage.max_retries = 9
)");

    EXPECT_EQ(parse_config_value(path, "storage", "path"), "/var/lib/tally/ledger.db");
    EXPECT_EQ(parse_config_value(path, "storage", "busy_timeout_ms"), "2500");
    EXPECT_EQ(parse_config_value(path, "ledger", "include_overrides_in_archive"), "true");
    EXPECT_EQ(parse_config_value(path, "storage", "max_retries"), "9");
    EXPECT_EQ(parse_config_value(path, "", "top"), "1");
    EXPECT_EQ(parse_config_value(path, "storage", "missing"), "");
    EXPECT_EQ(parse_config_value(tempDir_ / "absent.toml", "storage", "path"), "");
}

TEST_F(ConfigHelpersTest, DirectoriesFollowXdg) {
    EXPECT_EQ(get_config_dir(), tempDir_ / "xdg_config" / "tally");
    EXPECT_EQ(get_data_dir(), tempDir_ / "xdg_data" / "tally");
    EXPECT_EQ(get_config_path(), tempDir_ / "xdg_config" / "tally" / "config.toml");

    ::setenv("TALLY_CONFIG", "/etc/tally.toml", 1);
    EXPECT_EQ(get_config_path(), fs::path("/etc/tally.toml"));
    EXPECT_EQ(get_config_path("/opt/custom.toml"), fs::path("/opt/custom.toml"));
}

TEST_F(ConfigHelpersTest, DefaultsWithoutConfigFile) {
    auto settings = load_settings();
    ASSERT_TRUE(settings.has_value());
    EXPECT_EQ(settings.value().storage.path, (tempDir_ / "xdg_data" / "tally" / "tally.db").string());
    EXPECT_FALSE(settings.value().includeOverridesInArchive);
    EXPECT_TRUE(settings.value().storage.enableWAL);
    EXPECT_EQ(settings.value().storage.retry.maxAttempts, 5);
}

TEST_F(ConfigHelpersTest, ConfigFileValuesApply) {
    auto path = writeConfig(R"(
[storage]
path = "/srv/ledger.db"
busy_timeout_ms = 1500
max_retries = 2
retry_delay_ms = 25
enable_wal = off

[ledger]
include_overrides_in_archive = yes
)");

    auto settings = load_settings(path.string());
    ASSERT_TRUE(settings.has_value());
    const auto& s = settings.value();
    EXPECT_EQ(s.storage.path, "/srv/ledger.db");
    EXPECT_EQ(s.storage.busyTimeout, std::chrono::milliseconds(1500));
    EXPECT_EQ(s.storage.retry.maxAttempts, 2);
    EXPECT_EQ(s.storage.retry.initialDelay, std::chrono::milliseconds(25));
    EXPECT_FALSE(s.storage.enableWAL);
    EXPECT_TRUE(s.includeOverridesInArchive);
    EXPECT_EQ(s.configPath, path);
}

TEST_F(ConfigHelpersTest, DatabasePathPrecedence) {
    auto path = writeConfig("[storage]\npath = /from/config.db\n");

    auto fromConfig = load_settings(path.string());
    ASSERT_TRUE(fromConfig.has_value());
    EXPECT_EQ(fromConfig.value().storage.path, "/from/config.db");

    ::setenv("TALLY_DB", "/from/env.db", 1);
    auto fromEnv = load_settings(path.string());
    ASSERT_TRUE(fromEnv.has_value());
    EXPECT_EQ(fromEnv.value().storage.path, "/from/env.db");

    auto fromFlag = load_settings(path.string(), ":memory:");
    ASSERT_TRUE(fromFlag.has_value());
    EXPECT_EQ(fromFlag.value().storage.path, ":memory:");
}

TEST_F(ConfigHelpersTest, InvalidValuesAreRejected) {
    auto badInt = writeConfig("[storage]\nmax_retries = 0\n");
    auto r1 = load_settings(badInt.string());
    ASSERT_FALSE(r1.has_value());
    EXPECT_EQ(r1.error().code, ErrorCode::InvalidArgument);

    writeConfig("[storage]\nbusy_timeout_ms = soon\n");
    auto r2 = load_settings(badInt.string());
    ASSERT_FALSE(r2.has_value());
    EXPECT_EQ(r2.error().code, ErrorCode::InvalidArgument);

    writeConfig("[ledger]\ninclude_overrides_in_archive = sometimes\n");
    auto r3 = load_settings(badInt.string());
    ASSERT_FALSE(r3.has_value());
    EXPECT_EQ(r3.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ConfigHelpersTest, IntegerSettingsBeyondIntRangeAreRejected) {
    auto path = writeConfig("[storage]\nmax_retries = 4294967297\n");
    auto retries = load_settings(path.string());
    ASSERT_FALSE(retries.has_value());
    EXPECT_EQ(retries.error().code, ErrorCode::InvalidArgument);

    writeConfig("[storage]\nbusy_timeout_ms = 2147483648\n");
    auto timeout = load_settings(path.string());
    ASSERT_FALSE(timeout.has_value());
    EXPECT_EQ(timeout.error().code, ErrorCode::InvalidArgument);

    writeConfig("[storage]\nbusy_timeout_ms = 2147483647\n");
    auto largest = load_settings(path.string());
    ASSERT_TRUE(largest.has_value());
    EXPECT_EQ(largest.value().storage.busyTimeout, std::chrono::milliseconds(2147483647));
}

TEST_F(ConfigHelpersTest, MissingExplicitConfigIsNotFound) {
    auto result = load_settings((tempDir_ / "nope.toml").string());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}
