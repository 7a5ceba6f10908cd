#include <gtest/gtest.h>
#include <cstdlib>
#include "test_utils.hpp"
#include "load_config/load_config.hpp"

namespace fs = std::filesystem;
using namespace livetree::test::utils;

class ConfigTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        tempDir = createTempDir();
        unsetenv("START_PATH");
        unsetenv("PORT");
    }

    void TearDown() override
    {
        unsetenv("START_PATH");
        unsetenv("PORT");
        removeDir(tempDir);
    }

    fs::path tempDir;
};

TEST_F(ConfigTest, DefaultsWithoutFile)
{
    auto settings = ConfigReader::loadSettings("");
    EXPECT_EQ(settings.port, 4174);
    EXPECT_EQ(settings.bind_address, "0.0.0.0");
    EXPECT_EQ(settings.poll_interval_ms, 5000);
    EXPECT_EQ(settings.git_timeout_ms, 5000);
    EXPECT_EQ(settings.git_max_output_bytes, 2u * 1024 * 1024);
    EXPECT_EQ(settings.search_limit, 50u);
    EXPECT_FALSE(settings.root_path.empty());
}

TEST_F(ConfigTest, ReadsValuesFromFile)
{
    auto path = createFile(tempDir, "config.json",
                           R"({"root_path": ")" + tempDir.string() + R"(", "port": 9000, "search_limit": 10, "log_level": "debug"})");
    auto settings = ConfigReader::loadSettings(path.string());
    EXPECT_EQ(settings.root_path, tempDir.string());
    EXPECT_EQ(settings.port, 9000);
    EXPECT_EQ(settings.search_limit, 10u);
    EXPECT_EQ(settings.log_level, "debug");
    EXPECT_EQ(settings.db_path, "/tmp/livetree-index");
}

TEST_F(ConfigTest, EnvironmentOverridesFile)
{
    auto other = tempDir / "other";
    fs::create_directories(other);
    auto path = createFile(tempDir, "config.json", R"({"root_path": "/nowhere", "port": 9000})");
    setenv("START_PATH", other.c_str(), 1);
    setenv("PORT", "5123", 1);

    auto settings = ConfigReader::loadSettings(path.string());
    EXPECT_EQ(settings.root_path, other.string());
    EXPECT_EQ(settings.port, 5123);
}

TEST_F(ConfigTest, InvalidPortEnvironmentIsIgnored)
{
    setenv("PORT", "not-a-port", 1);
    auto settings = ConfigReader::loadSettings("");
    EXPECT_EQ(settings.port, 4174);
}

TEST_F(ConfigTest, MissingFileThrows)
{
    EXPECT_THROW(ConfigReader::loadSettings((tempDir / "absent.json").string()), std::runtime_error);
}

TEST_F(ConfigTest, MalformedFileFallsBackToDefaults)
{
    auto path = createFile(tempDir, "config.json", "{ not json");
    auto settings = ConfigReader::loadSettings(path.string());
    EXPECT_EQ(settings.port, 4174);
}
