#include <gtest/gtest.h>

#include <stdexcept>

#include "config.hpp"
#include "test_helpers.hpp"
#include "utils.hpp"

using namespace Toolpack;
using ToolpackTest::TempDir;

namespace fs = std::filesystem;

TEST(ConfigTest, DefaultsLiveUnderTheHome)
{
    fs::path home = "/home/user/.toolpack";
    Config config = Config::defaults(home);

    EXPECT_EQ(config.installRoot.string(), (home / "toolchains").string());
    EXPECT_EQ(config.stagingDir.string(), (home / "staging").string());
    EXPECT_EQ(config.stateFile.string(), (home / "install-state.yaml").string());
    EXPECT_EQ(config.catalog, (home / "catalog.yaml").string());
    EXPECT_EQ(config.exportFile.filename().string(), "export-toolpack.sh");
    EXPECT_TRUE(config.host.empty());
    EXPECT_GE(config.workers, 1u);
    EXPECT_EQ(config.fetchTimeout.count(), 600);
}

TEST(ConfigTest, EmptyDocumentKeepsDefaults)
{
    Config config = Config::loadFromString("", "/opt/tp");
    EXPECT_EQ(config.installRoot.string(), (fs::path("/opt/tp") / "toolchains").string());
}

TEST(ConfigTest, OverridesAreApplied)
{
    Config config = Config::loadFromString(R"(
install_root: /opt/toolchains
state_file: ~/state.yaml
catalog: https://example.org/catalog.yaml
host: aarch64-apple-darwin
workers: 3
fetch_timeout_seconds: 30
retry:
  max_attempts: 5
  base_delay_ms: 100
  jitter: 0
)", "/opt/tp");

    EXPECT_EQ(config.installRoot.string(), "/opt/toolchains");
    EXPECT_EQ(config.stateFile.string(), (homeDirectory() / "state.yaml").string());
    EXPECT_EQ(config.catalog, "https://example.org/catalog.yaml");
    EXPECT_EQ(config.host, "aarch64-apple-darwin");
    EXPECT_EQ(config.workers, 3u);
    EXPECT_EQ(config.fetchTimeout.count(), 30);
    EXPECT_EQ(config.extractTimeout.count(), 600);
    EXPECT_EQ(config.retry.maxAttempts, 5);
    EXPECT_EQ(config.retry.baseDelay.count(), 100);
    EXPECT_EQ(config.retry.maxDelay.count(), 8000);
    EXPECT_DOUBLE_EQ(config.retry.jitter, 0.0);
}

TEST(ConfigTest, InvalidValuesAreRejected)
{
    EXPECT_THROW(Config::loadFromString("workers: 0", "/opt/tp"), std::runtime_error);
    EXPECT_THROW(Config::loadFromString("workers: many", "/opt/tp"), std::runtime_error);
    EXPECT_THROW(Config::loadFromString("fetch_timeout_seconds: -1", "/opt/tp"), std::runtime_error);
    EXPECT_THROW(Config::loadFromString("retry: {jitter: 2}", "/opt/tp"), std::runtime_error);
    EXPECT_THROW(Config::loadFromString("retry: {max_attempts: 0}", "/opt/tp"), std::runtime_error);
    EXPECT_THROW(Config::loadFromString("- a\n- b\n", "/opt/tp"), std::runtime_error);
    EXPECT_THROW(Config::loadFromString("install_root: [unclosed", "/opt/tp"), std::runtime_error);
}

TEST(ConfigTest, MissingFileFallsBackToDefaults)
{
    TempDir dir;
    Config config = Config::loadFromFile(dir / "absent.yaml");
    EXPECT_EQ(config.installRoot.string(), (Config::toolpackHome() / "toolchains").string());
}

TEST(ConfigTest, FileErrorsNameTheFile)
{
    TempDir dir;
    ToolpackTest::writeFile(dir / "config.yaml", "workers: 0\n");
    try {
        Config::loadFromFile(dir / "config.yaml");
        FAIL() << "expected a configuration error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("config.yaml"), std::string::npos);
    }
}
