#include <gtest/gtest.h>

#include "config/Config.hpp"
#include "util/errors.hpp"
#include "support.hpp"

#include <cstdlib>

using namespace mds;
using namespace mds::test;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override { test_dir = makeTestDir("config"); }
    void TearDown() override { fs::remove_all(test_dir); }
};

TEST_F(ConfigTest, MissingFileYieldsDefaults) {
    const auto cfg = config::loadConfig(test_dir / "absent.yaml");
    EXPECT_EQ(cfg.converter.binary, "pandoc");
    EXPECT_EQ(cfg.converter.timeout, std::chrono::seconds{120});
    EXPECT_EQ(cfg.sync.local_extension, ".md");
    EXPECT_EQ(cfg.sync.remote_extension, ".docx");
    EXPECT_EQ(cfg.sync.state_filename, ".mdsync_config.json");
    EXPECT_EQ(cfg.sync.workers, 1u);
    EXPECT_TRUE(cfg.logging.log_dir.empty());
}

TEST_F(ConfigTest, ReadsEverySection) {
    writeTextFile(test_dir / "config.yaml", R"(
logging:
  console_level: debug
  levels:
    sync: trace
converter:
  binary: /opt/pandoc/bin/pandoc
  timeout_seconds: 10
remote:
  timeout_seconds: 60
  drive:
    token_file: /etc/mdsync/token.json
sync:
  workers: 4
  local_extension: .markdown
git:
  binary: /usr/bin/git
)");

    const auto cfg = config::loadConfig(test_dir / "config.yaml");
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.sync, spdlog::level::trace);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.remote, spdlog::level::warn);
    EXPECT_EQ(cfg.converter.binary, "/opt/pandoc/bin/pandoc");
    EXPECT_EQ(cfg.converter.timeout, std::chrono::seconds{10});
    EXPECT_EQ(cfg.remote.timeout, std::chrono::seconds{60});
    EXPECT_EQ(cfg.remote.drive.token_file, fs::path("/etc/mdsync/token.json"));
    EXPECT_EQ(cfg.sync.workers, 4u);
    EXPECT_EQ(cfg.sync.local_extension, ".markdown");
    EXPECT_EQ(cfg.sync.remote_extension, ".docx");
    EXPECT_EQ(cfg.git.binary, "/usr/bin/git");
}

TEST_F(ConfigTest, UnknownLogLevelIsAConfigError) {
    writeTextFile(test_dir / "config.yaml", "logging:\n  console_level: loud\n");
    EXPECT_THROW((void)config::loadConfig(test_dir / "config.yaml"), ConfigError);
}

TEST_F(ConfigTest, MalformedYamlIsAConfigError) {
    writeTextFile(test_dir / "config.yaml", "sync: [unterminated\n");
    EXPECT_THROW((void)config::loadConfig(test_dir / "config.yaml"), ConfigError);
}

TEST_F(ConfigTest, IdenticalExtensionsAreRejected) {
    writeTextFile(test_dir / "config.yaml", "sync:\n  local_extension: .docx\n");
    EXPECT_THROW((void)config::loadConfig(test_dir / "config.yaml"), ConfigError);
}

TEST_F(ConfigTest, ExplicitOverrideWins) {
    ::setenv("MDSYNC_CONFIG", "/tmp/from-env.yaml", 1);
    EXPECT_EQ(config::resolveConfigPath(fs::path("/tmp/explicit.yaml")), fs::path("/tmp/explicit.yaml"));
    EXPECT_EQ(config::resolveConfigPath(), fs::path("/tmp/from-env.yaml"));
    ::unsetenv("MDSYNC_CONFIG");
}
