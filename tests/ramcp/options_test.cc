#include <gtest/gtest.h>

#include <cstdlib>

#include "ramcp/options.h"
#include "test_support.h"

using namespace ramcp;
using server::Options;

TEST(OptionsTest, ParsesBothFlagForms) {
  const char* argv[] = {"ramcp", "--rust-analyzer", "/opt/ra", "--workspace=/src/crate",
                        "--timeout-ms", "900", "--no-log"};
  Options options;
  std::string error;
  ASSERT_TRUE(server::ParseArgs(7, argv, &options, &error)) << error;
  EXPECT_EQ(options.rust_analyzer_path, "/opt/ra");
  ASSERT_TRUE(options.workspace_root.has_value());
  EXPECT_EQ(options.workspace_root->string(), "/src/crate");
  EXPECT_EQ(options.request_timeout_ms, 900);
  EXPECT_TRUE(options.no_log);
  EXPECT_FALSE(options.show_help);
}

TEST(OptionsTest, RejectsBadInput) {
  Options options;
  std::string error;
  const char* unknown[] = {"ramcp", "--turbo", "1"};
  EXPECT_FALSE(server::ParseArgs(3, unknown, &options, &error));
  EXPECT_NE(error.find("--turbo"), std::string::npos);

  const char* missing[] = {"ramcp", "--config"};
  EXPECT_FALSE(server::ParseArgs(2, missing, &options, &error));

  const char* timeout[] = {"ramcp", "--timeout-ms=0"};
  EXPECT_FALSE(server::ParseArgs(2, timeout, &options, &error));
}

TEST(OptionsTest, CommandLineOverridesConfigFile) {
  testutil::TempDir dir;
  dir.Write("ramcp.toml",
            "rust_analyzer = \"/from/file\"\n"
            "request_timeout_ms = 1200\n"
            "diagnostics_wait_ms = 700\n");
  unsetenv("RAMCP_RUST_ANALYZER");
  unsetenv("RAMCP_WORKSPACE");
  Options options;
  options.workspace_root = dir.path();
  options.request_timeout_ms = 4000;
  options.log_path = "ramcp.log";

  Config config;
  std::filesystem::path config_dir;
  std::string error;
  ASSERT_TRUE(server::ResolveConfig(options, &config, &config_dir, &error)) << error;
  EXPECT_EQ(config.rust_analyzer_path, "/from/file");
  EXPECT_EQ(config.request_timeout_ms, 4000);
  EXPECT_EQ(config.diagnostics_wait_ms, 700);
  EXPECT_EQ(config.workspace_root.string(), dir.path().string());
  EXPECT_EQ(config_dir.string(), dir.path().string());
  EXPECT_EQ(config.log_enabled, true);
}

TEST(OptionsTest, ExplicitConfigMustExist) {
  testutil::TempDir dir;
  Options options;
  options.workspace_root = dir.path();
  options.config_path = dir.path() / "absent.toml";
  Config config;
  std::filesystem::path config_dir;
  std::string error;
  EXPECT_FALSE(server::ResolveConfig(options, &config, &config_dir, &error));
  EXPECT_FALSE(error.empty());
}

TEST(OptionsTest, WorkspaceFromConfigIsRelativeToIt) {
  testutil::TempDir dir;
  auto config_file = dir.Write("conf/ramcp.toml", "workspace = \"../crate\"\n");
  unsetenv("RAMCP_WORKSPACE");
  Options options;
  options.config_path = config_file;
  options.no_log = true;
  Config config;
  std::filesystem::path config_dir;
  std::string error;
  ASSERT_TRUE(server::ResolveConfig(options, &config, &config_dir, &error)) << error;
  EXPECT_EQ(config.workspace_root.string(), (dir.path() / "crate").string());
  EXPECT_EQ(config.log_enabled, false);
}
