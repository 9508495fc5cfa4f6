#include <gtest/gtest.h>

#include <cstdlib>

#include "ramcp_core/config.h"
#include "ramcp_core/toml_subset.h"
#include "test_support.h"

using namespace ramcp;

TEST(TomlSubsetTest, TracksSectionsAndLines) {
  auto entries = ParseTomlText(
      "# leading comment\n"
      "top = 1\n"
      "[server]\n"
      "name = \"x # y\"  # trailing\n"
      "list = [\n"
      "  \"a\",\n"
      "  \"b\",\n"
      "]\n");
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0].section, "");
  EXPECT_EQ(entries[0].line, 2);
  EXPECT_EQ(entries[1].section, "server");
  EXPECT_EQ(ParseStringValue(entries[1].value), "x # y");
  EXPECT_EQ(ParseStringArray(entries[2].value), (std::vector<std::string>{"a", "b"}));
}

TEST(TomlSubsetTest, ScalarParsers) {
  EXPECT_EQ(ParseInt("42"), 42);
  EXPECT_EQ(ParseInt("0x10"), 16);
  EXPECT_FALSE(ParseInt("12ms").has_value());
  EXPECT_EQ(ParseBool("true"), true);
  EXPECT_EQ(ParseBool("off"), false);
  EXPECT_FALSE(ParseBool("maybe").has_value());
  EXPECT_EQ(ParseStringValue("'literal\\n'"), "literal\\n");
  EXPECT_EQ(ParseStringValue("\"tab\\there\""), "tab\there");
}

TEST(TomlSubsetTest, InlineTablesKeepNestedValues) {
  auto pairs = ParseInlineTable(R"({ version = "1", features = ["a", "b"], optional = true })");
  ASSERT_EQ(pairs.size(), 3u);
  EXPECT_EQ(pairs[1].first, "features");
  EXPECT_EQ(pairs[1].second, R"(["a", "b"])");
  EXPECT_TRUE(ParseInlineTable("not a table").empty());
}

TEST(ConfigTest, AppliesFileKeys) {
  testutil::TempDir dir;
  auto path = dir.Write("ramcp.toml",
                        "rust_analyzer = \"/opt/ra/bin/rust-analyzer\"\n"
                        "rust_analyzer_args = [\"--log-file\", \"/tmp/ra.log\"]\n"
                        "request_timeout_ms = 1500\n"
                        "shutdown_grace_ms = -5\n"
                        "diagnostics_wait_ms = 250\n"
                        "log_enabled = false\n"
                        "[tools]\n"
                        "cargo = \"/usr/local/bin/cargo\"\n");
  Config config;
  std::string error;
  ASSERT_TRUE(ApplyConfigFile(path.string(), &config, &error)) << error;
  EXPECT_EQ(config.rust_analyzer_path, "/opt/ra/bin/rust-analyzer");
  EXPECT_EQ(config.rust_analyzer_args.size(), 2u);
  EXPECT_EQ(config.request_timeout_ms, 1500);
  // Invalid values keep the default.
  EXPECT_EQ(config.shutdown_grace_ms, 2000);
  EXPECT_EQ(config.diagnostics_wait_ms, 250);
  EXPECT_EQ(config.log_enabled, false);
  EXPECT_EQ(config.cargo_path, "/usr/local/bin/cargo");
  EXPECT_EQ(config.rustfmt_path, "rustfmt");
}

TEST(ConfigTest, MissingFileIsErrorOnlyWhenRequired) {
  testutil::TempDir dir;
  Config config;
  std::string error;
  EXPECT_FALSE(ApplyConfigFile((dir.path() / "ramcp.toml").string(), &config, &error));
  EXPECT_NE(error.find("Unable to open config"), std::string::npos);

  ApplyConfigIfExists((dir.path() / "ramcp.toml").string(), &config);
  EXPECT_EQ(config.rust_analyzer_path, "rust-analyzer");
}

TEST(ConfigTest, EnvironmentOverridesFile) {
  Config config;
  config.rust_analyzer_path = "/from/file";
  setenv("RAMCP_RUST_ANALYZER", "/from/env", 1);
  setenv("RAMCP_LOG_PATH", "/tmp/ramcp-env.log", 1);
  unsetenv("RAMCP_WORKSPACE");
  ApplyEnvironment(&config);
  unsetenv("RAMCP_RUST_ANALYZER");
  unsetenv("RAMCP_LOG_PATH");
  EXPECT_EQ(config.rust_analyzer_path, "/from/env");
  EXPECT_EQ(config.log_path, "/tmp/ramcp-env.log");
  EXPECT_TRUE(config.workspace_root.empty());
}
