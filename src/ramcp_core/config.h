#ifndef RAMCP_CORE_CONFIG_H_
#define RAMCP_CORE_CONFIG_H_

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ramcp {

struct Config {
  std::string rust_analyzer_path = "rust-analyzer";
  std::vector<std::string> rust_analyzer_args;
  std::filesystem::path workspace_root;
  int request_timeout_ms = 30000;
  int shutdown_grace_ms = 2000;
  int diagnostics_wait_ms = 3000;
  std::optional<bool> log_enabled;
  std::optional<std::string> log_path;
  std::string rustfmt_path = "rustfmt";
  std::string cargo_path = "cargo";
};

constexpr const char kConfigFileName[] = "ramcp.toml";

// Overlays the keys found in `path` onto `config`.
bool ApplyConfigFile(const std::string& path, Config* config, std::string* error);
// Same, but a missing file is not an error.
void ApplyConfigIfExists(const std::string& path, Config* config);
// RAMCP_RUST_ANALYZER, RAMCP_WORKSPACE, RAMCP_LOG_PATH.
void ApplyEnvironment(Config* config);

}  // namespace ramcp

#endif  // RAMCP_CORE_CONFIG_H_
