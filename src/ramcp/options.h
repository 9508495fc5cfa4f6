#ifndef RAMCP_OPTIONS_H_
#define RAMCP_OPTIONS_H_

#include <filesystem>
#include <optional>
#include <string>

#include "ramcp_core/config.h"

namespace ramcp::server {

// Command-line flags. Anything left unset falls back to ramcp.toml, the
// environment, then built-in defaults.
struct Options {
  std::optional<std::string> rust_analyzer_path;
  std::optional<std::filesystem::path> workspace_root;
  std::optional<std::filesystem::path> config_path;
  std::optional<int> request_timeout_ms;
  std::optional<std::string> log_path;
  bool no_log = false;
  bool show_help = false;
};

void PrintUsage(const char* name);
// False on an unknown flag or a flag missing its value.
bool ParseArgs(int argc, const char* argv[], Options* options, std::string* error);

// Defaults, then the config file, then the environment, then `options`.
bool ResolveConfig(const Options& options, Config* config, std::filesystem::path* config_dir,
                   std::string* error);

}  // namespace ramcp::server

#endif  // RAMCP_OPTIONS_H_
