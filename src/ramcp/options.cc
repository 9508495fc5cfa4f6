#include "ramcp/options.h"

#include <cstdlib>
#include <iostream>

#include "ramcp_core/toml_subset.h"
#include "ramcp_core/utils.h"

namespace fs = std::filesystem;

namespace ramcp::server {

void PrintUsage(const char* name) {
  std::cerr << "Usage: " << name << " [options]\n\n"
            << "Serves rust-analyzer operations as MCP tools over stdio.\n\n"
            << "Options:\n"
            << "  --rust-analyzer <path>  rust-analyzer executable (default: PATH lookup)\n"
            << "  --workspace <dir>       Cargo workspace root (default: current directory)\n"
            << "  --config <path>         Config file (default: <workspace>/ramcp.toml)\n"
            << "  --timeout-ms <n>        Per-request timeout in milliseconds\n"
            << "  --log <path>            Log file (default: <tmp>/ramcp.log)\n"
            << "  --no-log                Disable logging\n"
            << "  -h, --help              Show help\n";
}

bool ParseArgs(int argc, const char* argv[], Options* options, std::string* error) {
  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    if (arg == "--help" || arg == "-h") {
      options->show_help = true;
      continue;
    }
    if (arg == "--no-log") {
      options->no_log = true;
      continue;
    }
    // Every remaining flag takes a value, as `--flag value` or `--flag=value`.
    std::string value;
    std::string flag = arg;
    size_t equals = arg.find('=');
    if (arg.rfind("--", 0) == 0 && equals != std::string::npos) {
      flag = arg.substr(0, equals);
      value = arg.substr(equals + 1);
    } else if (i + 1 < argc) {
      value = argv[++i];
    } else {
      if (error) *error = "missing value for " + arg;
      return false;
    }

    if (flag == "--rust-analyzer") {
      options->rust_analyzer_path = value;
    } else if (flag == "--workspace") {
      options->workspace_root = fs::path(value);
    } else if (flag == "--config") {
      options->config_path = fs::path(value);
    } else if (flag == "--timeout-ms") {
      auto parsed = ParseInt(value);
      if (!parsed.has_value() || *parsed <= 0) {
        if (error) *error = "invalid --timeout-ms: " + value;
        return false;
      }
      options->request_timeout_ms = *parsed;
    } else if (flag == "--log") {
      options->log_path = value;
    } else {
      if (error) *error = "unknown option: " + arg;
      return false;
    }
  }
  return true;
}

bool ResolveConfig(const Options& options, Config* config, fs::path* config_dir,
                   std::string* error) {
  fs::path workspace;
  if (options.workspace_root.has_value()) {
    workspace = *options.workspace_root;
  } else if (const char* env = std::getenv("RAMCP_WORKSPACE"); env && *env) {
    workspace = env;
  } else {
    std::error_code ec;
    workspace = fs::current_path(ec);
  }
  workspace = AbsoluteDocumentPath(workspace.string());

  if (options.config_path.has_value()) {
    if (!ApplyConfigFile(options.config_path->string(), config, error)) {
      return false;
    }
    *config_dir = AbsoluteDocumentPath(options.config_path->string()).parent_path();
  } else {
    fs::path candidate = workspace / kConfigFileName;
    ApplyConfigIfExists(candidate.string(), config);
    *config_dir = workspace;
  }
  ApplyEnvironment(config);

  if (options.rust_analyzer_path.has_value()) {
    config->rust_analyzer_path = *options.rust_analyzer_path;
  }
  if (options.workspace_root.has_value() || config->workspace_root.empty()) {
    config->workspace_root = workspace;
  } else if (config->workspace_root.is_relative()) {
    config->workspace_root = NormalizePath(*config_dir / config->workspace_root);
  }
  if (options.request_timeout_ms.has_value()) {
    config->request_timeout_ms = *options.request_timeout_ms;
  }
  if (options.log_path.has_value()) {
    config->log_path = *options.log_path;
    config->log_enabled = true;
  }
  if (options.no_log) {
    config->log_enabled = false;
  }
  return true;
}

}  // namespace ramcp::server
