#include "ramcp_core/config.h"

#include <cstdlib>
#include <fstream>
#include <utility>

#include "ramcp_core/logging.h"
#include "ramcp_core/toml_subset.h"

namespace ramcp {
namespace {

void ApplyPositiveInt(const TomlEntry& entry, int* out) {
  auto parsed = ParseInt(entry.value);
  if (parsed.has_value() && *parsed > 0) {
    *out = *parsed;
  } else {
    Log("config: ignoring " + entry.key + " at line " + std::to_string(entry.line));
  }
}

}  // namespace

bool ApplyConfigFile(const std::string& path, Config* config, std::string* error) {
  std::vector<TomlEntry> entries;
  std::string read_error;
  if (!ParseTomlFile(path, &entries, &read_error)) {
    if (error) {
      *error = "Unable to open config: " + read_error;
    }
    return false;
  }

  for (const auto& entry : entries) {
    const std::string& key = entry.key;
    if (key == "rust_analyzer" || key == "rust_analyzer_path") {
      config->rust_analyzer_path = ParseStringValue(entry.value);
    } else if (key == "rust_analyzer_args") {
      config->rust_analyzer_args = ParseStringArray(entry.value);
    } else if (key == "workspace" || key == "workspace_root") {
      config->workspace_root = ParseStringValue(entry.value);
    } else if (key == "request_timeout_ms") {
      ApplyPositiveInt(entry, &config->request_timeout_ms);
    } else if (key == "shutdown_grace_ms") {
      ApplyPositiveInt(entry, &config->shutdown_grace_ms);
    } else if (key == "diagnostics_wait_ms") {
      ApplyPositiveInt(entry, &config->diagnostics_wait_ms);
    } else if (key == "log_enabled") {
      config->log_enabled = ParseBool(entry.value);
    } else if (key == "log_path") {
      config->log_path = ParseStringValue(entry.value);
    } else if (key == "rustfmt" || key == "rustfmt_path") {
      config->rustfmt_path = ParseStringValue(entry.value);
    } else if (key == "cargo" || key == "cargo_path") {
      config->cargo_path = ParseStringValue(entry.value);
    }
  }
  return true;
}

void ApplyConfigIfExists(const std::string& path, Config* config) {
  std::ifstream file(path);
  if (!file.good()) {
    return;
  }
  file.close();
  std::string error;
  if (!ApplyConfigFile(path, config, &error)) {
    Log(error);
  }
}

void ApplyEnvironment(Config* config) {
  if (const char* value = std::getenv("RAMCP_RUST_ANALYZER"); value && *value) {
    config->rust_analyzer_path = value;
  }
  if (const char* value = std::getenv("RAMCP_WORKSPACE"); value && *value) {
    config->workspace_root = value;
  }
  if (const char* value = std::getenv("RAMCP_LOG_PATH"); value && *value) {
    config->log_path = std::string(value);
  }
}

}  // namespace ramcp
