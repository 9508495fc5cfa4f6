#include "ramcp_core/logging.h"

#include <cstdlib>
#include <fstream>
#include <mutex>
#include <system_error>

#include "ramcp_core/config.h"
#include "ramcp_core/utils.h"

namespace fs = std::filesystem;

namespace ramcp {

namespace {
std::mutex g_log_mutex;
bool g_log_enabled = true;
std::string g_log_path;
}  // namespace

std::string DefaultLogPath() {
  static std::string path = []() {
    std::string dir;
    std::error_code ec;
    fs::path tmp_dir = fs::temp_directory_path(ec);
    if (!ec) {
      dir = tmp_dir.string();
    } else {
      const char* tmp = std::getenv("TMPDIR");
      if (!tmp || !*tmp) {
        tmp = std::getenv("TEMP");
      }
      if (!tmp || !*tmp) {
        tmp = std::getenv("TMP");
      }
      if (tmp && *tmp) {
        dir = tmp;
      }
    }
    if (dir.empty()) {
      dir = "/tmp";
    }
    return (fs::path(dir) / "ramcp.log").string();
  }();
  return path;
}

void Log(const std::string& msg) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (!g_log_enabled) {
    return;
  }
  const std::string& resolved_path = g_log_path.empty() ? DefaultLogPath() : g_log_path;
  static std::string current_path;
  static std::ofstream log_file;
  if (resolved_path != current_path) {
    if (log_file.is_open()) {
      log_file.close();
    }
    log_file.clear();
    log_file.open(resolved_path, std::ios::app);
    current_path = resolved_path;
  }
  if (log_file.is_open()) {
    log_file << msg << std::endl;
  }
}

void UpdateLogConfig(const Config& config, const fs::path& config_dir) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (config.log_enabled.has_value()) {
    g_log_enabled = *config.log_enabled;
  }
  if (config.log_path.has_value()) {
    fs::path resolved = ResolveConfigPath(*config.log_path, config_dir, config.workspace_root);
    g_log_path = resolved.empty() ? std::string() : resolved.string();
  }
}

}  // namespace ramcp
