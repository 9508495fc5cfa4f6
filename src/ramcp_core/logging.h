#ifndef RAMCP_CORE_LOGGING_H_
#define RAMCP_CORE_LOGGING_H_

#include <filesystem>
#include <string>

namespace ramcp {

struct Config;

// Appends one line to the log file. Never writes to stdout.
void Log(const std::string& msg);
void UpdateLogConfig(const Config& config, const std::filesystem::path& config_dir);
std::string DefaultLogPath();

}  // namespace ramcp

#endif  // RAMCP_CORE_LOGGING_H_
