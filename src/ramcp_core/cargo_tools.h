#ifndef RAMCP_CORE_CARGO_TOOLS_H_
#define RAMCP_CORE_CARGO_TOOLS_H_

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "ramcp_core/command_runner.h"
#include "ramcp_core/error.h"

namespace ramcp {

struct ToolPaths {
  std::string rustfmt = "rustfmt";
  std::string cargo = "cargo";
};

struct RustfmtResult {
  // True when `rustfmt --check` found nothing to change.
  bool already_formatted = false;
  bool rewritten = false;
  std::string output;
};

// Checks formatting and, unless `check_only`, rewrites the file in place.
CallResult<RustfmtResult> FormatWithRustfmt(const ToolPaths& tools,
                                            const std::filesystem::path& file, bool check_only);

// One `reason == "compiler-message"` record of cargo's JSON output.
struct CompilerMessage {
  std::string level;
  std::string code;
  std::string message;
  std::string file;
  int line = 0;
  int column = 0;
  std::string rendered;
};

struct CargoReport {
  bool success = false;
  int exit_code = -1;
  int error_count = 0;
  int warning_count = 0;
  // Lines reporting an automatic fix, only for clippy --fix.
  int fixes_applied = 0;
  std::vector<CompilerMessage> messages;
  std::string stderr_text;
};

std::optional<CompilerMessage> ParseCompilerMessageLine(std::string_view line);
// Counts levels and collects every compiler message of a whole stdout.
void CollectCompilerMessages(const std::string& stdout_text, CargoReport* report);

CallResult<CargoReport> RunCargoCheck(const ToolPaths& tools,
                                      const std::filesystem::path& workspace);
CallResult<CargoReport> RunClippy(const ToolPaths& tools, const std::filesystem::path& workspace,
                                  bool apply_fixes);

nlohmann::json ToJson(const RustfmtResult& result);
nlohmann::json ToJson(const CompilerMessage& message);
nlohmann::json ToJson(const CargoReport& report);

}  // namespace ramcp

#endif  // RAMCP_CORE_CARGO_TOOLS_H_
