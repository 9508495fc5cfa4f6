#include "ramcp_core/cargo_tools.h"

#include <sstream>
#include <utility>

#include "ramcp_core/logging.h"
#include "ramcp_core/utils.h"

namespace fs = std::filesystem;

namespace ramcp {

namespace {

using json = nlohmann::json;

bool CheckDirectory(const fs::path& dir, Error* error) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    SetError(error, ErrorCode::kFileAccess, "not a directory: " + dir.string());
    return false;
  }
  return true;
}

CallResult<CargoReport> RunCargo(const ToolPaths& tools, const fs::path& workspace,
                                 std::vector<std::string> args, bool count_fixes) {
  Error error;
  if (!CheckDirectory(workspace, &error)) {
    return CallResult<CargoReport>::Failure(error);
  }
  args.insert(args.begin(), tools.cargo);
  CommandResult command;
  if (!RunCommand(args, workspace, &command, &error)) {
    return CallResult<CargoReport>::Failure(error);
  }
  CargoReport report;
  report.exit_code = command.exit_code;
  report.success = command.exit_code == 0;
  report.stderr_text = command.stderr_text;
  CollectCompilerMessages(command.stdout_text, &report);
  if (count_fixes) {
    std::istringstream lines(command.stderr_text);
    std::string line;
    while (std::getline(lines, line)) {
      if (Trim(line).rfind("Fixed", 0) == 0) {
        ++report.fixes_applied;
      }
    }
  }
  return CallResult<CargoReport>::Success(std::move(report));
}

}  // namespace

CallResult<RustfmtResult> FormatWithRustfmt(const ToolPaths& tools, const fs::path& file,
                                            bool check_only) {
  std::error_code ec;
  if (!fs::is_regular_file(file, ec)) {
    return CallResult<RustfmtResult>::Failure(
        Error{ErrorCode::kFileAccess, "not a regular file: " + file.string(), 0});
  }
  Error error;
  CommandResult check;
  if (!RunCommand({tools.rustfmt, "--check", "--edition", "2021", file.string()},
                  file.parent_path(), &check, &error)) {
    return CallResult<RustfmtResult>::Failure(error);
  }
  RustfmtResult result;
  result.already_formatted = check.exit_code == 0;
  result.output = check.stdout_text + check.stderr_text;
  // Exit code 1 means "would reformat"; anything else is a rustfmt failure.
  if (check.exit_code != 0 && check.exit_code != 1) {
    return CallResult<RustfmtResult>::Failure(
        Error{ErrorCode::kBackendRejected, "rustfmt failed: " + Trim(check.stderr_text), 0});
  }
  if (check_only || result.already_formatted) {
    return CallResult<RustfmtResult>::Success(std::move(result));
  }

  CommandResult rewrite;
  if (!RunCommand({tools.rustfmt, "--edition", "2021", file.string()}, file.parent_path(),
                  &rewrite, &error)) {
    return CallResult<RustfmtResult>::Failure(error);
  }
  if (rewrite.exit_code != 0) {
    return CallResult<RustfmtResult>::Failure(
        Error{ErrorCode::kBackendRejected, "rustfmt failed: " + Trim(rewrite.stderr_text), 0});
  }
  result.rewritten = true;
  Log("rustfmt rewrote " + file.string());
  return CallResult<RustfmtResult>::Success(std::move(result));
}

std::optional<CompilerMessage> ParseCompilerMessageLine(std::string_view line) {
  json record = json::parse(line.begin(), line.end(), nullptr, false);
  if (record.is_discarded() || !record.is_object() ||
      record.value("reason", std::string()) != "compiler-message") {
    return std::nullopt;
  }
  auto message = record.find("message");
  if (message == record.end() || !message->is_object()) {
    return std::nullopt;
  }
  try {
    CompilerMessage out;
    out.level = message->value("level", std::string());
    out.message = message->value("message", std::string());
    auto rendered = message->find("rendered");
    if (rendered != message->end() && rendered->is_string()) {
      out.rendered = rendered->get<std::string>();
    }
    auto code = message->find("code");
    if (code != message->end() && code->is_object()) {
      out.code = code->value("code", std::string());
    }
    auto spans = message->find("spans");
    if (spans != message->end() && spans->is_array()) {
      const json* chosen = nullptr;
      for (const auto& span : *spans) {
        if (span.is_object() && span.value("is_primary", false)) {
          chosen = &span;
          break;
        }
      }
      if (!chosen && !spans->empty() && spans->front().is_object()) {
        chosen = &spans->front();
      }
      if (chosen) {
        out.file = chosen->value("file_name", std::string());
        out.line = chosen->value("line_start", 0);
        out.column = chosen->value("column_start", 0);
      }
    }
    return out;
  } catch (const json::exception& e) {
    Log(std::string("malformed compiler message: ") + e.what());
    return std::nullopt;
  }
}

void CollectCompilerMessages(const std::string& stdout_text, CargoReport* report) {
  std::istringstream lines(stdout_text);
  std::string line;
  while (std::getline(lines, line)) {
    if (line.empty() || line.front() != '{') {
      continue;
    }
    auto message = ParseCompilerMessageLine(line);
    if (!message) {
      continue;
    }
    if (message->level == "error") {
      ++report->error_count;
    } else if (message->level == "warning") {
      ++report->warning_count;
    }
    report->messages.push_back(std::move(*message));
  }
}

CallResult<CargoReport> RunCargoCheck(const ToolPaths& tools, const fs::path& workspace) {
  return RunCargo(tools, workspace, {"check", "--message-format=json"}, false);
}

CallResult<CargoReport> RunClippy(const ToolPaths& tools, const fs::path& workspace,
                                  bool apply_fixes) {
  std::vector<std::string> args = {"clippy"};
  if (apply_fixes) {
    args.push_back("--fix");
    args.push_back("--allow-dirty");
  }
  args.insert(args.end(), {"--all-targets", "--message-format=json", "--", "-W", "clippy::all"});
  return RunCargo(tools, workspace, std::move(args), apply_fixes);
}

json ToJson(const RustfmtResult& result) {
  return {{"already_formatted", result.already_formatted},
          {"rewritten", result.rewritten},
          {"output", result.output}};
}

json ToJson(const CompilerMessage& message) {
  json out = {{"level", message.level}, {"message", message.message}};
  if (!message.code.empty()) {
    out["code"] = message.code;
  }
  if (!message.file.empty()) {
    out["file"] = message.file;
    out["line"] = message.line;
    out["column"] = message.column;
  }
  if (!message.rendered.empty()) {
    out["rendered"] = message.rendered;
  }
  return out;
}

json ToJson(const CargoReport& report) {
  json messages = json::array();
  for (const auto& message : report.messages) {
    messages.push_back(ToJson(message));
  }
  json out = {{"success", report.success},
              {"exit_code", report.exit_code},
              {"errors", report.error_count},
              {"warnings", report.warning_count},
              {"messages", messages}};
  if (report.fixes_applied > 0) {
    out["fixes_applied"] = report.fixes_applied;
  }
  if (messages.empty() && !report.stderr_text.empty()) {
    out["stderr"] = report.stderr_text;
  }
  return out;
}

}  // namespace ramcp
