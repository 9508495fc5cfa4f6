#ifndef RAMCP_TOOL_REGISTRY_H_
#define RAMCP_TOOL_REGISTRY_H_

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ramcp_core/cargo_tools.h"
#include "ramcp_core/error.h"
#include "ramcp_core/rust_analyzer.h"

namespace ramcp::server {

using json = nlohmann::json;

struct ToolContext {
  // Null when the backend never started; analyzer tools then report
  // kNotReady.
  RustAnalyzer* analyzer = nullptr;
  ToolPaths tools;
  // Relative paths in tool arguments resolve against this.
  std::filesystem::path workspace_root;
};

// MCP tool call outcome: `payload` is the shaped result, or the error.
struct ToolOutcome {
  bool is_error = false;
  json payload;
};

class ToolRegistry {
 public:
  using Handler = std::function<ToolOutcome(const json& arguments)>;

  explicit ToolRegistry(ToolContext context);

  bool HasTool(const std::string& name) const;
  // `tools/list` result.
  json ListTools() const;
  // `tools/call` result: text content, structuredContent and isError.
  json CallTool(const std::string& name, const json& arguments) const;

  // Checks required keys and primitive types against the tool's schema.
  static bool ValidateArguments(const json& schema, const json& arguments, Error* error);

 private:
  struct Tool {
    std::string name;
    std::string description;
    json input_schema;
    Handler handler;
  };

  void Register(std::string name, std::string description, json schema, Handler handler);
  void RegisterAnalyzerTools();
  void RegisterCommandLineTools();
  const Tool* Find(const std::string& name) const;
  std::filesystem::path ResolvePath(const json& arguments, const char* key) const;

  ToolContext context_;
  std::vector<Tool> tools_;
};

ToolOutcome ErrorOutcome(const Error& error);

}  // namespace ramcp::server

#endif  // RAMCP_TOOL_REGISTRY_H_
