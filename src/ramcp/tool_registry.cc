#include "ramcp/tool_registry.h"

#include <cstdint>
#include <utility>

#include "ramcp_core/logging.h"
#include "ramcp_core/manifest.h"
#include "ramcp_core/utils.h"

namespace fs = std::filesystem;

namespace ramcp::server {

namespace {

json Property(const char* type, const char* description) {
  return {{"type", type}, {"description", description}};
}

json Counter(const char* description) {
  return {{"type", "integer"},
          {"minimum", 0},
          {"maximum", INT32_MAX},
          {"description", description}};
}

json ObjectSchema(json properties, std::vector<std::string> required) {
  return {{"type", "object"}, {"properties", std::move(properties)}, {"required", required}};
}

json FileSchema() {
  return ObjectSchema({{"file_path", Property("string", "Rust source file")}}, {"file_path"});
}

json PositionSchema() {
  return ObjectSchema({{"file_path", Property("string", "Rust source file")},
                       {"line", Counter("Zero-based line")},
                       {"character", Counter("Zero-based UTF-16 column")}},
                      {"file_path", "line", "character"});
}

json WorkspaceSchema() {
  return ObjectSchema({{"workspace_path", Property("string", "Directory holding Cargo.toml")}},
                      {"workspace_path"});
}

Position ArgPosition(const json& arguments) {
  return Position{arguments.at("line").get<int>(), arguments.at("character").get<int>()};
}

template <typename T, typename Shape>
ToolOutcome FromResult(const CallResult<T>& result, Shape shape) {
  if (!result.ok()) {
    return ErrorOutcome(*result.error);
  }
  return ToolOutcome{false, shape(*result.value)};
}

template <typename T>
ToolOutcome FromResult(const CallResult<T>& result) {
  return FromResult(result, [](const T& value) { return ToJson(value); });
}

bool TypeMatches(const std::string& type, const json& value) {
  if (type == "string") return value.is_string();
  if (type == "integer") return value.is_number_integer();
  if (type == "number") return value.is_number();
  if (type == "boolean") return value.is_boolean();
  if (type == "array") return value.is_array();
  if (type == "object") return value.is_object();
  return true;
}

}  // namespace

ToolOutcome ErrorOutcome(const Error& error) {
  json payload = {{"error_code", ErrorCodeName(error.code)}, {"message", error.message}};
  if (error.code == ErrorCode::kBackendRejected) {
    payload["backend_code"] = error.backend_code;
  }
  return ToolOutcome{true, std::move(payload)};
}

ToolRegistry::ToolRegistry(ToolContext context) : context_(std::move(context)) {
  RegisterAnalyzerTools();
  RegisterCommandLineTools();
}

void ToolRegistry::Register(std::string name, std::string description, json schema,
                            Handler handler) {
  tools_.push_back(Tool{std::move(name), std::move(description), std::move(schema),
                        std::move(handler)});
}

fs::path ToolRegistry::ResolvePath(const json& arguments, const char* key) const {
  fs::path path(arguments.at(key).get<std::string>());
  if (path.is_relative() && !context_.workspace_root.empty()) {
    path = context_.workspace_root / path;
  }
  return NormalizePath(path);
}

void ToolRegistry::RegisterAnalyzerTools() {
  // Every analyzer tool goes through this guard first.
  auto with_analyzer = [this](auto body) {
    return [this, body](const json& arguments) -> ToolOutcome {
      if (!context_.analyzer) {
        return ErrorOutcome(
            Error{ErrorCode::kNotReady, "rust-analyzer is not running", 0});
      }
      return body(*context_.analyzer, arguments);
    };
  };

  Register("find_definition", "Find where the symbol at a position is defined",
           PositionSchema(), with_analyzer([this](RustAnalyzer& ra, const json& args) {
             return FromResult(
                 ra.FindDefinition(ResolvePath(args, "file_path").string(), ArgPosition(args)));
           }));

  json references_schema = PositionSchema();
  references_schema["properties"]["include_declaration"] =
      Property("boolean", "Include the declaration itself (default true)");
  Register("find_references", "Find all references to the symbol at a position",
           references_schema, with_analyzer([this](RustAnalyzer& ra, const json& args) {
             return FromResult(ra.FindReferences(ResolvePath(args, "file_path").string(),
                                                 ArgPosition(args),
                                                 args.value("include_declaration", true)));
           }));

  Register("get_diagnostics", "Get compiler diagnostics published for a file", FileSchema(),
           with_analyzer([this](RustAnalyzer& ra, const json& args) {
             return FromResult(ra.GetDiagnostics(ResolvePath(args, "file_path").string()));
           }));

  Register("workspace_symbols", "Search for symbols in the workspace",
           ObjectSchema({{"query", Property("string", "Symbol name or fragment")}}, {"query"}),
           with_analyzer([](RustAnalyzer& ra, const json& args) {
             return FromResult(ra.WorkspaceSymbols(args.at("query").get<std::string>()),
                               [](const std::vector<SymbolInfo>& symbols) {
                                 json out = json::array();
                                 for (const auto& symbol : symbols) {
                                   out.push_back(ToJson(symbol));
                                 }
                                 return json{{"symbols", out}};
                               });
           }));

  json rename_schema = PositionSchema();
  rename_schema["properties"]["new_name"] = Property("string", "New identifier");
  rename_schema["required"].push_back("new_name");
  Register("rename_symbol", "Compute the edits renaming the symbol at a position",
           rename_schema, with_analyzer([this](RustAnalyzer& ra, const json& args) {
             return FromResult(ra.RenameSymbol(ResolvePath(args, "file_path").string(),
                                               ArgPosition(args),
                                               args.at("new_name").get<std::string>()));
           }));

  Register(
      "extract_function", "List the extract refactorings available for a selection",
      ObjectSchema({{"file_path", Property("string", "Rust source file")},
                    {"start_line", Counter("Zero-based start line")},
                    {"start_character", Counter("Zero-based start column")},
                    {"end_line", Counter("Zero-based end line")},
                    {"end_character", Counter("Zero-based end column")},
                    {"function_name", Property("string", "Name wanted for the new function")}},
                   {"file_path", "start_line", "start_character", "end_line", "end_character"}),
      with_analyzer([this](RustAnalyzer& ra, const json& args) {
        Range range{Position{args.at("start_line").get<int>(),
                             args.at("start_character").get<int>()},
                    Position{args.at("end_line").get<int>(), args.at("end_character").get<int>()}};
        auto outcome =
            FromResult(ra.ExtractFunction(ResolvePath(args, "file_path").string(), range));
        if (!outcome.is_error && args.contains("function_name")) {
          // rust-analyzer names the function itself; the caller renames after.
          outcome.payload["requested_name"] = args["function_name"];
        }
        return outcome;
      }));

  Register("inline_function", "List the inline refactorings available at a position",
           PositionSchema(), with_analyzer([this](RustAnalyzer& ra, const json& args) {
             return FromResult(
                 ra.InlineFunction(ResolvePath(args, "file_path").string(), ArgPosition(args)));
           }));

  json signature_schema = PositionSchema();
  signature_schema["properties"]["new_signature"] =
      Property("string", "Desired signature, echoed back for the caller");
  Register("change_signature", "List the signature rewrites available at a position",
           signature_schema, with_analyzer([this](RustAnalyzer& ra, const json& args) {
             auto outcome = FromResult(
                 ra.ChangeSignature(ResolvePath(args, "file_path").string(), ArgPosition(args)));
             if (!outcome.is_error && args.contains("new_signature")) {
               outcome.payload["requested_signature"] = args["new_signature"];
             }
             return outcome;
           }));

  Register("organize_imports", "List the import organizing actions for a file", FileSchema(),
           with_analyzer([this](RustAnalyzer& ra, const json& args) {
             return FromResult(ra.OrganizeImports(ResolvePath(args, "file_path").string()));
           }));

  Register("validate_lifetimes", "Report lifetime and borrow checker diagnostics for a file",
           FileSchema(), with_analyzer([this](RustAnalyzer& ra, const json& args) {
             return FromResult(ra.ValidateLifetimes(ResolvePath(args, "file_path").string()));
           }));
}

void ToolRegistry::RegisterCommandLineTools() {
  json format_schema = FileSchema();
  format_schema["properties"]["check_only"] =
      Property("boolean", "Only report whether the file is formatted");
  format_schema["properties"]["via_analyzer"] =
      Property("boolean", "Return rust-analyzer formatting edits instead of running rustfmt");
  Register("format_code", "Format a file with rustfmt", format_schema,
           [this](const json& args) {
             fs::path file = ResolvePath(args, "file_path");
             if (!args.value("via_analyzer", false)) {
               return FromResult(
                   FormatWithRustfmt(context_.tools, file, args.value("check_only", false)));
             }
             if (!context_.analyzer) {
               return ErrorOutcome(
                   Error{ErrorCode::kNotReady, "rust-analyzer is not running", 0});
             }
             return FromResult(context_.analyzer->FormatDocument(file.string()),
                               [](const std::vector<TextEdit>& edits) {
                                 json out = json::array();
                                 for (const auto& edit : edits) {
                                   out.push_back(ToJson(edit));
                                 }
                                 return json{{"edits", out}};
                               });
           });

  Register("analyze_manifest", "Parse a Cargo.toml and list its package and dependencies",
           ObjectSchema({{"manifest_path", Property("string", "Cargo.toml or its directory")}},
                        {"manifest_path"}),
           [this](const json& args) {
             return FromResult(AnalyzeManifest(ResolvePath(args, "manifest_path")));
           });

  Register("run_cargo_check", "Run cargo check and collect compiler messages",
           WorkspaceSchema(), [this](const json& args) {
             return FromResult(RunCargoCheck(context_.tools, ResolvePath(args, "workspace_path")));
           });

  json clippy_schema = WorkspaceSchema();
  clippy_schema["properties"]["apply_fixes"] =
      Property("boolean", "Let clippy rewrite sources (default true)");
  Register("apply_clippy_suggestions", "Run clippy, applying its automatic fixes",
           clippy_schema, [this](const json& args) {
             return FromResult(RunClippy(context_.tools, ResolvePath(args, "workspace_path"),
                                         args.value("apply_fixes", true)));
           });
}

const ToolRegistry::Tool* ToolRegistry::Find(const std::string& name) const {
  for (const auto& tool : tools_) {
    if (tool.name == name) {
      return &tool;
    }
  }
  return nullptr;
}

bool ToolRegistry::HasTool(const std::string& name) const { return Find(name) != nullptr; }

json ToolRegistry::ListTools() const {
  json tools = json::array();
  for (const auto& tool : tools_) {
    tools.push_back({{"name", tool.name},
                     {"description", tool.description},
                     {"inputSchema", tool.input_schema}});
  }
  return {{"tools", tools}};
}

bool ToolRegistry::ValidateArguments(const json& schema, const json& arguments, Error* error) {
  if (!arguments.is_object()) {
    SetError(error, ErrorCode::kInvalidParams, "arguments must be an object");
    return false;
  }
  for (const auto& key : schema.value("required", json::array())) {
    if (!arguments.contains(key.get<std::string>())) {
      SetError(error, ErrorCode::kInvalidParams,
               "missing required argument: " + key.get<std::string>());
      return false;
    }
  }
  const json properties = schema.value("properties", json::object());
  for (const auto& [key, value] : arguments.items()) {
    auto property = properties.find(key);
    if (property == properties.end()) {
      continue;
    }
    const std::string type = property->value("type", std::string());
    if (!TypeMatches(type, value)) {
      SetError(error, ErrorCode::kInvalidParams, "argument " + key + " must be " + type);
      return false;
    }
    if (property->contains("minimum") && value.is_number() &&
        value.get<double>() < (*property)["minimum"].get<double>()) {
      SetError(error, ErrorCode::kInvalidParams, "argument " + key + " must not be negative");
      return false;
    }
    if (property->contains("maximum") && value.is_number() &&
        value.get<double>() > (*property)["maximum"].get<double>()) {
      SetError(error, ErrorCode::kInvalidParams,
               "argument " + key + " must be at most " + (*property)["maximum"].dump());
      return false;
    }
  }
  return true;
}

json ToolRegistry::CallTool(const std::string& name, const json& arguments) const {
  ToolOutcome outcome;
  const Tool* tool = Find(name);
  Error error;
  if (!tool) {
    outcome = ErrorOutcome(Error{ErrorCode::kInvalidParams, "unknown tool: " + name, 0});
  } else if (!ValidateArguments(tool->input_schema, arguments, &error)) {
    outcome = ErrorOutcome(error);
  } else {
    Log("tool " + name + " " + arguments.dump());
    try {
      outcome = tool->handler(arguments);
    } catch (const json::exception& e) {
      outcome = ErrorOutcome(Error{ErrorCode::kInvalidParams, e.what(), 0});
    }
  }

  std::string text;
  if (outcome.is_error) {
    text = outcome.payload.value("error_code", std::string()) + ": " +
           outcome.payload.value("message", std::string());
    Log("tool " + name + " failed: " + text);
  } else {
    text = outcome.payload.dump(2, ' ', false, json::error_handler_t::replace);
  }
  return {{"content", json::array({{{"type", "text"}, {"text", text}}})},
          {"structuredContent", outcome.payload},
          {"isError", outcome.is_error}};
}

}  // namespace ramcp::server
