#ifndef RAMCP_CORE_LSP_TYPES_H_
#define RAMCP_CORE_LSP_TYPES_H_

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ramcp {

using json = nlohmann::json;

struct Position {
  int line = 0;
  int character = 0;
};

struct Range {
  Position start;
  Position end;
};

struct Location {
  std::string uri;
  std::string path;
  Range range;
};

// `found` is false for a null or empty reply; true means `locations` is
// non-empty.
struct LocationList {
  bool found = false;
  std::vector<Location> locations;
};

struct SymbolInfo {
  std::string name;
  int kind = 0;
  std::string container;
  Location location;
};

struct TextEdit {
  Range range;
  std::string new_text;
};

// Both `changes` and `documentChanges` replies are flattened into `edits`.
// `possible` is false when the backend answered null.
struct WorkspaceEdit {
  bool possible = false;
  std::map<std::string, std::vector<TextEdit>> edits;
  std::vector<json> resource_operations;
};

struct CodeAction {
  std::string title;
  std::optional<std::string> kind;
  bool is_preferred = false;
  std::optional<std::string> disabled_reason;
  json raw;
};

struct Diagnostic {
  Range range;
  int severity = 0;
  std::string code;
  std::string source;
  std::string message;
};

struct DiagnosticsReport {
  std::string uri;
  std::optional<int> version;
  // False when no publish arrived for the current content within the wait.
  bool fresh = false;
  std::vector<Diagnostic> diagnostics;
};

json ToJson(const Position& position);
json ToJson(const Range& range);
json ToJson(const Location& location);
json ToJson(const LocationList& list);
json ToJson(const SymbolInfo& symbol);
json ToJson(const TextEdit& edit);
json ToJson(const WorkspaceEdit& edit);
json ToJson(const Diagnostic& diagnostic);
json ToJson(const DiagnosticsReport& report);

std::optional<Position> ParsePosition(const json& value);
std::optional<Range> ParseRange(const json& value);
// Accepts Location and LocationLink.
std::optional<Location> ParseLocation(const json& value);
// null, a single Location, Location[] or LocationLink[].
LocationList ParseLocationList(const json& result);
// SymbolInformation[] or WorkspaceSymbol[].
std::vector<SymbolInfo> ParseSymbols(const json& result);
std::optional<TextEdit> ParseTextEdit(const json& value);
std::vector<TextEdit> ParseTextEdits(const json& result);
WorkspaceEdit ParseWorkspaceEdit(const json& result);
// Plain Command entries are kept with no kind.
std::vector<CodeAction> ParseCodeActions(const json& result);
std::optional<Diagnostic> ParseDiagnostic(const json& value);
std::vector<Diagnostic> ParseDiagnostics(const json& array);

json MakeTextDocumentPositionParams(const std::string& uri, Position position);

// Position just past the last character of UTF-8 `text`, with the column in
// UTF-16 code units.
Position EndOfTextPosition(const std::string& text);

const char* SymbolKindName(int kind);
const char* SeverityName(int severity);

}  // namespace ramcp

#endif  // RAMCP_CORE_LSP_TYPES_H_
