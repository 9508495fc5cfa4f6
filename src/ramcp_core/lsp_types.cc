#include "ramcp_core/lsp_types.h"

#include "ramcp_core/utils.h"

namespace ramcp {

json ToJson(const Position& position) {
  return {{"line", position.line}, {"character", position.character}};
}

json ToJson(const Range& range) {
  return {{"start", ToJson(range.start)}, {"end", ToJson(range.end)}};
}

json ToJson(const Location& location) {
  return {{"uri", location.uri}, {"path", location.path}, {"range", ToJson(location.range)}};
}

json ToJson(const LocationList& list) {
  json locations = json::array();
  for (const auto& location : list.locations) {
    locations.push_back(ToJson(location));
  }
  return {{"found", list.found}, {"locations", locations}};
}

json ToJson(const SymbolInfo& symbol) {
  json out = {
      {"name", symbol.name},
      {"kind", SymbolKindName(symbol.kind)},
      {"location", ToJson(symbol.location)},
  };
  if (!symbol.container.empty()) {
    out["container"] = symbol.container;
  }
  return out;
}

json ToJson(const TextEdit& edit) {
  return {{"range", ToJson(edit.range)}, {"newText", edit.new_text}};
}

json ToJson(const WorkspaceEdit& edit) {
  json files = json::object();
  for (const auto& [uri, edits] : edit.edits) {
    json list = json::array();
    for (const auto& text_edit : edits) {
      list.push_back(ToJson(text_edit));
    }
    files[uri] = list;
  }
  json out = {{"possible", edit.possible}, {"edits", files}};
  if (!edit.resource_operations.empty()) {
    out["resourceOperations"] = edit.resource_operations;
  }
  return out;
}

json ToJson(const Diagnostic& diagnostic) {
  json out = {
      {"range", ToJson(diagnostic.range)},
      {"severity", SeverityName(diagnostic.severity)},
      {"message", diagnostic.message},
  };
  if (!diagnostic.code.empty()) {
    out["code"] = diagnostic.code;
  }
  if (!diagnostic.source.empty()) {
    out["source"] = diagnostic.source;
  }
  return out;
}

json ToJson(const DiagnosticsReport& report) {
  json diagnostics = json::array();
  for (const auto& diagnostic : report.diagnostics) {
    diagnostics.push_back(ToJson(diagnostic));
  }
  json out = {
      {"uri", report.uri},
      {"fresh", report.fresh},
      {"diagnostics", diagnostics},
  };
  if (report.version.has_value()) {
    out["version"] = *report.version;
  }
  return out;
}

std::optional<Position> ParsePosition(const json& value) {
  if (!value.is_object()) {
    return std::nullopt;
  }
  auto line = value.find("line");
  auto character = value.find("character");
  if (line == value.end() || character == value.end() || !line->is_number_integer() ||
      !character->is_number_integer()) {
    return std::nullopt;
  }
  return Position{line->get<int>(), character->get<int>()};
}

std::optional<Range> ParseRange(const json& value) {
  if (!value.is_object()) {
    return std::nullopt;
  }
  auto start = ParsePosition(value.value("start", json()));
  auto end = ParsePosition(value.value("end", json()));
  if (!start.has_value() || !end.has_value()) {
    return std::nullopt;
  }
  return Range{*start, *end};
}

std::optional<Location> ParseLocation(const json& value) {
  if (!value.is_object()) {
    return std::nullopt;
  }
  Location location;
  std::optional<Range> range;
  if (value.contains("targetUri")) {
    location.uri = value.value("targetUri", "");
    range = ParseRange(value.value("targetSelectionRange", json()));
    if (!range.has_value()) {
      range = ParseRange(value.value("targetRange", json()));
    }
  } else {
    location.uri = value.value("uri", "");
    range = ParseRange(value.value("range", json()));
  }
  if (location.uri.empty() || !range.has_value()) {
    return std::nullopt;
  }
  location.path = UriToPath(location.uri);
  location.range = *range;
  return location;
}

LocationList ParseLocationList(const json& result) {
  LocationList list;
  if (result.is_object()) {
    if (auto location = ParseLocation(result)) {
      list.locations.push_back(std::move(*location));
    }
  } else if (result.is_array()) {
    for (const auto& item : result) {
      if (auto location = ParseLocation(item)) {
        list.locations.push_back(std::move(*location));
      }
    }
  }
  list.found = !list.locations.empty();
  return list;
}

std::vector<SymbolInfo> ParseSymbols(const json& result) {
  std::vector<SymbolInfo> symbols;
  if (!result.is_array()) {
    return symbols;
  }
  for (const auto& item : result) {
    if (!item.is_object()) {
      continue;
    }
    SymbolInfo symbol;
    symbol.name = item.value("name", "");
    symbol.kind = item.value("kind", 0);
    symbol.container = item.value("containerName", "");
    const json location = item.value("location", json());
    if (auto parsed = ParseLocation(location)) {
      symbol.location = std::move(*parsed);
    } else if (location.is_object()) {
      // WorkspaceSymbol with a uri-only location.
      symbol.location.uri = location.value("uri", "");
      symbol.location.path = UriToPath(symbol.location.uri);
    }
    if (!symbol.name.empty()) {
      symbols.push_back(std::move(symbol));
    }
  }
  return symbols;
}

std::optional<TextEdit> ParseTextEdit(const json& value) {
  if (!value.is_object()) {
    return std::nullopt;
  }
  auto range = ParseRange(value.value("range", json()));
  if (!range.has_value()) {
    return std::nullopt;
  }
  auto text = value.find("newText");
  if (text == value.end() || !text->is_string()) {
    return std::nullopt;
  }
  return TextEdit{*range, text->get<std::string>()};
}

std::vector<TextEdit> ParseTextEdits(const json& result) {
  std::vector<TextEdit> edits;
  if (!result.is_array()) {
    return edits;
  }
  for (const auto& item : result) {
    if (auto edit = ParseTextEdit(item)) {
      edits.push_back(std::move(*edit));
    }
  }
  return edits;
}

WorkspaceEdit ParseWorkspaceEdit(const json& result) {
  WorkspaceEdit edit;
  if (!result.is_object()) {
    return edit;
  }
  edit.possible = true;
  auto changes = result.find("changes");
  if (changes != result.end() && changes->is_object()) {
    for (const auto& [uri, list] : changes->items()) {
      auto parsed = ParseTextEdits(list);
      auto& target = edit.edits[uri];
      target.insert(target.end(), parsed.begin(), parsed.end());
    }
  }
  auto document_changes = result.find("documentChanges");
  if (document_changes != result.end() && document_changes->is_array()) {
    for (const auto& change : *document_changes) {
      if (!change.is_object()) {
        continue;
      }
      if (change.contains("kind")) {
        // create / rename / delete file operations.
        edit.resource_operations.push_back(change);
        continue;
      }
      const json document = change.value("textDocument", json::object());
      std::string uri = document.is_object() ? document.value("uri", "") : "";
      if (uri.empty()) {
        continue;
      }
      auto parsed = ParseTextEdits(change.value("edits", json::array()));
      auto& target = edit.edits[uri];
      target.insert(target.end(), parsed.begin(), parsed.end());
    }
  }
  return edit;
}

std::vector<CodeAction> ParseCodeActions(const json& result) {
  std::vector<CodeAction> actions;
  if (!result.is_array()) {
    return actions;
  }
  for (const auto& item : result) {
    if (!item.is_object()) {
      continue;
    }
    CodeAction action;
    action.title = item.value("title", "");
    auto kind = item.find("kind");
    if (kind != item.end() && kind->is_string()) {
      action.kind = kind->get<std::string>();
    }
    action.is_preferred = item.value("isPreferred", false);
    auto disabled = item.find("disabled");
    if (disabled != item.end() && disabled->is_object()) {
      action.disabled_reason = disabled->value("reason", "");
    }
    action.raw = item;
    actions.push_back(std::move(action));
  }
  return actions;
}

std::optional<Diagnostic> ParseDiagnostic(const json& value) {
  if (!value.is_object()) {
    return std::nullopt;
  }
  auto range = ParseRange(value.value("range", json()));
  if (!range.has_value()) {
    return std::nullopt;
  }
  Diagnostic diagnostic;
  diagnostic.range = *range;
  diagnostic.severity = value.value("severity", 0);
  diagnostic.message = value.value("message", "");
  diagnostic.source = value.value("source", "");
  auto code = value.find("code");
  if (code != value.end()) {
    if (code->is_string()) {
      diagnostic.code = code->get<std::string>();
    } else if (code->is_number_integer()) {
      diagnostic.code = std::to_string(code->get<int64_t>());
    }
  }
  return diagnostic;
}

std::vector<Diagnostic> ParseDiagnostics(const json& array) {
  std::vector<Diagnostic> diagnostics;
  if (!array.is_array()) {
    return diagnostics;
  }
  for (const auto& item : array) {
    if (auto diagnostic = ParseDiagnostic(item)) {
      diagnostics.push_back(std::move(*diagnostic));
    }
  }
  return diagnostics;
}

json MakeTextDocumentPositionParams(const std::string& uri, Position position) {
  return {
      {"textDocument", {{"uri", uri}}},
      {"position", ToJson(position)},
  };
}

Position EndOfTextPosition(const std::string& text) {
  Position end;
  for (unsigned char c : text) {
    if (c == '\n') {
      ++end.line;
      end.character = 0;
    } else if ((c & 0xC0) == 0x80) {
      // Continuation byte.
    } else if (c >= 0xF0) {
      // Outside the BMP: a surrogate pair.
      end.character += 2;
    } else {
      ++end.character;
    }
  }
  return end;
}

const char* SymbolKindName(int kind) {
  static const char* const kNames[] = {
      "Unknown",  "File",     "Module",      "Namespace", "Package",  "Class",
      "Method",   "Property", "Field",       "Constructor", "Enum",   "Interface",
      "Function", "Variable", "Constant",    "String",    "Number",   "Boolean",
      "Array",    "Object",   "Key",         "Null",      "EnumMember", "Struct",
      "Event",    "Operator", "TypeParameter",
  };
  if (kind < 0 || kind >= static_cast<int>(sizeof(kNames) / sizeof(kNames[0]))) {
    return "Unknown";
  }
  return kNames[kind];
}

const char* SeverityName(int severity) {
  switch (severity) {
    case 1:
      return "error";
    case 2:
      return "warning";
    case 3:
      return "information";
    case 4:
      return "hint";
    default:
      return "unknown";
  }
}

}  // namespace ramcp
