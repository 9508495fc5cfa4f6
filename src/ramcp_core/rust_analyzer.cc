#include "ramcp_core/rust_analyzer.h"

#include <algorithm>
#include <utility>

#include "ramcp_core/logging.h"
#include "ramcp_core/utils.h"

namespace ramcp {

namespace {

json DocumentParams(const std::string& uri) { return {{"textDocument", {{"uri", uri}}}}; }

template <typename T>
CallResult<T> ShapeFailure(const std::string& method, const json::exception& e) {
  return CallResult<T>::Failure(
      Error{ErrorCode::kBackendRejected, "unexpected " + method + " reply: " + e.what(), 0});
}

}  // namespace

const std::vector<std::string>& LifetimeErrorCodes() {
  static const std::vector<std::string> codes = {
      "E0106", "E0261", "E0262", "E0263", "E0495", "E0499", "E0502",
      "E0505", "E0506", "E0597", "E0621", "E0700", "E0716"};
  return codes;
}

bool IsLifetimeDiagnostic(const Diagnostic& diagnostic) {
  const auto& codes = LifetimeErrorCodes();
  if (std::find(codes.begin(), codes.end(), diagnostic.code) != codes.end()) {
    return true;
  }
  return ContainsIgnoreCase(diagnostic.message, "lifetime") ||
         ContainsIgnoreCase(diagnostic.message, "borrow");
}

RustAnalyzer::RustAnalyzer(ProtocolClient* client, std::chrono::milliseconds diagnostics_wait)
    : client_(client), diagnostics_wait_(diagnostics_wait) {}

bool RustAnalyzer::Prepare(const std::string& file, std::string* uri, SyncAction* action,
                           Error* error) {
  if (!client_->IsReady()) {
    SetError(error,
             client_->state() == SessionState::kTerminated ? ErrorCode::kConnectionClosed
                                                           : ErrorCode::kNotReady,
             std::string("rust-analyzer session is ") + SessionStateName(client_->state()));
    return false;
  }
  if (file.empty()) {
    SetError(error, ErrorCode::kInvalidParams, "file path is empty");
    return false;
  }
  return client_->SyncDocument(file, uri, action, error);
}

CallResult<LocationList> RustAnalyzer::FindDefinition(const std::string& file,
                                                      Position position) {
  Error error;
  std::string uri;
  if (!Prepare(file, &uri, nullptr, &error)) {
    return CallResult<LocationList>::Failure(error);
  }
  auto result = client_->Request("textDocument/definition",
                                 MakeTextDocumentPositionParams(uri, position), &error);
  if (!result) {
    return CallResult<LocationList>::Failure(error);
  }
  try {
    return CallResult<LocationList>::Success(ParseLocationList(*result));
  } catch (const json::exception& e) {
    return ShapeFailure<LocationList>("definition", e);
  }
}

CallResult<LocationList> RustAnalyzer::FindReferences(const std::string& file, Position position,
                                                      bool include_declaration) {
  Error error;
  std::string uri;
  if (!Prepare(file, &uri, nullptr, &error)) {
    return CallResult<LocationList>::Failure(error);
  }
  json params = MakeTextDocumentPositionParams(uri, position);
  params["context"] = {{"includeDeclaration", include_declaration}};
  auto result = client_->Request("textDocument/references", params, &error);
  if (!result) {
    return CallResult<LocationList>::Failure(error);
  }
  try {
    return CallResult<LocationList>::Success(ParseLocationList(*result));
  } catch (const json::exception& e) {
    return ShapeFailure<LocationList>("references", e);
  }
}

CallResult<std::vector<SymbolInfo>> RustAnalyzer::WorkspaceSymbols(const std::string& query) {
  using Result = CallResult<std::vector<SymbolInfo>>;
  if (!client_->IsReady()) {
    return Result::Failure(
        Error{client_->state() == SessionState::kTerminated ? ErrorCode::kConnectionClosed
                                                            : ErrorCode::kNotReady,
              std::string("rust-analyzer session is ") + SessionStateName(client_->state()),
              0});
  }
  Error error;
  auto result = client_->Request("workspace/symbol", {{"query", query}}, &error);
  if (!result) {
    return Result::Failure(error);
  }
  try {
    return Result::Success(ParseSymbols(*result));
  } catch (const json::exception& e) {
    return ShapeFailure<std::vector<SymbolInfo>>("workspace/symbol", e);
  }
}

CallResult<WorkspaceEdit> RustAnalyzer::RenameSymbol(const std::string& file, Position position,
                                                     const std::string& new_name) {
  if (new_name.empty()) {
    return CallResult<WorkspaceEdit>::Failure(
        Error{ErrorCode::kInvalidParams, "new_name is empty", 0});
  }
  Error error;
  std::string uri;
  if (!Prepare(file, &uri, nullptr, &error)) {
    return CallResult<WorkspaceEdit>::Failure(error);
  }
  json params = MakeTextDocumentPositionParams(uri, position);
  params["newName"] = new_name;
  auto result = client_->Request("textDocument/rename", params, &error);
  if (!result) {
    return CallResult<WorkspaceEdit>::Failure(error);
  }
  try {
    return CallResult<WorkspaceEdit>::Success(ParseWorkspaceEdit(*result));
  } catch (const json::exception& e) {
    return ShapeFailure<WorkspaceEdit>("rename", e);
  }
}

CallResult<std::vector<TextEdit>> RustAnalyzer::FormatDocument(const std::string& file) {
  using Result = CallResult<std::vector<TextEdit>>;
  Error error;
  std::string uri;
  if (!Prepare(file, &uri, nullptr, &error)) {
    return Result::Failure(error);
  }
  json params = DocumentParams(uri);
  params["options"] = {{"tabSize", 4}, {"insertSpaces", true}};
  auto result = client_->Request("textDocument/formatting", params, &error);
  if (!result) {
    return Result::Failure(error);
  }
  try {
    return Result::Success(ParseTextEdits(*result));
  } catch (const json::exception& e) {
    return ShapeFailure<std::vector<TextEdit>>("formatting", e);
  }
}

CallResult<CodeActionQuery> RustAnalyzer::QueryCodeActions(const std::string& file, Range range,
                                                           const CodeActionMatcher& matcher) {
  Error error;
  std::string uri;
  if (!Prepare(file, &uri, nullptr, &error)) {
    return CallResult<CodeActionQuery>::Failure(error);
  }
  // No `only` filter: untyped actions must reach the title heuristic.
  json params = DocumentParams(uri);
  params["range"] = ToJson(range);
  json context_diagnostics = json::array();
  if (auto entry = client_->diagnostics().Get(uri)) {
    for (const auto& diagnostic : entry->diagnostics) {
      if (!diagnostic.is_object()) {
        continue;
      }
      auto parsed = ParseRange(diagnostic.value("range", json()));
      if (parsed && parsed->start.line <= range.end.line && parsed->end.line >= range.start.line) {
        context_diagnostics.push_back(diagnostic);
      }
    }
  }
  params["context"] = {{"diagnostics", context_diagnostics}};
  auto result = client_->Request("textDocument/codeAction", params, &error);
  if (!result) {
    return CallResult<CodeActionQuery>::Failure(error);
  }
  try {
    return CallResult<CodeActionQuery>::Success(
        FilterCodeActions(ParseCodeActions(*result), matcher));
  } catch (const json::exception& e) {
    return ShapeFailure<CodeActionQuery>("codeAction", e);
  }
}

CallResult<CodeActionQuery> RustAnalyzer::ExtractFunction(const std::string& file, Range range) {
  return QueryCodeActions(file, range, ExtractMatcher());
}

CallResult<CodeActionQuery> RustAnalyzer::InlineFunction(const std::string& file,
                                                         Position position) {
  return QueryCodeActions(file, Range{position, position}, InlineMatcher());
}

CallResult<CodeActionQuery> RustAnalyzer::ChangeSignature(const std::string& file,
                                                          Position position) {
  return QueryCodeActions(file, Range{position, position}, ChangeSignatureMatcher());
}

CallResult<CodeActionQuery> RustAnalyzer::OrganizeImports(const std::string& file) {
  std::string text;
  std::string read_error;
  if (!ReadFileToString(AbsoluteDocumentPath(file), &text, &read_error)) {
    return CallResult<CodeActionQuery>::Failure(
        Error{ErrorCode::kFileAccess, read_error, 0});
  }
  return QueryCodeActions(file, Range{Position{}, EndOfTextPosition(text)},
                          OrganizeImportsMatcher());
}

CallResult<DiagnosticsReport> RustAnalyzer::GetDiagnostics(const std::string& file) {
  using Result = CallResult<DiagnosticsReport>;
  Error error;
  std::string uri;
  SyncAction action = SyncAction::kNone;
  // Taken before the sync so a publish racing with it still counts.
  uint64_t mark = client_->diagnostics().generation();
  if (!Prepare(file, &uri, &action, &error)) {
    return Result::Failure(error);
  }

  std::optional<DiagnosticsStore::Entry> entry;
  bool fresh = false;
  if (action == SyncAction::kNone) {
    entry = client_->diagnostics().Get(uri);
    fresh = entry.has_value();
  }
  if (!fresh) {
    entry = client_->diagnostics().WaitForNewer(uri, mark, diagnostics_wait_, &fresh);
  }
  if (!fresh) {
    Log("no fresh diagnostics for " + uri + " within " +
        std::to_string(diagnostics_wait_.count()) + " ms");
  }

  DiagnosticsReport report;
  report.uri = uri;
  report.fresh = fresh;
  if (entry) {
    report.version = entry->version;
    try {
      report.diagnostics = ParseDiagnostics(entry->diagnostics);
    } catch (const json::exception& e) {
      return ShapeFailure<DiagnosticsReport>("publishDiagnostics", e);
    }
  }
  return Result::Success(std::move(report));
}

CallResult<DiagnosticsReport> RustAnalyzer::ValidateLifetimes(const std::string& file) {
  auto result = GetDiagnostics(file);
  if (!result.ok()) {
    return result;
  }
  auto& diagnostics = result.value->diagnostics;
  diagnostics.erase(std::remove_if(diagnostics.begin(), diagnostics.end(),
                                   [](const Diagnostic& d) { return !IsLifetimeDiagnostic(d); }),
                    diagnostics.end());
  return result;
}

}  // namespace ramcp
