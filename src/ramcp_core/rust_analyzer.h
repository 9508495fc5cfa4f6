#ifndef RAMCP_CORE_RUST_ANALYZER_H_
#define RAMCP_CORE_RUST_ANALYZER_H_

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ramcp_core/code_action_filter.h"
#include "ramcp_core/error.h"
#include "ramcp_core/lsp_types.h"
#include "ramcp_core/protocol_client.h"

namespace ramcp {

// One call per analysis operation. Each call checks the session is Ready,
// synchronizes the target file, sends one request and shapes the reply.
// Nothing is retried here.
class RustAnalyzer {
 public:
  RustAnalyzer(ProtocolClient* client, std::chrono::milliseconds diagnostics_wait);

  CallResult<LocationList> FindDefinition(const std::string& file, Position position);
  CallResult<LocationList> FindReferences(const std::string& file, Position position,
                                          bool include_declaration = true);
  CallResult<std::vector<SymbolInfo>> WorkspaceSymbols(const std::string& query);
  CallResult<WorkspaceEdit> RenameSymbol(const std::string& file, Position position,
                                         const std::string& new_name);
  CallResult<std::vector<TextEdit>> FormatDocument(const std::string& file);

  CallResult<CodeActionQuery> ExtractFunction(const std::string& file, Range range);
  CallResult<CodeActionQuery> InlineFunction(const std::string& file, Position position);
  CallResult<CodeActionQuery> ChangeSignature(const std::string& file, Position position);
  CallResult<CodeActionQuery> OrganizeImports(const std::string& file);

  // Diagnostics only arrive as pushes. Waits for a publish newer than the
  // sync unless the backend already holds the current text.
  CallResult<DiagnosticsReport> GetDiagnostics(const std::string& file);
  CallResult<DiagnosticsReport> ValidateLifetimes(const std::string& file);

  bool IsReady() const { return client_->IsReady(); }

 private:
  bool Prepare(const std::string& file, std::string* uri, SyncAction* action, Error* error);
  CallResult<CodeActionQuery> QueryCodeActions(const std::string& file, Range range,
                                               const CodeActionMatcher& matcher);

  ProtocolClient* client_;
  std::chrono::milliseconds diagnostics_wait_;
};

// rustc codes raised by the borrow checker and lifetime resolution.
const std::vector<std::string>& LifetimeErrorCodes();
bool IsLifetimeDiagnostic(const Diagnostic& diagnostic);

}  // namespace ramcp

#endif  // RAMCP_CORE_RUST_ANALYZER_H_
