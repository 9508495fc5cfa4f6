#ifndef RAMCP_CORE_CODE_ACTION_FILTER_H_
#define RAMCP_CORE_CODE_ACTION_FILTER_H_

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "ramcp_core/lsp_types.h"

namespace ramcp {

enum class MatchSource {
  kKind,
  kTitleHeuristic,
};

// `kind` is an LSP CodeActionKind; `title_keywords` feed the title
// heuristic used only for actions that carry no kind.
struct CodeActionMatcher {
  std::string kind;
  std::vector<std::string> title_keywords;
};

const CodeActionMatcher& ExtractMatcher();
const CodeActionMatcher& InlineMatcher();
const CodeActionMatcher& ChangeSignatureMatcher();
const CodeActionMatcher& OrganizeImportsMatcher();

// Hierarchical kind match: "refactor.inline" matches "refactor.inline" and
// "refactor.inline.call", not "refactor.inlineX" or "refactor".
bool KindMatches(std::string_view action_kind, std::string_view wanted);

// Case-insensitive keyword search over the title. Misses titles worded
// differently or localized, so it is only a fallback.
bool TitleKeywordHeuristic(std::string_view title, const std::vector<std::string>& keywords);

std::optional<MatchSource> MatchCodeAction(const CodeAction& action,
                                           const CodeActionMatcher& matcher);

struct MatchedAction {
  CodeAction action;
  MatchSource source = MatchSource::kKind;
};

struct CodeActionQuery {
  std::vector<CodeAction> all;
  std::vector<MatchedAction> matching;
};

CodeActionQuery FilterCodeActions(std::vector<CodeAction> actions,
                                  const CodeActionMatcher& matcher);

nlohmann::json ToJson(const CodeActionQuery& query);

}  // namespace ramcp

#endif  // RAMCP_CORE_CODE_ACTION_FILTER_H_
