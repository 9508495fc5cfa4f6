#include "ramcp_core/code_action_filter.h"

#include "ramcp_core/utils.h"

namespace ramcp {

namespace {

json ActionToJson(const CodeAction& action) {
  json out = {{"title", action.title}, {"isPreferred", action.is_preferred}};
  if (action.kind.has_value()) {
    out["kind"] = *action.kind;
  }
  if (action.disabled_reason.has_value()) {
    out["disabled"] = *action.disabled_reason;
  }
  if (action.raw.contains("edit")) {
    out["edit"] = ToJson(ParseWorkspaceEdit(action.raw["edit"]));
  }
  if (action.raw.contains("command")) {
    out["command"] = action.raw["command"];
  }
  // Unresolved actions carry their payload in `data`.
  if (action.raw.contains("data")) {
    out["data"] = action.raw["data"];
  }
  return out;
}

}  // namespace

const CodeActionMatcher& ExtractMatcher() {
  static const CodeActionMatcher matcher{"refactor.extract", {"extract"}};
  return matcher;
}

const CodeActionMatcher& InlineMatcher() {
  static const CodeActionMatcher matcher{"refactor.inline", {"inline"}};
  return matcher;
}

const CodeActionMatcher& ChangeSignatureMatcher() {
  static const CodeActionMatcher matcher{"refactor.rewrite",
                                         {"signature", "parameter", "argument"}};
  return matcher;
}

const CodeActionMatcher& OrganizeImportsMatcher() {
  static const CodeActionMatcher matcher{"source.organizeImports", {"import"}};
  return matcher;
}

bool KindMatches(std::string_view action_kind, std::string_view wanted) {
  if (wanted.empty()) {
    return true;
  }
  if (action_kind.size() < wanted.size() ||
      action_kind.compare(0, wanted.size(), wanted) != 0) {
    return false;
  }
  return action_kind.size() == wanted.size() || action_kind[wanted.size()] == '.';
}

bool TitleKeywordHeuristic(std::string_view title, const std::vector<std::string>& keywords) {
  for (const auto& keyword : keywords) {
    if (!keyword.empty() && ContainsIgnoreCase(title, keyword)) {
      return true;
    }
  }
  return false;
}

std::optional<MatchSource> MatchCodeAction(const CodeAction& action,
                                           const CodeActionMatcher& matcher) {
  if (action.kind.has_value() && !action.kind->empty()) {
    if (KindMatches(*action.kind, matcher.kind)) {
      return MatchSource::kKind;
    }
    return std::nullopt;
  }
  if (TitleKeywordHeuristic(action.title, matcher.title_keywords)) {
    return MatchSource::kTitleHeuristic;
  }
  return std::nullopt;
}

CodeActionQuery FilterCodeActions(std::vector<CodeAction> actions,
                                  const CodeActionMatcher& matcher) {
  CodeActionQuery query;
  for (const auto& action : actions) {
    if (auto source = MatchCodeAction(action, matcher)) {
      query.matching.push_back(MatchedAction{action, *source});
    }
  }
  query.all = std::move(actions);
  return query;
}

json ToJson(const CodeActionQuery& query) {
  json all = json::array();
  for (const auto& action : query.all) {
    all.push_back(ActionToJson(action));
  }
  json matching = json::array();
  for (const auto& matched : query.matching) {
    json entry = ActionToJson(matched.action);
    entry["matched_by"] =
        matched.source == MatchSource::kKind ? "kind" : "title_heuristic";
    matching.push_back(std::move(entry));
  }
  return {{"matching", matching}, {"all", all}};
}

}  // namespace ramcp
