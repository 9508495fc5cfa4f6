#include <gtest/gtest.h>

#include "ramcp_core/code_action_filter.h"

using namespace ramcp;

namespace {

CodeAction Action(const std::string& title, std::optional<std::string> kind = std::nullopt) {
  CodeAction action;
  action.title = title;
  action.kind = std::move(kind);
  action.raw = {{"title", title}};
  return action;
}

}  // namespace

TEST(CodeActionFilterTest, KindMatchingIsHierarchical) {
  EXPECT_TRUE(KindMatches("refactor.inline", "refactor.inline"));
  EXPECT_TRUE(KindMatches("refactor.inline.call", "refactor.inline"));
  EXPECT_FALSE(KindMatches("refactor.inlineX", "refactor.inline"));
  EXPECT_FALSE(KindMatches("refactor", "refactor.inline"));
  EXPECT_FALSE(KindMatches("quickfix", "refactor"));
}

TEST(CodeActionFilterTest, KindWinsOverTitle) {
  // Titled like an extraction, but the kind says otherwise.
  auto action = Action("Extract into variable", "refactor.rewrite");
  EXPECT_FALSE(MatchCodeAction(action, ExtractMatcher()).has_value());
  EXPECT_EQ(MatchCodeAction(Action("Anything", "refactor.extract.function"), ExtractMatcher()),
            MatchSource::kKind);
}

TEST(CodeActionFilterTest, TitleHeuristicOnlyForUntypedActions) {
  EXPECT_EQ(MatchCodeAction(Action("Inline call"), InlineMatcher()),
            MatchSource::kTitleHeuristic);
  EXPECT_EQ(MatchCodeAction(Action("Change parameter order"), ChangeSignatureMatcher()),
            MatchSource::kTitleHeuristic);
  EXPECT_FALSE(MatchCodeAction(Action("Fill match arms"), InlineMatcher()).has_value());
}

TEST(CodeActionFilterTest, FilterKeepsFullListAndTagsMatches) {
  std::vector<CodeAction> actions = {
      Action("Extract into function", "refactor.extract.function"),
      Action("Extract into variable", "refactor.extract.variable"),
      Action("Inline function", "refactor.inline"),
      Action("Extract type alias"),
  };
  CodeActionQuery query = FilterCodeActions(actions, ExtractMatcher());
  EXPECT_EQ(query.all.size(), 4u);
  ASSERT_EQ(query.matching.size(), 3u);
  EXPECT_EQ(query.matching[2].source, MatchSource::kTitleHeuristic);

  json out = ToJson(query);
  EXPECT_EQ(out["all"].size(), 4u);
  EXPECT_EQ(out["matching"][0]["matched_by"], "kind");
  EXPECT_EQ(out["matching"][2]["matched_by"], "title_heuristic");
}

TEST(CodeActionFilterTest, EditsAreFlattenedInOutput) {
  CodeAction action = Action("Merge imports", "source.organizeImports");
  action.raw["edit"] = {{"changes",
                         {{"file:///a.rs",
                           json::array({{{"range",
                                          {{"start", {{"line", 0}, {"character", 0}}},
                                           {"end", {{"line", 1}, {"character", 0}}}}},
                                         {"newText", "use std::{fs, io};\n"}}})}}}};
  CodeActionQuery query = FilterCodeActions({action}, OrganizeImportsMatcher());
  json out = ToJson(query);
  ASSERT_EQ(out["matching"].size(), 1u);
  EXPECT_EQ(out["matching"][0]["edit"]["edits"]["file:///a.rs"][0]["newText"],
            "use std::{fs, io};\n");
}
