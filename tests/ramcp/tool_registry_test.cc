#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>

#include "ramcp/tool_registry.h"
#include "test_support.h"

using namespace ramcp;
using server::ToolContext;
using server::ToolRegistry;
using testutil::FakeClientOptions;
using testutil::TempDir;

namespace {

json Call(const ToolRegistry& registry, const std::string& name, const json& arguments) {
  return registry.CallTool(name, arguments);
}

class ToolRegistryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_.Write("src/main.rs", "fn main() {\n    BORROW_ERROR\n}\n");
    dir_.Write("Cargo.toml", "[package]\nname = \"demo\"\nversion = \"0.1.0\"\n"
                             "[dependencies]\nserde = \"1\"\n");
    client_ = std::make_unique<ProtocolClient>(FakeClientOptions("normal", dir_.path()));
    Error error;
    ASSERT_TRUE(client_->Start(&error)) << error.ToString();
    analyzer_ = std::make_unique<RustAnalyzer>(client_.get(), std::chrono::milliseconds(2000));
    ToolContext context;
    context.analyzer = analyzer_.get();
    context.workspace_root = dir_.path();
    registry_ = std::make_unique<ToolRegistry>(context);
  }

  TempDir dir_;
  std::unique_ptr<ProtocolClient> client_;
  std::unique_ptr<RustAnalyzer> analyzer_;
  std::unique_ptr<ToolRegistry> registry_;
};

}  // namespace

TEST_F(ToolRegistryTest, ListsEveryTool) {
  json listed = registry_->ListTools()["tools"];
  EXPECT_EQ(listed.size(), 14u);
  for (const char* name :
       {"find_definition", "find_references", "get_diagnostics", "workspace_symbols",
        "rename_symbol", "extract_function", "inline_function", "change_signature",
        "organize_imports", "validate_lifetimes", "format_code", "analyze_manifest",
        "run_cargo_check", "apply_clippy_suggestions"}) {
    EXPECT_TRUE(registry_->HasTool(name)) << name;
  }
  for (const auto& tool : listed) {
    EXPECT_EQ(tool["inputSchema"]["type"], "object") << tool["name"];
    EXPECT_FALSE(tool["description"].get<std::string>().empty());
  }
}

TEST_F(ToolRegistryTest, RelativePathsResolveAgainstWorkspace) {
  json result = Call(*registry_, "find_definition",
                     {{"file_path", "src/main.rs"}, {"line", 1}, {"character", 4}});
  ASSERT_FALSE(result["isError"].get<bool>()) << result.dump();
  json payload = result["structuredContent"];
  EXPECT_TRUE(payload["found"].get<bool>());
  EXPECT_EQ(payload["locations"][0]["path"], (dir_.path() / "src/main.rs").string());
  EXPECT_EQ(result["content"][0]["type"], "text");
}

TEST_F(ToolRegistryTest, MissingArgumentIsInvalidParams) {
  json result = Call(*registry_, "find_definition", {{"file_path", "src/main.rs"}});
  EXPECT_TRUE(result["isError"].get<bool>());
  EXPECT_EQ(result["structuredContent"]["error_code"], "InvalidParams");
  EXPECT_NE(result["content"][0]["text"].get<std::string>().find("line"), std::string::npos);
}

TEST_F(ToolRegistryTest, WrongTypeAndNegativeValuesAreRejected) {
  json wrong_type = Call(*registry_, "find_references",
                         {{"file_path", "src/main.rs"}, {"line", "1"}, {"character", 0}});
  EXPECT_EQ(wrong_type["structuredContent"]["error_code"], "InvalidParams");
  json negative = Call(*registry_, "find_references",
                       {{"file_path", "src/main.rs"}, {"line", -1}, {"character", 0}});
  EXPECT_EQ(negative["structuredContent"]["error_code"], "InvalidParams");
  json too_large = Call(*registry_, "find_definition",
                        {{"file_path", "src/main.rs"},
                         {"line", 4294967296LL},
                         {"character", 4294967301LL}});
  EXPECT_EQ(too_large["structuredContent"]["error_code"], "InvalidParams");
  json range_too_large = Call(*registry_, "extract_function",
                              {{"file_path", "src/main.rs"},
                               {"start_line", 0},
                               {"start_character", 0},
                               {"end_line", 2147483648LL},
                               {"end_character", 0}});
  EXPECT_EQ(range_too_large["structuredContent"]["error_code"], "InvalidParams");
}

TEST_F(ToolRegistryTest, ValidateArgumentsBoundsPositionsToInt) {
  json schema;
  json listed = registry_->ListTools();
  for (const auto& tool : listed["tools"]) {
    if (tool["name"] == "find_definition") schema = tool["inputSchema"];
  }
  ASSERT_TRUE(schema.is_object());
  Error error;
  EXPECT_TRUE(ToolRegistry::ValidateArguments(
      schema, {{"file_path", "a.rs"}, {"line", 2147483647LL}, {"character", 0}}, &error));
  EXPECT_FALSE(ToolRegistry::ValidateArguments(
      schema, {{"file_path", "a.rs"}, {"line", 4294967296LL}, {"character", 4294967301LL}},
      &error));
  EXPECT_EQ(error.code, ErrorCode::kInvalidParams);
}

TEST_F(ToolRegistryTest, RenameEchoesEdits) {
  json result = Call(*registry_, "rename_symbol",
                     {{"file_path", "src/main.rs"}, {"line", 0}, {"character", 3},
                      {"new_name", "start"}});
  ASSERT_FALSE(result["isError"].get<bool>()) << result.dump();
  EXPECT_TRUE(result["structuredContent"]["possible"].get<bool>());
}

TEST_F(ToolRegistryTest, ExtractFunctionEchoesRequestedName) {
  json result = Call(*registry_, "extract_function",
                     {{"file_path", "src/main.rs"},
                      {"start_line", 1},
                      {"start_character", 4},
                      {"end_line", 1},
                      {"end_character", 16},
                      {"function_name", "check_borrow"}});
  ASSERT_FALSE(result["isError"].get<bool>()) << result.dump();
  EXPECT_EQ(result["structuredContent"]["requested_name"], "check_borrow");
  EXPECT_EQ(result["structuredContent"]["matching"].size(), 2u);
}

TEST_F(ToolRegistryTest, ValidateLifetimesFiltersDiagnostics) {
  json result = Call(*registry_, "validate_lifetimes", {{"file_path", "src/main.rs"}});
  ASSERT_FALSE(result["isError"].get<bool>()) << result.dump();
  json diagnostics = result["structuredContent"]["diagnostics"];
  ASSERT_EQ(diagnostics.size(), 1u);
  EXPECT_EQ(diagnostics[0]["code"], "E0502");
}

TEST_F(ToolRegistryTest, WorkspaceSymbolsWrapsList) {
  json result = Call(*registry_, "workspace_symbols", {{"query", "Config"}});
  ASSERT_FALSE(result["isError"].get<bool>()) << result.dump();
  EXPECT_EQ(result["structuredContent"]["symbols"][0]["name"], "Config");
}

TEST_F(ToolRegistryTest, FormatViaAnalyzerReturnsEdits) {
  json result = Call(*registry_, "format_code",
                     {{"file_path", "src/main.rs"}, {"via_analyzer", true}});
  ASSERT_FALSE(result["isError"].get<bool>()) << result.dump();
  EXPECT_EQ(result["structuredContent"]["edits"][0]["newText"], "// fmt\n");
}

TEST_F(ToolRegistryTest, AnalyzeManifestFromWorkspace) {
  json result = Call(*registry_, "analyze_manifest", {{"manifest_path", "."}});
  ASSERT_FALSE(result["isError"].get<bool>()) << result.dump();
  EXPECT_EQ(result["structuredContent"]["package"]["name"], "demo");
  EXPECT_EQ(result["structuredContent"]["dependencies"][0]["name"], "serde");
}

TEST_F(ToolRegistryTest, FileErrorsAreToolErrors) {
  json result = Call(*registry_, "get_diagnostics", {{"file_path", "src/missing.rs"}});
  EXPECT_TRUE(result["isError"].get<bool>());
  EXPECT_EQ(result["structuredContent"]["error_code"], "FileAccessError");
  EXPECT_EQ(result["content"][0]["text"].get<std::string>().rfind("FileAccessError: ", 0), 0u);
}

TEST(ToolRegistryNoBackendTest, AnalyzerToolsReportNotReady) {
  TempDir dir;
  dir.Write("Cargo.toml", "[package]\nname = \"solo\"\n");
  ToolContext context;
  context.workspace_root = dir.path();
  ToolRegistry registry(context);

  json result = registry.CallTool("inline_function",
                                  {{"file_path", "src/lib.rs"}, {"line", 0}, {"character", 0}});
  EXPECT_TRUE(result["isError"].get<bool>());
  EXPECT_EQ(result["structuredContent"]["error_code"], "NotReadyError");

  // Command-line tools keep working.
  json manifest = registry.CallTool("analyze_manifest", {{"manifest_path", "Cargo.toml"}});
  EXPECT_FALSE(manifest["isError"].get<bool>());
}

TEST(ToolRegistryValidationTest, ChecksSchemaShape) {
  json schema = {{"type", "object"},
                 {"properties",
                  {{"name", {{"type", "string"}}},
                   {"count", {{"type", "integer"}, {"minimum", 0}}},
                   {"flag", {{"type", "boolean"}}}}},
                 {"required", json::array({"name"})}};
  Error error;
  EXPECT_TRUE(ToolRegistry::ValidateArguments(schema, {{"name", "x"}, {"extra", 1}}, &error));
  EXPECT_FALSE(ToolRegistry::ValidateArguments(schema, json::array(), &error));
  EXPECT_FALSE(ToolRegistry::ValidateArguments(schema, {{"count", 1}}, &error));
  EXPECT_FALSE(ToolRegistry::ValidateArguments(schema, {{"name", "x"}, {"count", 1.5}}, &error));
  EXPECT_FALSE(ToolRegistry::ValidateArguments(schema, {{"name", "x"}, {"flag", "yes"}}, &error));
  EXPECT_EQ(error.code, ErrorCode::kInvalidParams);
}
