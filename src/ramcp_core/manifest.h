#ifndef RAMCP_CORE_MANIFEST_H_
#define RAMCP_CORE_MANIFEST_H_

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "ramcp_core/error.h"

namespace ramcp {

enum class DependencyKind {
  kNormal,
  kDev,
  kBuild,
};

const char* DependencyKindName(DependencyKind kind);

struct Dependency {
  std::string name;
  DependencyKind kind = DependencyKind::kNormal;
  std::string version;
  std::string path;
  std::string git;
  std::vector<std::string> features;
  bool optional = false;
  // `foo.workspace = true` entries.
  bool workspace = false;
  // Set for `[target.'cfg(...)'.dependencies]` tables.
  std::string target;
};

struct Manifest {
  std::string package_name;
  std::string version;
  std::string edition;
  std::string description;
  std::vector<Dependency> dependencies;
  std::map<std::string, std::vector<std::string>> features;
  bool is_workspace = false;
  std::vector<std::string> workspace_members;
};

Manifest ParseManifestText(std::string_view text);
CallResult<Manifest> AnalyzeManifest(const std::filesystem::path& path);

nlohmann::json ToJson(const Dependency& dependency);
nlohmann::json ToJson(const Manifest& manifest);

}  // namespace ramcp

#endif  // RAMCP_CORE_MANIFEST_H_
