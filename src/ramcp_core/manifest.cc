#include "ramcp_core/manifest.h"

#include <optional>
#include <utility>

#include "ramcp_core/toml_subset.h"
#include "ramcp_core/utils.h"

namespace ramcp {

namespace {

using json = nlohmann::json;

struct DependencyTable {
  DependencyKind kind = DependencyKind::kNormal;
  std::string target;
  // Non-empty for `[dependencies.name]` tables.
  std::string name;
};

std::optional<DependencyKind> KindForTableName(std::string_view name) {
  if (name == "dependencies") return DependencyKind::kNormal;
  if (name == "dev-dependencies" || name == "dev_dependencies") return DependencyKind::kDev;
  if (name == "build-dependencies" || name == "build_dependencies") return DependencyKind::kBuild;
  return std::nullopt;
}

// Splits a section name on dots outside quotes.
std::vector<std::string> SplitSection(std::string_view section) {
  std::vector<std::string> parts;
  std::string current;
  char quote = 0;
  for (char c : section) {
    if (quote != 0) {
      if (c == quote) {
        quote = 0;
      } else {
        current.push_back(c);
      }
      continue;
    }
    if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == '.') {
      parts.push_back(std::move(current));
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  parts.push_back(std::move(current));
  return parts;
}

std::optional<DependencyTable> ClassifySection(std::string_view section) {
  std::vector<std::string> parts = SplitSection(section);
  DependencyTable table;
  size_t index = 0;
  if (parts.size() >= 3 && parts[0] == "target") {
    table.target = parts[1];
    index = 2;
  }
  if (index >= parts.size()) {
    return std::nullopt;
  }
  auto kind = KindForTableName(parts[index]);
  if (!kind) {
    return std::nullopt;
  }
  table.kind = *kind;
  if (index + 1 < parts.size()) {
    table.name = parts[index + 1];
  }
  if (index + 2 < parts.size()) {
    return std::nullopt;
  }
  return table;
}

void ApplyDependencyField(Dependency* dependency, const std::string& key,
                          const std::string& value) {
  if (key == "version") {
    dependency->version = ParseStringValue(value);
  } else if (key == "path") {
    dependency->path = ParseStringValue(value);
  } else if (key == "git") {
    dependency->git = ParseStringValue(value);
  } else if (key == "features") {
    dependency->features = ParseStringArray(value);
  } else if (key == "optional") {
    dependency->optional = ParseBool(value).value_or(false);
  } else if (key == "workspace") {
    dependency->workspace = ParseBool(value).value_or(false);
  }
}

Dependency* FindOrAdd(std::vector<Dependency>* dependencies, const std::string& name,
                      const DependencyTable& table) {
  for (auto& dependency : *dependencies) {
    if (dependency.name == name && dependency.kind == table.kind &&
        dependency.target == table.target) {
      return &dependency;
    }
  }
  Dependency dependency;
  dependency.name = name;
  dependency.kind = table.kind;
  dependency.target = table.target;
  dependencies->push_back(std::move(dependency));
  return &dependencies->back();
}

}  // namespace

const char* DependencyKindName(DependencyKind kind) {
  switch (kind) {
    case DependencyKind::kNormal:
      return "normal";
    case DependencyKind::kDev:
      return "dev";
    case DependencyKind::kBuild:
      return "build";
  }
  return "normal";
}

Manifest ParseManifestText(std::string_view text) {
  Manifest manifest;
  for (const auto& entry : ParseTomlText(text)) {
    if (entry.section == "package") {
      if (entry.key == "name") {
        manifest.package_name = ParseStringValue(entry.value);
      } else if (entry.key == "version") {
        manifest.version = ParseStringValue(entry.value);
      } else if (entry.key == "edition") {
        manifest.edition = ParseStringValue(entry.value);
      } else if (entry.key == "description") {
        manifest.description = ParseStringValue(entry.value);
      }
      continue;
    }
    if (entry.section == "workspace") {
      manifest.is_workspace = true;
      if (entry.key == "members") {
        manifest.workspace_members = ParseStringArray(entry.value);
      }
      continue;
    }
    if (entry.section == "features") {
      manifest.features[entry.key] = ParseStringArray(entry.value);
      continue;
    }

    auto table = ClassifySection(entry.section);
    if (!table) {
      continue;
    }
    if (!table->name.empty()) {
      ApplyDependencyField(FindOrAdd(&manifest.dependencies, table->name, *table), entry.key,
                           entry.value);
      continue;
    }
    // `name = "1.0"`, `name = { ... }` or dotted `name.workspace = true`.
    std::string name = entry.key;
    size_t dot = name.find('.');
    Dependency* dependency = FindOrAdd(&manifest.dependencies, name.substr(0, dot), *table);
    if (dot != std::string::npos) {
      ApplyDependencyField(dependency, name.substr(dot + 1), entry.value);
    } else if (!entry.value.empty() && entry.value.front() == '{') {
      for (const auto& [key, value] : ParseInlineTable(entry.value)) {
        ApplyDependencyField(dependency, key, value);
      }
    } else {
      dependency->version = ParseStringValue(entry.value);
    }
  }
  return manifest;
}

CallResult<Manifest> AnalyzeManifest(const std::filesystem::path& path) {
  std::filesystem::path file = path;
  std::error_code ec;
  if (std::filesystem::is_directory(file, ec)) {
    file /= "Cargo.toml";
  }
  std::string text;
  std::string error;
  if (!ReadFileToString(file, &text, &error)) {
    return CallResult<Manifest>::Failure(Error{ErrorCode::kFileAccess, error, 0});
  }
  return CallResult<Manifest>::Success(ParseManifestText(text));
}

json ToJson(const Dependency& dependency) {
  json out = {{"name", dependency.name}, {"kind", DependencyKindName(dependency.kind)}};
  if (!dependency.version.empty()) out["version"] = dependency.version;
  if (!dependency.path.empty()) out["path"] = dependency.path;
  if (!dependency.git.empty()) out["git"] = dependency.git;
  if (!dependency.features.empty()) out["features"] = dependency.features;
  if (dependency.optional) out["optional"] = true;
  if (dependency.workspace) out["workspace"] = true;
  if (!dependency.target.empty()) out["target"] = dependency.target;
  return out;
}

json ToJson(const Manifest& manifest) {
  json dependencies = json::array();
  for (const auto& dependency : manifest.dependencies) {
    dependencies.push_back(ToJson(dependency));
  }
  json out = {{"dependencies", dependencies}};
  if (!manifest.package_name.empty()) {
    out["package"] = {{"name", manifest.package_name},
                      {"version", manifest.version},
                      {"edition", manifest.edition}};
    if (!manifest.description.empty()) {
      out["package"]["description"] = manifest.description;
    }
  }
  if (!manifest.features.empty()) {
    out["features"] = manifest.features;
  }
  if (manifest.is_workspace) {
    out["workspace"] = {{"members", manifest.workspace_members}};
  }
  return out;
}

}  // namespace ramcp
