#ifndef RAMCP_CORE_TOML_SUBSET_H_
#define RAMCP_CORE_TOML_SUBSET_H_

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ramcp {

// Flat reader for the TOML subset used by ramcp.toml and Cargo.toml:
// [section] headers, key = value lines, # comments, and arrays or inline
// tables that may span several lines. Values are kept raw.
struct TomlEntry {
  std::string section;
  std::string key;
  std::string value;
  int line = 0;
};

std::vector<TomlEntry> ParseTomlText(std::string_view text);
bool ParseTomlFile(const std::string& path, std::vector<TomlEntry>* entries,
                   std::string* error);

std::string ParseStringValue(std::string_view value);
std::vector<std::string> ParseStringArray(std::string_view value);
std::optional<int> ParseInt(std::string_view value);
std::optional<bool> ParseBool(std::string_view value);
// { a = "1", b = [..] } -> raw key/value pairs, in order.
std::vector<std::pair<std::string, std::string>> ParseInlineTable(std::string_view value);

}  // namespace ramcp

#endif  // RAMCP_CORE_TOML_SUBSET_H_
