#include "ramcp_core/toml_subset.h"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "ramcp_core/utils.h"

namespace ramcp {
namespace {

std::string StripComments(const std::string& line) {
  bool in_string = false;
  bool escape = false;
  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (escape) {
      escape = false;
      continue;
    }
    if (c == '\\') {
      escape = true;
      continue;
    }
    if (c == '"') {
      in_string = !in_string;
      continue;
    }
    if (!in_string && c == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

std::string UnescapeString(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  bool escape = false;
  for (char c : text) {
    if (escape) {
      switch (c) {
        case 'n':
          out.push_back('\n');
          break;
        case 't':
          out.push_back('\t');
          break;
        case 'r':
          out.push_back('\r');
          break;
        default:
          out.push_back(c);
          break;
      }
      escape = false;
    } else if (c == '\\') {
      escape = true;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

// Net count of open [ and { outside strings.
int NestingDelta(std::string_view value) {
  bool in_string = false;
  bool escape = false;
  int delta = 0;
  for (char c : value) {
    if (escape) {
      escape = false;
      continue;
    }
    if (c == '\\') {
      escape = true;
      continue;
    }
    if (c == '"') {
      in_string = !in_string;
      continue;
    }
    if (!in_string) {
      if (c == '[' || c == '{') {
        ++delta;
      } else if (c == ']' || c == '}') {
        --delta;
      }
    }
  }
  return delta;
}

// Splits on commas at nesting depth zero, outside strings.
std::vector<std::string> SplitTopLevel(std::string_view inner) {
  std::vector<std::string> out;
  std::string current;
  bool in_string = false;
  bool escape = false;
  int depth = 0;
  for (char c : inner) {
    if (escape) {
      current.push_back(c);
      escape = false;
      continue;
    }
    if (c == '\\') {
      current.push_back(c);
      escape = true;
      continue;
    }
    if (c == '"') {
      in_string = !in_string;
    } else if (!in_string) {
      if (c == '[' || c == '{') {
        ++depth;
      } else if (c == ']' || c == '}') {
        --depth;
      } else if (c == ',' && depth == 0) {
        std::string token = Trim(current);
        if (!token.empty()) {
          out.push_back(std::move(token));
        }
        current.clear();
        continue;
      }
    }
    current.push_back(c);
  }
  std::string token = Trim(current);
  if (!token.empty()) {
    out.push_back(std::move(token));
  }
  return out;
}

size_t FindAssignment(std::string_view line) {
  bool in_string = false;
  for (size_t i = 0; i < line.size(); ++i) {
    if (line[i] == '"') {
      in_string = !in_string;
    } else if (!in_string && line[i] == '=') {
      return i;
    }
  }
  return std::string_view::npos;
}

}  // namespace

std::string ParseStringValue(std::string_view value) {
  std::string trimmed = Trim(value);
  if (trimmed.size() >= 2 && trimmed.front() == '"' && trimmed.back() == '"') {
    return UnescapeString(std::string_view(trimmed).substr(1, trimmed.size() - 2));
  }
  if (trimmed.size() >= 2 && trimmed.front() == '\'' && trimmed.back() == '\'') {
    return trimmed.substr(1, trimmed.size() - 2);
  }
  return trimmed;
}

std::vector<std::string> ParseStringArray(std::string_view value) {
  std::vector<std::string> out;
  std::string trimmed = Trim(value);
  if (trimmed.size() < 2 || trimmed.front() != '[' || trimmed.back() != ']') {
    if (!trimmed.empty()) {
      out.push_back(ParseStringValue(trimmed));
    }
    return out;
  }
  for (const auto& token :
       SplitTopLevel(std::string_view(trimmed).substr(1, trimmed.size() - 2))) {
    out.push_back(ParseStringValue(token));
  }
  return out;
}

std::optional<int> ParseInt(std::string_view value) {
  std::string trimmed = Trim(value);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  char* end = nullptr;
  long parsed = std::strtol(trimmed.c_str(), &end, 0);
  if (end == trimmed.c_str() || *end != '\0') {
    return std::nullopt;
  }
  return static_cast<int>(parsed);
}

std::optional<bool> ParseBool(std::string_view value) {
  std::string lower = ToLower(Trim(value));
  if (lower.empty()) {
    return std::nullopt;
  }
  if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
    return false;
  }
  return std::nullopt;
}

std::vector<std::pair<std::string, std::string>> ParseInlineTable(std::string_view value) {
  std::vector<std::pair<std::string, std::string>> out;
  std::string trimmed = Trim(value);
  if (trimmed.size() < 2 || trimmed.front() != '{' || trimmed.back() != '}') {
    return out;
  }
  for (const auto& item :
       SplitTopLevel(std::string_view(trimmed).substr(1, trimmed.size() - 2))) {
    size_t equals = FindAssignment(item);
    if (equals == std::string::npos) {
      continue;
    }
    out.emplace_back(ParseStringValue(item.substr(0, equals)),
                     Trim(std::string_view(item).substr(equals + 1)));
  }
  return out;
}

std::vector<TomlEntry> ParseTomlText(std::string_view text) {
  std::vector<TomlEntry> entries;
  std::istringstream stream{std::string(text)};
  std::string line;
  int line_number = 0;
  std::string section;
  TomlEntry pending;
  int pending_depth = 0;
  while (std::getline(stream, line)) {
    ++line_number;
    std::string trimmed = Trim(StripComments(line));
    if (trimmed.empty()) {
      continue;
    }

    if (pending_depth > 0) {
      pending.value += " ";
      pending.value += trimmed;
      pending_depth += NestingDelta(trimmed);
      if (pending_depth <= 0) {
        entries.push_back(std::move(pending));
        pending = TomlEntry{};
        pending_depth = 0;
      }
      continue;
    }

    size_t equals = FindAssignment(trimmed);
    if (trimmed.front() == '[' && equals == std::string::npos) {
      std::string header = trimmed;
      while (!header.empty() && header.front() == '[') {
        header.erase(0, 1);
      }
      while (!header.empty() && header.back() == ']') {
        header.pop_back();
      }
      section = Trim(header);
      continue;
    }
    if (equals == std::string::npos) {
      continue;
    }

    TomlEntry entry;
    entry.section = section;
    entry.key = ParseStringValue(trimmed.substr(0, equals));
    entry.value = Trim(trimmed.substr(equals + 1));
    entry.line = line_number;
    int depth = NestingDelta(entry.value);
    if (depth > 0) {
      pending = std::move(entry);
      pending_depth = depth;
      continue;
    }
    entries.push_back(std::move(entry));
  }

  if (pending_depth > 0) {
    entries.push_back(std::move(pending));
  }
  return entries;
}

bool ParseTomlFile(const std::string& path, std::vector<TomlEntry>* entries,
                   std::string* error) {
  std::string text;
  std::string read_error;
  if (!ReadFileToString(path, &text, &read_error)) {
    if (error) {
      *error = read_error;
    }
    return false;
  }
  *entries = ParseTomlText(text);
  return true;
}

}  // namespace ramcp
