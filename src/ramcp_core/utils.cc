#include "ramcp_core/utils.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace ramcp {

namespace {

bool IsUnreservedUriChar(unsigned char c) {
  return std::isalnum(c) != 0 || c == '-' || c == '.' || c == '_' || c == '~' ||
         c == '/';
}

}  // namespace

std::string UrlDecode(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '%' && i + 2 < text.size()) {
      char hex[3] = {static_cast<char>(text[i + 1]),
                     static_cast<char>(text[i + 2]), '\0'};
      char* end = nullptr;
      long value = std::strtol(hex, &end, 16);
      if (end == hex + 2) {
        out.push_back(static_cast<char>(value));
        i += 2;
        continue;
      }
    }
    out.push_back(static_cast<char>(text[i]));
  }
  return out;
}

std::string UriToPath(const std::string& uri) {
  const std::string prefix = "file://";
  if (uri.rfind(prefix, 0) == 0) {
    std::string path = uri.substr(prefix.size());
    return UrlDecode(path);
  }
  return uri;
}

std::string PathToUri(const std::string& path) {
  static const char kHex[] = "0123456789ABCDEF";
  std::string uri = "file://";
  if (path.empty() || path.front() != '/') {
    uri.push_back('/');
  }
  for (char raw : path) {
    unsigned char c = static_cast<unsigned char>(raw);
    if (IsUnreservedUriChar(c)) {
      uri.push_back(raw);
    } else {
      uri.push_back('%');
      uri.push_back(kHex[c >> 4]);
      uri.push_back(kHex[c & 0x0F]);
    }
  }
  return uri;
}

std::string Trim(std::string_view text) {
  size_t start = 0;
  while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])) != 0) {
    ++start;
  }
  size_t end = text.size();
  while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  return std::string(text.substr(start, end - start));
}

std::string ToLower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool HasPrefixIgnoreCase(std::string_view text, std::string_view prefix) {
  if (prefix.empty() || text.size() < prefix.size()) {
    return false;
  }
  for (size_t i = 0; i < prefix.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(text[i])) !=
        std::tolower(static_cast<unsigned char>(prefix[i]))) {
      return false;
    }
  }
  return true;
}

bool ContainsIgnoreCase(std::string_view text, std::string_view query) {
  if (query.empty()) {
    return true;
  }
  if (query.size() > text.size()) {
    return false;
  }
  for (size_t i = 0; i + query.size() <= text.size(); ++i) {
    if (HasPrefixIgnoreCase(text.substr(i), query)) {
      return true;
    }
  }
  return false;
}

fs::path NormalizePath(const fs::path& path) {
  return path.lexically_normal();
}

fs::path ResolveConfigPath(const std::string& raw,
                           const fs::path& config_dir,
                           const fs::path& workspace_root) {
  if (raw.empty()) return {};
  fs::path p(raw);
  if (p.is_absolute()) return NormalizePath(p);
  if (!config_dir.empty()) {
    fs::path c = NormalizePath(config_dir / p);
    std::error_code ec;
    if (fs::exists(c, ec)) return c;
  }
  if (!workspace_root.empty()) {
    return NormalizePath(workspace_root / p);
  }
  return NormalizePath(p);
}

fs::path AbsoluteDocumentPath(const std::string& path) {
  std::error_code ec;
  fs::path absolute = fs::absolute(fs::path(path), ec);
  if (ec) {
    return NormalizePath(fs::path(path));
  }
  return NormalizePath(absolute);
}

bool ReadFileToString(const fs::path& path, std::string* out, std::string* error) {
  std::error_code ec;
  if (fs::is_directory(path, ec)) {
    if (error) {
      *error = "Not a regular file: " + path.string();
    }
    return false;
  }
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    if (error) {
      *error = "Unable to open " + path.string() + ": " + std::strerror(errno);
    }
    return false;
  }
  std::ostringstream ss;
  ss << file.rdbuf();
  if (file.bad()) {
    if (error) {
      *error = "Unable to read " + path.string();
    }
    return false;
  }
  *out = ss.str();
  return true;
}

}  // namespace ramcp
