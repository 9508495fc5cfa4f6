#ifndef RAMCP_CORE_UTILS_H_
#define RAMCP_CORE_UTILS_H_

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace ramcp {

std::string PathToUri(const std::string& path);
std::string UriToPath(const std::string& uri);
std::string UrlDecode(std::string_view text);
std::string Trim(std::string_view text);
std::string ToLower(std::string_view text);

bool HasPrefixIgnoreCase(std::string_view text, std::string_view prefix);
bool ContainsIgnoreCase(std::string_view text, std::string_view query);

std::filesystem::path NormalizePath(const std::filesystem::path& path);
std::filesystem::path ResolveConfigPath(const std::string& raw,
                                        const std::filesystem::path& config_dir,
                                        const std::filesystem::path& workspace_root);

// Absolute, lexically normal form used as the document key.
std::filesystem::path AbsoluteDocumentPath(const std::string& path);

bool ReadFileToString(const std::filesystem::path& path, std::string* out,
                      std::string* error);

}  // namespace ramcp

#endif  // RAMCP_CORE_UTILS_H_
