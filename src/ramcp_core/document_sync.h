#ifndef RAMCP_CORE_DOCUMENT_SYNC_H_
#define RAMCP_CORE_DOCUMENT_SYNC_H_

#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "ramcp_core/error.h"

namespace ramcp {

enum class SyncAction {
  kNone,     // backend already has the current text
  kOpened,   // didOpen sent
  kChanged,  // didChange sent with the new full text
};

// Open Document Set. Tracks which files the backend has been given and
// re-sends the full text when the file changed on disk since the last sync.
class DocumentSync {
 public:
  using Sender = std::function<bool(const std::string& method, const nlohmann::json& params,
                                    Error* error)>;

  explicit DocumentSync(std::string language_id = "rust");

  // The check, the file read and the notification all happen under one
  // lock: concurrent callers for the same file produce one didOpen, and
  // none of them returns before that notification has been written.
  bool Ensure(const std::filesystem::path& path, const Sender& send, std::string* uri,
              SyncAction* action, Error* error);

  bool IsOpen(const std::string& uri) const;
  std::optional<int> Version(const std::string& uri) const;
  size_t size() const;
  void Clear();

 private:
  struct Entry {
    int version = 0;
    std::filesystem::file_time_type mtime;
    size_t content_hash = 0;
  };

  std::string language_id_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> documents_;
};

}  // namespace ramcp

#endif  // RAMCP_CORE_DOCUMENT_SYNC_H_
