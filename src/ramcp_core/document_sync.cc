#include "ramcp_core/document_sync.h"

#include <utility>

#include "ramcp_core/logging.h"
#include "ramcp_core/utils.h"

namespace fs = std::filesystem;

namespace ramcp {

DocumentSync::DocumentSync(std::string language_id) : language_id_(std::move(language_id)) {}

bool DocumentSync::Ensure(const fs::path& path, const Sender& send, std::string* uri,
                          SyncAction* action, Error* error) {
  fs::path absolute = AbsoluteDocumentPath(path.string());
  std::string document_uri = PathToUri(absolute.string());
  if (uri) {
    *uri = document_uri;
  }
  if (action) {
    *action = SyncAction::kNone;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  fs::file_time_type mtime = fs::last_write_time(absolute, ec);
  if (ec) {
    SetError(error, ErrorCode::kFileAccess,
             "cannot stat " + absolute.string() + ": " + ec.message());
    return false;
  }

  auto it = documents_.find(document_uri);
  if (it != documents_.end() && it->second.mtime == mtime) {
    return true;
  }

  std::string text;
  std::string read_error;
  if (!ReadFileToString(absolute, &text, &read_error)) {
    SetError(error, ErrorCode::kFileAccess, read_error);
    return false;
  }
  size_t content_hash = std::hash<std::string>{}(text);

  if (it == documents_.end()) {
    nlohmann::json params = {
        {"textDocument",
         {{"uri", document_uri},
          {"languageId", language_id_},
          {"version", 1},
          {"text", text}}},
    };
    if (!send("textDocument/didOpen", params, error)) {
      return false;
    }
    documents_[document_uri] = Entry{1, mtime, content_hash};
    if (action) {
      *action = SyncAction::kOpened;
    }
    return true;
  }

  Entry& entry = it->second;
  entry.mtime = mtime;
  if (entry.content_hash == content_hash) {
    return true;
  }
  int version = entry.version + 1;
  nlohmann::json params = {
      {"textDocument", {{"uri", document_uri}, {"version", version}}},
      {"contentChanges", nlohmann::json::array({{{"text", text}}})},
  };
  if (!send("textDocument/didChange", params, error)) {
    return false;
  }
  entry.version = version;
  entry.content_hash = content_hash;
  Log("resynced " + document_uri + " at version " + std::to_string(version));
  if (action) {
    *action = SyncAction::kChanged;
  }
  return true;
}

bool DocumentSync::IsOpen(const std::string& uri) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return documents_.count(uri) > 0;
}

std::optional<int> DocumentSync::Version(const std::string& uri) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = documents_.find(uri);
  if (it == documents_.end()) {
    return std::nullopt;
  }
  return it->second.version;
}

size_t DocumentSync::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return documents_.size();
}

void DocumentSync::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  documents_.clear();
}

}  // namespace ramcp
