#include "ramcp_core/diagnostics_store.h"

#include "ramcp_core/logging.h"

namespace ramcp {

void DiagnosticsStore::Publish(const nlohmann::json& params) {
  if (!params.is_object()) {
    return;
  }
  auto uri = params.find("uri");
  if (uri == params.end() || !uri->is_string()) {
    Log("publishDiagnostics without uri ignored");
    return;
  }
  Entry entry;
  auto diagnostics = params.find("diagnostics");
  if (diagnostics != params.end() && diagnostics->is_array()) {
    entry.diagnostics = *diagnostics;
  }
  auto version = params.find("version");
  if (version != params.end() && version->is_number_integer()) {
    entry.version = version->get<int>();
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    entry.generation = ++generation_;
    entries_[uri->get<std::string>()] = std::move(entry);
  }
  cv_.notify_all();
}

uint64_t DiagnosticsStore::generation() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return generation_;
}

std::optional<DiagnosticsStore::Entry> DiagnosticsStore::Get(const std::string& uri) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(uri);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<DiagnosticsStore::Entry> DiagnosticsStore::WaitForNewer(
    const std::string& uri, uint64_t after, std::chrono::milliseconds timeout, bool* fresh) {
  std::unique_lock<std::mutex> lock(mutex_);
  auto is_newer = [&]() {
    auto it = entries_.find(uri);
    return it != entries_.end() && it->second.generation > after;
  };
  bool satisfied = cv_.wait_for(lock, timeout, [&]() { return closed_ || is_newer(); });
  if (fresh) {
    *fresh = satisfied && is_newer();
  }
  auto it = entries_.find(uri);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void DiagnosticsStore::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

}  // namespace ramcp
