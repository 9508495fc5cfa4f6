#ifndef RAMCP_CORE_DIAGNOSTICS_STORE_H_
#define RAMCP_CORE_DIAGNOSTICS_STORE_H_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace ramcp {

// Latest textDocument/publishDiagnostics push per URI. Every publish bumps
// a store-wide generation so callers can wait for one newer than a mark.
class DiagnosticsStore {
 public:
  struct Entry {
    nlohmann::json diagnostics = nlohmann::json::array();
    std::optional<int> version;
    uint64_t generation = 0;
  };

  void Publish(const nlohmann::json& params);
  uint64_t generation() const;
  std::optional<Entry> Get(const std::string& uri) const;

  // Waits for a publish for `uri` newer than `after`. Returns the latest
  // entry either way; `fresh` tells whether the wait was satisfied.
  std::optional<Entry> WaitForNewer(const std::string& uri, uint64_t after,
                                    std::chrono::milliseconds timeout, bool* fresh);

  // Wakes all waiters; later waits return immediately.
  void Close();

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::unordered_map<std::string, Entry> entries_;
  uint64_t generation_ = 0;
  bool closed_ = false;
};

}  // namespace ramcp

#endif  // RAMCP_CORE_DIAGNOSTICS_STORE_H_
