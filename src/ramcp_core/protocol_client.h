#ifndef RAMCP_CORE_PROTOCOL_CLIENT_H_
#define RAMCP_CORE_PROTOCOL_CLIENT_H_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "ramcp_core/diagnostics_store.h"
#include "ramcp_core/document_sync.h"
#include "ramcp_core/error.h"
#include "ramcp_core/framed_channel.h"
#include "ramcp_core/process_supervisor.h"

namespace ramcp {

using json = nlohmann::json;

enum class SessionState {
  kUnstarted,
  kInitializing,
  kReady,
  kTerminated,
};

const char* SessionStateName(SessionState state);

struct ClientOptions {
  SpawnOptions backend;
  std::filesystem::path workspace_root;
  std::chrono::milliseconds request_timeout{30000};
  std::chrono::milliseconds shutdown_grace{2000};
  std::string client_name = "ramcp";
  std::string client_version = "0.1.0";
  std::string language_id = "rust";
  // Passed through as `initializationOptions` when not null.
  json initialization_options;
};

// Language server client over the backend's stdio. Any number of threads
// may issue requests concurrently; one internal thread drains the backend
// output and routes each reply to the caller waiting on its id.
class ProtocolClient {
 public:
  using NotificationHandler = std::function<void(const json& params)>;

  explicit ProtocolClient(ClientOptions options);
  ~ProtocolClient();

  ProtocolClient(const ProtocolClient&) = delete;
  ProtocolClient& operator=(const ProtocolClient&) = delete;

  // Unstarted -> Initializing -> Ready. kSpawn when the backend cannot be
  // launched, kStartup when the handshake fails.
  bool Start(Error* error);

  // shutdown request, exit notification, then process termination. Every
  // pending call is resolved with kConnectionClosed. Idempotent.
  void Shutdown();

  SessionState state() const;
  bool IsReady() const;

  // Sends a request and blocks until its reply, the deadline, or the end of
  // the session. A null json value is a successful null result.
  std::optional<json> Request(const std::string& method, const json& params, Error* error);
  std::optional<json> Request(const std::string& method, const json& params,
                              std::chrono::milliseconds timeout, Error* error);

  bool Notify(const std::string& method, const json& params, Error* error);

  // Makes sure the backend has the current text of `path` before any
  // request that depends on it. The notification is fully written when
  // this returns.
  bool SyncDocument(const std::filesystem::path& path, std::string* uri, SyncAction* action,
                    Error* error);

  // Handlers run on the reader thread and must not issue requests.
  void SetNotificationHandler(const std::string& method, NotificationHandler handler);

  json server_capabilities() const;
  // The failure that ended the session, if it did not end by Shutdown.
  std::optional<Error> termination_error() const;
  size_t pending_count() const;
  const DocumentSync& documents() const { return documents_; }
  DiagnosticsStore& diagnostics() { return diagnostics_; }

 private:
  struct PendingCall {
    std::condition_variable cv;
    bool done = false;
    std::optional<json> result;
    Error error;
  };

  std::optional<json> RequestLocked(const std::string& method, const json& params,
                                    std::chrono::milliseconds timeout, Error* error);
  bool SendNotification(const std::string& method, const json& params, Error* error);
  bool Initialize(Error* error);

  void ReaderLoop();
  void StderrLoop(int fd);
  void Dispatch(const json& message);
  void HandleResponse(const json& message);
  void HandleServerRequest(const json& message);
  void HandleNotification(const json& message);

  // Moves to Terminated and resolves every pending call with `cause`.
  void TerminateSession(const Error& cause, bool record);
  void StopThreads();

  ClientOptions options_;
  ProcessSupervisor supervisor_;
  std::unique_ptr<FramedWriter> writer_;
  std::unique_ptr<FramedReader> reader_;
  std::thread reader_thread_;
  std::thread stderr_thread_;
  int stderr_stop_fds_[2] = {-1, -1};

  // Serializes Start and Shutdown.
  std::mutex lifecycle_mutex_;
  // Id assignment + registration + frame write.
  std::mutex send_mutex_;
  // State, pending table, capabilities. Taken after send_mutex_, never before.
  mutable std::mutex state_mutex_;
  SessionState state_ = SessionState::kUnstarted;
  int64_t next_id_ = 0;
  std::unordered_map<int64_t, std::shared_ptr<PendingCall>> pending_;
  json capabilities_ = json::object();
  std::optional<Error> termination_error_;
  std::atomic<bool> shutting_down_{false};

  std::mutex handlers_mutex_;
  std::unordered_map<std::string, NotificationHandler> handlers_;

  DocumentSync documents_;
  DiagnosticsStore diagnostics_;
};

}  // namespace ramcp

#endif  // RAMCP_CORE_PROTOCOL_CLIENT_H_
