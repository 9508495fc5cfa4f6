#include "ramcp_core/protocol_client.h"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <utility>
#include <vector>

#include "ramcp_core/json_rpc.h"
#include "ramcp_core/logging.h"
#include "ramcp_core/utils.h"

namespace ramcp {

namespace {

json ClientCapabilities() {
  json code_action_kinds = json::array({"", "quickfix", "refactor", "refactor.extract",
                                        "refactor.inline", "refactor.rewrite", "source",
                                        "source.organizeImports"});
  return {
      {"textDocument",
       {{"synchronization",
         {{"dynamicRegistration", false}, {"didSave", false}, {"willSave", false}}},
        {"definition", {{"dynamicRegistration", false}, {"linkSupport", true}}},
        {"references", {{"dynamicRegistration", false}}},
        {"rename", {{"dynamicRegistration", false}, {"prepareSupport", false}}},
        {"formatting", {{"dynamicRegistration", false}}},
        {"codeAction",
         {{"dynamicRegistration", false},
          {"isPreferredSupport", true},
          {"disabledSupport", true},
          {"codeActionLiteralSupport",
           {{"codeActionKind", {{"valueSet", code_action_kinds}}}}}}},
        {"publishDiagnostics", {{"relatedInformation", true}, {"versionSupport", true}}}}},
      {"workspace",
       {{"symbol", {{"dynamicRegistration", false}}},
        {"workspaceFolders", true},
        {"configuration", true},
        {"workspaceEdit", {{"documentChanges", true}}}}},
      {"window", {{"workDoneProgress", true}}},
  };
}

}  // namespace

const char* SessionStateName(SessionState state) {
  switch (state) {
    case SessionState::kUnstarted:
      return "unstarted";
    case SessionState::kInitializing:
      return "initializing";
    case SessionState::kReady:
      return "ready";
    case SessionState::kTerminated:
      return "terminated";
  }
  return "unknown";
}

ProtocolClient::ProtocolClient(ClientOptions options)
    : options_(std::move(options)), documents_(options_.language_id) {}

ProtocolClient::~ProtocolClient() { Shutdown(); }

bool ProtocolClient::Start(Error* error) {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != SessionState::kUnstarted) {
      SetError(error, ErrorCode::kStartup,
               std::string("client already ") + SessionStateName(state_));
      return false;
    }
  }

  SpawnOptions spawn = options_.backend;
  if (spawn.working_dir.empty()) {
    spawn.working_dir = options_.workspace_root;
  }
  if (!supervisor_.Spawn(spawn, error)) {
    Log("backend spawn failed: " + (error ? error->message : std::string()));
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = SessionState::kTerminated;
    return false;
  }

  writer_ = std::make_unique<FramedWriter>(supervisor_.TakeStdin());
  reader_ = std::make_unique<FramedReader>(supervisor_.TakeStdout());
  int stderr_fd = supervisor_.TakeStderr();
  if (pipe2(stderr_stop_fds_, O_CLOEXEC) != 0) {
    stderr_stop_fds_[0] = -1;
    stderr_stop_fds_[1] = -1;
  }
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = SessionState::kInitializing;
  }
  reader_thread_ = std::thread(&ProtocolClient::ReaderLoop, this);
  stderr_thread_ = std::thread(&ProtocolClient::StderrLoop, this, stderr_fd);

  Error init_error;
  if (!Initialize(&init_error)) {
    Log("initialize failed: " + init_error.ToString());
    Error cause{ErrorCode::kConnectionClosed, "startup failed", 0};
    TerminateSession(cause, false);
    StopThreads();
    if (init_error.code != ErrorCode::kStartup) {
      init_error.message = init_error.ToString();
      init_error.code = ErrorCode::kStartup;
    }
    if (error) {
      *error = init_error;
    }
    return false;
  }
  return true;
}

bool ProtocolClient::Initialize(Error* error) {
  std::filesystem::path root = options_.workspace_root;
  if (root.empty()) {
    std::error_code ec;
    root = std::filesystem::current_path(ec);
  }
  root = AbsoluteDocumentPath(root.string());
  std::string root_uri = PathToUri(root.string());

  json params = {
      {"processId", static_cast<int64_t>(getpid())},
      {"clientInfo", {{"name", options_.client_name}, {"version", options_.client_version}}},
      {"rootUri", root_uri},
      {"rootPath", root.string()},
      {"workspaceFolders",
       json::array({{{"uri", root_uri}, {"name", root.filename().string()}}})},
      {"capabilities", ClientCapabilities()},
  };
  if (!options_.initialization_options.is_null()) {
    params["initializationOptions"] = options_.initialization_options;
  }

  Error request_error;
  auto result = RequestLocked("initialize", params, options_.request_timeout, &request_error);
  if (!result.has_value()) {
    if (request_error.code == ErrorCode::kBackendRejected) {
      SetError(error, ErrorCode::kStartup,
               "initialize rejected: " + request_error.message);
      if (error) {
        error->backend_code = request_error.backend_code;
      }
    } else if (error) {
      *error = request_error;
    }
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (result->is_object() && result->contains("capabilities")) {
      capabilities_ = (*result)["capabilities"];
    }
  }
  if (!SendNotification("initialized", json::object(), error)) {
    return false;
  }

  std::lock_guard<std::mutex> lock(state_mutex_);
  if (state_ != SessionState::kInitializing) {
    SetError(error, ErrorCode::kConnectionClosed, "backend exited during initialization");
    return false;
  }
  state_ = SessionState::kReady;
  Log("session ready");
  return true;
}

void ProtocolClient::Shutdown() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  SessionState state;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state = state_;
    if (state == SessionState::kUnstarted) {
      state_ = SessionState::kTerminated;
      return;
    }
  }
  if (shutting_down_.exchange(true)) {
    return;
  }

  if (state == SessionState::kReady) {
    Error error;
    auto grace = std::min(options_.request_timeout, options_.shutdown_grace);
    if (!RequestLocked("shutdown", json(), grace, &error).has_value()) {
      Log("shutdown request failed: " + error.ToString());
    }
    if (!SendNotification("exit", json(), &error)) {
      Log("exit notification failed: " + error.ToString());
    }
  }

  TerminateSession(Error{ErrorCode::kConnectionClosed, "client shut down", 0}, false);
  if (writer_) {
    writer_->Close();
  }
  supervisor_.Terminate(options_.shutdown_grace);
  StopThreads();
  Log("session closed");
}

void ProtocolClient::StopThreads() {
  if (reader_) {
    reader_->RequestStop();
  }
  if (stderr_stop_fds_[1] >= 0) {
    char byte = 1;
    ssize_t ignored = write(stderr_stop_fds_[1], &byte, 1);
    (void)ignored;
  }
  if (reader_thread_.joinable() && reader_thread_.get_id() != std::this_thread::get_id()) {
    reader_thread_.join();
  }
  if (stderr_thread_.joinable()) {
    stderr_thread_.join();
  }
  for (int& fd : stderr_stop_fds_) {
    if (fd >= 0) {
      close(fd);
      fd = -1;
    }
  }
}

SessionState ProtocolClient::state() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

bool ProtocolClient::IsReady() const { return state() == SessionState::kReady; }

json ProtocolClient::server_capabilities() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return capabilities_;
}

std::optional<Error> ProtocolClient::termination_error() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return termination_error_;
}

size_t ProtocolClient::pending_count() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return pending_.size();
}

std::optional<json> ProtocolClient::Request(const std::string& method, const json& params,
                                            Error* error) {
  return Request(method, params, options_.request_timeout, error);
}

std::optional<json> ProtocolClient::Request(const std::string& method, const json& params,
                                            std::chrono::milliseconds timeout, Error* error) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == SessionState::kTerminated) {
      SetError(error, ErrorCode::kConnectionClosed, "session terminated");
      return std::nullopt;
    }
    if (state_ != SessionState::kReady) {
      SetError(error, ErrorCode::kNotReady,
               std::string("client is ") + SessionStateName(state_));
      return std::nullopt;
    }
  }
  return RequestLocked(method, params, timeout, error);
}

std::optional<json> ProtocolClient::RequestLocked(const std::string& method,
                                                  const json& params,
                                                  std::chrono::milliseconds timeout,
                                                  Error* error) {
  auto call = std::make_shared<PendingCall>();
  int64_t id = 0;
  {
    std::lock_guard<std::mutex> send_lock(send_mutex_);
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      if (state_ == SessionState::kTerminated || !writer_) {
        SetError(error, ErrorCode::kConnectionClosed, "session terminated");
        return std::nullopt;
      }
      id = ++next_id_;
      // Registered before the write so an immediate reply finds its entry.
      pending_[id] = call;
    }
    Error write_error;
    if (!writer_->WriteMessage(MakeRequest(id, method, params), &write_error)) {
      std::lock_guard<std::mutex> lock(state_mutex_);
      pending_.erase(id);
      if (error) {
        *error = write_error;
      }
      return std::nullopt;
    }
  }
  Log("-> " + method + " #" + std::to_string(id));

  std::unique_lock<std::mutex> lock(state_mutex_);
  bool completed =
      call->cv.wait_for(lock, timeout, [&call]() { return call->done; });
  if (!completed) {
    pending_.erase(id);
    bool terminated = state_ == SessionState::kTerminated;
    lock.unlock();
    Log("request " + method + " #" + std::to_string(id) + " timed out");
    SetError(error, ErrorCode::kTimeout,
             method + " timed out after " + std::to_string(timeout.count()) + " ms");
    if (!terminated) {
      Error cancel_error;
      if (!SendNotification("$/cancelRequest", {{"id", id}}, &cancel_error)) {
        Log("cancel #" + std::to_string(id) + " failed: " + cancel_error.ToString());
      }
    }
    return std::nullopt;
  }
  if (!call->result.has_value()) {
    if (error) {
      *error = call->error;
    }
    return std::nullopt;
  }
  return std::move(call->result);
}

bool ProtocolClient::Notify(const std::string& method, const json& params, Error* error) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == SessionState::kTerminated) {
      SetError(error, ErrorCode::kConnectionClosed, "session terminated");
      return false;
    }
    if (state_ != SessionState::kReady) {
      SetError(error, ErrorCode::kNotReady,
               std::string("client is ") + SessionStateName(state_));
      return false;
    }
  }
  return SendNotification(method, params, error);
}

bool ProtocolClient::SendNotification(const std::string& method, const json& params,
                                      Error* error) {
  std::lock_guard<std::mutex> send_lock(send_mutex_);
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == SessionState::kTerminated || !writer_) {
      SetError(error, ErrorCode::kConnectionClosed, "session terminated");
      return false;
    }
  }
  if (!writer_->WriteMessage(MakeNotification(method, params), error)) {
    return false;
  }
  Log("-> " + method);
  return true;
}

bool ProtocolClient::SyncDocument(const std::filesystem::path& path, std::string* uri,
                                  SyncAction* action, Error* error) {
  if (!IsReady()) {
    SetError(error, state() == SessionState::kTerminated ? ErrorCode::kConnectionClosed
                                                         : ErrorCode::kNotReady,
             std::string("client is ") + SessionStateName(state()));
    return false;
  }
  return documents_.Ensure(
      path,
      [this](const std::string& method, const json& params, Error* send_error) {
        return SendNotification(method, params, send_error);
      },
      uri, action, error);
}

void ProtocolClient::SetNotificationHandler(const std::string& method,
                                            NotificationHandler handler) {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  if (handler) {
    handlers_[method] = std::move(handler);
  } else {
    handlers_.erase(method);
  }
}

void ProtocolClient::ReaderLoop() {
  while (true) {
    json message;
    Error error;
    if (!reader_->ReadMessage(&message, &error)) {
      if (error.code == ErrorCode::kFraming) {
        Log("framing error, terminating session: " + error.message);
        TerminateSession(error, true);
        // The stream cannot be resumed; make the backend go away.
        if (writer_) {
          writer_->Close();
        }
        supervisor_.Terminate(options_.shutdown_grace);
      } else if (!shutting_down_.load()) {
        Log("backend output closed: " + error.message);
        Error cause{ErrorCode::kConnectionClosed, "backend exited", 0};
        if (!supervisor_.IsAlive()) {
          auto status = supervisor_.exit_status();
          if (status.has_value()) {
            cause.message += " (wait status " + std::to_string(*status) + ")";
          }
        }
        TerminateSession(cause, true);
      }
      return;
    }
    Dispatch(message);
  }
}

void ProtocolClient::StderrLoop(int fd) {
  std::string pending;
  char buffer[4096];
  while (fd >= 0) {
    pollfd fds[2];
    fds[0] = {fd, POLLIN, 0};
    fds[1] = {stderr_stop_fds_[0], POLLIN, 0};
    int nfds = stderr_stop_fds_[0] >= 0 ? 2 : 1;
    int ready = poll(fds, nfds, -1);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (nfds == 2 && (fds[1].revents & POLLIN) != 0) {
      break;
    }
    if (fds[0].revents == 0) {
      continue;
    }
    ssize_t received = read(fd, buffer, sizeof(buffer));
    if (received < 0 && errno == EINTR) {
      continue;
    }
    if (received <= 0) {
      break;
    }
    pending.append(buffer, static_cast<size_t>(received));
    size_t newline;
    while ((newline = pending.find('\n')) != std::string::npos) {
      std::string line = pending.substr(0, newline);
      pending.erase(0, newline + 1);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      if (!line.empty()) {
        Log("[rust-analyzer] " + line);
      }
    }
  }
  if (!pending.empty()) {
    Log("[rust-analyzer] " + pending);
  }
  if (fd >= 0) {
    close(fd);
  }
}

void ProtocolClient::Dispatch(const json& message) {
  switch (ClassifyMessage(message)) {
    case MessageKind::kResponse:
      HandleResponse(message);
      break;
    case MessageKind::kRequest:
      HandleServerRequest(message);
      break;
    case MessageKind::kNotification:
      HandleNotification(message);
      break;
    case MessageKind::kInvalid:
      Log("<- discarded message that is neither request, response nor notification");
      break;
  }
}

void ProtocolClient::HandleResponse(const json& message) {
  auto id = MessageId(message);
  std::shared_ptr<PendingCall> call;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (id.has_value()) {
      auto it = pending_.find(*id);
      if (it != pending_.end()) {
        call = it->second;
        pending_.erase(it);
      }
    }
    if (call) {
      auto error = message.find("error");
      if (error != message.end() && !error->is_null()) {
        call->error.code = ErrorCode::kBackendRejected;
        if (error->is_object()) {
          call->error.message = error->value("message", std::string());
          auto code = error->find("code");
          call->error.backend_code =
              code != error->end() && code->is_number_integer() ? code->get<int>() : 0;
        } else {
          call->error.message = error->dump();
        }
      } else {
        call->result = message.value("result", json());
      }
      call->done = true;
      call->cv.notify_all();
    }
  }
  if (!call) {
    Log("<- unmatched response " + (id.has_value() ? "#" + std::to_string(*id) : "without id") +
        " discarded");
    return;
  }
  Log("<- response #" + std::to_string(*id));
}

void ProtocolClient::HandleServerRequest(const json& message) {
  const std::string method = message.value("method", std::string());
  const json& id = message["id"];
  json reply;
  if (method == "window/workDoneProgress/create" || method == "client/registerCapability" ||
      method == "client/unregisterCapability" || method == "workspace/codeLens/refresh" ||
      method == "workspace/semanticTokens/refresh" || method == "workspace/inlayHint/refresh" ||
      method == "workspace/diagnostic/refresh") {
    reply = MakeResult(id, json());
  } else if (method == "workspace/configuration") {
    json items = json::array();
    const json params = message.value("params", json::object());
    size_t count = params.is_object() && params.contains("items") && params["items"].is_array()
                       ? params["items"].size()
                       : 0;
    for (size_t i = 0; i < count; ++i) {
      items.push_back(json());
    }
    reply = MakeResult(id, items);
  } else if (method == "workspace/applyEdit") {
    // Edits are reported to the caller, never applied by the client.
    reply = MakeResult(id, {{"applied", false}, {"failureReason", "client is read-only"}});
  } else {
    reply = MakeErrorResponse(id, rpc_error::kMethodNotFound, "unsupported method: " + method);
  }
  Log("<- server request " + method);
  Error error;
  if (writer_ && !writer_->WriteMessage(reply, &error)) {
    Log("reply to " + method + " failed: " + error.ToString());
  }
}

void ProtocolClient::HandleNotification(const json& message) {
  const std::string method = message.value("method", std::string());
  NotificationHandler handler;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    auto it = handlers_.find(method);
    if (it != handlers_.end()) {
      handler = it->second;
    }
  }
  const json params = message.value("params", json());
  if (method == "textDocument/publishDiagnostics") {
    diagnostics_.Publish(params);
  }
  if (handler) {
    handler(params);
    return;
  }
  if (method == "window/logMessage" || method == "window/showMessage") {
    Log("[rust-analyzer] " + (params.is_object() ? params.value("message", std::string())
                                                 : std::string()));
  }
}

void ProtocolClient::TerminateSession(const Error& cause, bool record) {
  std::vector<std::shared_ptr<PendingCall>> failed;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == SessionState::kTerminated) {
      return;
    }
    state_ = SessionState::kTerminated;
    if (record) {
      termination_error_ = cause;
    }
    for (auto& [id, call] : pending_) {
      call->error = cause;
      call->done = true;
      call->cv.notify_all();
    }
    pending_.clear();
  }
  diagnostics_.Close();
  Log(std::string("session terminated: ") + cause.ToString());
}

}  // namespace ramcp
