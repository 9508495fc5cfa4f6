#include "ramcp_core/error.h"

namespace ramcp {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSpawn:
      return "SpawnError";
    case ErrorCode::kStartup:
      return "StartupError";
    case ErrorCode::kNotReady:
      return "NotReadyError";
    case ErrorCode::kFraming:
      return "FramingError";
    case ErrorCode::kConnectionClosed:
      return "ConnectionClosedError";
    case ErrorCode::kBackendRejected:
      return "BackendRejected";
    case ErrorCode::kFileAccess:
      return "FileAccessError";
    case ErrorCode::kTimeout:
      return "TimeoutError";
    case ErrorCode::kInvalidParams:
      return "InvalidParams";
  }
  return "UnknownError";
}

bool IsSessionFatal(ErrorCode code) {
  return code == ErrorCode::kFraming || code == ErrorCode::kConnectionClosed;
}

std::string Error::ToString() const {
  std::string out = ErrorCodeName(code);
  if (code == ErrorCode::kBackendRejected) {
    out += " (" + std::to_string(backend_code) + ")";
  }
  if (!message.empty()) {
    out += ": " + message;
  }
  return out;
}

}  // namespace ramcp
