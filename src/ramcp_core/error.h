#ifndef RAMCP_CORE_ERROR_H_
#define RAMCP_CORE_ERROR_H_

#include <optional>
#include <string>
#include <utility>

namespace ramcp {

enum class ErrorCode {
  kSpawn,
  kStartup,
  kNotReady,
  kFraming,
  kConnectionClosed,
  kBackendRejected,
  kFileAccess,
  kTimeout,
  kInvalidParams,
};

struct Error {
  ErrorCode code = ErrorCode::kConnectionClosed;
  std::string message;
  // JSON-RPC error code of the backend reply, only for kBackendRejected.
  int backend_code = 0;

  std::string ToString() const;
};

const char* ErrorCodeName(ErrorCode code);

// Transport level failures invalidate the whole session.
bool IsSessionFatal(ErrorCode code);

inline void SetError(Error* error, ErrorCode code, std::string message) {
  if (error) {
    error->code = code;
    error->message = std::move(message);
    error->backend_code = 0;
  }
}

// Exactly one of value or error is set.
template <typename T>
struct CallResult {
  std::optional<T> value;
  std::optional<Error> error;

  bool ok() const { return value.has_value(); }

  static CallResult Success(T v) {
    CallResult result;
    result.value = std::move(v);
    return result;
  }
  static CallResult Failure(Error e) {
    CallResult result;
    result.error = std::move(e);
    return result;
  }
};

}  // namespace ramcp

#endif  // RAMCP_CORE_ERROR_H_
