#include "ramcp_core/json_rpc.h"

#include <cerrno>
#include <cstdlib>

namespace ramcp {

MessageKind ClassifyMessage(const json& message) {
  if (!message.is_object()) {
    return MessageKind::kInvalid;
  }
  auto method = message.find("method");
  bool has_method = method != message.end() && method->is_string();
  auto id = message.find("id");
  bool has_id = id != message.end() && !id->is_null();
  if (has_method) {
    return has_id ? MessageKind::kRequest : MessageKind::kNotification;
  }
  if (has_id && (message.contains("result") || message.contains("error"))) {
    return MessageKind::kResponse;
  }
  // An error reply to an unparseable request carries a null id.
  if (id != message.end() && message.contains("error")) {
    return MessageKind::kResponse;
  }
  return MessageKind::kInvalid;
}

json MakeRequest(int64_t id, const std::string& method, const json& params) {
  json request = {
      {"jsonrpc", "2.0"},
      {"id", id},
      {"method", method},
  };
  if (!params.is_null()) {
    request["params"] = params;
  }
  return request;
}

json MakeNotification(const std::string& method, const json& params) {
  json notification = {
      {"jsonrpc", "2.0"},
      {"method", method},
  };
  if (!params.is_null()) {
    notification["params"] = params;
  }
  return notification;
}

json MakeResult(const json& id, const json& result) {
  return {
      {"jsonrpc", "2.0"},
      {"id", id},
      {"result", result},
  };
}

json MakeErrorResponse(const json& id, int code, const std::string& message) {
  return {
      {"jsonrpc", "2.0"},
      {"id", id},
      {"error", {{"code", code}, {"message", message}}},
  };
}

std::optional<int64_t> MessageId(const json& message) {
  auto id = message.find("id");
  if (id == message.end()) {
    return std::nullopt;
  }
  if (id->is_number_integer()) {
    return id->get<int64_t>();
  }
  if (id->is_string()) {
    const std::string& text = id->get_ref<const std::string&>();
    if (text.empty()) {
      return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    long long parsed = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') {
      return std::nullopt;
    }
    return static_cast<int64_t>(parsed);
  }
  return std::nullopt;
}

}  // namespace ramcp
